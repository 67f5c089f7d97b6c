#pragma once

/**
 * @file synthesizer.h
 * @brief Text-to-Speech interface
 *
 * Defines the abstract interface for offline TTS backends. The whole reply
 * is synthesized at once and returned as a WAV file in memory.
 */

#include "core/types.h"
#include "core/cancellation.h"
#include "errors.h"
#include <string>

namespace livetalk {
namespace tts {

/**
 * @brief Abstract TTS interface
 */
class ISynthesizer {
public:
    virtual ~ISynthesizer() = default;

    /**
     * @brief Synthesize text to a WAV file image
     * @param text Complete reply text
     * @param token Cancellation and deadline for this call
     * @return WAV bytes, SynthesisFailed, Cancelled or Timeout
     */
    virtual Result<AudioBytes> synthesize(const std::string& text, const CancellationToken& token) = 0;

    /**
     * @brief Check if engine is ready
     */
    virtual bool is_ready() const = 0;

    /**
     * @brief Resolve binaries and models up front to avoid first-call latency
     */
    virtual VoidResult warmup() = 0;
};

} // namespace tts
} // namespace livetalk
