#pragma once

/**
 * @file transcriber.h
 * @brief Speech-to-text interface
 *
 * Defines the abstract interface for offline STT backends. A transcriber
 * receives one finished utterance; there is no partial/streaming mode.
 */

#include "core/types.h"
#include "core/cancellation.h"
#include "errors.h"
#include <string>

namespace livetalk {
namespace stt {

/**
 * @brief Abstract STT interface
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    /**
     * @brief Transcribe a finished 16 kHz mono buffer
     * @param pcm Samples at audio::SAMPLE_RATE
     * @param token Cancellation and deadline for this call
     * @return Transcript (possibly blank), TranscriptionFailed, Cancelled or Timeout
     */
    virtual Result<Transcript> transcribe(const AudioBuffer& pcm, const CancellationToken& token) = 0;

    virtual bool is_ready() const = 0;
};

/**
 * @brief Decode client audio and transcribe it
 *
 * No samples or a blank result (whitespace or blank_sentinel) yields
 * EmptyTranscription; undecodable bytes yield TranscriptionFailed. The
 * returned text is trimmed.
 */
Result<Transcript> transcribe_audio(ITranscriber& transcriber,
                                    const AudioBytes& audio,
                                    const std::string& blank_sentinel,
                                    const CancellationToken& token);

} // namespace stt
} // namespace livetalk
