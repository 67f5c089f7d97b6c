#pragma once

/**
 * @file whisper_transcriber.h
 * @brief whisper.cpp transcriber
 *
 * The model is loaded once and shared; every call decodes in its own
 * whisper_state, so conversations transcribe in parallel. Cancellation and deadlines reach whisper through its abort
 * callback, so a long decode stops between encoder/decoder steps.
 */

#include "stt/transcriber.h"
#include "config.h"
#include <memory>

namespace livetalk {
namespace stt {

class WhisperTranscriber : public ITranscriber {
public:
    explicit WhisperTranscriber(const STTConfig& config);
    ~WhisperTranscriber() override;

    // Non-copyable
    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    Result<Transcript> transcribe(const AudioBuffer& pcm, const CancellationToken& token) override;

    bool is_ready() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace stt
} // namespace livetalk
