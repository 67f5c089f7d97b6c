#pragma once

/**
 * @file piper_synthesizer.h
 * @brief Piper TTS driven through its command-line binary
 *
 * Each request runs one piper process: text on stdin, WAV to a temp file.
 * The process is polled while it runs and killed on cancellation or when
 * the deadline passes.
 */

#include "tts/synthesizer.h"
#include "config.h"
#include <memory>

namespace livetalk {
namespace tts {

class PiperSynthesizer : public ISynthesizer {
public:
    explicit PiperSynthesizer(const TTSConfig& config);
    ~PiperSynthesizer() override;

    // Non-copyable
    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    Result<AudioBytes> synthesize(const std::string& text, const CancellationToken& token) override;
    bool is_ready() const override;
    VoidResult warmup() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tts
} // namespace livetalk
