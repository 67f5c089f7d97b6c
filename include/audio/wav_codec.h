#pragma once

/**
 * @file wav_codec.h
 * @brief In-memory WAV (RIFF) decoding and encoding
 *
 * Client recordings arrive as WAV bytes and are reduced to the 16 kHz mono
 * PCM whisper expects; synthesized replies leave as 16-bit mono WAV bytes.
 */

#include "core/types.h"
#include "errors.h"

namespace livetalk {
namespace wav {

/// Format fields of a decoded WAV stream
struct Format {
    int sample_rate = 0;
    int channels = 0;
    int bits_per_sample = 0;
    int audio_format = 0;  ///< 1 = PCM, 3 = IEEE float
};

/**
 * @brief Parse the RIFF container and return its format and raw mono samples
 *
 * Walks the chunk list (fmt, data, and any LIST/fact chunks in between).
 * Supports 16-bit PCM and 32-bit float; multi-channel input keeps the
 * first channel.
 *
 * @return Samples at the file's own rate, or InvalidRequest on malformed data
 */
Result<AudioBuffer> decode(const AudioBytes& bytes, Format* format = nullptr);

/**
 * @brief Decode and resample to audio::SAMPLE_RATE
 */
Result<AudioBuffer> decode_to_16k(const AudioBytes& bytes);

/**
 * @brief Encode mono 16-bit PCM as a 44-byte-header WAV file
 */
AudioBytes encode(const AudioBuffer& samples, int sample_rate = audio::SAMPLE_RATE);

/// Linear-interpolation resampler
AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate);

/// Multiply samples by gain, clamped to the 16-bit range
void apply_gain(AudioBuffer& samples, float gain);

} // namespace wav
} // namespace livetalk
