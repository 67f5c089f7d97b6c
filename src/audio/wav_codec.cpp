#include "audio/wav_codec.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <sstream>

namespace livetalk {
namespace wav {

namespace {

uint16_t read_u16(const AudioBytes& b, size_t offset) {
    return static_cast<uint8_t>(b[offset]) |
           (static_cast<uint8_t>(b[offset + 1]) << 8);
}

uint32_t read_u32(const AudioBytes& b, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(b[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[offset + 3])) << 24);
}

void write_u16(AudioBytes& out, uint16_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
}

void write_u32(AudioBytes& out, uint32_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
    out += static_cast<char>((v >> 16) & 0xFF);
    out += static_cast<char>((v >> 24) & 0xFF);
}

Error invalid(const std::string& what) {
    return make_error(ErrorKind::InvalidRequest, "Invalid WAV data: " + what);
}

} // anonymous namespace

Result<AudioBuffer> decode(const AudioBytes& bytes, Format* format_out) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 || bytes.compare(8, 4, "WAVE") != 0) {
        return invalid("missing RIFF/WAVE header");
    }

    Format format;
    bool have_fmt = false;
    size_t data_offset = 0;
    size_t data_size = 0;
    bool have_data = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        std::string id = bytes.substr(pos, 4);
        size_t chunk_size = read_u32(bytes, pos + 4);
        size_t body = pos + 8;

        if (id == "fmt ") {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return invalid("truncated fmt chunk");
            }
            format.audio_format = read_u16(bytes, body);
            format.channels = read_u16(bytes, body + 2);
            format.sample_rate = static_cast<int>(read_u32(bytes, body + 4));
            format.bits_per_sample = read_u16(bytes, body + 14);
            if (format.audio_format == 0xFFFE && chunk_size >= 26 && body + 26 <= bytes.size()) {
                // WAVE_FORMAT_EXTENSIBLE: sub-format GUID starts with the real tag
                format.audio_format = read_u16(bytes, body + 24);
            }
            have_fmt = true;
        } else if (id == "data") {
            data_offset = body;
            // Streaming writers leave the size at 0 or 0xFFFFFFFF
            data_size = std::min(chunk_size, bytes.size() - body);
            have_data = true;
            break;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt) return invalid("no fmt chunk");
    if (!have_data) return invalid("no data chunk");
    if (format.channels <= 0 || format.sample_rate <= 0) {
        return invalid("bad channel count or sample rate");
    }

    bool pcm16 = format.audio_format == 1 && format.bits_per_sample == 16;
    bool float32 = format.audio_format == 3 && format.bits_per_sample == 32;
    if (!pcm16 && !float32) {
        std::ostringstream oss;
        oss << "unsupported encoding (format " << format.audio_format
            << ", " << format.bits_per_sample << " bits)";
        return invalid(oss.str());
    }

    size_t bytes_per_sample = static_cast<size_t>(format.bits_per_sample / 8);
    size_t frame_size = bytes_per_sample * static_cast<size_t>(format.channels);
    size_t frames = data_size / frame_size;

    AudioBuffer samples;
    samples.reserve(frames);
    for (size_t i = 0; i < frames; i++) {
        size_t offset = data_offset + i * frame_size;  // first channel only
        if (pcm16) {
            samples.push_back(static_cast<Sample>(read_u16(bytes, offset)));
        } else {
            uint32_t raw = read_u32(bytes, offset);
            float value;
            std::memcpy(&value, &raw, sizeof(value));
            float scaled = std::clamp(value, -1.0f, 1.0f) * 32767.0f;
            samples.push_back(static_cast<Sample>(scaled));
        }
    }

    if (format_out) *format_out = format;
    return samples;
}

Result<AudioBuffer> decode_to_16k(const AudioBytes& bytes) {
    Format format;
    auto decoded = decode(bytes, &format);
    if (decoded.is_error()) {
        return decoded;
    }

    std::ostringstream info;
    info << "WAV: " << format.sample_rate << "Hz, " << format.channels << "ch, "
         << decoded.value().size() << " frames";
    LOG_DEBUG(info.str());

    if (format.sample_rate == audio::SAMPLE_RATE) {
        return decoded;
    }
    return resample(decoded.value(), format.sample_rate, audio::SAMPLE_RATE);
}

AudioBytes encode(const AudioBuffer& samples, int sample_rate) {
    const uint16_t num_channels = 1;
    const uint16_t bits_per_sample = 16;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(Sample));

    AudioBytes out;
    out.reserve(44 + data_size);

    // RIFF header
    out += "RIFF";
    write_u32(out, 36 + data_size);
    out += "WAVE";

    // fmt chunk
    out += "fmt ";
    write_u32(out, 16);
    write_u16(out, 1);  // PCM
    write_u16(out, num_channels);
    write_u32(out, static_cast<uint32_t>(sample_rate));
    write_u32(out, static_cast<uint32_t>(sample_rate) * num_channels * bits_per_sample / 8);
    write_u16(out, num_channels * bits_per_sample / 8);
    write_u16(out, bits_per_sample);

    // data chunk
    out += "data";
    write_u32(out, data_size);
    for (Sample s : samples) {
        write_u16(out, static_cast<uint16_t>(s));
    }
    return out;
}

AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty()) return input;

    double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    size_t output_samples = static_cast<size_t>(input.size() / ratio);

    AudioBuffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        // Linear interpolation
        double t = input_pos - static_cast<double>(idx0);
        double interpolated = input[idx0] * (1.0 - t) + input[idx1] * t;
        output.push_back(static_cast<Sample>(interpolated));
    }

    return output;
}

void apply_gain(AudioBuffer& samples, float gain) {
    if (std::abs(gain - 1.0f) < 0.001f) return;

    for (auto& sample : samples) {
        float scaled = static_cast<float>(sample) * gain;
        sample = static_cast<Sample>(std::clamp(scaled, -32768.0f, 32767.0f));
    }
}

} // namespace wav
} // namespace livetalk
