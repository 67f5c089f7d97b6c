/**
 * Deterministic tests for the audio path helpers: WAV decoding, base64,
 * transcript text cleanup, and the transcription adapter's empty/blank
 * handling.
 *
 * Run from build dir: ./test_audio_utils
 * No whisper model required.
 */

#include "audio/wav_codec.h"
#include "fakes.h"
#include "logger.h"
#include "stt/transcriber.h"
#include "utils.h"
#include <cstdlib>
#include <iostream>
#include <string>

using namespace livetalk;
using namespace livetalk::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

void put_u16(std::string& out, uint16_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>(v >> 8);
}

void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; i++) out += static_cast<char>((v >> (8 * i)) & 0xFF);
}

/// Stereo PCM16 WAV with an extra LIST chunk before data
std::string stereo_wav_with_list(int sample_rate, const std::vector<int16_t>& left,
                                 const std::vector<int16_t>& right) {
    std::string data;
    for (size_t i = 0; i < left.size(); i++) {
        put_u16(data, static_cast<uint16_t>(left[i]));
        put_u16(data, static_cast<uint16_t>(right[i]));
    }
    std::string list = "LIST";
    put_u32(list, 3);
    list += "abc";
    list += '\0';  // pad byte

    std::string out = "RIFF";
    put_u32(out, static_cast<uint32_t>(4 + 24 + list.size() + 8 + data.size()));
    out += "WAVE";
    out += "fmt ";
    put_u32(out, 16);
    put_u16(out, 1);
    put_u16(out, 2);
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate * 4));
    put_u16(out, 4);
    put_u16(out, 16);
    out += list;
    out += "data";
    put_u32(out, static_cast<uint32_t>(data.size()));
    out += data;
    return out;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- is_blank_transcript ---
    ASSERT(utils::is_blank_transcript("", "[BLANK_AUDIO]"));
    ASSERT(utils::is_blank_transcript("   ", "[BLANK_AUDIO]"));
    ASSERT(utils::is_blank_transcript("\t\n", "[BLANK_AUDIO]"));
    ASSERT(utils::is_blank_transcript("[BLANK_AUDIO]", "[BLANK_AUDIO]"));
    ASSERT(utils::is_blank_transcript("  [BLANK_AUDIO]  ", "[BLANK_AUDIO]"));
    ASSERT(utils::is_blank_transcript("hello", "[BLANK_AUDIO]") == false);
    ASSERT(utils::is_blank_transcript("[BLANK_AUDIO]", "") == false);

    // --- strip_think_tags ---
    ASSERT(utils::strip_think_tags("<think>plan</think>Answer.") == "Answer.");
    ASSERT(utils::strip_think_tags("A <think>x</think>B<think>y</think> C") == "A B C");
    ASSERT(utils::strip_think_tags("Visible <think>never closed") == "Visible");
    ASSERT(utils::strip_think_tags("<think>only reasoning</think>").empty());
    ASSERT(utils::strip_think_tags("  plain  ") == "plain");

    // --- utf8_length ---
    ASSERT(utils::utf8_length("abc") == 3);
    ASSERT(utils::utf8_length("\xE4\xBD\xA0\xE5\xA5\xBD") == 2);
    ASSERT(utils::utf8_length("") == 0);

    // --- base64 ---
    ASSERT(utils::base64_encode("") == "");
    ASSERT(utils::base64_encode("f") == "Zg==");
    ASSERT(utils::base64_encode("fo") == "Zm8=");
    ASSERT(utils::base64_encode("foobar") == "Zm9vYmFy");
    ASSERT(utils::base64_decode("Zm9vYmFy").value_or("") == "foobar");
    ASSERT(utils::base64_decode("Zm8=").value_or("") == "fo");
    ASSERT(utils::base64_decode("Zm9v\nYmFy").value_or("") == "foobar");
    ASSERT(!utils::base64_decode("Zm9v!mFy"));
    ASSERT(!utils::base64_decode("Zm9"));
    std::string binary;
    for (int i = 0; i < 256; i++) binary += static_cast<char>(i);
    ASSERT(utils::base64_decode(utils::base64_encode(binary)).value_or("") == binary);

    // --- WAV encode / decode ---
    {
        AudioBuffer samples = {0, 1000, -1000, 32767, -32768};
        AudioBytes bytes = wav::encode(samples);
        ASSERT(bytes.size() == 44 + samples.size() * 2);

        wav::Format format;
        auto decoded = wav::decode(bytes, &format);
        ASSERT(decoded.is_ok());
        ASSERT(format.sample_rate == 16000);
        ASSERT(format.channels == 1);
        ASSERT(format.bits_per_sample == 16);
        ASSERT(decoded.is_ok() && decoded.value() == samples);
    }
    {
        // Extra chunks are skipped and only the first channel is kept
        std::string bytes = stereo_wav_with_list(16000, {100, 200, 300}, {-1, -2, -3});
        auto decoded = wav::decode(bytes);
        ASSERT(decoded.is_ok());
        ASSERT(decoded.is_ok() && decoded.value() == AudioBuffer({100, 200, 300}));
    }
    {
        // 8 kHz input is resampled to 16 kHz
        AudioBuffer samples(800, 500);
        auto decoded = wav::decode_to_16k(wav::encode(samples, 8000));
        ASSERT(decoded.is_ok());
        ASSERT(decoded.is_ok() && std::abs(static_cast<int>(decoded.value().size()) - 1600) <= 2);
    }
    {
        auto garbage = wav::decode("definitely not a wav file");
        ASSERT(garbage.is_error());
        ASSERT(garbage.error().kind == ErrorKind::InvalidRequest);

        AudioBytes truncated = wav::encode(AudioBuffer(10, 1)).substr(0, 30);
        ASSERT(wav::decode(truncated).is_error());
    }
    {
        AudioBuffer loud = {20000, -20000, 100};
        wav::apply_gain(loud, 2.0f);
        ASSERT(loud[0] == 32767);
        ASSERT(loud[1] == -32768);
        ASSERT(loud[2] == 200);
    }

    // --- transcribe_audio: empty, undecodable, blank, valid ---
    {
        FakeTranscriber transcriber("  what time is it  ");
        CancellationToken token;

        auto empty = stt::transcribe_audio(transcriber, "", "[BLANK_AUDIO]", token);
        ASSERT(empty.is_error() && empty.error().kind == ErrorKind::EmptyTranscription);
        ASSERT(transcriber.calls() == 0);

        auto header_only = stt::transcribe_audio(transcriber, wav::encode(AudioBuffer()), "[BLANK_AUDIO]", token);
        ASSERT(header_only.is_error() && header_only.error().kind == ErrorKind::EmptyTranscription);

        auto garbage = stt::transcribe_audio(transcriber, "RIFFxxxxWAVEjunk", "[BLANK_AUDIO]", token);
        ASSERT(garbage.is_error() && garbage.error().kind == ErrorKind::TranscriptionFailed);
        ASSERT(transcriber.calls() == 0);

        auto ok = stt::transcribe_audio(transcriber, tone_wav(500), "[BLANK_AUDIO]", token);
        ASSERT(ok.is_ok());
        ASSERT(ok.is_ok() && ok.value().text == "what time is it");
        ASSERT(transcriber.last_samples() == audio::ms_to_samples(500));

        transcriber.set_text("[BLANK_AUDIO]");
        auto blank = stt::transcribe_audio(transcriber, tone_wav(500), "[BLANK_AUDIO]", token);
        ASSERT(blank.is_error() && blank.error().kind == ErrorKind::EmptyTranscription);

        transcriber.set_error(Error(ErrorKind::TranscriptionFailed, "whisper_full failed"));
        auto engine = stt::transcribe_audio(transcriber, tone_wav(500), "[BLANK_AUDIO]", token);
        ASSERT(engine.is_error() && engine.error().kind == ErrorKind::TranscriptionFailed);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All audio and text utility tests passed.\n";
    return 0;
}
