#include "stt/transcriber.h"
#include "audio/wav_codec.h"
#include "logger.h"
#include "utils.h"

namespace livetalk {
namespace stt {

Result<Transcript> transcribe_audio(ITranscriber& transcriber,
                                    const AudioBytes& audio,
                                    const std::string& blank_sentinel,
                                    const CancellationToken& token) {
    if (audio.empty()) {
        return make_error(ErrorKind::EmptyTranscription, "No audio received");
    }

    auto pcm = wav::decode_to_16k(audio);
    if (pcm.is_error()) {
        return make_error(ErrorKind::TranscriptionFailed, pcm.error().message);
    }
    if (pcm.value().empty()) {
        return make_error(ErrorKind::EmptyTranscription, "Audio contains no samples");
    }

    auto result = transcriber.transcribe(pcm.value(), token);
    if (result.is_error()) {
        return result;
    }

    Transcript transcript = std::move(result.value());
    if (utils::is_blank_transcript(transcript.text, blank_sentinel)) {
        LOG_STT("Blank transcript, no speech detected");
        return make_error(ErrorKind::EmptyTranscription, "No speech detected");
    }
    utils::trim(transcript.text);
    return transcript;
}

} // namespace stt
} // namespace livetalk
