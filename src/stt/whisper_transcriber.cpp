#include "stt/whisper_transcriber.h"
#include "logger.h"
#include <whisper.h>
#include <memory>
#include <sstream>
#include <vector>

namespace livetalk {
namespace stt {

namespace {

bool abort_requested(void* user_data) {
    auto* token = static_cast<const CancellationToken*>(user_data);
    return !token->is_active();
}

struct StateDeleter {
    void operator()(whisper_state* state) const { whisper_free_state(state); }
};

using StatePtr = std::unique_ptr<whisper_state, StateDeleter>;

} // anonymous namespace

class WhisperTranscriber::Impl {
public:
    Impl(const STTConfig& config) : config_(config), ctx_(nullptr) {
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            LOG_STT("Failed to load whisper model: " + config_.model_path);
            return;
        }

        LOG_STT("Model loaded: " + config_.model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Result<Transcript> transcribe(const AudioBuffer& pcm, const CancellationToken& parent) {
        if (!ctx_) {
            return make_error(ErrorKind::TranscriptionFailed, "Speech model not loaded");
        }

        CancellationToken token = parent.with_deadline(config_.timeout_ms);

        if (!token.is_active()) {
            return token.to_error("Transcription");
        }

        auto start = Clock::now();

        // The model weights are shared; each call decodes in its own state
        StatePtr state(whisper_init_state(ctx_));
        if (!state) {
            return make_error(ErrorKind::TranscriptionFailed, "Failed to allocate whisper state");
        }

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.detect_language = config_.language == "auto";
        params.n_threads = config_.n_threads;
        params.offset_ms = 0;
        params.no_context = true;
        params.single_segment = false;
        params.abort_callback = abort_requested;
        params.abort_callback_user_data = &token;

        std::vector<float> pcmf32(pcm.size());
        for (size_t i = 0; i < pcm.size(); i++) {
            pcmf32[i] = static_cast<float>(pcm[i]) / 32768.0f;
        }

        int ret = whisper_full_with_state(ctx_, state.get(), params, pcmf32.data(),
                                          static_cast<int>(pcmf32.size()));
        if (!token.is_active()) {
            return token.to_error("Transcription");
        }
        if (ret != 0) {
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            LOG_STT(oss.str());
            return make_error(ErrorKind::TranscriptionFailed, oss.str());
        }

        Transcript result;
        int n_segments = whisper_full_n_segments_from_state(state.get());
        int total_tokens = 0;
        float total_prob = 0.0f;
        for (int i = 0; i < n_segments; i++) {
            result.text += whisper_full_get_segment_text_from_state(state.get(), i);

            int n_tokens = whisper_full_n_tokens_from_state(state.get(), i);
            total_tokens += n_tokens;
            for (int j = 0; j < n_tokens; j++) {
                total_prob += whisper_full_get_token_p_from_state(state.get(), i, j);
            }
        }
        result.confidence = total_tokens > 0 ? (total_prob / total_tokens) : 0.0f;
        result.token_count = total_tokens;
        result.processing_ms = ms_since(start);

        std::ostringstream oss;
        oss << "Transcribed " << audio::samples_to_ms(pcm.size()) << "ms of audio in "
            << result.processing_ms << "ms (" << total_tokens << " tokens)";
        LOG_STT(oss.str());

        return result;
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

private:
    STTConfig config_;
    whisper_context* ctx_;
};

WhisperTranscriber::WhisperTranscriber(const STTConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperTranscriber::~WhisperTranscriber() = default;

Result<Transcript> WhisperTranscriber::transcribe(const AudioBuffer& pcm, const CancellationToken& token) {
    return pimpl_->transcribe(pcm, token);
}

bool WhisperTranscriber::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace stt
} // namespace livetalk
