/**
 * @file piper_synthesizer.cpp
 * @brief Piper TTS implementation
 */

#include "tts/piper_synthesizer.h"
#include "audio/wav_codec.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <mutex>
#include <sstream>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace livetalk {
namespace tts {

namespace {

/// Removes a file when it goes out of scope
class TempFile {
public:
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    ~TempFile() { std::remove(path_.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string temp_path(const std::string& suffix) {
    static std::atomic<uint64_t> counter{0};
    std::ostringstream oss;
    oss << "/tmp/livetalk_tts_" << getpid() << "_" << counter.fetch_add(1) << suffix;
    return oss.str();
}

void terminate_child(pid_t pid) {
    kill(pid, SIGTERM);
    // Wait up to ~200ms for graceful exit
    for (int i = 0; i < 10; ++i) {
        if (waitpid(pid, nullptr, WNOHANG) > 0) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(constants::tts::PROCESS_POLL_MS));
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

} // anonymous namespace

/**
 * @brief Implementation details for PiperSynthesizer
 */
class PiperSynthesizer::Impl {
public:
    explicit Impl(const TTSConfig& config) : config_(config) {
        std::ostringstream oss;
        oss << "Piper synthesizer: voice=" << config.voice_path
            << ", gain=" << config.output_gain
            << ", length_scale=" << config.length_scale;
        LOG_TTS(oss.str());
    }

    VoidResult warmup() {
        auto found = find_piper();
        if (found.is_error()) {
            return found;
        }
        std::ifstream voice(config_.voice_path);
        if (!voice.good()) {
            return make_error(ErrorKind::SynthesisFailed, "Voice model not found: " + config_.voice_path);
        }
        return VoidResult();
    }

    bool is_ready() const {
        std::lock_guard<std::mutex> lock(path_mutex_);
        return !piper_path_.empty();
    }

    Result<AudioBytes> synthesize(const std::string& text, const CancellationToken& parent) {
        std::string clean = utils::trim_copy(text);
        if (clean.empty()) {
            return make_error(ErrorKind::SynthesisFailed, "Nothing to synthesize");
        }

        auto found = find_piper();
        if (found.is_error()) {
            return found.error();
        }

        CancellationToken token = parent.with_deadline(config_.timeout_ms);
        auto start_time = Clock::now();

        TempFile text_file(temp_path(".txt"));
        TempFile wav_file(temp_path(".wav"));
        {
            std::ofstream out(text_file.path(), std::ios::binary);
            // Piper synthesizes one utterance per input line
            for (char c : clean) {
                out << (c == '\n' || c == '\r' ? ' ' : c);
            }
            out << '\n';
            if (!out.good()) {
                return make_error(ErrorKind::SynthesisFailed, "Failed to write TTS input file");
            }
        }

        std::vector<std::string> args = {
            piper_path(),
            "--model", config_.voice_path,
            "--output_file", wav_file.path(),
        };
        if (!config_.espeak_data_path.empty()) {
            args.push_back("--espeak_data");
            args.push_back(config_.espeak_data_path);
        }
        if (config_.speaker_id > 0) {
            args.push_back("--speaker");
            args.push_back(std::to_string(config_.speaker_id));
        }
        if (config_.length_scale != 1.0f) {
            args.push_back("--length_scale");
            args.push_back(std::to_string(config_.length_scale));
        }

        pid_t pid = 0;
        auto spawned = spawn(args, text_file.path(), pid);
        if (spawned.is_error()) {
            return spawned.error();
        }

        LOG_TTS("Synthesizing " + std::to_string(clean.size()) + " chars (pid " + std::to_string(pid) + ")");

        int status = 0;
        while (true) {
            pid_t done = waitpid(pid, &status, WNOHANG);
            if (done == pid) break;
            if (done < 0 && errno != EINTR) {
                std::string reason = std::strerror(errno);
                terminate_child(pid);
                return make_error(ErrorKind::SynthesisFailed, "waitpid failed: " + reason);
            }
            if (!token.is_active()) {
                terminate_child(pid);
                LOG_TTS("Piper process terminated");
                return token.to_error("Synthesis");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(constants::tts::PROCESS_POLL_MS));
        }

        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            std::ostringstream oss;
            oss << "Piper exited abnormally (status " << status << ")";
            LOG_TTS(oss.str());
            return make_error(ErrorKind::SynthesisFailed, oss.str());
        }

        std::ifstream in(wav_file.path(), std::ios::binary);
        if (!in.is_open()) {
            return make_error(ErrorKind::SynthesisFailed, "Piper produced no output file");
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        wav::Format format;
        auto samples = wav::decode(buffer.str(), &format);
        if (samples.is_error()) {
            return make_error(ErrorKind::SynthesisFailed, samples.error().message);
        }
        if (samples.value().empty()) {
            return make_error(ErrorKind::SynthesisFailed, "Piper produced empty audio");
        }

        AudioBuffer audio = std::move(samples.value());
        wav::apply_gain(audio, config_.output_gain);

        std::ostringstream timing;
        timing << "Synthesized " << audio.size() << " samples @" << format.sample_rate
               << "Hz in " << ms_since(start_time) << "ms";
        LOG_TTS(timing.str());

        return wav::encode(audio, format.sample_rate);
    }

private:
    VoidResult find_piper() {
        std::lock_guard<std::mutex> lock(path_mutex_);
        if (!piper_path_.empty()) {
            return VoidResult();
        }

        std::string requested = config_.piper_path.empty() ? "piper" : config_.piper_path;
        std::string resolved = find_executable(requested);
        if (resolved.empty()) {
            return make_error(ErrorKind::SynthesisFailed,
                              "Piper binary not found: " + requested +
                              ". Install piper or set tts.piper_path in config.");
        }
        piper_path_ = resolved;
        LOG_TTS("Using piper at: " + piper_path_);
        return VoidResult();
    }

    std::string piper_path() const {
        std::lock_guard<std::mutex> lock(path_mutex_);
        return piper_path_;
    }

    VoidResult spawn(const std::vector<std::string>& args, const std::string& stdin_path, pid_t& out_pid) {
        std::vector<char*> argv;
        for (const auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
        argv.push_back(nullptr);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, stdin_path.c_str(), O_RDONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
        int rc = posix_spawn(&out_pid, argv[0], &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);

        if (rc != 0) {
            return make_error(ErrorKind::SynthesisFailed,
                              "Failed to spawn '" + args[0] + "': " + std::strerror(rc));
        }
        return VoidResult();
    }

    TTSConfig config_;
    mutable std::mutex path_mutex_;
    std::string piper_path_;
};

PiperSynthesizer::PiperSynthesizer(const TTSConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

PiperSynthesizer::~PiperSynthesizer() = default;

Result<AudioBytes> PiperSynthesizer::synthesize(const std::string& text, const CancellationToken& token) {
    return impl_->synthesize(text, token);
}

bool PiperSynthesizer::is_ready() const {
    return impl_->is_ready();
}

VoidResult PiperSynthesizer::warmup() {
    return impl_->warmup();
}

} // namespace tts
} // namespace livetalk
