#include "llm/openai_client.h"
#include "llm/sse_parser.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <array>
#include <functional>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace livetalk {
namespace llm {

// =============================================================================
// Request helpers
// =============================================================================

std::string build_request_body(const ModelProfile& profile, const ChatMessages& messages, bool stream) {
    json request;
    request["model"] = profile.model;

    json msgs = json::array();
    for (const auto& message : messages) {
        json m;
        m["role"] = role_name(message.role);
        m["content"] = message.content;
        msgs.push_back(m);
    }
    request["messages"] = msgs;
    request["max_tokens"] = profile.max_tokens;
    request["temperature"] = profile.temperature;
    request["stream"] = stream;
    if (profile.disable_thinking) {
        request["chat_template_kwargs"] = {{"enable_thinking", false}};
    }
    return request.dump();
}

std::string completions_url(const std::string& base_url) {
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/chat/completions";
}

namespace {

bool is_success(long status) {
    return status >= 200 && status < 300;
}

/// Classify a failed transfer; status is 0 when no response line arrived
Error transport_error(CURLcode code, long status, const std::string& url) {
    std::string detail = std::string(curl_easy_strerror(code)) + " (" + url + ")";
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
            return make_error(ErrorKind::BackendUnavailable, "Completion backend unreachable: " + detail);
        case CURLE_OPERATION_TIMEDOUT:
            if (status == 0) {
                return make_error(ErrorKind::BackendUnavailable, "Completion backend connect timeout: " + detail);
            }
            return make_timeout_error("Completion timed out: " + detail);
        default:
            break;
    }
    if (status == 0) {
        return make_error(ErrorKind::BackendUnavailable, "Completion request failed: " + detail);
    }
    return make_error(ErrorKind::BackendUnavailable, "Completion stream interrupted: " + detail);
}

Error http_error(long status, const std::string& body) {
    std::string excerpt = body.substr(0, constants::llm::ERROR_BODY_EXCERPT);
    std::ostringstream oss;
    oss << "Completion backend returned HTTP " << status;
    if (!excerpt.empty()) oss << ": " << excerpt;
    return make_backend_error(static_cast<int>(status), oss.str());
}

// =============================================================================
// Shared connection pool
// =============================================================================

class SharePool {
public:
    SharePool() : share_(curl_share_init()) {
        if (!share_) return;
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, lock_cb);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, unlock_cb);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }

    ~SharePool() {
        if (share_) curl_share_cleanup(share_);
    }

    CURLSH* handle() const { return share_; }

private:
    static void lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<SharePool*>(userptr)->mutexes_[data % CURL_LOCK_DATA_LAST].lock();
    }

    static void unlock_cb(CURL*, curl_lock_data data, void* userptr) {
        static_cast<SharePool*>(userptr)->mutexes_[data % CURL_LOCK_DATA_LAST].unlock();
    }

    CURLSH* share_;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> mutexes_;
};

// =============================================================================
// HttpTransfer: one POST driven incrementally from the caller's thread
// =============================================================================

class HttpTransfer {
public:
    using BodySink = std::function<bool(const std::string&)>;

    HttpTransfer(CURLSH* share, const ModelProfile& profile, std::string body, bool stream, BodySink sink)
        : url_(completions_url(profile.base_url))
        , request_body_(std::move(body))
        , sink_(std::move(sink))
        , deadline_(Clock::now() + Duration(profile.timeout_ms)) {
        multi_ = curl_multi_init();
        easy_ = curl_easy_init();
        if (!multi_ || !easy_) return;

        headers_ = curl_slist_append(headers_, "Content-Type: application/json");
        if (stream) {
            headers_ = curl_slist_append(headers_, "Accept: text/event-stream");
        }
        if (!profile.api_key.empty()) {
            std::string auth = "Authorization: Bearer " + profile.api_key;
            headers_ = curl_slist_append(headers_, auth.c_str());
        }

        curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(easy_, CURLOPT_POSTFIELDS, request_body_.c_str());
        curl_easy_setopt(easy_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body_.size()));
        curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(constants::llm::CONNECT_TIMEOUT_MS));
        curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
        if (share) {
            curl_easy_setopt(easy_, CURLOPT_SHARE, share);
        }
    }

    ~HttpTransfer() {
        if (multi_ && easy_ && attached_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        if (easy_) curl_easy_cleanup(easy_);
        if (multi_) curl_multi_cleanup(multi_);
        if (headers_) curl_slist_free_all(headers_);
    }

    HttpTransfer(const HttpTransfer&) = delete;
    HttpTransfer& operator=(const HttpTransfer&) = delete;

    /**
     * Advance the transfer by at most one poll interval.
     * Returns an error for cancellation, deadline, or setup failure.
     */
    VoidResult step(const CancellationToken& token) {
        if (!multi_ || !easy_) {
            return make_error(ErrorKind::BackendUnavailable, "Failed to initialize CURL");
        }
        if (!token.is_active()) {
            return token.to_error("Completion");
        }
        if (Clock::now() >= deadline_) {
            return make_timeout_error("Completion timed out");
        }
        if (!attached_) {
            curl_multi_add_handle(multi_, easy_);
            attached_ = true;
        }
        if (complete_) {
            return VoidResult();
        }

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc == CURLM_OK && running > 0) {
            mc = curl_multi_wait(multi_, nullptr, 0, constants::llm::STREAM_POLL_MS, nullptr);
        }
        if (mc != CURLM_OK) {
            return make_error(ErrorKind::BackendUnavailable,
                              std::string("curl multi error: ") + curl_multi_strerror(mc));
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                complete_ = true;
                result_ = msg->data.result;
                curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status_);
            }
        }
        return VoidResult();
    }

    bool complete() const { return complete_; }
    CURLcode result() const { return result_; }
    long status() const { return status_; }
    const std::string& error_body() const { return error_body_; }
    const std::string& url() const { return url_; }

private:
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<HttpTransfer*>(userdata);
        size_t total = size * nmemb;

        if (self->status_ == 0) {
            curl_easy_getinfo(self->easy_, CURLINFO_RESPONSE_CODE, &self->status_);
        }
        if (!is_success(self->status_)) {
            if (self->error_body_.size() < constants::llm::ERROR_BODY_EXCERPT) {
                self->error_body_.append(ptr, total);
            }
            return total;
        }
        // Returning short aborts the transfer with CURLE_WRITE_ERROR
        return self->sink_(std::string(ptr, total)) ? total : 0;
    }

    std::string url_;
    std::string request_body_;
    BodySink sink_;
    TimePoint deadline_;

    CURLM* multi_ = nullptr;
    CURL* easy_ = nullptr;
    struct curl_slist* headers_ = nullptr;
    bool attached_ = false;
    bool complete_ = false;
    CURLcode result_ = CURLE_OK;
    long status_ = 0;
    std::string error_body_;
};

// =============================================================================
// Streaming completion
// =============================================================================

class OpenAIStream : public CompletionStream {
public:
    OpenAIStream(CURLSH* share, const ModelProfile& profile, const ChatMessages& messages)
        : model_(profile.model)
        , transfer_(share, profile, build_request_body(profile, messages, true), true,
                    [this](const std::string& bytes) { return on_body(bytes); })
        , start_(Clock::now()) {}

    ~OpenAIStream() override {
        if (!finished()) {
            LOG_LLM("Stream released before completion (" + model_ + ")");
        }
    }

protected:
    Result<StreamDelta> pull(const CancellationToken& token) override {
        while (true) {
            std::string delta;
            if (parser_.next_delta(delta)) {
                if (!first_token_logged_) {
                    first_token_logged_ = true;
                    LOG_LLM("First token after " + std::to_string(ms_since(start_)) + "ms");
                }
                StreamDelta out;
                out.content = std::move(delta);
                return out;
            }
            if (parser_.done()) {
                LOG_LLM("Stream complete in " + std::to_string(ms_since(start_)) + "ms");
                StreamDelta end;
                end.done = true;
                return end;
            }
            if (parse_error_) {
                return parse_error_;
            }
            if (transfer_.complete()) {
                auto finished = finish_transfer();
                if (finished.is_error()) {
                    return finished.error();
                }
                continue;
            }

            auto stepped = transfer_.step(token);
            if (stepped.is_error()) {
                return stepped.error();
            }
        }
    }

private:
    bool on_body(const std::string& bytes) {
        auto fed = parser_.feed(bytes);
        if (fed.is_error()) {
            parse_error_ = fed.error();
            return false;
        }
        return true;
    }

    VoidResult finish_transfer() {
        if (parse_error_) {
            return parse_error_;
        }
        if (transfer_.result() != CURLE_OK) {
            return transport_error(transfer_.result(), transfer_.status(), transfer_.url());
        }
        if (!is_success(transfer_.status())) {
            return http_error(transfer_.status(), transfer_.error_body());
        }
        auto finished = parser_.finish();
        if (finished.is_error()) {
            parse_error_ = finished.error();
        }
        return finished;
    }

    std::string model_;
    SseParser parser_;
    Error parse_error_;
    HttpTransfer transfer_;
    TimePoint start_;
    bool first_token_logged_ = false;
};

} // anonymous namespace

// =============================================================================
// OpenAIClient
// =============================================================================

class OpenAIClient::Impl {
public:
    Impl(const LLMConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        share_ = std::make_unique<SharePool>();
        LOG_LLM("Main model: " + config_.main_model.model + " @ " + config_.main_model.base_url);
        LOG_LLM("Summary model: " + config_.summary_model.model + " @ " + config_.summary_model.base_url);
    }

    ~Impl() {
        share_.reset();
        curl_global_cleanup();
    }

    std::unique_ptr<CompletionStream> stream(const ChatMessages& messages, Profile profile) {
        const ModelProfile& p = profile_for(profile);
        std::ostringstream oss;
        oss << "Streaming " << messages.size() << " messages to " << profile_name(profile)
            << " model " << p.model;
        LOG_LLM(oss.str());
        return std::make_unique<OpenAIStream>(share_->handle(), p, messages);
    }

    Result<std::string> summarize(const ChatMessages& messages,
                                  const std::string& summary_prompt,
                                  const CancellationToken& token) {
        const ModelProfile& p = config_.summary_model;

        ChatMessages request = {
            {Role::System, config_.summarizer_system_prompt},
            {Role::User, summary_prompt + "\n\n" + format_transcript(messages)},
        };

        std::string body;
        HttpTransfer transfer(share_->handle(), p, build_request_body(p, request, false), false,
                              [&body](const std::string& bytes) { body += bytes; return true; });

        auto start = Clock::now();
        while (!transfer.complete()) {
            auto stepped = transfer.step(token);
            if (stepped.is_error()) {
                return stepped.error();
            }
        }

        if (transfer.result() != CURLE_OK) {
            return transport_error(transfer.result(), transfer.status(), transfer.url());
        }
        if (!is_success(transfer.status())) {
            return http_error(transfer.status(), transfer.error_body());
        }

        try {
            json response = json::parse(body);
            if (!response.contains("choices") || !response["choices"].is_array() ||
                response["choices"].empty()) {
                return make_error(ErrorKind::ProtocolError, "Summary response without choices");
            }
            const auto& message = response["choices"][0]["message"];
            if (!message.contains("content") || !message["content"].is_string()) {
                return make_error(ErrorKind::ProtocolError, "Summary response without content");
            }
            std::string summary = utils::strip_think_tags(message["content"].get<std::string>());

            std::ostringstream oss;
            oss << "Summarized " << messages.size() << " messages into " << summary.size()
                << " chars in " << ms_since(start) << "ms";
            LOG_LLM(oss.str());
            return summary;
        } catch (const json::exception& e) {
            return make_error(ErrorKind::ProtocolError,
                              std::string("Malformed summary response: ") + e.what());
        }
    }

private:
    const ModelProfile& profile_for(Profile profile) const {
        return profile == Profile::Summary ? config_.summary_model : config_.main_model;
    }

    LLMConfig config_;
    std::unique_ptr<SharePool> share_;
};

OpenAIClient::OpenAIClient(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

OpenAIClient::~OpenAIClient() = default;

std::unique_ptr<CompletionStream> OpenAIClient::stream(const ChatMessages& messages, Profile profile) {
    return pimpl_->stream(messages, profile);
}

Result<std::string> OpenAIClient::summarize(const ChatMessages& messages,
                                            const std::string& summary_prompt,
                                            const CancellationToken& token) {
    return pimpl_->summarize(messages, summary_prompt, token);
}

} // namespace llm
} // namespace livetalk
