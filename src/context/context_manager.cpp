/**
 * @file context_manager.cpp
 * @brief Context window and compression implementation
 */

#include "context/context_manager.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <sstream>

namespace livetalk {
namespace context {

size_t estimate_tokens(const std::string& content) {
    double chars = static_cast<double>(utils::utf8_length(content));
    return static_cast<size_t>(std::ceil(chars * constants::context::TOKENS_PER_CHAR)) +
           constants::context::TOKENS_PER_MESSAGE;
}

// =============================================================================
// ContextManager Implementation
// =============================================================================

class ContextManager::Impl {
public:
    Impl(const ContextConfig& config,
         const std::string& system_prompt,
         llm::ICompletionClient& client,
         const ConversationId& conversation_id)
        : config_(config)
        , system_prompt_(system_prompt)
        , client_(client)
        , conversation_id_(conversation_id) {}

    ChatMessages assemble() const {
        std::lock_guard<std::mutex> lock(mutex_);

        ChatMessages messages;
        messages.reserve(turns_.size() + 2);
        if (!system_prompt_.empty()) {
            messages.push_back({Role::System, system_prompt_});
        }
        if (summary_) {
            messages.push_back({Role::System, std::string(SUMMARY_HEADING) + *summary_});
        }
        for (const auto& turn : turns_) {
            messages.push_back({turn.role, turn.content});
        }
        return messages;
    }

    Turn append(Turn turn) {
        std::lock_guard<std::mutex> lock(mutex_);

        turn.seq = ++last_seq_;
        if (turn.created_at_ms == 0) {
            turn.created_at_ms = now_ms();
        }
        size_t tokens = estimate_tokens(turn.content);
        turn.estimated_tokens = tokens;
        turns_tokens_ += tokens;
        turns_.push_back(turn);
        return turn;
    }

    void restore(std::vector<Turn> turns,
                 const std::optional<std::string>& summary,
                 int64_t summarized_through_seq) {
        std::lock_guard<std::mutex> lock(mutex_);

        turns_.clear();
        turns_tokens_ = 0;
        last_seq_ = summarized_through_seq;
        for (auto& turn : turns) {
            // Turns already folded into the summary are not part of the window
            if (turn.seq != 0 && turn.seq <= summarized_through_seq) continue;
            if (turn.seq == 0) turn.seq = last_seq_ + 1;
            size_t tokens = estimate_tokens(turn.content);
            turn.estimated_tokens = tokens;
            turns_tokens_ += tokens;
            last_seq_ = std::max(last_seq_, turn.seq);
            turns_.push_back(std::move(turn));
        }
        summary_.reset();
        if (summary && !summary->empty()) {
            summary_ = summary;
        }
        summarized_through_seq_ = summarized_through_seq;

        std::ostringstream oss;
        oss << "Restored " << conversation_id_ << ": " << turns_.size() << " turns, "
            << (summary_ ? "with" : "no") << " summary, ~" << estimated_tokens_locked() << " tokens";
        LOG_CTX(oss.str());
    }

    size_t estimated_tokens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return estimated_tokens_locked();
    }

    bool needs_compression() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return needs_compression_locked();
    }

    std::vector<Turn> turns() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return turns_;
    }

    size_t turn_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return turns_.size();
    }

    std::optional<std::string> summary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return summary_;
    }

    int64_t summarized_through_seq() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return summarized_through_seq_;
    }

    int64_t last_seq() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_seq_;
    }

    bool compression_in_progress() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return compressing_;
    }

    bool maybe_compress(const CancellationToken& token) {
        CompressionJob job;
        std::optional<std::string> previous_summary;
        size_t pre_tokens = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (compressing_ || !needs_compression_locked()) {
                return false;
            }
            if (turns_.size() <= config_.keep_recent) {
                LOG_DEBUG("Over threshold but only " + std::to_string(turns_.size()) +
                          " turns retained; nothing to fold");
                return false;
            }

            job = build_job_locked();
            previous_summary = summary_;
            pre_tokens = estimated_tokens_locked();
            compressing_ = true;
        }

        std::ostringstream start;
        start << "Compressing " << conversation_id_ << ": folding turns " << job.first_seq
              << ".." << job.last_seq << " (~" << pre_tokens << " tokens)";
        LOG_CTX(start.str());

        auto summary = summarize_job(job, previous_summary, token);

        std::lock_guard<std::mutex> lock(mutex_);
        compressing_ = false;

        if (summary.is_error()) {
            LOG_WARN("[Context] Compression failed for " + conversation_id_ + " (" +
                     error_kind_name(summary.error().kind) + "): " + summary.error().message);
            return false;
        }

        return splice_locked(job, previous_summary, summary.value());
    }

private:
    size_t estimated_tokens_locked() const {
        return (summary_ ? estimate_tokens(*summary_) : 0) + turns_tokens_;
    }

    bool needs_compression_locked() const {
        if (config_.max_tokens == 0) return false;
        double ratio = static_cast<double>(estimated_tokens_locked()) /
                       static_cast<double>(config_.max_tokens);
        return ratio >= config_.compression_threshold;
    }

    CompressionJob build_job_locked() const {
        CompressionJob job;
        job.turn_count = turns_.size() - config_.keep_recent;
        job.first_seq = turns_.front().seq;
        job.last_seq = turns_[job.turn_count - 1].seq;
        job.summary_prompt = config_.summary_prompt;
        job.messages.reserve(job.turn_count);
        for (size_t i = 0; i < job.turn_count; i++) {
            job.messages.push_back({turns_[i].role, turns_[i].content});
            job.folded_tokens += turns_[i].estimated_tokens.value_or(estimate_tokens(turns_[i].content));
        }
        return job;
    }

public:
    Result<std::string> generate_title(const std::string& first_message, const CancellationToken& token) {
        ChatMessages messages = {{Role::User, first_message}};
        auto result = client_.summarize(messages, config_.title_prompt, token);
        if (result.is_error()) {
            return result;
        }
        std::string title = utils::trim_copy(result.value());
        title = utils::trim_copy(title.substr(0, title.find('\n')));
        // Models like to quote their titles
        while (title.size() >= 2 && (title.front() == '"' || title.front() == '\'') &&
               title.back() == title.front()) {
            title = utils::trim_copy(title.substr(1, title.size() - 2));
        }
        title = utils::trim_copy(utils::utf8_truncate(title, constants::context::TITLE_MAX_CHARS));
        if (title.empty()) {
            return make_error(ErrorKind::ProtocolError, "Title model returned empty text");
        }
        LOG_CTX("Title for " + conversation_id_ + ": " + title);
        return title;
    }

private:
    /// Runs without the window lock
    Result<std::string> summarize_job(const CompressionJob& job,
                                      const std::optional<std::string>& previous_summary,
                                      const CancellationToken& token) {
        auto result = client_.summarize(job.messages, job.summary_prompt, token);
        if (result.is_error()) {
            return result;
        }
        std::string summary = utils::trim_copy(result.value());
        if (summary.empty()) {
            return make_error(ErrorKind::CompressionFailed, "Summary model returned empty text");
        }
        if (!previous_summary) {
            return summary;
        }

        std::string combined = *previous_summary + "\n\n" + summary;
        if (estimate_tokens(combined) <= config_.max_tokens / 2) {
            return combined;
        }

        LOG_CTX("Combined summary too long, summarizing again");
        ChatMessages folded = {{Role::System, combined}};
        auto condensed = client_.summarize(folded, job.summary_prompt, token);
        if (condensed.is_error()) {
            return condensed;
        }
        std::string text = utils::trim_copy(condensed.value());
        if (text.empty()) {
            return make_error(ErrorKind::CompressionFailed, "Summary model returned empty text");
        }
        return text;
    }

    bool splice_locked(const CompressionJob& job,
                       const std::optional<std::string>& previous_summary,
                       const std::string& new_summary) {
        // Window replaced by restore() while summarizing
        if (turns_.size() < job.turn_count || turns_.front().seq != job.first_seq ||
            turns_[job.turn_count - 1].seq != job.last_seq || summary_ != previous_summary) {
            LOG_WARN("[Context] Window changed during compression of " + conversation_id_ +
                     "; discarding summary");
            return false;
        }

        size_t before = (previous_summary ? estimate_tokens(*previous_summary) : 0) + job.folded_tokens;
        size_t after = estimate_tokens(new_summary);
        if (after >= before) {
            std::ostringstream oss;
            oss << "[Context] Compression of " << conversation_id_ << " did not shrink the window ("
                << before << " -> " << after << " tokens); keeping turns";
            LOG_WARN(oss.str());
            return false;
        }

        size_t pre_tokens = estimated_tokens_locked();
        turns_.erase(turns_.begin(), turns_.begin() + static_cast<std::ptrdiff_t>(job.turn_count));
        turns_tokens_ -= job.folded_tokens;
        summary_ = new_summary;
        summarized_through_seq_ = job.last_seq;

        std::ostringstream oss;
        oss << "Compressed " << conversation_id_ << ": " << job.turn_count << " turns folded, "
            << turns_.size() << " retained, ~" << pre_tokens << " -> ~" << estimated_tokens_locked()
            << " tokens";
        LOG_CTX(oss.str());
        return true;
    }

    ContextConfig config_;
    std::string system_prompt_;
    llm::ICompletionClient& client_;
    ConversationId conversation_id_;

    mutable std::mutex mutex_;
    std::vector<Turn> turns_;
    size_t turns_tokens_ = 0;
    std::optional<std::string> summary_;
    int64_t summarized_through_seq_ = 0;
    int64_t last_seq_ = 0;
    bool compressing_ = false;
};

// =============================================================================
// Public Interface
// =============================================================================

ContextManager::ContextManager(const ContextConfig& config,
                               const std::string& system_prompt,
                               llm::ICompletionClient& client,
                               const ConversationId& conversation_id)
    : impl_(std::make_unique<Impl>(config, system_prompt, client, conversation_id)) {}

ContextManager::~ContextManager() = default;

ChatMessages ContextManager::assemble() const {
    return impl_->assemble();
}

Turn ContextManager::append(Turn turn) {
    return impl_->append(std::move(turn));
}

void ContextManager::restore(std::vector<Turn> turns,
                             const std::optional<std::string>& summary,
                             int64_t summarized_through_seq) {
    impl_->restore(std::move(turns), summary, summarized_through_seq);
}

size_t ContextManager::estimated_tokens() const {
    return impl_->estimated_tokens();
}

bool ContextManager::needs_compression() const {
    return impl_->needs_compression();
}

std::vector<Turn> ContextManager::turns() const {
    return impl_->turns();
}

size_t ContextManager::turn_count() const {
    return impl_->turn_count();
}

std::optional<std::string> ContextManager::summary() const {
    return impl_->summary();
}

int64_t ContextManager::summarized_through_seq() const {
    return impl_->summarized_through_seq();
}

int64_t ContextManager::last_seq() const {
    return impl_->last_seq();
}

bool ContextManager::compression_in_progress() const {
    return impl_->compression_in_progress();
}

bool ContextManager::maybe_compress(const CancellationToken& token) {
    return impl_->maybe_compress(token);
}

Result<std::string> ContextManager::generate_title(const std::string& first_message,
                                                   const CancellationToken& token) {
    return impl_->generate_title(first_message, token);
}

} // namespace context
} // namespace livetalk
