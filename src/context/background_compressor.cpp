#include "context/background_compressor.h"
#include "logger.h"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace livetalk {
namespace context {

class BackgroundCompressor::Impl {
public:
    struct Job {
        enum class Kind { Compress, Title };
        Kind kind = Kind::Compress;
        ConversationId conversation_id;
        std::shared_ptr<ContextManager> context;
        std::string first_message;

        std::string key() const {
            return kind == Kind::Title ? conversation_id + "#title" : conversation_id;
        }
    };

    explicit Impl(store::ITurnStore* store) : store_(store) {
        worker_thread_ = std::thread(&Impl::worker_loop, this);
        Logger::info("Background context compressor started");
    }

    ~Impl() {
        stop();
    }

    bool schedule(Job job) {
        {
            std::lock_guard<std::mutex> lock(job_mutex_);
            std::string key = job.key();
            if (shutdown_ || queued_.count(key)) {
                return false;
            }
            queued_.insert(key);
            jobs_.push_back(std::move(job));
        }
        job_cv_.notify_one();
        return true;
    }

    bool wait_until_idle(int timeout_ms) {
        std::unique_lock<std::mutex> lock(job_mutex_);
        return idle_cv_.wait_for(lock, Duration(timeout_ms), [this] {
            return jobs_.empty() && !running_;
        });
    }

    size_t compressions() const {
        std::lock_guard<std::mutex> lock(job_mutex_);
        return compressions_;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(job_mutex_);
            if (shutdown_ && !worker_thread_.joinable()) return;
            shutdown_ = true;
            jobs_.clear();
            queued_.clear();
        }
        cancel_.cancel();
        job_cv_.notify_one();
        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
        idle_cv_.notify_all();
    }

private:
    void worker_loop() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(job_mutex_);
                job_cv_.wait(lock, [this] {
                    return shutdown_ || !jobs_.empty();
                });
                if (shutdown_) break;
                job = std::move(jobs_.front());
                jobs_.pop_front();
                queued_.erase(job.key());
                running_ = true;
            }

            bool compressed = false;
            if (job.kind == Job::Kind::Title) {
                run_title(job);
            } else {
                compressed = run_job(job);
            }

            {
                std::lock_guard<std::mutex> lock(job_mutex_);
                running_ = false;
                if (compressed) compressions_++;
            }
            idle_cv_.notify_all();
        }
    }

    bool run_job(const Job& job) {
        if (!job.context->maybe_compress(cancel_.token())) {
            return false;
        }
        if (!store_) {
            return true;
        }

        auto summary = job.context->summary();
        if (!summary) {
            return true;
        }
        auto saved = store_->save_context_summary(job.conversation_id, *summary,
                                                  job.context->summarized_through_seq());
        if (saved.is_error()) {
            LOG_ERROR("[Context] Failed to persist summary for " + job.conversation_id + ": " +
                      saved.error().message);
        }
        return true;
    }

    void run_title(const Job& job) {
        auto title = job.context->generate_title(job.first_message, cancel_.token());
        if (title.is_error()) {
            LOG_WARN("[Context] Title generation failed for " + job.conversation_id + ": " +
                     title.error().message);
            return;
        }
        if (!store_) {
            return;
        }
        auto saved = store_->save_title(job.conversation_id, title.value());
        if (saved.is_error()) {
            LOG_ERROR("[Context] Failed to persist title for " + job.conversation_id + ": " +
                      saved.error().message);
        }
    }

    store::ITurnStore* store_;
    CancellationSource cancel_;

    mutable std::mutex job_mutex_;
    std::condition_variable job_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    std::unordered_set<ConversationId> queued_;
    bool running_ = false;
    bool shutdown_ = false;
    size_t compressions_ = 0;
    std::thread worker_thread_;
};

BackgroundCompressor::BackgroundCompressor(store::ITurnStore* store)
    : impl_(std::make_unique<Impl>(store)) {}

BackgroundCompressor::~BackgroundCompressor() = default;

bool BackgroundCompressor::schedule(const ConversationId& conversation_id,
                                    std::shared_ptr<ContextManager> context) {
    Impl::Job job;
    job.conversation_id = conversation_id;
    job.context = std::move(context);
    return impl_->schedule(std::move(job));
}

bool BackgroundCompressor::schedule_title(const ConversationId& conversation_id,
                                          std::shared_ptr<ContextManager> context,
                                          const std::string& first_message) {
    Impl::Job job;
    job.kind = Impl::Job::Kind::Title;
    job.conversation_id = conversation_id;
    job.context = std::move(context);
    job.first_message = first_message;
    return impl_->schedule(std::move(job));
}

bool BackgroundCompressor::wait_until_idle(int timeout_ms) {
    return impl_->wait_until_idle(timeout_ms);
}

size_t BackgroundCompressor::compressions() const {
    return impl_->compressions();
}

void BackgroundCompressor::stop() {
    impl_->stop();
}

} // namespace context
} // namespace livetalk
