#include "core/cancellation.h"
#include <algorithm>

namespace livetalk {

CancelState CancellationToken::state() const {
    if (flag_ && flag_->load()) {
        return CancelState::Cancelled;
    }
    if (deadline_ && Clock::now() >= *deadline_) {
        return CancelState::Expired;
    }
    return CancelState::Active;
}

CancellationToken CancellationToken::with_deadline(int timeout_ms) const {
    CancellationToken derived = *this;
    if (timeout_ms > 0) {
        TimePoint candidate = Clock::now() + Duration(timeout_ms);
        derived.deadline_ = deadline_ ? std::min(*deadline_, candidate) : candidate;
    }
    return derived;
}

std::optional<int64_t> CancellationToken::remaining_ms() const {
    if (!deadline_) {
        return std::nullopt;
    }
    auto left = std::chrono::duration_cast<Duration>(*deadline_ - Clock::now()).count();
    return std::max<int64_t>(0, left);
}

Error CancellationToken::to_error(const std::string& what) const {
    switch (state()) {
        case CancelState::Cancelled:
            return make_cancelled_error(what + " cancelled");
        case CancelState::Expired:
            return make_timeout_error(what + " timed out");
        case CancelState::Active:
            break;
    }
    return Error();
}

CancellationSource::CancellationSource()
    : flag_(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationSource::cancel() {
    flag_->store(true);
}

bool CancellationSource::is_cancelled() const {
    return flag_->load();
}

CancellationToken CancellationSource::token() const {
    CancellationToken token;
    token.flag_ = flag_;
    return token;
}

} // namespace livetalk
