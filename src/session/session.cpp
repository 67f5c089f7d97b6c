#include "session/session.h"
#include <algorithm>

namespace livetalk {
namespace session {

namespace {

int64_t steady_ms() {
    return std::chrono::duration_cast<Duration>(Clock::now().time_since_epoch()).count();
}

} // anonymous namespace

Result<std::shared_ptr<Session>> Session::open(const ConversationId& id,
                                               const Config& config,
                                               const SessionServices& services) {
    if (!services.client) {
        return make_error(ErrorKind::ConfigError, "Session requires a completion client");
    }

    auto context = std::make_shared<context::ContextManager>(
        config.context, config.llm.system_prompt, *services.client, id);

    if (services.store) {
        auto turns = services.store->load_recent_turns(id);
        if (turns.is_error()) {
            return Error(ErrorKind::StoreError, "Failed to load conversation " + id + ": " +
                         turns.error().message);
        }
        auto summary = services.store->load_context_summary(id);
        if (summary.is_error()) {
            return Error(ErrorKind::StoreError, "Failed to load summary of " + id + ": " +
                         summary.error().message);
        }
        context->restore(std::move(turns.value()), summary.value().summary,
                         summary.value().summarized_through_seq);
    }

    auto orchestrator = std::make_unique<TurnOrchestrator>(id, config, services, context);
    return std::shared_ptr<Session>(new Session(id, std::move(context), std::move(orchestrator)));
}

Session::Session(const ConversationId& id,
                 std::shared_ptr<context::ContextManager> context,
                 std::unique_ptr<TurnOrchestrator> orchestrator)
    : id_(id)
    , context_(std::move(context))
    , orchestrator_(std::move(orchestrator))
    , last_touch_ms_(steady_ms()) {}

Session::~Session() {
    close();
}

void Session::touch() {
    last_touch_ms_.store(steady_ms());
}

int64_t Session::idle_ms() const {
    int64_t since_touch = steady_ms() - last_touch_ms_.load();
    return std::min(since_touch, orchestrator_->idle_ms());
}

void Session::close() {
    orchestrator_->shutdown();
}

} // namespace session
} // namespace livetalk
