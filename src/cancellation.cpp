#include "cancellation.hpp"
#include <chrono>
#include <utility>
#include <vector>

namespace platerec {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>())
{
}

void CancellationToken::cancel() const
{
    std::vector<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;

        for (auto& entry : state_->callbacks) {
            pending.push_back(std::move(entry.second));
        }
        state_->callbacks.clear();
    }

    state_->cv.notify_all();

    for (auto& callback : pending) {
        callback();
    }
}

bool CancellationToken::is_cancelled() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(int64_t ms) const
{
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (ms <= 0) {
        return state_->cancelled;
    }

    State* state = state_.get();
    return state_->cv.wait_for(lock, std::chrono::milliseconds(ms),
                               [state] { return state->cancelled; });
}

CancellationToken::CallbackId CancellationToken::on_cancel(std::function<void()> callback) const
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            const CallbackId id = state_->next_id++;
            state_->callbacks[id] = std::move(callback);
            return id;
        }
    }

    callback();
    return 0;
}

void CancellationToken::remove_callback(CallbackId id) const
{
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

// ============================================================================
// CancellationRegistration
// ============================================================================

CancellationRegistration::CancellationRegistration(const CancellationToken& token,
                                                   std::function<void()> callback)
    : token_(token)
    , id_(token.on_cancel(std::move(callback)))
{
}

CancellationRegistration::~CancellationRegistration()
{
    token_.remove_callback(id_);
}

} // namespace platerec
