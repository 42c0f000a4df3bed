#include "objxfer/cancellation.hpp"

#include <vector>

namespace objxfer {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken CancellationToken::child() const {
    auto child_state = std::make_shared<State>();
    std::weak_ptr<State> weak = child_state;
    // The parent only holds a weak reference so finished children are not kept alive.
    on_cancel([weak]() {
        if (auto s = weak.lock()) fire(s);
    });
    return CancellationToken(child_state);
}

void CancellationToken::cancel() const {
    fire(state_);
}

bool CancellationToken::cancelled() const {
    return state_->cancelled.load(std::memory_order_acquire);
}

void CancellationToken::fire(const std::shared_ptr<State>& state) {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard lock(state->mutex);
        if (state->cancelled.exchange(true, std::memory_order_acq_rel)) return;
        for (auto& [id, cb] : state->callbacks) {
            to_run.push_back(std::move(cb));
        }
        state->callbacks.clear();
    }
    // Run outside the lock: callbacks close channels and cancel children.
    for (auto& cb : to_run) {
        cb();
    }
}

uint64_t CancellationToken::on_cancel(std::function<void()> callback) const {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled.load(std::memory_order_acquire)) {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::remove_callback(uint64_t id) const {
    if (id == 0) return;
    std::lock_guard lock(state_->mutex);
    state_->callbacks.erase(id);
}

}  // namespace objxfer
