#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace objxfer {

/// Cancellation handle scoped to one command invocation.
///
/// Copies share state. A child token is cancelled when its parent is, but
/// cancelling a child leaves the parent untouched, so a bulk operation can
/// tear down its own listing and removal tasks without affecting the next
/// top-level target.
class CancellationToken {
public:
    CancellationToken();

    /// Derive a token that is cancelled together with this one.
    CancellationToken child() const;

    void cancel() const;
    bool cancelled() const;

    /// Register a callback run once on cancellation (immediately if already
    /// cancelled). Returns an id for remove_callback().
    uint64_t on_cancel(std::function<void()> callback) const;
    void remove_callback(uint64_t id) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        uint64_t next_id = 1;
        std::map<uint64_t, std::function<void()>> callbacks;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}
    static void fire(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

/// Unregisters a cancellation callback when it goes out of scope.
class CancelRegistration {
public:
    CancelRegistration(const CancellationToken& token, std::function<void()> callback)
        : token_(token), id_(token.on_cancel(std::move(callback))) {}
    ~CancelRegistration() { token_.remove_callback(id_); }

    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

private:
    CancellationToken token_;
    uint64_t id_;
};

}  // namespace objxfer
