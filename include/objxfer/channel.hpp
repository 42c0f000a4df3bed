#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace objxfer {

/// Wakes a thread waiting on several channels at once.
///
/// Every attached channel bumps the generation on any state change. A waiter
/// records the generation, polls its channels, then sleeps until the
/// generation moves.
class Selector {
public:
    uint64_t generation() const {
        std::lock_guard lock(mutex_);
        return generation_;
    }

    void notify() {
        {
            std::lock_guard lock(mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    void wait_for_change(uint64_t seen) {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return generation_ != seen; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t generation_ = 0;
};

enum class TryResult { Ok, WouldBlock, Closed };

/// Multi-producer multi-consumer FIFO with optional capacity bound.
/// Closing wakes all blocked senders and receivers; buffered items remain
/// receivable after close.
template <typename T>
class Channel {
public:
    static constexpr size_t UNBOUNDED = 0;

    explicit Channel(size_t capacity = UNBOUNDED) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Blocks while full. Returns false if the channel is (or becomes) closed.
    bool send(T value) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [&] { return closed_ || !full_locked(); });
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        notify_selectors();
        return true;
    }

    /// Blocks until an item arrives. Returns nullopt once closed and drained.
    std::optional<T> receive() {
        std::optional<T> out;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [&] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return std::nullopt;
            out.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_one();
        notify_selectors();
        return out;
    }

    /// Moves from value only on Ok.
    TryResult try_send(T& value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return TryResult::Closed;
            if (full_locked()) return TryResult::WouldBlock;
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        notify_selectors();
        return TryResult::Ok;
    }

    TryResult try_receive(std::optional<T>& out) {
        {
            std::lock_guard lock(mutex_);
            if (queue_.empty()) {
                return closed_ ? TryResult::Closed : TryResult::WouldBlock;
            }
            out.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_one();
        notify_selectors();
        return TryResult::Ok;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return;
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        notify_selectors();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    void attach(std::shared_ptr<Selector> selector) {
        std::lock_guard lock(selector_mutex_);
        selectors_.push_back(std::move(selector));
    }

private:
    bool full_locked() const {
        return capacity_ != UNBOUNDED && queue_.size() >= capacity_;
    }

    void notify_selectors() {
        std::vector<std::shared_ptr<Selector>> targets;
        {
            std::lock_guard lock(selector_mutex_);
            targets = selectors_;
        }
        for (auto& s : targets) s->notify();
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_ = false;

    std::mutex selector_mutex_;
    std::vector<std::shared_ptr<Selector>> selectors_;
};

enum class SelectOutcome { Sent, Received, SendClosed, ReceiveClosed };

/// Wait until either value is delivered to out or an item is taken from in.
/// Both channels must be attached to selector. Pass out == nullptr to only
/// receive.
template <typename S, typename R>
SelectOutcome send_or_receive(Channel<S>* out, S& value, Channel<R>& in,
                              std::optional<R>& received, Selector& selector) {
    for (;;) {
        uint64_t seen = selector.generation();
        if (out) {
            TryResult r = out->try_send(value);
            if (r == TryResult::Ok) return SelectOutcome::Sent;
            if (r == TryResult::Closed) return SelectOutcome::SendClosed;
        }
        TryResult r = in.try_receive(received);
        if (r == TryResult::Ok) return SelectOutcome::Received;
        if (r == TryResult::Closed) return SelectOutcome::ReceiveClosed;
        selector.wait_for_change(seen);
    }
}

/// A background task producing items on an owned channel.
///
/// The channel is closed when the body returns. Destroying the stream closes
/// the channel first so a producer blocked on a full channel unwinds, then
/// joins the worker.
template <typename T>
class TaskStream {
public:
    using Body = std::function<void(Channel<T>&)>;

    TaskStream(size_t capacity, Body body)
        : channel_(std::make_shared<Channel<T>>(capacity)) {
        auto ch = channel_;
        worker_ = std::thread([ch, body = std::move(body)]() {
            body(*ch);
            ch->close();
        });
    }

    ~TaskStream() {
        channel_->close();
        if (worker_.joinable()) worker_.join();
    }

    TaskStream(const TaskStream&) = delete;
    TaskStream& operator=(const TaskStream&) = delete;

    Channel<T>& channel() { return *channel_; }
    std::optional<T> next() { return channel_->receive(); }

private:
    std::shared_ptr<Channel<T>> channel_;
    std::thread worker_;
};

}  // namespace objxfer
