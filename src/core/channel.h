#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// ChannelClosedError -- thrown when receiving from a closed, empty channel
// ---------------------------------------------------------------------------

class ChannelClosedError : public std::runtime_error {
public:
    ChannelClosedError();
    explicit ChannelClosedError(const std::string& message);
};

/// Outcome of a non-blocking send.
enum class SendStatus {
    SENT,    // enqueued
    FULL,    // bounded buffer at capacity; item dropped
    CLOSED,  // receiver gone or channel closed; item dropped
};

[[nodiscard]] std::string_view send_status_name(SendStatus status) noexcept;

template<typename T> class Sender;
template<typename T> class Receiver;

template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel(size_t capacity);

namespace detail {

// Shared buffer behind a Sender/Receiver pair.
template<typename T>
struct ChannelState {
    explicit ChannelState(size_t cap) : capacity(cap) {}

    std::mutex              mutex;
    std::condition_variable not_empty;
    std::deque<T>           queue;
    size_t                  capacity;
    size_t                  senders{0};
    bool                    closed{false};

    // Caller holds mutex.
    bool finished() const { return closed || senders == 0; }
};

}  // namespace detail

// ---------------------------------------------------------------------------
// Sender<T> -- producer handle of a bounded MPSC channel
// ---------------------------------------------------------------------------
// Copyable; each copy counts as one producer. When the last sender is
// destroyed the receiver drains what is buffered and then sees the channel
// as closed.
// ---------------------------------------------------------------------------
template<typename T>
class Sender {
public:
    Sender(const Sender& other) : state_(other.state_) { attach(); }
    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender() { detach(); }

    /// Non-blocking enqueue. Never waits for buffer space.
    SendStatus try_send(T item) {
        if (!state_) return SendStatus::CLOSED;
        std::lock_guard lock(state_->mutex);
        if (state_->closed) return SendStatus::CLOSED;
        if (state_->capacity > 0 && state_->queue.size() >= state_->capacity) {
            return SendStatus::FULL;
        }
        state_->queue.push_back(std::move(item));
        state_->not_empty.notify_one();
        return SendStatus::SENT;
    }

    /// True once the receiver has been dropped or closed the channel.
    [[nodiscard]] bool is_closed() const {
        if (!state_) return true;
        std::lock_guard lock(state_->mutex);
        return state_->closed;
    }

private:
    friend std::pair<Sender<T>, Receiver<T>> make_channel<T>(size_t);

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) { attach(); }

    void attach() {
        if (!state_) return;
        std::lock_guard lock(state_->mutex);
        ++state_->senders;
    }

    void detach() {
        if (!state_) return;
        std::lock_guard lock(state_->mutex);
        if (--state_->senders == 0) {
            state_->not_empty.notify_all();
        }
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

// ---------------------------------------------------------------------------
// Receiver<T> -- the single consumer handle
// ---------------------------------------------------------------------------
// Move-only. Destroying the receiver closes the channel, so every sender
// observes SendStatus::CLOSED from then on.
// ---------------------------------------------------------------------------
template<typename T>
class Receiver {
public:
    Receiver(const Receiver&)            = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}
    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Receiver() { close(); }

    /// Blocks until an item is available.
    /// @throws ChannelClosedError once the channel is closed (or every
    ///         sender is gone) and the buffer is empty.
    T receive() {
        if (!state_) throw ChannelClosedError();
        std::unique_lock lock(state_->mutex);
        state_->not_empty.wait(lock, [this] {
            return !state_->queue.empty() || state_->finished();
        });
        if (state_->queue.empty()) throw ChannelClosedError();
        return pop_locked();
    }

    std::optional<T> try_receive() {
        if (!state_) return std::nullopt;
        std::lock_guard lock(state_->mutex);
        if (state_->queue.empty()) return std::nullopt;
        return pop_locked();
    }

    std::optional<T> try_receive_for(std::chrono::milliseconds timeout) {
        if (!state_) return std::nullopt;
        std::unique_lock lock(state_->mutex);
        bool ready = state_->not_empty.wait_for(lock, timeout, [this] {
            return !state_->queue.empty() || state_->finished();
        });
        if (!ready || state_->queue.empty()) return std::nullopt;
        return pop_locked();
    }

    /// Takes every buffered item without blocking.
    std::vector<T> drain() {
        std::vector<T> out;
        if (!state_) return out;
        std::lock_guard lock(state_->mutex);
        out.reserve(state_->queue.size());
        while (!state_->queue.empty()) out.push_back(pop_locked());
        return out;
    }

    /// Stops accepting items. Buffered items stay receivable.
    void close() {
        if (!state_) return;
        std::lock_guard lock(state_->mutex);
        state_->closed = true;
        state_->not_empty.notify_all();
    }

    [[nodiscard]] size_t size() const {
        if (!state_) return 0;
        std::lock_guard lock(state_->mutex);
        return state_->queue.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] size_t capacity() const {
        return state_ ? state_->capacity : 0;
    }

private:
    friend std::pair<Sender<T>, Receiver<T>> make_channel<T>(size_t);

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    // Caller holds the state mutex.
    T pop_locked() {
        T item = std::move(state_->queue.front());
        state_->queue.pop_front();
        return item;
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

/// Creates a connected sender/receiver pair.
/// @param capacity  Maximum buffered items; 0 means unbounded.
template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel(size_t capacity) {
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>(state), Receiver<T>(state)};
}

}  // namespace core
