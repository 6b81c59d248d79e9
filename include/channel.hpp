#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

// Unbounded single-producer single-consumer channel. The receiver sees a
// disconnect once the sender is closed or destroyed and the queue is drained.
template <typename T>
class Channel {
public:
    class Sender;
    class Receiver;

    static std::pair<Sender, Receiver> make() {
        auto state = std::make_shared<State>();
        return {Sender(state), Receiver(state)};
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<T> pending;
        bool sender_open{true};
        bool receiver_open{true};
    };

public:
    class Sender {
    public:
        Sender() = default;
        Sender(Sender&&) noexcept = default;
        Sender& operator=(Sender&& other) noexcept {
            if (this != &other) {
                close();
                state_ = std::move(other.state_);
            }
            return *this;
        }
        Sender(const Sender&) = delete;
        Sender& operator=(const Sender&) = delete;

        ~Sender() { close(); }

        // Returns false if the receiver is gone.
        bool send(T value) {
            if (!state_) return false;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (!state_->receiver_open) return false;
                state_->pending.push_back(std::move(value));
            }
            state_->cv.notify_one();
            return true;
        }

        void close() {
            if (!state_) return;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                state_->sender_open = false;
            }
            state_->cv.notify_all();
            state_.reset();
        }

        bool is_open() const { return static_cast<bool>(state_); }

    private:
        friend class Channel;
        explicit Sender(std::shared_ptr<State> state) : state_(std::move(state)) {}

        std::shared_ptr<State> state_;
    };

    class Receiver {
    public:
        Receiver() = default;
        Receiver(Receiver&&) noexcept = default;
        Receiver& operator=(Receiver&& other) noexcept {
            if (this != &other) {
                close();
                state_ = std::move(other.state_);
            }
            return *this;
        }
        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;

        ~Receiver() { close(); }

        // Blocks until a value arrives. Empty result means disconnected.
        std::optional<T> recv() {
            if (!state_) return std::nullopt;
            std::unique_lock<std::mutex> lock(state_->mutex);
            state_->cv.wait(lock, [&] { return !state_->pending.empty() || !state_->sender_open; });
            return pop_locked();
        }

        template <typename Rep, typename Period>
        std::optional<T> recv_for(const std::chrono::duration<Rep, Period>& timeout) {
            if (!state_) return std::nullopt;
            std::unique_lock<std::mutex> lock(state_->mutex);
            state_->cv.wait_for(lock, timeout,
                                [&] { return !state_->pending.empty() || !state_->sender_open; });
            return pop_locked();
        }

        // Never blocks. Empty result means nothing is queued right now.
        std::optional<T> try_recv() {
            if (!state_) return std::nullopt;
            std::lock_guard<std::mutex> lock(state_->mutex);
            return pop_locked();
        }

        bool is_disconnected() const {
            if (!state_) return true;
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->pending.empty() && !state_->sender_open;
        }

    private:
        friend class Channel;
        explicit Receiver(std::shared_ptr<State> state) : state_(std::move(state)) {}

        void close() {
            if (!state_) return;
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->receiver_open = false;
            state_->pending.clear();
        }

        std::optional<T> pop_locked() {
            if (state_->pending.empty()) return std::nullopt;
            T value = std::move(state_->pending.front());
            state_->pending.pop_front();
            return value;
        }

        std::shared_ptr<State> state_;
    };
};
