#pragma once

/**
 * Single-producer, single-consumer queue of StreamEvents.
 *
 * The producer (a background stream) sends events and closes the channel
 * when it is finished; the consumer drains it in order. Cancelling from the
 * consumer side drops queued events and makes every later send fail, which
 * is how the producer learns it should stop.
 */

#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mllm::chat {

class EventChannel {
public:
    enum class ReceiveStatus {
        Event,
        Timeout,
        Closed
    };

    // Queues an event. Returns false if the channel was closed or cancelled.
    bool send(StreamEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || cancelled_) {
                return false;
            }
            queue_.push_back(std::move(event));
        }
        ready_.notify_one();
        return true;
    }

    // Blocks for the next event. Returns nullopt once closed and drained.
    std::optional<StreamEvent> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !queue_.empty() || closed_ || cancelled_; });
        return pop_locked();
    }

    // Waits up to timeout for the next event.
    ReceiveStatus receive_for(StreamEvent& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool woke = ready_.wait_for(lock, timeout, [this] {
            return !queue_.empty() || closed_ || cancelled_;
        });
        if (!woke) {
            return ReceiveStatus::Timeout;
        }
        auto event = pop_locked();
        if (!event) {
            return ReceiveStatus::Closed;
        }
        out = std::move(*event);
        return ReceiveStatus::Event;
    }

    // Producer side: no more events. Queued events stay readable.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    // Consumer side: stop listening. Queued events are dropped.
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
            queue_.clear();
        }
        ready_.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<StreamEvent> queue_;
    bool closed_ = false;
    bool cancelled_ = false;

    std::optional<StreamEvent> pop_locked() {
        if (cancelled_ || queue_.empty()) {
            return std::nullopt;
        }
        StreamEvent event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }
};

} // namespace mllm::chat
