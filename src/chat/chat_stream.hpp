#pragma once

/**
 * Handle to a streaming call running on a background thread.
 *
 * The producer function runs on its own thread and writes events into an
 * EventChannel; the owner reads them with next(). Cancelling, or destroying
 * the handle, tells the producer to stop (its cancel check turns true,
 * which aborts the HTTP transfer) and waits for the thread to finish.
 */

#include "event_channel.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <thread>

namespace mllm::chat {

class ChatStream {
public:
    using Producer = std::function<void(const EventCallback& emit, const CancelCallback& cancel_check)>;

    // Starts the producer on a new thread.
    explicit ChatStream(Producer producer);

    // Cancels and joins.
    ~ChatStream();

    ChatStream(const ChatStream&) = delete;
    ChatStream& operator=(const ChatStream&) = delete;

    // Blocks for the next event; nullopt when the stream has ended.
    std::optional<StreamEvent> next();

    // Waits up to timeout for the next event.
    EventChannel::ReceiveStatus next_for(StreamEvent& out, std::chrono::milliseconds timeout);

    void cancel();

    bool is_cancelled() const { return channel_.is_cancelled(); }

private:
    EventChannel channel_;
    std::thread worker_;
};

} // namespace mllm::chat
