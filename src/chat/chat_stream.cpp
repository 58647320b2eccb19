#include "chat_stream.hpp"
#include "error_classifier.hpp"
#include "../verbose.hpp"

namespace mllm::chat {

ChatStream::ChatStream(Producer producer) {
    worker_ = std::thread([this, producer = std::move(producer)]() {
        EventCallback emit = [this](const StreamEvent& event) {
            channel_.send(event);
        };
        CancelCallback cancel_check = [this]() {
            return channel_.is_cancelled();
        };

        try {
            producer(emit, cancel_check);
        } catch (const std::exception& e) {
            verbose_err("STREAM", std::string("Producer failed: ") + e.what());
            channel_.send(events::Error{describe_exception(e), std::nullopt});
        }

        channel_.close();
    });
}

ChatStream::~ChatStream() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<StreamEvent> ChatStream::next() {
    return channel_.receive();
}

EventChannel::ReceiveStatus ChatStream::next_for(StreamEvent& out, std::chrono::milliseconds timeout) {
    return channel_.receive_for(out, timeout);
}

void ChatStream::cancel() {
    if (!channel_.is_cancelled()) {
        verbose_log("STREAM", "Cancelling stream");
    }
    channel_.cancel();
}

} // namespace mllm::chat
