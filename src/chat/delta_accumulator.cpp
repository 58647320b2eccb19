#include "delta_accumulator.hpp"
#include "../verbose.hpp"

namespace mllm::chat {

DeltaAccumulator::DeltaAccumulator(EventCallback emit) : emit_(std::move(emit)) {}

bool DeltaAccumulator::on_line(const std::string& line) {
    if (finished_) {
        return false;
    }

    SseLine parsed = parse_sse_line(line);
    switch (parsed.kind) {
        case SseLineKind::Ignored:
            return true;
        case SseLineKind::Malformed:
            ++malformed_lines_;
            return true;
        case SseLineKind::Done:
            verbose_in("SSE", "[DONE]");
            finish_with_done();
            return false;
        case SseLineKind::Chunk:
            return on_chunk(parsed.chunk);
    }
    return true;
}

bool DeltaAccumulator::on_chunk(const ChatChunk& chunk) {
    if (finished_) {
        return false;
    }

    if (chunk.content && !chunk.content->empty()) {
        emit_(events::Content{*chunk.content});
    }

    if (chunk.reasoning_content && !chunk.reasoning_content->empty()) {
        emit_(events::Reasoning{*chunk.reasoning_content});
    }

    for (const auto& delta : chunk.tool_calls) {
        tool_calls_.accept(delta);
    }

    if (!chunk.finish_reason) {
        return true;
    }

    verbose_in("SSE", "finish_reason=" + *chunk.finish_reason);

    if (*chunk.finish_reason == "tool_calls") {
        finished_ = true;
        tool_calls_.finalize(emit_);
        return false;
    }

    finish_with_done();
    return false;
}

void DeltaAccumulator::finish_with_done() {
    finished_ = true;
    tool_calls_.clear();
    emit_(events::Done{});
}

} // namespace mllm::chat
