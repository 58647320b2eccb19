#pragma once

/**
 * Turns the lines of one chat-completions stream into StreamEvents.
 *
 * Content and reasoning deltas are forwarded as soon as their chunk is
 * decoded, on separate event types. Tool-call deltas go to a per-stream
 * ToolCallAggregator. The first finish_reason, the [DONE] sentinel or the
 * end of the body finishes the stream.
 */

#include "sse_parser.hpp"
#include "tool_call_aggregator.hpp"
#include "types.hpp"
#include <string>

namespace mllm::chat {

class DeltaAccumulator {
public:
    explicit DeltaAccumulator(EventCallback emit);

    /**
     * Processes one raw line. Returns false once the stream is finished and
     * no further lines should be read.
     */
    bool on_line(const std::string& line);

    // Applies one decoded chunk. Returns false once the stream is finished.
    bool on_chunk(const ChatChunk& chunk);

    bool finished() const { return finished_; }

    // Number of data lines skipped because their JSON did not parse.
    size_t malformed_lines() const { return malformed_lines_; }

private:
    EventCallback emit_;
    ToolCallAggregator tool_calls_;
    bool finished_ = false;
    size_t malformed_lines_ = 0;

    void finish_with_done();
};

} // namespace mllm::chat
