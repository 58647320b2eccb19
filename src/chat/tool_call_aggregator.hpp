#pragma once

/**
 * Reassembles streamed tool calls.
 *
 * The API splits each tool call across many chunks: the id and function
 * name usually come first, then the argument JSON in arbitrary fragments.
 * Fragments are keyed by the index the protocol assigns, never by id, since
 * the id is not guaranteed to arrive first.
 *
 * An aggregator lives for exactly one streaming call.
 */

#include "sse_parser.hpp"
#include "types.hpp"
#include <map>
#include <set>
#include <string>

namespace mllm::chat {

constexpr const char* NO_TOOL_CALLS_MESSAGE =
    "Received tool_calls finish but no tool calls were accumulated";
constexpr const char* INCOMPLETE_TOOL_CALLS_MESSAGE =
    "One or more tool calls in the stream were incomplete";

class ToolCallAggregator {
public:
    // Records one delta.tool_calls entry. Ids and names overwrite earlier
    // values when non-empty; argument fragments are appended in order.
    void accept(const ToolCallDelta& delta);

    /**
     * Emits the finished tool calls in ascending index order.
     *
     * With nothing recorded, emits a single Error. Indices missing an id or
     * a name are skipped, and one Error follows the complete calls.
     * The aggregator is empty afterwards.
     */
    void finalize(const EventCallback& emit);

    // Drops all recorded state.
    void clear();

    bool empty() const { return indices_.empty(); }

private:
    std::set<int> indices_;
    std::map<int, std::string> ids_;
    std::map<int, std::string> names_;
    std::map<int, std::string> arguments_;
};

} // namespace mllm::chat
