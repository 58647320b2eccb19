#include "tool_call_aggregator.hpp"
#include "../verbose.hpp"

namespace mllm::chat {

void ToolCallAggregator::accept(const ToolCallDelta& delta) {
    indices_.insert(delta.index);

    if (delta.id && !delta.id->empty()) {
        ids_[delta.index] = *delta.id;
    }
    if (delta.name && !delta.name->empty()) {
        names_[delta.index] = *delta.name;
    }
    if (delta.arguments && !delta.arguments->empty()) {
        arguments_[delta.index] += *delta.arguments;
    }
}

void ToolCallAggregator::finalize(const EventCallback& emit) {
    if (indices_.empty()) {
        verbose_err("SSE", "finish_reason=tool_calls without any tool call deltas");
        emit(events::Error{NO_TOOL_CALLS_MESSAGE, std::nullopt});
        return;
    }

    bool incomplete = false;
    for (int index : indices_) {
        auto id = ids_.find(index);
        auto name = names_.find(index);
        if (id == ids_.end() || name == names_.end()) {
            verbose_err("SSE", "Tool call at index " + std::to_string(index) + " is missing its id or name");
            incomplete = true;
            continue;
        }

        auto args = arguments_.find(index);
        std::string arguments = (args == arguments_.end() || args->second.empty()) ? "{}" : args->second;

        verbose_log("SSE", "Tool call ready: " + name->second + " (id: " + id->second + ") args: " + arguments);
        emit(events::ToolCallRequested{id->second, name->second, arguments});
    }

    if (incomplete) {
        emit(events::Error{INCOMPLETE_TOOL_CALLS_MESSAGE, std::nullopt});
    }

    clear();
}

void ToolCallAggregator::clear() {
    indices_.clear();
    ids_.clear();
    names_.clear();
    arguments_.clear();
}

} // namespace mllm::chat
