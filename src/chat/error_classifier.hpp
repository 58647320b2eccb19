#pragma once

/**
 * Maps transport and protocol failures to user-facing messages.
 */

#include "types.hpp"
#include "../transport/transport.hpp"
#include <exception>
#include <optional>
#include <string>

namespace mllm::chat {

/**
 * Which endpoint a status code came from. Only the 404 wording differs.
 */
enum class Endpoint {
    ChatCompletions,
    Models
};

// Message for a failed transfer, chosen by failure class.
std::string describe_transport_error(const transport::TransportError& error);

// Message for any exception escaping the transport or a search provider.
// TransportError is classified; anything else falls into the unknown class.
std::string describe_exception(const std::exception& error);

// Pulls error.message out of an OpenAI-style error body.
std::optional<std::string> extract_error_message(const std::string& body);

/**
 * Classifies a non-2xx response. 401, 404 and 429 always produce a fixed
 * message; other codes use the body's error message or "API error: {code}".
 */
ApiError classify_http_status(long status, const std::string& body,
                              Endpoint endpoint = Endpoint::ChatCompletions);

} // namespace mllm::chat
