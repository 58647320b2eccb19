#pragma once

/**
 * HTTP transport abstraction.
 *
 * The chat client and the search providers talk HTTP only through ITransport,
 * which keeps libcurl in one place and lets tests script responses and
 * stream lines without a network.
 */

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mllm::transport {

/**
 * Broad class of a failed transfer, used to pick a user-facing message.
 */
enum class TransportFailure {
    Timeout,
    Dns,
    TlsHandshake,
    Tls,
    ConnectionRefused,
    Io,
    Unknown
};

/**
 * Thrown when a request could not be completed at the transport level
 * (no HTTP status was obtained, or the connection broke mid-body).
 */
class TransportError : public std::runtime_error {
public:
    TransportError(TransportFailure kind, const std::string& detail, const std::string& type_name = "")
        : std::runtime_error(detail), kind_(kind), type_name_(type_name) {}

    TransportFailure kind() const { return kind_; }

    // Name of the underlying error code (e.g. "CURLE_SEND_ERROR"), may be empty.
    const std::string& type_name() const { return type_name_; }

private:
    TransportFailure kind_;
    std::string type_name_;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    long connect_timeout_seconds = 30;
    long read_timeout_seconds = 60;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Outcome of a streaming request.
 *
 * For a non-2xx status the full body is in error_body and no line was
 * delivered. cancelled is set when the cancel check aborted the transfer.
 */
struct StreamOutcome {
    long status = 0;
    std::string error_body;
    bool cancelled = false;

    bool ok() const { return status >= 200 && status < 300; }
};

// Receives one response line without its terminator. Return false to stop
// reading and close the connection.
using LineCallback = std::function<bool(const std::string&)>;

// Returns true when the transfer in progress should be aborted.
using CancelCallback = std::function<bool()>;

class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * Performs a request and buffers the whole response body.
     * Throws TransportError on failure.
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;

    /**
     * Performs a request and delivers the body line by line as it arrives.
     * Throws TransportError on failure other than cancellation or an
     * on_line stop.
     */
    virtual StreamOutcome stream_lines(const HttpRequest& request,
                                       LineCallback on_line,
                                       CancelCallback cancel_check = nullptr) = 0;

    /**
     * Percent-encodes a string for use in a URL query component.
     */
    virtual std::string url_encode(const std::string& value) = 0;
};

} // namespace mllm::transport
