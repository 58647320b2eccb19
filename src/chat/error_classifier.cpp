#include "error_classifier.hpp"

namespace mllm::chat {

using json = nlohmann::json;
using transport::TransportError;
using transport::TransportFailure;

static std::string unknown_error_message(const std::string& detail, const std::string& type_name) {
    if (detail.find_first_not_of(" \t\r\n") == std::string::npos) {
        return "Unexpected error (" + type_name + "). Please try again.";
    }
    return "Error: " + detail;
}

std::string describe_transport_error(const TransportError& error) {
    std::string detail = error.what();

    switch (error.kind()) {
        case TransportFailure::Timeout:
            return "Connection timed out. Please check your internet connection and try again.";
        case TransportFailure::Dns:
            return "Cannot resolve server address. Please check your Base URL and internet connection.";
        case TransportFailure::TlsHandshake:
            return "SSL/TLS handshake failed. The server's certificate may be invalid or untrusted.";
        case TransportFailure::Tls:
            return "SSL/TLS error: " + (detail.empty() ? std::string("Secure connection failed") : detail);
        case TransportFailure::ConnectionRefused:
            return "Connection refused. Please verify the server address and port.";
        case TransportFailure::Io:
            return "Network error: " + (detail.empty() ? std::string("Connection failed") : detail);
        case TransportFailure::Unknown:
            break;
    }

    return unknown_error_message(detail,
                                 error.type_name().empty() ? "TransportError" : error.type_name());
}

std::string describe_exception(const std::exception& error) {
    if (const auto* transport_error = dynamic_cast<const TransportError*>(&error)) {
        return describe_transport_error(*transport_error);
    }
    if (dynamic_cast<const json::exception*>(&error)) {
        return unknown_error_message(error.what(), "json::exception");
    }
    return unknown_error_message(error.what(), "std::exception");
}

std::optional<std::string> extract_error_message(const std::string& body) {
    try {
        json j = json::parse(body);
        if (j.is_object() && j.contains("error") && j["error"].is_object()) {
            const auto& err = j["error"];
            if (err.contains("message") && err["message"].is_string()) {
                return err["message"].get<std::string>();
            }
        }
    } catch (const json::exception&) {
        // Not JSON; the caller falls back to the status code.
    }
    return std::nullopt;
}

ApiError classify_http_status(long status, const std::string& body, Endpoint endpoint) {
    int code = static_cast<int>(status);

    switch (status) {
        case 401:
            return {"Authentication failed. Please check your API key.", code};
        case 404:
            if (endpoint == Endpoint::Models) {
                return {"Models endpoint not found.", code};
            }
            return {"Model not found or invalid endpoint.", code};
        case 429:
            return {"Rate limit exceeded. Please try again later.", code};
        default:
            break;
    }

    if (auto message = extract_error_message(body)) {
        return {*message, code};
    }
    return {"API error: " + std::to_string(code), code};
}

} // namespace mllm::chat
