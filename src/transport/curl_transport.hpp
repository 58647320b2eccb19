#pragma once

/**
 * libcurl implementation of ITransport.
 */

#include "transport.hpp"
#include <curl/curl.h>

namespace mllm::transport {

class CurlTransport : public ITransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse send(const HttpRequest& request) override;

    StreamOutcome stream_lines(const HttpRequest& request,
                               LineCallback on_line,
                               CancelCallback cancel_check = nullptr) override;

    std::string url_encode(const std::string& value) override;

    // Maps a libcurl result code to a transport failure class.
    static TransportFailure classify_curl_code(CURLcode code);

private:
    // Applies URL, method, headers, body and timeouts to a fresh handle.
    // Returns the header list, which the caller must free.
    curl_slist* prepare(CURL* curl, const HttpRequest& request);
};

} // namespace mllm::transport
