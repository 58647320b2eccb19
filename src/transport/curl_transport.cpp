#include "curl_transport.hpp"
#include "../verbose.hpp"

namespace mllm::transport {

// CURL write callback for collecting response data into a string.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

// State shared with the streaming callbacks for one transfer.
struct StreamContext {
    CURL* curl = nullptr;
    LineCallback on_line;
    CancelCallback cancel_check;
    std::string buffer;         // Partial line not yet terminated.
    long status = 0;            // HTTP status, read on the first body bytes.
    std::string error_body;     // Full body of a non-2xx response.
    bool cancelled = false;
    bool stopped = false;       // on_line asked to stop reading.
};

static bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

static void strip_carriage_return(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

// CURL progress callback for cancellation support.
// Returns non-zero to abort the transfer.
static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->cancel_check && ctx->cancel_check()) {
        ctx->cancelled = true;
        return 1;
    }
    return 0;
}

// CURL write callback for line streaming. Splits the body on '\n' and hands
// each complete line to the context callback. Returning a short count aborts
// the transfer, which is how both cancellation and an early stop close the
// connection.
static size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    size_t total_size = size * nmemb;

    if (ctx->status == 0) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
    }

    if (!is_success_status(ctx->status)) {
        ctx->error_body.append(ptr, total_size);
        return total_size;
    }

    if (ctx->cancel_check && ctx->cancel_check()) {
        ctx->cancelled = true;
        return 0;
    }

    ctx->buffer.append(ptr, total_size);

    size_t pos;
    while ((pos = ctx->buffer.find('\n')) != std::string::npos) {
        std::string line = ctx->buffer.substr(0, pos);
        ctx->buffer.erase(0, pos + 1);
        strip_carriage_return(line);

        if (!ctx->on_line(line)) {
            ctx->stopped = true;
            ctx->buffer.clear();
            return 0;
        }
    }

    return total_size;
}

static std::string curl_code_name(CURLcode code) {
    return "CURLcode " + std::to_string(static_cast<int>(code));
}

CurlTransport::CurlTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

TransportFailure CurlTransport::classify_curl_code(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportFailure::Timeout;

        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportFailure::Dns;

        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            return TransportFailure::TlsHandshake;

        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_SETFAILED:
        case CURLE_SSL_ENGINE_INITFAILED:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_SHUTDOWN_FAILED:
        case CURLE_SSL_CRL_BADFILE:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
        case CURLE_SSL_INVALIDCERTSTATUS:
        case CURLE_USE_SSL_FAILED:
            return TransportFailure::Tls;

        case CURLE_COULDNT_CONNECT:
            return TransportFailure::ConnectionRefused;

        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_READ_ERROR:
        case CURLE_WRITE_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return TransportFailure::Io;

        default:
            return TransportFailure::Unknown;
    }
}

curl_slist* CurlTransport::prepare(CURL* curl, const HttpRequest& request) {
    curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        headers = curl_slist_append(headers, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.connect_timeout_seconds);

    // A transfer that stalls below 1 byte/s for the read timeout fails with
    // CURLE_OPERATION_TIMEDOUT.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, request.read_timeout_seconds);

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    return headers;
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    verbose_out("CURL", request.method + " " + request.url);
    if (!request.body.empty()) {
        verbose_out("CURL", "Body: " + format_json_compact(request.body));
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("CURL", "Failed to initialize CURL");
        throw TransportError(TransportFailure::Unknown, "Failed to initialize CURL", "CURL");
    }

    HttpResponse response;
    curl_slist* headers = prepare(curl, request);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        verbose_err("CURL", request.method + " failed: " + curl_easy_strerror(res));
        throw TransportError(classify_curl_code(res), curl_easy_strerror(res), curl_code_name(res));
    }

    verbose_in("CURL", "HTTP " + std::to_string(response.status) + " - " + truncate(response.body, 500));
    return response;
}

StreamOutcome CurlTransport::stream_lines(const HttpRequest& request,
                                          LineCallback on_line,
                                          CancelCallback cancel_check) {
    verbose_out("CURL", request.method + " (stream) " + request.url);
    verbose_out("CURL", "Body: " + format_json_compact(request.body, 1000));

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("CURL", "Failed to initialize CURL");
        throw TransportError(TransportFailure::Unknown, "Failed to initialize CURL", "CURL");
    }

    StreamContext ctx;
    ctx.curl = curl;
    ctx.on_line = std::move(on_line);
    ctx.cancel_check = std::move(cancel_check);

    curl_slist* headers = prepare(curl, request);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    if (ctx.cancel_check) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    }

    verbose_log("CURL", "Starting streaming request...");
    CURLcode res = curl_easy_perform(curl);

    if (ctx.status == 0) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &ctx.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    StreamOutcome outcome;
    outcome.status = ctx.status;

    if (ctx.cancelled || res == CURLE_ABORTED_BY_CALLBACK) {
        verbose_log("CURL", "Stream cancelled");
        outcome.cancelled = true;
        return outcome;
    }

    if (res == CURLE_WRITE_ERROR && ctx.stopped) {
        verbose_log("CURL", "Stream closed by reader");
        return outcome;
    }

    if (res != CURLE_OK) {
        verbose_err("CURL", std::string("Streaming request failed: ") + curl_easy_strerror(res));
        throw TransportError(classify_curl_code(res), curl_easy_strerror(res), curl_code_name(res));
    }

    if (!outcome.ok()) {
        outcome.error_body = std::move(ctx.error_body);
        verbose_in("CURL", "HTTP " + std::to_string(outcome.status) + " - " + truncate(outcome.error_body, 500));
        return outcome;
    }

    // Final line without a terminator.
    if (!ctx.stopped && !ctx.buffer.empty()) {
        strip_carriage_return(ctx.buffer);
        ctx.on_line(ctx.buffer);
    }

    verbose_in("CURL", "Stream complete, HTTP " + std::to_string(outcome.status));
    return outcome;
}

std::string CurlTransport::url_encode(const std::string& value) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError(TransportFailure::Unknown, "Failed to initialize CURL", "CURL");
    }

    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    std::string result = escaped ? escaped : "";
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

} // namespace mllm::transport
