#include "CurlTransport.hpp"
#include "../core/Errors.hpp"
#include "../utils/NetworkUtils.hpp"
#include <curl/curl.h>
#include <exception>
#include <stdexcept>

namespace {

enum class BodyMode {
    Discard,
    Range,
    Stream
};

struct TransferContext {
    CURL* curl = nullptr;
    HttpResponse* response = nullptr;
    BodyMode mode = BodyMode::Discard;
    int64_t body_limit = 0;
    const BodySink* sink = nullptr;
    bool stopped = false; // write callback refused the body on purpose
    std::exception_ptr sink_error;
};

}

CurlTransport::CurlTransport(long timeout_ms, const std::string& user_agent)
    : timeout_ms(timeout_ms), user_agent(user_agent) {}

void CurlTransport::global_init() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        throw std::runtime_error("curl_global_init() failed: " + std::string(curl_easy_strerror(res)));
    }
}

void CurlTransport::global_cleanup() {
    curl_global_cleanup();
}

long CurlTransport::stall_seconds(long timeout_ms) {
    long seconds = (timeout_ms + 999) / 1000;
    return seconds < 1 ? 1 : seconds;
}

HttpResponse CurlTransport::head(const std::string& url) {
    HttpResponse response;
    CURL* curl = open_handle(url);
    TransferContext ctx;
    ctx.curl = curl;
    ctx.response = &response;

    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    perform(curl, url, &ctx, response);
    return response;
}

HttpResponse CurlTransport::get_range(const std::string& url, int64_t offset, int64_t length) {
    HttpResponse response;
    CURL* curl = open_handle(url);
    TransferContext ctx;
    ctx.curl = curl;
    ctx.response = &response;
    ctx.mode = BodyMode::Range;
    ctx.body_limit = length;
    response.body.reserve(static_cast<size_t>(length));

    std::string range = std::to_string(offset) + "-" + std::to_string(offset + length - 1);
    curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    perform(curl, url, &ctx, response);
    return response;
}

HttpResponse CurlTransport::get_stream(const std::string& url, const BodySink& sink) {
    HttpResponse response;
    CURL* curl = open_handle(url);
    TransferContext ctx;
    ctx.curl = curl;
    ctx.response = &response;
    ctx.mode = BodyMode::Stream;
    ctx.sink = &sink;

    perform(curl, url, &ctx, response);
    if (ctx.sink_error) {
        std::rethrow_exception(ctx.sink_error);
    }
    return response;
}

CURL* CurlTransport::open_handle(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw TransportError("Failed to initialize CURL");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // The timeout bounds connecting and each stall, never the whole body
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stall_seconds(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    return curl;
}

void CurlTransport::perform(CURL* curl, const std::string& url, void* context, HttpResponse& response) const {
    TransferContext* ctx = static_cast<TransferContext*>(context);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, ctx);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && ctx->stopped)) {
        throw TransportError("Request to " + url + " failed: " + std::string(curl_easy_strerror(res)));
    }
    response.status = status;
}

size_t CurlTransport::write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    TransferContext* ctx = static_cast<TransferContext*>(userp);

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    ctx->response->status = status;

    switch (ctx->mode) {
        case BodyMode::Discard:
            return total_size;

        case BodyMode::Range:
            if (status != 206) {
                ctx->stopped = true;
                return 0;
            }
            ctx->response->body.insert(ctx->response->body.end(),
                                       reinterpret_cast<uint8_t*>(contents),
                                       reinterpret_cast<uint8_t*>(contents) + total_size);
            // Server ignored the requested span; keep what arrived so the caller sees the overrun
            if (static_cast<int64_t>(ctx->response->body.size()) > ctx->body_limit) {
                ctx->stopped = true;
                return 0;
            }
            return total_size;

        case BodyMode::Stream:
            if (status < 200 || status >= 300) {
                ctx->stopped = true;
                return 0;
            }
            try {
                (*ctx->sink)(reinterpret_cast<const uint8_t*>(contents), total_size);
            } catch (...) {
                ctx->sink_error = std::current_exception();
                ctx->stopped = true;
                return 0;
            }
            return total_size;
    }
    return 0;
}

size_t CurlTransport::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total_size = size * nitems;
    TransferContext* ctx = static_cast<TransferContext*>(userp);
    std::string line(buffer, total_size);

    // Each hop of a redirect chain starts with a new status line
    if (line.compare(0, 5, "HTTP/") == 0) {
        ctx->response->headers.clear();
        return total_size;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return total_size;
    }
    std::string name = NetworkUtils::to_lower(NetworkUtils::trim(line.substr(0, colon)));
    std::string value = NetworkUtils::trim(line.substr(colon + 1));
    ctx->response->headers[name] = value;
    return total_size;
}
