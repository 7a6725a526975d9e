#pragma once
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers; // names lowercased
    std::vector<uint8_t> body;

    bool is_success() const;
    bool has_header(const std::string& name) const;
    std::string get_header(const std::string& name) const;
    // -1 when absent or malformed
    int64_t content_length() const;
    // Total size from "Content-Range: bytes a-b/total"; -1 when absent, malformed or "*"
    int64_t content_range_total() const;
};

typedef std::function<void(const uint8_t* data, size_t size)> BodySink;

// The only way the engine talks to the network. Implementations throw
// TransportError for connection failures and timeouts; HTTP error statuses are
// returned, not thrown.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse head(const std::string& url) = 0;

    // Asks for bytes [offset, offset + length). Only a 206 answer carries a
    // body; any other status comes back with the body dropped.
    virtual HttpResponse get_range(const std::string& url, int64_t offset, int64_t length) = 0;

    // Plain GET; a 2xx body is delivered to sink chunk by chunk, in order.
    virtual HttpResponse get_stream(const std::string& url, const BodySink& sink) = 0;
};
