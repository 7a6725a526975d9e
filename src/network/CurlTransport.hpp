#pragma once
#include "HttpTransport.hpp"
#include <string>

typedef void CURL;

class CurlTransport : public HttpTransport {
private:
    long timeout_ms;
    std::string user_agent;

    static size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);

    CURL* open_handle(const std::string& url) const;
    void perform(CURL* curl, const std::string& url, void* context, HttpResponse& response) const;

public:
    CurlTransport(long timeout_ms, const std::string& user_agent);

    HttpResponse head(const std::string& url) override;
    HttpResponse get_range(const std::string& url, int64_t offset, int64_t length) override;
    HttpResponse get_stream(const std::string& url, const BodySink& sink) override;

    // Process-wide libcurl setup; call once from main before any thread starts.
    static void global_init();
    static void global_cleanup();

    // Seconds without a single received byte before a transfer is abandoned.
    static long stall_seconds(long timeout_ms);
};
