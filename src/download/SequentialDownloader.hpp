#pragma once
#include "../network/HttpTransport.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <cstdint>

struct SequentialResult {
    std::string mirror;
    int64_t bytes_written = 0;
    std::string sha256; // whole-file digest, informational only
};

// Single-stream download for servers without range support. Every attempt
// starts from byte zero; nothing is persisted for resume.
class SequentialDownloader {
private:
    HttpTransport& transport;
    const std::atomic<bool>& cancel_requested;

public:
    SequentialDownloader(HttpTransport& transport, const std::atomic<bool>& cancel_requested);

    // One mirror. Returns false (with a reason) when the mirror fails; throws
    // StorageError, or TransferCancelled between body chunks.
    bool sequential_download(const std::string& mirror, const std::string& destination,
                             int64_t expected_size, SequentialResult& result, std::string& reason);

    // Tries each mirror in order from the start. Throws SourceUnavailableError when none succeeds.
    SequentialResult download(const std::vector<std::string>& mirrors, const std::string& destination,
                              int64_t expected_size);
};
