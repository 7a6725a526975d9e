#include "SequentialDownloader.hpp"
#include "../core/Errors.hpp"
#include "../storage/DestinationFile.hpp"
#include "../utils/CryptoUtils.hpp"
#include <iostream>

SequentialDownloader::SequentialDownloader(HttpTransport& transport, const std::atomic<bool>& cancel_requested)
    : transport(transport), cancel_requested(cancel_requested) {}

bool SequentialDownloader::sequential_download(const std::string& mirror, const std::string& destination,
                                               int64_t expected_size, SequentialResult& result,
                                               std::string& reason) {
    DestinationFile file(destination);
    file.resize(0);

    Sha256Stream digest;
    int64_t offset = 0;
    BodySink sink = [&](const uint8_t* data, size_t size) {
        if (cancel_requested) {
            throw TransferCancelled("Transfer cancelled after streaming " + std::to_string(offset) + " bytes from " +
                                    mirror);
        }
        file.write_at(offset, data, size);
        digest.update(data, size);
        offset += static_cast<int64_t>(size);
    };

    HttpResponse response;
    try {
        response = transport.get_stream(mirror, sink);
    } catch (const TransportError& e) {
        reason = e.what();
        return false;
    }

    if (!response.is_success()) {
        reason = "HTTP " + std::to_string(response.status);
        return false;
    }
    if (expected_size >= 0 && offset != expected_size) {
        reason = "stream ended after " + std::to_string(offset) + " of " + std::to_string(expected_size) + " bytes";
        return false;
    }

    file.sync();
    file.close();

    result.mirror = mirror;
    result.bytes_written = offset;
    result.sha256 = digest.finish_hex();
    return true;
}

SequentialResult SequentialDownloader::download(const std::vector<std::string>& mirrors,
                                                const std::string& destination, int64_t expected_size) {
    std::string failures;
    for (const auto& mirror : mirrors) {
        if (cancel_requested) {
            throw TransferCancelled("Transfer cancelled before streaming from " + mirror);
        }
        std::cout << "Streaming " << mirror << " (no range support)" << std::endl;

        SequentialResult result;
        std::string reason;
        if (sequential_download(mirror, destination, expected_size, result, reason)) {
            std::cout << "Streamed " << result.bytes_written << " bytes, sha256 " << result.sha256 << std::endl;
            return result;
        }
        std::cerr << "Sequential download from " << mirror << " failed: " << reason << std::endl;
        failures += "\n  " + mirror + ": " + reason;
    }
    throw SourceUnavailableError("Sequential download failed on every mirror:" + failures);
}
