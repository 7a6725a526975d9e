#include "TransferOptions.hpp"
#include "Errors.hpp"
#include "../commands/helpers/Config.hpp"
#include "../utils/NetworkUtils.hpp"

TransferOptions::TransferOptions()
    : piece_size(Config::DEFAULT_PIECE_SIZE),
      concurrency(Config::DEFAULT_CONCURRENCY),
      timeout_ms(Config::DEFAULT_TIMEOUT_SECONDS * 1000L),
      user_agent(Config::DEFAULT_USER_AGENT) {}

void TransferOptions::validate() const {
    if (mirrors.empty()) {
        throw ConfigurationError("At least one URL must be provided");
    }
    for (const auto& url : mirrors) {
        if (!NetworkUtils::is_http_url(url)) {
            throw ConfigurationError("Not an http(s) URL: '" + url + "'");
        }
    }
    if (destination.empty()) {
        throw ConfigurationError("Destination path must not be empty");
    }
    if (piece_size <= 0) {
        throw ConfigurationError("Piece size must be positive, got " + std::to_string(piece_size));
    }
    if (concurrency <= 0 || concurrency > Config::MAX_CONCURRENCY) {
        throw ConfigurationError("Concurrency must be between 1 and " + std::to_string(Config::MAX_CONCURRENCY) +
                                 ", got " + std::to_string(concurrency));
    }
    if (timeout_ms <= 0) {
        throw ConfigurationError("Timeout must be positive, got " + std::to_string(timeout_ms) + " ms");
    }
}
