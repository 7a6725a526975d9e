#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>

namespace Config {
    constexpr const char* VERSION = "0.1.0";

    // Transfer defaults, overridable from config.json and the command line
    constexpr int64_t DEFAULT_PIECE_SIZE = 4 * 1024 * 1024; // 4 MiB
    constexpr int DEFAULT_CONCURRENCY = 4;
    constexpr int MAX_CONCURRENCY = 256;
    constexpr int DEFAULT_TIMEOUT_SECONDS = 15;
    constexpr const char* DEFAULT_USER_AGENT = "zdm/0.1.0";

    // Upper bound on transfer record rewrites during one piece fetch
    constexpr int RECORD_SAVES_PER_RUN = 64;

    // Output name when the url has no usable last path segment
    constexpr const char* FALLBACK_FILENAME = "download.bin";

    // User configuration location, below $XDG_CONFIG_HOME or ~/.config
    constexpr const char* CONFIG_DIRECTORY = "zdm";
    constexpr const char* CONFIG_FILENAME = "config.json";
}

#endif // CONFIG_HPP
