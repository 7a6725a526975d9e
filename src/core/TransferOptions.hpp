#pragma once
#include <string>
#include <vector>
#include <cstdint>

struct TransferOptions {
    std::vector<std::string> mirrors; // priority order
    std::string destination;
    int64_t piece_size;
    int concurrency;
    long timeout_ms;
    std::string user_agent;

    TransferOptions();

    // Throws ConfigurationError naming the first invalid field.
    void validate() const;
};
