#pragma once
#include "HttpTransport.hpp"
#include <string>
#include <vector>
#include <cstdint>

struct MirrorProbe {
    std::string url;
    bool reachable = false;
    int64_t size = -1;
    bool supports_range = false;
    std::string error;

    std::string to_string() const;
};

struct ProbeReport {
    int64_t size = -1;
    bool supports_range = false;
    std::vector<MirrorProbe> mirrors; // every mirror, in priority order

    std::vector<std::string> ranged_mirrors() const;
    std::vector<std::string> reachable_mirrors() const;
};

class CapabilityProber {
private:
    HttpTransport& transport;

public:
    explicit CapabilityProber(HttpTransport& transport);

    // Never throws for network trouble; failures are reported in the result.
    MirrorProbe probe(const std::string& url);

    // Throws SourceUnavailableError or InconsistentMirrorError.
    ProbeReport probe_all(const std::vector<std::string>& mirrors);
};
