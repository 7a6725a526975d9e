#include "CapabilityProber.hpp"
#include "../core/Errors.hpp"
#include <iostream>

std::string MirrorProbe::to_string() const {
    if (!reachable) {
        return url + ": unavailable (" + error + ")";
    }
    return url + ": " + std::to_string(size) + " bytes, ranges " +
           (supports_range ? "supported" : "not supported");
}

std::vector<std::string> ProbeReport::ranged_mirrors() const {
    std::vector<std::string> urls;
    for (const auto& mirror : mirrors) {
        if (mirror.reachable && mirror.supports_range) {
            urls.push_back(mirror.url);
        }
    }
    return urls;
}

std::vector<std::string> ProbeReport::reachable_mirrors() const {
    std::vector<std::string> urls;
    for (const auto& mirror : mirrors) {
        if (mirror.reachable) {
            urls.push_back(mirror.url);
        }
    }
    return urls;
}

CapabilityProber::CapabilityProber(HttpTransport& transport) : transport(transport) {}

MirrorProbe CapabilityProber::probe(const std::string& url) {
    MirrorProbe result;
    result.url = url;

    // HEAD first; some servers reject it, so an error here only loses the size hint
    bool head_ok = false;
    try {
        HttpResponse head = transport.head(url);
        if (head.status < 400) {
            head_ok = true;
            result.size = head.content_length();
        } else {
            result.error = "HEAD returned HTTP " + std::to_string(head.status);
        }
    } catch (const TransportError& e) {
        result.error = e.what();
    }

    // Ask for one byte; only a 206 proves the server honours ranges
    try {
        HttpResponse range = transport.get_range(url, 0, 1);
        if (range.status == 206) {
            result.supports_range = true;
            int64_t total = range.content_range_total();
            if (total >= 0) {
                result.size = total;
            }
        } else if (range.is_success()) {
            if (result.size < 0) {
                result.size = range.content_length();
            }
        } else if (!head_ok) {
            result.error = "server returned HTTP " + std::to_string(range.status);
            return result;
        }
    } catch (const TransportError& e) {
        if (!head_ok) {
            result.error = e.what();
            return result;
        }
    }

    if (result.size < 0) {
        result.error = "server did not report the file size";
        return result;
    }

    result.reachable = true;
    result.error.clear();
    return result;
}

ProbeReport CapabilityProber::probe_all(const std::vector<std::string>& mirrors) {
    ProbeReport report;
    const MirrorProbe* reference = nullptr;

    for (const auto& url : mirrors) {
        report.mirrors.push_back(probe(url));
    }

    std::string failures;
    for (const auto& mirror : report.mirrors) {
        if (!mirror.reachable) {
            std::cerr << "Mirror " << mirror.to_string() << std::endl;
            failures += "\n  " + mirror.to_string();
            continue;
        }
        std::cout << "Mirror " << mirror.to_string() << std::endl;

        if (!reference) {
            reference = &mirror;
        } else if (mirror.size != reference->size) {
            throw InconsistentMirrorError(reference->url, reference->size, mirror.url, mirror.size);
        }
        if (mirror.supports_range) {
            report.supports_range = true;
        }
    }

    if (!reference) {
        throw SourceUnavailableError("No mirror could be probed:" + failures);
    }
    report.size = reference->size;
    return report;
}
