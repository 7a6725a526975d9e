#include "HttpTransport.hpp"
#include "../utils/NetworkUtils.hpp"
#include <cctype>
#include <stdexcept>

static bool parse_size(const std::string& text, int64_t& value) {
    std::string trimmed = NetworkUtils::trim(text);
    if (trimmed.empty()) return false;
    for (char c : trimmed) {
        if (!isdigit(static_cast<unsigned char>(c))) return false;
    }
    try {
        value = std::stoll(trimmed);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool HttpResponse::is_success() const {
    return status >= 200 && status < 300;
}

bool HttpResponse::has_header(const std::string& name) const {
    return headers.find(NetworkUtils::to_lower(name)) != headers.end();
}

std::string HttpResponse::get_header(const std::string& name) const {
    auto it = headers.find(NetworkUtils::to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

int64_t HttpResponse::content_length() const {
    int64_t value;
    if (!has_header("content-length") || !parse_size(get_header("content-length"), value)) {
        return -1;
    }
    return value;
}

int64_t HttpResponse::content_range_total() const {
    std::string range = get_header("content-range");
    size_t slash = range.rfind('/');
    if (range.empty() || slash == std::string::npos) {
        return -1;
    }
    int64_t value;
    if (!parse_size(range.substr(slash + 1), value)) {
        return -1;
    }
    return value;
}
