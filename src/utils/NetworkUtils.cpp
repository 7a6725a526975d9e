#include "NetworkUtils.hpp"
#include <sstream>
#include <cctype>

std::string NetworkUtils::url_decode(const std::string& encoded) {
    std::string result;
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size() &&
            isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
            isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
            std::string hex = encoded.substr(i + 1, 2);
            char ch = static_cast<char>(std::stoi(hex, nullptr, 16));
            result.push_back(ch);
            i += 2;
        } else if (encoded[i] == '+') {
            result.push_back(' ');
        } else {
            result.push_back(encoded[i]);
        }
    }
    return result;
}

bool NetworkUtils::is_http_url(const std::string& url) {
    std::string lower = to_lower(url);
    size_t prefix = 0;
    if (lower.compare(0, 7, "http://") == 0) {
        prefix = 7;
    } else if (lower.compare(0, 8, "https://") == 0) {
        prefix = 8;
    } else {
        return false;
    }
    return url.size() > prefix && url[prefix] != '/';
}

std::string NetworkUtils::filename_from_url(const std::string& url) {
    size_t start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;

    size_t end = url.find_first_of("?#", start);
    std::string rest = url.substr(start, end == std::string::npos ? std::string::npos : end - start);

    size_t path_start = rest.find('/');
    if (path_start == std::string::npos) {
        return "";
    }
    std::string path = rest.substr(path_start);
    size_t last_slash = path.find_last_of('/');
    std::string name = url_decode(path.substr(last_slash + 1));

    // A decoded name must not escape the working directory
    if (name == "." || name == ".." || name.find('/') != std::string::npos) {
        return "";
    }
    return name;
}

std::vector<std::string> NetworkUtils::split_list(const std::string& value, char separator) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string token;
    while (std::getline(stream, token, separator)) {
        token = trim(token);
        if (!token.empty()) {
            items.push_back(token);
        }
    }
    return items;
}

std::string NetworkUtils::trim(const std::string& value) {
    size_t first = 0;
    while (first < value.size() && isspace(static_cast<unsigned char>(value[first]))) ++first;
    size_t last = value.size();
    while (last > first && isspace(static_cast<unsigned char>(value[last - 1]))) --last;
    return value.substr(first, last - first);
}

std::string NetworkUtils::to_lower(const std::string& value) {
    std::string lower = value;
    for (char& c : lower) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}
