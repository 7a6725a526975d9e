#pragma once
#include <string>
#include <vector>

class NetworkUtils {
public:
    static std::string url_decode(const std::string& encoded);
    static bool is_http_url(const std::string& url);
    // Last path segment of the url, decoded; empty when the path has none.
    static std::string filename_from_url(const std::string& url);
    static std::vector<std::string> split_list(const std::string& value, char separator);
    static std::string trim(const std::string& value);
    static std::string to_lower(const std::string& value);
};
