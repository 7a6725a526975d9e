#include "FileUtils.hpp"
#include "../core/Errors.hpp"
#include <sys/stat.h>
#include <cerrno>

std::string FileUtils::parent_directory(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

void FileUtils::make_directories(const std::string& dir) {
    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = dir.find('/', pos + 1);
        partial = dir.substr(0, pos);
        if (partial.empty()) continue;
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            throw StorageError("Failed to create directory", partial, errno);
        }
    }
}

void FileUtils::make_parent_directories(const std::string& path) {
    std::string dir = parent_directory(path);
    if (dir != "." && dir != "/") {
        make_directories(dir);
    }
}
