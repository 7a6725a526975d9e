#pragma once
#include <string>

class FileUtils {
public:
    // Directory part of a path: "." for a bare name, "/" for a root entry.
    static std::string parent_directory(const std::string& path);
    // mkdir -p. Throws StorageError.
    static void make_directories(const std::string& dir);
    static void make_parent_directories(const std::string& path);
};
