#include "DestinationFile.hpp"
#include "../core/Errors.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>

DestinationFile::DestinationFile(const std::string& path) : path(path) {
    fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError("Failed to open output file", path, errno);
    }
}

DestinationFile::~DestinationFile() {
    if (fd >= 0) {
        ::close(fd);
    }
}

int64_t DestinationFile::size() const {
    struct stat st;
    if (fstat(fd, &st) != 0) {
        throw StorageError("Failed to stat", path, errno);
    }
    return static_cast<int64_t>(st.st_size);
}

void DestinationFile::resize(int64_t new_size) {
    if (ftruncate(fd, static_cast<off_t>(new_size)) != 0) {
        throw StorageError("Failed to resize to " + std::to_string(new_size) + " bytes:", path, errno);
    }
}

void DestinationFile::write_at(int64_t offset, const uint8_t* data, size_t length) {
    size_t written = 0;
    while (written < length) {
        ssize_t n = pwrite(fd, data + written, length - written, static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError("Failed to write at offset " + std::to_string(offset + written) + " of", path, errno);
        }
        written += static_cast<size_t>(n);
    }
}

std::vector<uint8_t> DestinationFile::read_at(int64_t offset, size_t length) const {
    std::vector<uint8_t> buffer(length);
    size_t total = 0;
    while (total < length) {
        ssize_t n = pread(fd, buffer.data() + total, length - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError("Failed to read at offset " + std::to_string(offset + total) + " of", path, errno);
        }
        if (n == 0) break; // short file
        total += static_cast<size_t>(n);
    }
    buffer.resize(total);
    return buffer;
}

void DestinationFile::sync() {
    if (fdatasync(fd) != 0) {
        throw StorageError("Failed to flush", path, errno);
    }
}

void DestinationFile::close() {
    if (fd >= 0) {
        int rc = ::close(fd);
        fd = -1;
        if (rc != 0) {
            throw StorageError("Failed to close", path, errno);
        }
    }
}

bool DestinationFile::exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

void DestinationFile::remove(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        throw StorageError("Failed to remove", path, errno);
    }
}
