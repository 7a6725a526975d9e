#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Owns one read/write descriptor on the output file. Positional reads and
// writes do not move a shared cursor, so workers writing disjoint ranges can
// share a single instance.
class DestinationFile {
private:
    std::string path;
    int fd = -1;

public:
    // Opens (creating if needed) without truncating. Throws StorageError.
    explicit DestinationFile(const std::string& path);
    ~DestinationFile();
    DestinationFile(const DestinationFile&) = delete;
    DestinationFile& operator=(const DestinationFile&) = delete;

    int64_t size() const;
    void resize(int64_t new_size);
    void write_at(int64_t offset, const uint8_t* data, size_t length);
    std::vector<uint8_t> read_at(int64_t offset, size_t length) const;
    // Flushes file data to the device (fdatasync).
    void sync();
    void close();

    static bool exists(const std::string& path);
    static void remove(const std::string& path);
};
