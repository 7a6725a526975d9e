#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

// Base of every error the engine reports to its caller.
class DownloadError : public std::runtime_error {
private:
    int verified_pieces = -1;
    int total_pieces = -1;

public:
    explicit DownloadError(const std::string& message);

    virtual const char* kind() const;

    void set_progress(int verified, int total);
    bool has_progress() const;
    int get_verified_pieces() const;
    int get_total_pieces() const;
};

class ConfigurationError : public DownloadError {
public:
    explicit ConfigurationError(const std::string& message);
    const char* kind() const override;
};

class SourceUnavailableError : public DownloadError {
public:
    explicit SourceUnavailableError(const std::string& message);
    const char* kind() const override;
};

class InconsistentMirrorError : public DownloadError {
public:
    InconsistentMirrorError(const std::string& first_url, int64_t first_size,
                            const std::string& second_url, int64_t second_size);
    const char* kind() const override;
};

class PieceUnavailableError : public DownloadError {
private:
    int piece_index;

public:
    PieceUnavailableError(int piece_index, int mirrors_tried);
    const char* kind() const override;
    int get_piece_index() const;
};

class PartialFailure : public DownloadError {
private:
    std::vector<int> unresolved;

public:
    PartialFailure(const std::vector<int>& unresolved_pieces, int verified, int total);
    const char* kind() const override;
    const std::vector<int>& get_unresolved_pieces() const;
};

class IntegrityMismatchError : public DownloadError {
private:
    int piece_index;

public:
    IntegrityMismatchError(int piece_index, const std::string& expected_digest,
                           const std::string& actual_digest, const std::string& mirror);
    const char* kind() const override;
    int get_piece_index() const;
};

class TransferCancelled : public DownloadError {
public:
    explicit TransferCancelled(const std::string& message);
    const char* kind() const override;
};

class StorageError : public DownloadError {
public:
    StorageError(const std::string& what, const std::string& path, int err);
    const char* kind() const override;
};

// Raised by transports for connection failures and timeouts. Never leaves the
// engine: the prober and fetcher turn it into a mirror-level failure.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message);
};
