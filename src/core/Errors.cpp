#include "Errors.hpp"
#include <cstring>

DownloadError::DownloadError(const std::string& message) : std::runtime_error(message) {}

const char* DownloadError::kind() const {
    return "DownloadError";
}

void DownloadError::set_progress(int verified, int total) {
    verified_pieces = verified;
    total_pieces = total;
}

bool DownloadError::has_progress() const {
    return total_pieces >= 0;
}

int DownloadError::get_verified_pieces() const {
    return verified_pieces;
}

int DownloadError::get_total_pieces() const {
    return total_pieces;
}

ConfigurationError::ConfigurationError(const std::string& message) : DownloadError(message) {}

const char* ConfigurationError::kind() const {
    return "ConfigurationError";
}

SourceUnavailableError::SourceUnavailableError(const std::string& message) : DownloadError(message) {}

const char* SourceUnavailableError::kind() const {
    return "SourceUnavailableError";
}

InconsistentMirrorError::InconsistentMirrorError(const std::string& first_url, int64_t first_size,
                                                 const std::string& second_url, int64_t second_size)
    : DownloadError("Mirrors disagree on file size: " + first_url + " reports " +
                    std::to_string(first_size) + " bytes, " + second_url + " reports " +
                    std::to_string(second_size) + " bytes") {}

const char* InconsistentMirrorError::kind() const {
    return "InconsistentMirrorError";
}

PieceUnavailableError::PieceUnavailableError(int piece_index, int mirrors_tried)
    : DownloadError("Piece " + std::to_string(piece_index) + " failed on all " +
                    std::to_string(mirrors_tried) + " mirror(s)"),
      piece_index(piece_index) {}

const char* PieceUnavailableError::kind() const {
    return "PieceUnavailableError";
}

int PieceUnavailableError::get_piece_index() const {
    return piece_index;
}

static std::string describe_unresolved(const std::vector<int>& pieces) {
    std::string list;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0) list += ", ";
        list += std::to_string(pieces[i]);
    }
    return std::to_string(pieces.size()) + " piece(s) could not be fetched from any mirror: " + list;
}

PartialFailure::PartialFailure(const std::vector<int>& unresolved_pieces, int verified, int total)
    : DownloadError(describe_unresolved(unresolved_pieces)), unresolved(unresolved_pieces) {
    set_progress(verified, total);
}

const char* PartialFailure::kind() const {
    return "PartialFailure";
}

const std::vector<int>& PartialFailure::get_unresolved_pieces() const {
    return unresolved;
}

IntegrityMismatchError::IntegrityMismatchError(int piece_index, const std::string& expected_digest,
                                               const std::string& actual_digest, const std::string& mirror)
    : DownloadError("Piece " + std::to_string(piece_index) + " from " + mirror +
                    " hashed to " + actual_digest + " but was previously verified as " + expected_digest),
      piece_index(piece_index) {}

const char* IntegrityMismatchError::kind() const {
    return "IntegrityMismatchError";
}

int IntegrityMismatchError::get_piece_index() const {
    return piece_index;
}

TransferCancelled::TransferCancelled(const std::string& message) : DownloadError(message) {}

const char* TransferCancelled::kind() const {
    return "TransferCancelled";
}

StorageError::StorageError(const std::string& what, const std::string& path, int err)
    : DownloadError(what + " " + path + ": " + std::strerror(err)) {}

const char* StorageError::kind() const {
    return "StorageError";
}

TransportError::TransportError(const std::string& message) : std::runtime_error(message) {}
