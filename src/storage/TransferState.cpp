#include "TransferState.hpp"
#include "../core/Errors.hpp"
#include "../utils/CryptoUtils.hpp"
#include "../utils/FileUtils.hpp"
#include <nlohmann/json.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

int TransferRecord::get_verified_count() const {
    int count = 0;
    for (const auto& piece : pieces) {
        if (piece.status == PieceStatus::Verified) ++count;
    }
    return count;
}

int TransferRecord::get_total_count() const {
    return static_cast<int>(pieces.size());
}

bool TransferRecord::is_complete() const {
    return get_verified_count() == get_total_count();
}

std::vector<int> TransferRecord::get_unverified_indices() const {
    std::vector<int> indices;
    for (const auto& piece : pieces) {
        if (piece.status != PieceStatus::Verified) indices.push_back(piece.index);
    }
    return indices;
}

const char* load_outcome_name(LoadOutcome outcome) {
    switch (outcome) {
        case LoadOutcome::Created:   return "created";
        case LoadOutcome::Resumed:   return "resumed";
        case LoadOutcome::Restarted: return "restarted";
    }
    return "created";
}

static json piece_to_json(const Piece& piece) {
    return json{
        {"index", piece.index},
        {"offset", piece.offset},
        {"length", piece.length},
        {"status", piece_status_name(piece.status)},
        {"sha256", piece.sha256},
        {"mirror", piece.mirror}
    };
}

TransferState::TransferState(const std::string& destination)
    : destination(destination), record_path(record_path_for(destination)) {}

std::string TransferState::record_path_for(const std::string& destination) {
    return destination + RECORD_SUFFIX;
}

bool TransferState::has_record(const std::string& destination) {
    return DestinationFile::exists(record_path_for(destination));
}

TransferRecord TransferState::read(const std::string& destination) {
    std::string path = record_path_for(destination);
    if (!DestinationFile::exists(path)) {
        throw StorageError("No transfer record at", path, ENOENT);
    }
    TransferRecord record;
    std::string problem;
    if (!read_record(path, record, problem)) {
        throw std::runtime_error("Unreadable transfer record " + path + ": " + problem);
    }
    return record;
}

void TransferState::discard(const std::string& destination) {
    DestinationFile::remove(record_path_for(destination));
}

bool TransferState::read_record(const std::string& path, TransferRecord& out, std::string& problem) {
    std::ifstream file(path);
    if (!file.is_open()) {
        problem = "cannot open file";
        return false;
    }

    try {
        json doc = json::parse(file);
        if (doc.value("format", 0) != FORMAT_VERSION) {
            problem = "unsupported format " + doc.value("format", json()).dump();
            return false;
        }

        TransferRecord record;
        record.destination = doc.at("destination").get<std::string>();
        record.file_size = doc.at("file_size").get<int64_t>();
        record.piece_size = doc.at("piece_size").get<int64_t>();

        for (const auto& entry : doc.at("pieces")) {
            Piece piece(entry.at("index").get<int>(),
                        entry.at("offset").get<int64_t>(),
                        entry.at("length").get<int64_t>());
            if (!parse_piece_status(entry.at("status").get<std::string>(), piece.status)) {
                problem = "piece " + std::to_string(piece.index) + " has unknown status";
                return false;
            }
            piece.sha256 = entry.value("sha256", "");
            piece.mirror = entry.value("mirror", "");
            if (piece.index != static_cast<int>(record.pieces.size())) {
                problem = "pieces out of order at index " + std::to_string(piece.index);
                return false;
            }
            record.pieces.push_back(piece);
        }
        out = record;
        return true;
    } catch (const json::exception& e) {
        problem = e.what();
        return false;
    }
}

LoadOutcome TransferState::load_or_create(const PiecePlan& plan) {
    LoadOutcome outcome = LoadOutcome::Created;

    if (DestinationFile::exists(record_path)) {
        TransferRecord existing;
        std::string problem;
        bool same_plan = false;

        if (read_record(record_path, existing, problem)) {
            same_plan = existing.destination == destination &&
                        plan.matches(existing.file_size, existing.piece_size, existing.pieces.size());
            for (size_t i = 0; same_plan && i < plan.pieces.size(); ++i) {
                same_plan = existing.pieces[i].offset == plan.pieces[i].offset &&
                            existing.pieces[i].length == plan.pieces[i].length;
            }
            if (existing.destination != destination) {
                problem = "record belongs to " + existing.destination;
            } else if (!same_plan) {
                problem = "plan changed (" + std::to_string(existing.file_size) + " bytes / " +
                          std::to_string(existing.piece_size) + " per piece before, " +
                          std::to_string(plan.file_size) + " / " + std::to_string(plan.piece_size) + " now)";
            }
        }

        if (same_plan) {
            record = existing;
            for (auto& piece : record.pieces) {
                // Nothing in-flight survived the previous process
                if (piece.status == PieceStatus::InFlight || piece.status == PieceStatus::Failed) {
                    piece.status = PieceStatus::Pending;
                }
            }
            save();
            std::cout << "Resuming " << destination << ": " << record.get_verified_count() << "/"
                      << record.get_total_count() << " pieces already verified" << std::endl;
            return LoadOutcome::Resumed;
        }

        std::cerr << "Discarding transfer record " << record_path << ": " << problem << std::endl;
        DestinationFile::remove(record_path);
        DestinationFile::remove(destination);
        outcome = LoadOutcome::Restarted;
    }

    record = TransferRecord();
    record.destination = destination;
    record.file_size = plan.file_size;
    record.piece_size = plan.piece_size;
    record.pieces = plan.pieces;
    save();
    return outcome;
}

std::vector<int> TransferState::reverify(const DestinationFile& file) {
    std::vector<int> demoted;
    for (auto& piece : record.pieces) {
        if (piece.status != PieceStatus::Verified) continue;

        std::vector<uint8_t> bytes = file.read_at(piece.offset, static_cast<size_t>(piece.length));
        if (static_cast<int64_t>(bytes.size()) != piece.length ||
            CryptoUtils::sha256_to_hex(bytes) != piece.sha256) {
            piece.status = PieceStatus::Pending;
            demoted.push_back(piece.index);
        }
    }
    if (!demoted.empty()) {
        std::cerr << demoted.size() << " verified piece(s) no longer match their digest on disk; refetching"
                  << std::endl;
        save();
    }
    return demoted;
}

Piece& TransferState::piece_at(int piece_index) {
    if (piece_index < 0 || piece_index >= record.get_total_count()) {
        throw std::out_of_range("Piece index " + std::to_string(piece_index) + " out of range");
    }
    return record.pieces[piece_index];
}

void TransferState::mark(int piece_index, PieceStatus status, const std::string& digest, const std::string& mirror) {
    Piece& piece = piece_at(piece_index);
    piece.status = status;
    if (!digest.empty()) piece.sha256 = digest;
    if (!mirror.empty()) piece.mirror = mirror;

    if (status == PieceStatus::InFlight) {
        return;
    }
    if (++unsaved_changes >= save_every) {
        save();
    }
}

void TransferState::set_save_every(int changes) {
    save_every = changes < 1 ? 1 : changes;
}

void TransferState::flush() {
    if (unsaved_changes > 0) {
        save();
    }
}

int TransferState::get_save_count() const {
    return save_count;
}

const Piece& TransferState::get_piece(int piece_index) const {
    if (piece_index < 0 || piece_index >= record.get_total_count()) {
        throw std::out_of_range("Piece index " + std::to_string(piece_index) + " out of range");
    }
    return record.pieces[piece_index];
}

TransferRecord TransferState::snapshot() const {
    return record;
}

const std::string& TransferState::get_record_path() const {
    return record_path;
}

void TransferState::retire() {
    DestinationFile::remove(record_path);
}

void TransferState::save() {
    json pieces = json::array();
    for (const auto& piece : record.pieces) {
        pieces.push_back(piece_to_json(piece));
    }
    json doc = {
        {"format", FORMAT_VERSION},
        {"destination", record.destination},
        {"file_size", record.file_size},
        {"piece_size", record.piece_size},
        {"pieces", pieces}
    };
    std::string text = doc.dump(2);

    std::string tmp_path = record_path + ".tmp";
    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError("Failed to create", tmp_path, errno);
    }
    size_t written = 0;
    while (written < text.size()) {
        ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw StorageError("Failed to write", tmp_path, err);
        }
        written += static_cast<size_t>(n);
    }
    if (fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw StorageError("Failed to flush", tmp_path, err);
    }
    if (::close(fd) != 0) {
        throw StorageError("Failed to close", tmp_path, errno);
    }
    if (std::rename(tmp_path.c_str(), record_path.c_str()) != 0) {
        throw StorageError("Failed to replace", record_path, errno);
    }

    // Make the rename itself durable
    std::string dir = FileUtils::parent_directory(record_path);
    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) {
        throw StorageError("Failed to open directory", dir, errno);
    }
    int rc = fsync(dir_fd);
    int err = errno;
    ::close(dir_fd);
    if (rc != 0) {
        throw StorageError("Failed to flush directory", dir, err);
    }
    unsaved_changes = 0;
    ++save_count;
}
