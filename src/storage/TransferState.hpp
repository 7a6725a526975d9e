#pragma once
#include "../core/Piece.hpp"
#include "../core/PiecePlanner.hpp"
#include "DestinationFile.hpp"
#include <string>
#include <vector>
#include <cstdint>

struct TransferRecord {
    std::string destination;
    int64_t file_size = 0;
    int64_t piece_size = 0;
    std::vector<Piece> pieces;

    int get_verified_count() const;
    int get_total_count() const;
    bool is_complete() const;
    std::vector<int> get_unverified_indices() const;
};

enum class LoadOutcome {
    Created,
    Resumed,
    Restarted
};

const char* load_outcome_name(LoadOutcome outcome);

/**
 * Durable per-destination record of the piece plan and per-piece progress,
 * stored as JSON at "<destination>.zdm.json".
 *
 * Saves go through a temporary file and rename so a crash leaves either the
 * old or the new record. In-flight marks stay in memory, since a reloaded
 * record turns them back into pending anyway; other marks are written every
 * save_every changes and on flush(). A verified piece lost in a crash is
 * fetched again. The object does no locking of its own: whoever shares it
 * between threads must serialize calls.
 */
class TransferState {
private:
    std::string destination;
    std::string record_path;
    TransferRecord record;
    int save_every = 1;
    int unsaved_changes = 0;
    int save_count = 0;

    void save();
    Piece& piece_at(int piece_index);
    static bool read_record(const std::string& path, TransferRecord& out, std::string& problem);

public:
    static constexpr int FORMAT_VERSION = 1;
    static constexpr const char* RECORD_SUFFIX = ".zdm.json";

    explicit TransferState(const std::string& destination);

    /**
     * Reuse the stored record when its plan equals the given one, otherwise
     * discard it together with the partial destination file and start fresh.
     * Pieces left in-flight or failed by an earlier run come back as pending.
     */
    LoadOutcome load_or_create(const PiecePlan& plan);

    /**
     * Re-hash every verified piece from the destination file. Pieces whose
     * bytes no longer match go back to pending but keep their expected digest.
     * @return indices that were demoted
     */
    std::vector<int> reverify(const DestinationFile& file);

    // Empty digest or mirror leaves the stored value untouched.
    void mark(int piece_index, PieceStatus status, const std::string& digest, const std::string& mirror);

    // Persist at most once per this many marks; clamped to at least 1.
    void set_save_every(int changes);
    // Writes any marks not yet on disk.
    void flush();
    // Number of times the record file has been written by this object.
    int get_save_count() const;

    const Piece& get_piece(int piece_index) const;
    TransferRecord snapshot() const;
    const std::string& get_record_path() const;

    // Removes the record once the destination is final.
    void retire();

    static std::string record_path_for(const std::string& destination);
    static bool has_record(const std::string& destination);
    static TransferRecord read(const std::string& destination);
    static void discard(const std::string& destination);
};
