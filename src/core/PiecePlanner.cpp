#include "PiecePlanner.hpp"
#include "Errors.hpp"
#include <limits>

int PiecePlan::get_piece_count() const {
    return static_cast<int>(pieces.size());
}

bool PiecePlan::matches(int64_t other_file_size, int64_t other_piece_size, size_t other_piece_count) const {
    return file_size == other_file_size && piece_size == other_piece_size &&
           pieces.size() == other_piece_count;
}

PiecePlan PiecePlanner::plan(int64_t file_size, int64_t piece_size) {
    if (piece_size <= 0) {
        throw ConfigurationError("Piece size must be positive, got " + std::to_string(piece_size));
    }
    if (file_size < 0) {
        throw ConfigurationError("File size must not be negative, got " + std::to_string(file_size));
    }

    PiecePlan plan;
    plan.file_size = file_size;
    plan.piece_size = piece_size;

    int count = get_piece_count(file_size, piece_size);
    plan.pieces.reserve(count);
    for (int i = 0; i < count; ++i) {
        plan.pieces.emplace_back(i, static_cast<int64_t>(i) * piece_size,
                                 get_piece_size(file_size, piece_size, i));
    }
    return plan;
}

int PiecePlanner::get_piece_count(int64_t file_size, int64_t piece_size) {
    int64_t count = file_size / piece_size + (file_size % piece_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<int>::max()) {
        throw ConfigurationError("Piece size " + std::to_string(piece_size) + " is too small for a file of " +
                                 std::to_string(file_size) + " bytes");
    }
    return static_cast<int>(count);
}

int64_t PiecePlanner::get_piece_size(int64_t file_size, int64_t piece_size, int piece_index) {
    int total_pieces = get_piece_count(file_size, piece_size);
    if (piece_index < total_pieces - 1) {
        return piece_size;
    } else {
        // Last piece might be smaller
        int64_t last_piece_size = file_size % piece_size;
        return last_piece_size == 0 ? piece_size : last_piece_size;
    }
}
