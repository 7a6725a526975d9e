#pragma once
#include "Piece.hpp"
#include <vector>
#include <cstdint>

struct PiecePlan {
    int64_t file_size = 0;
    int64_t piece_size = 0;
    std::vector<Piece> pieces;

    int get_piece_count() const;
    // Same inputs and piece count; the only test used to decide resume vs restart.
    bool matches(int64_t other_file_size, int64_t other_piece_size, size_t other_piece_count) const;
};

class PiecePlanner {
public:
    // Deterministic: equal inputs always give an equal plan. Throws ConfigurationError.
    static PiecePlan plan(int64_t file_size, int64_t piece_size);

    static int get_piece_count(int64_t file_size, int64_t piece_size);
    static int64_t get_piece_size(int64_t file_size, int64_t piece_size, int piece_index);
};
