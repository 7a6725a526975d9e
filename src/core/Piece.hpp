#pragma once
#include <string>
#include <cstdint>

enum class PieceStatus {
    Pending,
    InFlight,
    Verified,
    Failed
};

const char* piece_status_name(PieceStatus status);
bool parse_piece_status(const std::string& name, PieceStatus& status);

struct Piece {
    int index;
    int64_t offset;
    int64_t length;
    PieceStatus status = PieceStatus::Pending;
    std::string sha256;   // expected digest, empty until first verified fetch
    std::string mirror;   // url that last supplied the bytes

    Piece(int index, int64_t offset, int64_t length);
    int64_t end() const;
    std::string to_string() const;
};
