#include "Piece.hpp"

const char* piece_status_name(PieceStatus status) {
    switch (status) {
        case PieceStatus::Pending:  return "pending";
        case PieceStatus::InFlight: return "in-flight";
        case PieceStatus::Verified: return "verified";
        case PieceStatus::Failed:   return "failed";
    }
    return "pending";
}

bool parse_piece_status(const std::string& name, PieceStatus& status) {
    if (name == "pending") {
        status = PieceStatus::Pending;
    } else if (name == "in-flight") {
        status = PieceStatus::InFlight;
    } else if (name == "verified") {
        status = PieceStatus::Verified;
    } else if (name == "failed") {
        status = PieceStatus::Failed;
    } else {
        return false;
    }
    return true;
}

Piece::Piece(int index, int64_t offset, int64_t length) : index(index), offset(offset), length(length) {}

int64_t Piece::end() const {
    return offset + length;
}

std::string Piece::to_string() const {
    return "#" + std::to_string(index) + " [" + std::to_string(offset) + ", " +
           std::to_string(end()) + ") " + piece_status_name(status);
}
