#include "DownloadProgress.hpp"
#include <iostream>

DownloadProgress::DownloadProgress(int total_pieces, int already_verified)
    : completed_count(already_verified), total_pieces(total_pieces) {
    // About twenty progress lines per transfer, whatever the piece count
    report_every = total_pieces / 20;
    if (report_every < 1) report_every = 1;
}

void DownloadProgress::mark_piece_complete(int piece_index, const std::string& mirror) {
    std::lock_guard<std::mutex> lock(mtx);
    int done = ++completed_count;

    if (done % report_every == 0 || done == total_pieces) {
        std::cout << "Downloaded piece " << piece_index << " (" << done << "/" << total_pieces
                  << ") from " << mirror << std::endl;
    }
}

void DownloadProgress::mark_piece_failed(int piece_index, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx);
    std::cerr << "Piece " << piece_index << " failed: " << reason << std::endl;
}
