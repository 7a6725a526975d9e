#pragma once
#include <string>
#include <mutex>
#include <atomic>

class DownloadProgress {
private:
    mutable std::mutex mtx;
    std::atomic<int> completed_count{0};
    int total_pieces;
    int report_every;

public:
    DownloadProgress(int total_pieces, int already_verified);

    void mark_piece_complete(int piece_index, const std::string& mirror);
    void mark_piece_failed(int piece_index, const std::string& reason);
};
