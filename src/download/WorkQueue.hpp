#pragma once
#include <deque>
#include <set>
#include <vector>
#include <mutex>
#include <condition_variable>

// Exclusive claims on piece indices. An index is either queued, claimed by
// one worker, or absent; it is never handed to two workers at once.
class WorkQueue {
private:
    std::deque<int> queued;
    std::set<int> members;  // queued or claimed
    std::set<int> claimed;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool finished = false;

public:
    // False when the index is already queued or claimed.
    bool add_piece(int piece_index);
    // Blocks until a piece can be claimed or the queue is finished and empty.
    bool claim_piece(int& piece_index);
    void release_piece(int piece_index);
    void mark_finished();
    // Finishes the queue and returns whatever was still unclaimed.
    std::vector<int> drain();
    size_t size() const;
    size_t claimed_count() const;
};
