#include "WorkQueue.hpp"

bool WorkQueue::add_piece(int piece_index) {
    std::lock_guard<std::mutex> lock(mtx);
    if (finished || !members.insert(piece_index).second) {
        return false;
    }
    queued.push_back(piece_index);
    cv.notify_one();
    return true;
}

bool WorkQueue::claim_piece(int& piece_index) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queued.empty() || finished; });

    if (queued.empty()) {
        return false;
    }

    piece_index = queued.front();
    queued.pop_front();
    claimed.insert(piece_index);
    return true;
}

void WorkQueue::release_piece(int piece_index) {
    std::lock_guard<std::mutex> lock(mtx);
    if (claimed.erase(piece_index) > 0) {
        members.erase(piece_index);
    }
}

void WorkQueue::mark_finished() {
    std::lock_guard<std::mutex> lock(mtx);
    finished = true;
    cv.notify_all();
}

std::vector<int> WorkQueue::drain() {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<int> remaining(queued.begin(), queued.end());
    for (int index : remaining) {
        members.erase(index);
    }
    queued.clear();
    finished = true;
    cv.notify_all();
    return remaining;
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queued.size();
}

size_t WorkQueue::claimed_count() const {
    std::lock_guard<std::mutex> lock(mtx);
    return claimed.size();
}
