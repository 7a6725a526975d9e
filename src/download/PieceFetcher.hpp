#pragma once
#include "../core/Piece.hpp"
#include "../network/HttpTransport.hpp"
#include "../storage/DestinationFile.hpp"
#include "../storage/TransferState.hpp"
#include "WorkQueue.hpp"
#include "DownloadProgress.hpp"
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

class PieceFetcher {
private:
    HttpTransport& transport;
    TransferState& state;
    DestinationFile& file;
    std::vector<std::string> mirrors;
    int concurrency;
    const std::atomic<bool>& cancel_requested;

    WorkQueue work_queue;
    std::mutex state_mtx; // every TransferState call goes through this
    std::mutex result_mtx;
    std::vector<int> unresolved;
    std::exception_ptr fatal_error;
    std::atomic<bool> stop{false};

    void download_worker(DownloadProgress& progress);
    bool download_piece(const Piece& piece, DownloadProgress& progress);
    bool fetch_from_mirror(const Piece& piece, const std::string& mirror,
                           std::vector<uint8_t>& data, std::string& reason);

public:
    // mirrors: ranged-capable urls in priority order
    PieceFetcher(HttpTransport& transport, TransferState& state, DestinationFile& file,
                 const std::vector<std::string>& mirrors, int concurrency,
                 const std::atomic<bool>& cancel_requested);

    /**
     * Fetch every piece the record does not list as verified.
     * Returns only when all pieces are verified; otherwise throws
     * PartialFailure, IntegrityMismatchError, TransferCancelled or StorageError.
     */
    void fetch_all();
};
