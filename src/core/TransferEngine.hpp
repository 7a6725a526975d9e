#pragma once
#include "TransferOptions.hpp"
#include "Piece.hpp"
#include "../network/HttpTransport.hpp"
#include "../network/CapabilityProber.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include <cstdint>

enum class TransferPhase {
    Probing,
    Planning,
    Fetching,
    Finalizing,
    Done,
    Failed
};

enum class TransferMode {
    Pieces,
    Sequential
};

struct TransferResult {
    std::string path;
    int64_t size = 0;
    TransferMode mode = TransferMode::Pieces;
    int verified_pieces = 0;
    int total_pieces = 0;
    bool resumed = false;
    std::string sha256; // whole-file digest, sequential mode only
    std::vector<Piece> pieces; // final per-piece digest and serving mirror, pieces mode only
};

typedef std::function<void(const TransferResult& result)> CompletionHandler;

/**
 * Drives one download: probe the mirrors, plan or resume the piece record,
 * fetch (ranged pieces, or a single stream when no mirror supports ranges),
 * then finalize. Classified errors propagate as DownloadError subclasses and
 * leave the engine in the Failed phase.
 *
 * One engine per destination at a time; run() is not reentrant.
 */
class TransferEngine {
private:
    TransferOptions options;
    HttpTransport& transport;
    CompletionHandler on_complete;
    std::atomic<bool> cancel_requested{false};
    std::atomic<TransferPhase> phase{TransferPhase::Probing};
    std::atomic<int> verified_pieces{0};
    std::atomic<int> total_pieces{0};

    TransferResult run_pieces(const ProbeReport& report);
    TransferResult run_sequential(const ProbeReport& report);
    void enter(TransferPhase next);

public:
    TransferEngine(const TransferOptions& options, HttpTransport& transport);

    // Receives the finished file once the engine reaches Done.
    void set_completion_handler(const CompletionHandler& handler);

    TransferResult run();

    // Cooperative: requests in flight finish, no new pieces are claimed.
    void cancel();

    TransferPhase get_phase() const;
    int get_verified_pieces() const;
    int get_total_pieces() const;
};
