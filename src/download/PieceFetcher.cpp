#include "PieceFetcher.hpp"
#include "../core/Errors.hpp"
#include "../utils/CryptoUtils.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <thread>

PieceFetcher::PieceFetcher(HttpTransport& transport, TransferState& state, DestinationFile& file,
                           const std::vector<std::string>& mirrors, int concurrency,
                           const std::atomic<bool>& cancel_requested)
    : transport(transport), state(state), file(file), mirrors(mirrors),
      concurrency(concurrency), cancel_requested(cancel_requested) {}

void PieceFetcher::fetch_all() {
    TransferRecord record = state.snapshot();
    std::vector<int> pending = record.get_unverified_indices();
    if (pending.empty()) {
        return;
    }
    if (mirrors.empty()) {
        throw SourceUnavailableError("No mirror accepts ranged requests");
    }

    DownloadProgress progress(record.get_total_count(), record.get_verified_count());
    for (int index : pending) {
        work_queue.add_piece(index);
    }
    work_queue.mark_finished();

    int num_workers = std::min(concurrency, static_cast<int>(pending.size()));
    std::cout << "Fetching " << pending.size() << " piece(s) with " << num_workers << " worker(s) from "
              << mirrors.size() << " mirror(s)" << std::endl;

    std::vector<std::thread> workers;
    for (int i = 0; i < num_workers; ++i) {
        workers.emplace_back(&PieceFetcher::download_worker, this, std::ref(progress));
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    // Workers are gone; marks still held in memory go to disk before any outcome is reported
    state.flush();
    record = state.snapshot();
    int verified = record.get_verified_count();
    int total = record.get_total_count();

    if (fatal_error) {
        try {
            std::rethrow_exception(fatal_error);
        } catch (DownloadError& e) {
            e.set_progress(verified, total);
            throw;
        }
    }

    if (cancel_requested && !record.is_complete()) {
        TransferCancelled cancelled("Transfer cancelled with " + std::to_string(total - verified) +
                                    " piece(s) left; run again to resume");
        cancelled.set_progress(verified, total);
        throw cancelled;
    }

    if (!unresolved.empty()) {
        std::sort(unresolved.begin(), unresolved.end());
        throw PartialFailure(unresolved, verified, total);
    }

    if (!record.is_complete()) {
        throw PartialFailure(record.get_unverified_indices(), verified, total);
    }
}

void PieceFetcher::download_worker(DownloadProgress& progress) {
    while (!stop && !cancel_requested) {
        int piece_index;
        if (!work_queue.claim_piece(piece_index)) {
            break; // No more work
        }
        if (stop || cancel_requested) {
            work_queue.release_piece(piece_index);
            break;
        }

        try {
            Piece piece(0, 0, 0);
            {
                std::lock_guard<std::mutex> lock(state_mtx);
                piece = state.get_piece(piece_index);
                state.mark(piece_index, PieceStatus::InFlight, "", "");
            }

            if (!download_piece(piece, progress)) {
                PieceUnavailableError error(piece_index, static_cast<int>(mirrors.size()));
                {
                    std::lock_guard<std::mutex> lock(state_mtx);
                    state.mark(piece_index, PieceStatus::Failed, "", "");
                }
                {
                    std::lock_guard<std::mutex> lock(result_mtx);
                    unresolved.push_back(piece_index);
                }
                progress.mark_piece_failed(piece_index, error.what());
            }
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(result_mtx);
                if (!fatal_error) {
                    fatal_error = std::current_exception();
                }
            }
            stop = true;
            work_queue.drain();
        }

        work_queue.release_piece(piece_index);
    }
}

bool PieceFetcher::download_piece(const Piece& piece, DownloadProgress& progress) {
    // Rotation is per piece: every piece starts again at the first mirror
    for (const auto& mirror : mirrors) {
        std::vector<uint8_t> data;
        std::string reason;
        if (!fetch_from_mirror(piece, mirror, data, reason)) {
            std::cerr << "Piece " << piece.index << " from " << mirror << ": " << reason << std::endl;
            continue;
        }

        std::string digest = CryptoUtils::sha256_to_hex(data);
        if (!piece.sha256.empty() && piece.sha256 != digest) {
            throw IntegrityMismatchError(piece.index, piece.sha256, digest, mirror);
        }

        file.write_at(piece.offset, data.data(), data.size());
        file.sync();
        {
            std::lock_guard<std::mutex> lock(state_mtx);
            state.mark(piece.index, PieceStatus::Verified, digest, mirror);
        }
        progress.mark_piece_complete(piece.index, mirror);
        return true;
    }
    return false;
}

bool PieceFetcher::fetch_from_mirror(const Piece& piece, const std::string& mirror,
                                     std::vector<uint8_t>& data, std::string& reason) {
    HttpResponse response;
    try {
        response = transport.get_range(mirror, piece.offset, piece.length);
    } catch (const TransportError& e) {
        reason = e.what();
        return false;
    }

    if (response.status != 206) {
        reason = "HTTP " + std::to_string(response.status) + " instead of 206 Partial Content";
        return false;
    }

    std::string expected_range = "bytes " + std::to_string(piece.offset) + "-" + std::to_string(piece.end() - 1) + "/";
    if (response.has_header("content-range") &&
        response.get_header("content-range").compare(0, expected_range.size(), expected_range) != 0) {
        reason = "server answered with range '" + response.get_header("content-range") + "'";
        return false;
    }

    if (static_cast<int64_t>(response.body.size()) != piece.length) {
        reason = "received " + std::to_string(response.body.size()) + " of " +
                 std::to_string(piece.length) + " bytes";
        return false;
    }

    data.swap(response.body);
    return true;
}
