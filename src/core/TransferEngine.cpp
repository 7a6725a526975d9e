#include "TransferEngine.hpp"
#include "Errors.hpp"
#include "PiecePlanner.hpp"
#include "../commands/helpers/Config.hpp"
#include "../download/PieceFetcher.hpp"
#include "../download/SequentialDownloader.hpp"
#include "../storage/DestinationFile.hpp"
#include "../storage/TransferState.hpp"
#include "../utils/FileUtils.hpp"
#include <iostream>

TransferEngine::TransferEngine(const TransferOptions& options, HttpTransport& transport)
    : options(options), transport(transport) {}

void TransferEngine::set_completion_handler(const CompletionHandler& handler) {
    on_complete = handler;
}

void TransferEngine::cancel() {
    cancel_requested = true;
}

TransferPhase TransferEngine::get_phase() const {
    return phase;
}

int TransferEngine::get_verified_pieces() const {
    return verified_pieces;
}

int TransferEngine::get_total_pieces() const {
    return total_pieces;
}

void TransferEngine::enter(TransferPhase next) {
    phase = next;
}

TransferResult TransferEngine::run() {
    enter(TransferPhase::Probing);
    try {
        options.validate();

        CapabilityProber prober(transport);
        ProbeReport report = prober.probe_all(options.mirrors);
        FileUtils::make_parent_directories(options.destination);

        TransferResult result = report.supports_range ? run_pieces(report) : run_sequential(report);

        enter(TransferPhase::Done);
        std::cout << "Download complete: " << result.path << " (" << result.size << " bytes)" << std::endl;
        if (on_complete) {
            on_complete(result);
        }
        return result;

    } catch (DownloadError& e) {
        if (!e.has_progress() && total_pieces > 0) {
            e.set_progress(verified_pieces, total_pieces);
        }
        enter(TransferPhase::Failed);
        throw;
    } catch (const std::exception&) {
        enter(TransferPhase::Failed);
        throw;
    }
}

TransferResult TransferEngine::run_pieces(const ProbeReport& report) {
    enter(TransferPhase::Planning);
    PiecePlan plan = PiecePlanner::plan(report.size, options.piece_size);

    TransferState state(options.destination);
    LoadOutcome outcome = state.load_or_create(plan);

    DestinationFile file(options.destination);
    if (outcome != LoadOutcome::Resumed) {
        // Bytes without a matching record cannot be trusted
        file.resize(0);
    }
    if (file.size() != plan.file_size) {
        file.resize(plan.file_size);
    }
    if (outcome == LoadOutcome::Resumed) {
        state.reverify(file);
    }

    TransferRecord record = state.snapshot();
    verified_pieces = record.get_verified_count();
    total_pieces = record.get_total_count();
    state.set_save_every(total_pieces / Config::RECORD_SAVES_PER_RUN);
    std::cout << "Planned " << total_pieces << " piece(s) of " << plan.piece_size << " bytes for "
              << plan.file_size << " bytes (" << load_outcome_name(outcome) << ")" << std::endl;

    enter(TransferPhase::Fetching);
    PieceFetcher fetcher(transport, state, file, report.ranged_mirrors(), options.concurrency, cancel_requested);
    try {
        fetcher.fetch_all();
    } catch (const DownloadError&) {
        verified_pieces = state.snapshot().get_verified_count();
        throw;
    }

    enter(TransferPhase::Finalizing);
    record = state.snapshot();
    verified_pieces = record.get_verified_count();
    if (!record.is_complete()) {
        throw PartialFailure(record.get_unverified_indices(), verified_pieces, total_pieces);
    }
    file.sync();
    if (file.size() != report.size) {
        throw DownloadError("Destination holds " + std::to_string(file.size()) + " bytes, expected " +
                            std::to_string(report.size));
    }
    file.close();
    state.retire();

    TransferResult result;
    result.path = options.destination;
    result.size = report.size;
    result.mode = TransferMode::Pieces;
    result.verified_pieces = verified_pieces;
    result.total_pieces = total_pieces;
    result.resumed = outcome == LoadOutcome::Resumed;
    result.pieces = record.pieces;
    return result;
}

TransferResult TransferEngine::run_sequential(const ProbeReport& report) {
    enter(TransferPhase::Planning);
    if (TransferState::has_record(options.destination)) {
        std::cerr << "Removing transfer record " << TransferState::record_path_for(options.destination)
                  << ": no mirror supports ranged requests" << std::endl;
        TransferState::discard(options.destination);
    }

    enter(TransferPhase::Fetching);
    SequentialDownloader downloader(transport, cancel_requested);
    SequentialResult streamed = downloader.download(report.reachable_mirrors(), options.destination, report.size);

    enter(TransferPhase::Finalizing);
    DestinationFile file(options.destination);
    if (file.size() != report.size) {
        throw DownloadError("Destination holds " + std::to_string(file.size()) + " bytes, expected " +
                            std::to_string(report.size));
    }

    TransferResult result;
    result.path = options.destination;
    result.size = streamed.bytes_written;
    result.mode = TransferMode::Sequential;
    result.sha256 = streamed.sha256;
    return result;
}
