#include "CommandHandler.hpp"
#include "helpers/Config.hpp"
#include "../core/Errors.hpp"
#include "../core/PiecePlanner.hpp"
#include "../core/TransferEngine.hpp"
#include "../core/TransferOptions.hpp"
#include "../core/UserConfig.hpp"
#include "../network/CapabilityProber.hpp"
#include "../network/CurlTransport.hpp"
#include "../storage/TransferState.hpp"
#include "../utils/NetworkUtils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>

static std::atomic<TransferEngine*> g_active_engine{nullptr};


static void print_failure(const DownloadError& e) {
    std::cerr << e.kind() << ": " << e.what() << std::endl;
    if (e.has_progress()) {
        std::cerr << "Verified pieces: " << e.get_verified_pieces() << "/" << e.get_total_pieces() << std::endl;
    }
    const PartialFailure* partial = dynamic_cast<const PartialFailure*>(&e);
    if (partial) {
        std::cerr << "Unresolved pieces:";
        for (int index : partial->get_unresolved_pieces()) {
            std::cerr << " " << index;
        }
        std::cerr << std::endl;
    }
}

// ============================================================================
// COMMAND EXECUTOR
// ============================================================================

int CommandHandler::execute(const std::string& command, const std::vector<std::string>& args) {
    try {
        if (command == "download") {
            return handle_download(args);
        } else if (command == "probe") {
            return handle_probe(args);
        } else if (command == "plan") {
            return handle_plan(args);
        } else if (command == "status") {
            return handle_status(args);
        } else if (command == "show-config") {
            return handle_show_config(args);
        } else if (command == "version") {
            return handle_version(args);
        }
        std::cerr << "Unknown command: " << command << std::endl;
        return 1;
    } catch (const DownloadError& e) {
        print_failure(e);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

void CommandHandler::print_usage(const std::string& program) {
    std::cerr << "Usage: " << program << " <command> <args>" << std::endl;
    std::cerr << "\nAvailable commands:" << std::endl;
    std::cerr << "    download [-o <output>] [--mirrors <url,url>] [--piece <bytes>] [--conc <n>]" << std::endl;
    std::cerr << "             [--timeout <seconds>] [--user-agent <ua>] <url>" << std::endl;
    std::cerr << "    probe <url> [mirror_url...]" << std::endl;
    std::cerr << "    plan <file_size> <piece_size>" << std::endl;
    std::cerr << "    status <destination>" << std::endl;
    std::cerr << "    show-config" << std::endl;
    std::cerr << "    version" << std::endl;
}

TransferEngine* CommandHandler::active_engine() {
    return g_active_engine.load();
}

int64_t CommandHandler::parse_number(const std::string& flag, const std::string& value,
                                     int64_t min_value, int64_t max_value) {
    long long number = 0;
    try {
        size_t used = 0;
        number = std::stoll(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::logic_error&) {
        throw ConfigurationError("Expected a number for " + flag + ", got '" + value + "'");
    }
    if (number < min_value || number > max_value) {
        throw ConfigurationError(flag + " must be between " + std::to_string(min_value) + " and " +
                                 std::to_string(max_value) + ", got " + value);
    }
    return number;
}

// ============================================================================
// DOWNLOAD
// ============================================================================

int CommandHandler::handle_download(const std::vector<std::string>& args) {
    UserConfig config(UserConfig::default_path());
    config.load();
    TransferOptions options = config.to_options();

    std::string url;
    std::string output;
    std::vector<std::string> extra_mirrors;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if ((arg == "-o" || arg == "--output") && has_value) {
            output = args[++i];
        } else if (arg == "--mirrors" && has_value) {
            extra_mirrors = NetworkUtils::split_list(args[++i], ',');
        } else if (arg == "--piece" && has_value) {
            options.piece_size = parse_number(arg, args[++i], 1, std::numeric_limits<int64_t>::max());
        } else if (arg == "--conc" && has_value) {
            options.concurrency = static_cast<int>(parse_number(arg, args[++i], 1, Config::MAX_CONCURRENCY));
        } else if (arg == "--timeout" && has_value) {
            int64_t seconds = parse_number(arg, args[++i], 1, std::numeric_limits<long>::max() / 1000);
            options.timeout_ms = static_cast<long>(seconds * 1000);
        } else if (arg == "--user-agent" && has_value) {
            options.user_agent = args[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            return 1;
        } else if (url.empty()) {
            url = NetworkUtils::trim(arg);
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (url.empty()) {
        std::cerr << "Usage: download [-o <output>] [--mirrors <url,url>] [--piece <bytes>] [--conc <n>] "
                     "[--timeout <seconds>] [--user-agent <ua>] <url>" << std::endl;
        return 1;
    }

    options.mirrors.push_back(url);
    options.mirrors.insert(options.mirrors.end(), extra_mirrors.begin(), extra_mirrors.end());
    if (output.empty()) {
        output = NetworkUtils::filename_from_url(url);
        if (output.empty()) output = Config::FALLBACK_FILENAME;
    }
    options.destination = output;
    options.validate();

    std::cout << "Downloading " << url << " to " << output << " (" << options.mirrors.size()
              << " mirror(s), piece size " << options.piece_size << ", concurrency "
              << options.concurrency << ")" << std::endl;

    CurlTransport transport(options.timeout_ms, options.user_agent);
    TransferEngine engine(options, transport);
    engine.set_completion_handler([](const TransferResult& result) {
        std::cout << "Saved to: " << result.path << std::endl;
    });

    auto start_time = std::chrono::steady_clock::now();
    g_active_engine = &engine;
    try {
        TransferResult result = engine.run();
        g_active_engine = nullptr;

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        double seconds = std::max(0.001, duration.count() / 1000.0);
        double speed_mbps = (result.size / (1024.0 * 1024.0)) / seconds;

        if (result.mode == TransferMode::Pieces) {
            std::cout << "Verified " << result.verified_pieces << "/" << result.total_pieces << " pieces"
                      << (result.resumed ? " (resumed)" : "") << std::endl;
        } else {
            std::cout << "SHA-256: " << result.sha256 << std::endl;
        }
        std::cout << "Completed in " << std::fixed << std::setprecision(1) << seconds << " seconds, "
                  << std::setprecision(2) << speed_mbps << " MB/s" << std::endl;
        return 0;

    } catch (const DownloadError& e) {
        g_active_engine = nullptr;
        print_failure(e);
        if (TransferState::has_record(output)) {
            std::cerr << "Progress kept in " << TransferState::record_path_for(output)
                      << "; run the same command again to resume" << std::endl;
        }
        return 1;
    } catch (...) {
        g_active_engine = nullptr;
        throw;
    }
}

// ============================================================================
// INSPECTION COMMANDS
// ============================================================================

int CommandHandler::handle_probe(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: probe <url> [mirror_url...]" << std::endl;
        return 1;
    }

    UserConfig config(UserConfig::default_path());
    config.load();
    TransferOptions options = config.to_options();
    for (const auto& url : args) {
        if (!NetworkUtils::is_http_url(url)) {
            throw ConfigurationError("Not an http(s) URL: '" + url + "'");
        }
    }
    options.mirrors = args;

    CurlTransport transport(options.timeout_ms, options.user_agent);
    CapabilityProber prober(transport);
    ProbeReport report = prober.probe_all(options.mirrors);

    std::cout << "Size: " << report.size << " bytes" << std::endl;
    std::cout << "Mode: " << (report.supports_range ? "ranged pieces" : "sequential stream") << std::endl;
    return 0;
}

int CommandHandler::handle_plan(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: plan <file_size> <piece_size>" << std::endl;
        return 1;
    }

    const int64_t max = std::numeric_limits<int64_t>::max();
    PiecePlan plan = PiecePlanner::plan(parse_number("file_size", args[0], 0, max),
                                        parse_number("piece_size", args[1], 1, max));
    std::cout << plan.get_piece_count() << " piece(s)" << std::endl;
    for (const auto& piece : plan.pieces) {
        std::cout << "  " << piece.index << ": offset " << piece.offset << ", length " << piece.length << std::endl;
    }
    return 0;
}

int CommandHandler::handle_status(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: status <destination>" << std::endl;
        return 1;
    }

    TransferRecord record = TransferState::read(args[0]);
    std::cout << "Destination: " << record.destination << std::endl;
    std::cout << "File size: " << record.file_size << std::endl;
    std::cout << "Piece size: " << record.piece_size << std::endl;
    std::cout << "Verified: " << record.get_verified_count() << "/" << record.get_total_count() << std::endl;
    for (const auto& piece : record.pieces) {
        std::cout << "  " << piece.to_string();
        if (!piece.mirror.empty()) std::cout << " via " << piece.mirror;
        std::cout << std::endl;
    }
    return 0;
}

int CommandHandler::handle_show_config(const std::vector<std::string>&) {
    UserConfig config(UserConfig::default_path());
    config.load();
    std::cout << "Config file: " << config.get_path() << std::endl;
    std::cout << config.get_data().dump(2) << std::endl;
    return 0;
}

int CommandHandler::handle_version(const std::vector<std::string>&) {
    std::cout << Config::VERSION << std::endl;
    return 0;
}
