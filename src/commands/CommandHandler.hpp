#pragma once
#include <string>
#include <vector>
#include <cstdint>

class TransferEngine;

class CommandHandler {
public:
    static int execute(const std::string& command, const std::vector<std::string>& args);
    static void print_usage(const std::string& program);

    // Engine that SIGINT/SIGTERM should cancel, if a download is running.
    static TransferEngine* active_engine();

    // Whole decimal number within [min_value, max_value]; throws ConfigurationError naming flag.
    static int64_t parse_number(const std::string& flag, const std::string& value,
                                int64_t min_value, int64_t max_value);

private:
    static int handle_download(const std::vector<std::string>& args);
    static int handle_probe(const std::vector<std::string>& args);
    static int handle_plan(const std::vector<std::string>& args);
    static int handle_status(const std::vector<std::string>& args);
    static int handle_show_config(const std::vector<std::string>& args);
    static int handle_version(const std::vector<std::string>& args);
};
