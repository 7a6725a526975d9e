#include "UserConfig.hpp"
#include "Errors.hpp"
#include "../commands/helpers/Config.hpp"
#include "../utils/FileUtils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

UserConfig::UserConfig(const std::string& path) : path(path), data(json::object()) {
    fill_defaults();
}

std::string UserConfig::default_path() {
    std::string base;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    if (xdg && *xdg) {
        base = xdg;
    } else if (home && *home) {
        base = std::string(home) + "/.config";
    } else {
        base = ".";
    }
    return base + "/" + Config::CONFIG_DIRECTORY + "/" + Config::CONFIG_FILENAME;
}

void UserConfig::load() {
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            json parsed = json::parse(file);
            if (parsed.is_object()) {
                data = parsed;
            } else {
                std::cerr << "Ignoring " << path << ": top level is not an object" << std::endl;
                data = json::object();
            }
        } catch (const json::parse_error& e) {
            std::cerr << "Ignoring corrupt config " << path << ": " << e.what() << std::endl;
            data = json::object();
        }
    }
    fill_defaults();
}

void UserConfig::fill_defaults() {
    if (!data.contains("piece_size") || !data["piece_size"].is_number_integer()) {
        data["piece_size"] = Config::DEFAULT_PIECE_SIZE;
    }
    if (!data.contains("concurrency") || !data["concurrency"].is_number_integer()) {
        data["concurrency"] = Config::DEFAULT_CONCURRENCY;
    }
    if (!data.contains("timeout_seconds") || !data["timeout_seconds"].is_number_integer()) {
        data["timeout_seconds"] = Config::DEFAULT_TIMEOUT_SECONDS;
    }
    if (!data.contains("user_agent") || !data["user_agent"].is_string()) {
        data["user_agent"] = Config::DEFAULT_USER_AGENT;
    }
}

void UserConfig::save() const {
    FileUtils::make_parent_directories(path);

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw StorageError("Failed to create", tmp_path, errno);
        }
        out << data.dump(2) << std::endl;
        if (!out) {
            throw StorageError("Failed to write", tmp_path, errno);
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        throw StorageError("Failed to replace", path, errno);
    }
}

int64_t UserConfig::get_piece_size() const {
    return data["piece_size"].get<int64_t>();
}

int UserConfig::get_concurrency() const {
    return data["concurrency"].get<int>();
}

int UserConfig::get_timeout_seconds() const {
    return data["timeout_seconds"].get<int>();
}

std::string UserConfig::get_user_agent() const {
    return data["user_agent"].get<std::string>();
}

void UserConfig::set(const std::string& key, const json& value) {
    data[key] = value;
    fill_defaults();
}

const json& UserConfig::get_data() const {
    return data;
}

const std::string& UserConfig::get_path() const {
    return path;
}

TransferOptions UserConfig::to_options() const {
    TransferOptions options;
    options.piece_size = get_piece_size();
    options.concurrency = get_concurrency();
    options.timeout_ms = get_timeout_seconds() * 1000L;
    options.user_agent = get_user_agent();
    return options;
}
