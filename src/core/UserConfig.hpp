#pragma once
#include "TransferOptions.hpp"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Persistent user preferences (config.json). Unknown keys are preserved.
class UserConfig {
private:
    std::string path;
    json data;

    void fill_defaults();

public:
    explicit UserConfig(const std::string& path);

    // $XDG_CONFIG_HOME/zdm/config.json, else ~/.config/zdm/config.json
    static std::string default_path();

    // A missing or corrupt file leaves the defaults in place.
    void load();
    // Writes through a temporary file and rename; creates the directory if needed.
    void save() const;

    int64_t get_piece_size() const;
    int get_concurrency() const;
    int get_timeout_seconds() const;
    std::string get_user_agent() const;

    void set(const std::string& key, const json& value);
    const json& get_data() const;
    const std::string& get_path() const;

    // Options seeded from this configuration; mirrors and destination left empty.
    TransferOptions to_options() const;
};
