#include "config.hpp"
#include "skillmint/error.hpp"
#include <fstream>

namespace skillmint::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException("failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw ConfigException("failed to parse config file: " + std::string(e.what()));
    }

    if (!config.data_.is_object()) {
        throw ConfigException("config root must be an object: " + path);
    }
    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigException("failed to parse JSON: " + std::string(e.what()));
    }
    if (!config.data_.is_object()) {
        throw ConfigException("config root must be an object");
    }
    return config;
}

Config Config::defaults() {
    Config config;
    config.set("log_level", "info");
    config.set("log_to_file", false);
    config.set("log_file", "skillmint.log");
    config.set("data_dir", "./data");
    config.set("snapshot_file", "ledger.json");
    config.set("completion_log_dir", "completions");
    config.set("payout_policy", "decrementing");
    config.set("verifier", "non_empty");
    return config;
}

void Config::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigException("failed to open file for writing: " + path);
    }

    file << data_.dump(2); // Pretty print with 2-space indent
}

void Config::merge(const Config& other) {
    for (auto it = other.data_.begin(); it != other.data_.end(); ++it) {
        data_[it.key()] = it.value();
    }
}

} // namespace skillmint::utils
