#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace skillmint::utils {

using json = nlohmann::json;

/**
 * Configuration management system
 * Loaded from a JSON document; unknown keys are kept but ignored.
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from JSON file
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from JSON string
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Built-in defaults used when no config file exists
     */
    static Config defaults();

    /**
     * Save configuration to file
     */
    void save_to_file(const std::string& path) const;

    /**
     * Get a value from config; nullopt if missing or of the wrong type
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        try {
            return it->template get<T>();
        } catch (const json::type_error&) {
            return std::nullopt;
        }
    }

    /**
     * Get a value with default
     */
    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value.value_or(default_value);
    }

    /**
     * Set a value
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }

    /**
     * Overlay every key of `other` onto this config
     */
    void merge(const Config& other);

    bool has(const std::string& key) const {
        return data_.contains(key);
    }

    const json& data() const { return data_; }

private:
    json data_ = json::object();
};

} // namespace skillmint::utils
