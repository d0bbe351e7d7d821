#pragma once

#include <string>
#include <optional>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace zulu::utils {

using json = nlohmann::json;

/**
 * JSON-backed configuration store
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
     * Save configuration to file
     */
    void save_to_file(const std::string& path) const;

    /**
     * Get a value from config. Missing keys and values of the wrong type
     * both yield nullopt. Negative numbers never convert to unsigned types.
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        if (!data_.contains(key)) {
            return std::nullopt;
        }
        if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
            const auto& value = data_.at(key);
            if (value.is_number() && !value.is_number_unsigned()) {
                return std::nullopt;
            }
        }
        try {
            return data_.at(key).get<T>();
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

    bool has(const std::string& key) const {
        return data_.contains(key);
    }

    const json& data() const { return data_; }

private:
    json data_ = json::object();
};

} // namespace zulu::utils
