#pragma once

#include <string>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "fracktal/types.hpp"
#include "fracktal/logging.hpp"

namespace fracktal {

/**
 * Codec parameters. Plain values: the codec never reads the environment,
 * hosts build one of these (directly or through load_codec_config()) and
 * pass it in.
 */
struct CodecConfig {
    uint32_t symbol_range = DEFAULT_SYMBOL_RANGE;   // R
    uint32_t hash_depth = DEFAULT_HASH_DEPTH;

    size_t min_pattern_length = 4;
    size_t min_occurrences = 3;
    int64_t min_savings_threshold = 1;       // Accept only if estimated savings exceed this

    size_t max_pattern_length = 20;
    size_t max_patterns = 256;
    uint64_t search_budget = uint64_t(1) << 24;   // Windows scanned across all lengths

    size_t num_threads = 0;   // 0 = hardware concurrency, 1 = sequential

    // Throws InvalidArgumentError on the first out-of-range field
    void validate() const;

    bool operator==(const CodecConfig& other) const = default;
};

/**
 * Key/value configuration store: environment first, then an optional
 * `key = value` file (lines starting with '#' or ';' are comments).
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    void load(const std::string& config_file = "");

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return it->second;
            } else if constexpr (std::is_signed_v<T>) {
                size_t consumed = 0;
                long long parsed = std::stoll(it->second, &consumed);
                if (consumed != it->second.size()) throw std::invalid_argument(key);
                return static_cast<T>(parsed);
            } else {
                size_t consumed = 0;
                if (it->second.front() == '-') throw std::invalid_argument(key);
                unsigned long long parsed = std::stoull(it->second, &consumed);
                if (consumed != it->second.size()) throw std::invalid_argument(key);
                return static_cast<T>(parsed);
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "' (", it->second, "), using default");
            return default_value;
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env();
    void load_from_file(const std::string& filename);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

/**
 * Populate a CodecConfig from FRACKTAL_* environment variables and an
 * optional config file, apply the log level, and validate the result.
 */
CodecConfig load_codec_config(const std::string& config_file = "");

} // namespace fracktal
