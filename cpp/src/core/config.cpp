#include "fracktal/config.hpp"
#include "fracktal/error.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fracktal {

namespace {

// Environment variable -> config key
struct EnvBinding {
    const char* key;
    const char* env_var;
};

constexpr EnvBinding ENV_BINDINGS[] = {
    {"codec.symbol_range",        "FRACKTAL_SYMBOL_RANGE"},
    {"codec.hash_depth",          "FRACKTAL_HASH_DEPTH"},
    {"codec.min_pattern_length",  "FRACKTAL_MIN_PATTERN_LENGTH"},
    {"codec.min_occurrences",     "FRACKTAL_MIN_OCCURRENCES"},
    {"codec.min_savings",         "FRACKTAL_MIN_SAVINGS"},
    {"codec.max_pattern_length",  "FRACKTAL_MAX_PATTERN_LENGTH"},
    {"codec.max_patterns",        "FRACKTAL_MAX_PATTERNS"},
    {"codec.search_budget",       "FRACKTAL_SEARCH_BUDGET"},
    {"perf.threads",              "FRACKTAL_THREADS"},
    {"log.level",                 "FRACKTAL_LOG_LEVEL"},
};

// Upper bound on worker threads a config may request
constexpr size_t MAX_THREADS = 1024;

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // anonymous namespace

void CodecConfig::validate() const {
    ErrorHandler::check_argument(symbol_range > 0,
        "symbol_range must be positive", "CodecConfig");
    ErrorHandler::check_argument(min_pattern_length >= 2,
        "min_pattern_length must be at least 2, got " + std::to_string(min_pattern_length),
        "CodecConfig");
    ErrorHandler::check_argument(min_occurrences >= 2,
        "min_occurrences must be at least 2, got " + std::to_string(min_occurrences),
        "CodecConfig");
    ErrorHandler::check_argument(max_pattern_length >= min_pattern_length,
        "max_pattern_length (" + std::to_string(max_pattern_length) +
        ") is below min_pattern_length (" + std::to_string(min_pattern_length) + ")",
        "CodecConfig");
    ErrorHandler::check_argument(num_threads <= MAX_THREADS,
        "num_threads exceeds " + std::to_string(MAX_THREADS), "CodecConfig");
}

void Config::load(const std::string& config_file) {
    load_from_env();

    if (!config_file.empty()) {
        if (std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        } else {
            LOG_WARN("Config file not found: ", config_file);
        }
    }
}

void Config::load_from_env() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& binding : ENV_BINDINGS) {
        const char* value = std::getenv(binding.env_var);
        if (value && *value) {
            values_[binding.key] = value;
        }
    }
}

void Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARN("Could not open config file: ", filename);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#' || stripped[0] == ';') continue;

        size_t equals_pos = stripped.find('=');
        if (equals_pos == std::string::npos) {
            LOG_WARN("Ignoring malformed line ", line_no, " in ", filename);
            continue;
        }

        std::string key = trim(stripped.substr(0, equals_pos));
        std::string value = trim(stripped.substr(equals_pos + 1));
        if (!key.empty()) {
            values_[key] = value;
        }
    }

    LOG_INFO("Loaded configuration from file: ", filename);
}

CodecConfig load_codec_config(const std::string& config_file) {
    Config& config = Config::getInstance();
    config.load(config_file);

    std::string level_name = config.get<std::string>("log.level");
    if (!level_name.empty()) {
        if (auto level = parse_log_level(level_name)) {
            set_log_level(*level);
        } else {
            LOG_WARN("Unknown log level '", level_name, "', keeping current level");
        }
    }

    CodecConfig defaults;
    CodecConfig result;
    result.symbol_range = config.get<uint32_t>("codec.symbol_range", defaults.symbol_range);
    result.hash_depth = config.get<uint32_t>("codec.hash_depth", defaults.hash_depth);
    result.min_pattern_length = config.get<size_t>("codec.min_pattern_length", defaults.min_pattern_length);
    result.min_occurrences = config.get<size_t>("codec.min_occurrences", defaults.min_occurrences);
    result.min_savings_threshold = config.get<int64_t>("codec.min_savings", defaults.min_savings_threshold);
    result.max_pattern_length = config.get<size_t>("codec.max_pattern_length", defaults.max_pattern_length);
    result.max_patterns = config.get<size_t>("codec.max_patterns", defaults.max_patterns);
    result.search_budget = config.get<uint64_t>("codec.search_budget", defaults.search_budget);
    result.num_threads = config.get<size_t>("perf.threads", defaults.num_threads);

    try {
        result.validate();
    } catch (const InvalidArgumentError& e) {
        LOG_ERROR("Invalid codec configuration: ", e.what());
        throw;
    }

    LOG_DEBUG("Codec config: R=", result.symbol_range, " depth=", result.hash_depth,
              " min_len=", result.min_pattern_length, " min_occ=", result.min_occurrences,
              " min_savings=", result.min_savings_threshold, " threads=", result.num_threads);
    return result;
}

} // namespace fracktal
