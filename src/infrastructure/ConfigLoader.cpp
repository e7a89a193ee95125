/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace finnews::infrastructure {

using json = nlohmann::json;

namespace {

// Longer retention windows overflow the microsecond clock arithmetic.
constexpr long long kMaxKeepDays = 36500;

void ReadString(const json& j, const char* key, std::string& target) {
    if (!j.contains(key)) return;
    if (j[key].is_string() && !j[key].get<std::string>().empty()) {
        target = j[key].get<std::string>();
    } else {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "'" << std::endl;
    }
}

void ReadPositive(const json& j, const char* key, int& target,
                  long long maxValue = std::numeric_limits<int>::max()) {
    if (!j.contains(key)) return;
    if (j[key].is_number_integer() && j[key].get<long long>() > 0 && j[key].get<long long>() <= maxValue) {
        target = j[key].get<int>();
    } else {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "' (expected an integer from 1 to "
                  << maxValue << ")" << std::endl;
    }
}

void Apply(const json& j, domain::AppConfig& config) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Settings root is not an object, using defaults." << std::endl;
        return;
    }
    ReadString(j, "base_url", config.baseUrl);
    ReadPositive(j, "scrape_interval_seconds", config.scrapeIntervalSeconds);
    ReadString(j, "seen_log_path", config.seenLogPath);
    ReadPositive(j, "keep_days", config.keepDays, kMaxKeepDays);
    ReadPositive(j, "max_pages", config.maxPages);
    ReadString(j, "source_label", config.sourceLabel);
    ReadPositive(j, "min_title_length", config.minTitleLength);
    ReadPositive(j, "fetch_timeout_seconds", config.fetchTimeoutSeconds);
    ReadPositive(j, "article_char_limit", config.articleCharLimit);

    if (j.contains("excluded_link_markers")) {
        const json& markers = j["excluded_link_markers"];
        bool valid = markers.is_array() &&
            std::all_of(markers.begin(), markers.end(), [](const json& m) { return m.is_string(); });
        if (valid) {
            config.excludedLinkMarkers = markers.get<std::vector<std::string>>();
        } else {
            std::cerr << "[ConfigLoader] Ignoring invalid 'excluded_link_markers'" << std::endl;
        }
    }
}

} // namespace

domain::AppConfig ConfigLoader::FromJsonText(const std::string& text) {
    domain::AppConfig config;
    try {
        Apply(json::parse(text), config);
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings: " << e.what() << std::endl;
        return domain::AppConfig{};
    }
    return config;
}

domain::AppConfig ConfigLoader::Load(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return domain::AppConfig{};
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << path << ", using defaults." << std::endl;
        return domain::AppConfig{};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return FromJsonText(buffer.str());
}

} // namespace finnews::infrastructure
