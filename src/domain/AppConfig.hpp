/**
 * @file AppConfig.hpp
 * @brief Settings fixed at process start.
 */

#pragma once
#include <string>
#include <vector>

namespace finnews::domain {

/**
 * @struct AppConfig
 * @brief Listing source, polling cadence and retention policy.
 */
struct AppConfig {
    std::string baseUrl = "https://apa.az/economy"; ///< Page 1 of the listing.
    int scrapeIntervalSeconds = 30;                  ///< Pause between poll cycles.
    std::string seenLogPath = "seen_links.json";     ///< JSON file of previously seen links.
    int keepDays = 7;                                ///< Retention window for seen links.
    int maxPages = 10;                               ///< Page ceiling per poll cycle.
    std::string sourceLabel = "APA.az";
    int minTitleLength = 5;
    std::vector<std::string> excludedLinkMarkers = {"rates", "weather"};
    int fetchTimeoutSeconds = 25;
    int articleCharLimit = 20000;
};

} // namespace finnews::domain
