#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "TestFakes.hpp"

using namespace finnews;
using infrastructure::ConfigLoader;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    auto root = test::MakeTestRoot("config_loader");

    // Missing file: built-in defaults
    auto defaults = ConfigLoader::Load((root / "absent.json").string());
    assert(defaults.baseUrl == "https://apa.az/economy");
    assert(defaults.scrapeIntervalSeconds == 30);
    assert(defaults.seenLogPath == "seen_links.json");
    assert(defaults.keepDays == 7);
    assert(defaults.maxPages == 10);
    assert(defaults.excludedLinkMarkers.size() == 2);

    // Overrides
    {
        std::ofstream ofs(root / "settings.json");
        ofs << R"({
            "base_url": "https://example.test/news",
            "scrape_interval_seconds": 120,
            "keep_days": 3,
            "max_pages": 2,
            "excluded_link_markers": ["sport"],
            "seen_log_path": "/tmp/finnews_seen.json"
        })";
    }
    auto custom = ConfigLoader::Load((root / "settings.json").string());
    assert(custom.baseUrl == "https://example.test/news");
    assert(custom.scrapeIntervalSeconds == 120);
    assert(custom.keepDays == 3);
    assert(custom.maxPages == 2);
    assert(custom.excludedLinkMarkers.size() == 1 && custom.excludedLinkMarkers[0] == "sport");
    assert(custom.seenLogPath == "/tmp/finnews_seen.json");
    assert(custom.sourceLabel == "APA.az");

    // Invalid values fall back per key
    auto mixed = ConfigLoader::FromJsonText(R"({
        "scrape_interval_seconds": -5,
        "max_pages": "ten",
        "keep_days": 0,
        "base_url": 42,
        "excluded_link_markers": [1, 2],
        "min_title_length": 8
    })");
    assert(mixed.scrapeIntervalSeconds == 30);
    assert(mixed.maxPages == 10);
    assert(mixed.keepDays == 7);
    assert(mixed.baseUrl == "https://apa.az/economy");
    assert(mixed.excludedLinkMarkers.size() == 2);
    assert(mixed.minTitleLength == 8);

    // Retention windows too long for the clock arithmetic are rejected
    assert(ConfigLoader::FromJsonText(R"({"keep_days": 36500})").keepDays == 36500);
    assert(ConfigLoader::FromJsonText(R"({"keep_days": 36501})").keepDays == 7);
    assert(ConfigLoader::FromJsonText(R"({"keep_days": 2147483647})").keepDays == 7);
    assert(ConfigLoader::FromJsonText(R"({"max_pages": 2147483647})").maxPages == 2147483647);

    // Malformed documents: defaults
    assert(ConfigLoader::FromJsonText("{ broken").maxPages == 10);
    assert(ConfigLoader::FromJsonText("[1, 2]").keepDays == 7);

    std::filesystem::remove_all(root);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
