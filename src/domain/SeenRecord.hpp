/**
 * @file SeenRecord.hpp
 * @brief Persisted metadata for a link observed in a previous crawl.
 */

#pragma once
#include <chrono>
#include <string>

namespace finnews::domain {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

/**
 * @struct SeenRecord
 * @brief Snapshot taken the first time a link was seen.
 */
struct SeenRecord {
    std::string title;   ///< Title at first sighting.
    TimePoint firstSeenAt; ///< Microsecond precision, matches the on-disk format.
};

} // namespace finnews::domain
