// TimeUtils Header
#pragma once
#include <optional>
#include <string>
#include "domain/SeenRecord.hpp"

namespace finnews::infrastructure {

class TimeUtils {
public:
    /** @brief Formats as local time "YYYY-MM-DDTHH:MM:SS.ffffff". */
    static std::string ToIsoString(domain::TimePoint tp);

    /**
     * @brief Parses an ISO-8601 timestamp.
     *
     * Accepts a date alone, 'T' or ' ' as separator, optional seconds and fraction,
     * and an optional 'Z' or +HH:MM offset. Values without an offset are local time.
     */
    static std::optional<domain::TimePoint> FromIsoString(const std::string& text);

    /** @brief Formats the wall clock part only ("HH:MM:SS"). */
    static std::string ToClockString(domain::TimePoint tp);

    static domain::TimePoint Now();
};

} // namespace finnews::infrastructure
