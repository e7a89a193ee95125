#include "infrastructure/TimeUtils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace finnews::infrastructure {

namespace {

using std::chrono::microseconds;
using std::chrono::seconds;

// Reads exactly `width` digits starting at pos.
bool ReadDigits(const std::string& s, size_t& pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += width;
    out = value;
    return true;
}

bool Expect(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

std::tm ToLocalTm(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

} // namespace

domain::TimePoint TimeUtils::Now() {
    return std::chrono::time_point_cast<microseconds>(domain::Clock::now());
}

std::string TimeUtils::ToIsoString(domain::TimePoint tp) {
    auto secs = std::chrono::floor<seconds>(tp);
    auto micros = (tp - secs).count();
    std::tm tm = ToLocalTm(domain::Clock::to_time_t(secs));

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

std::string TimeUtils::ToClockString(domain::TimePoint tp) {
    std::tm tm = ToLocalTm(domain::Clock::to_time_t(std::chrono::floor<seconds>(tp)));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S");
    return ss.str();
}

std::optional<domain::TimePoint> TimeUtils::FromIsoString(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    long micros = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') ||
            !ReadDigits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (Expect(text, pos, ':')) {
            if (!ReadDigits(text, pos, 2, second)) return std::nullopt;
            if (Expect(text, pos, '.') || Expect(text, pos, ',')) {
                size_t digits = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    if (digits < 6) micros = micros * 10 + (text[pos] - '0');
                    ++digits;
                    ++pos;
                }
                if (digits == 0) return std::nullopt;
                for (size_t i = digits; i < 6; ++i) micros *= 10;
            }
        }
    }
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t t = 0;
    if (pos == text.size()) {
        tm.tm_isdst = -1;
        t = std::mktime(&tm);
    } else {
        int offsetMinutes = 0;
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!ReadDigits(text, pos, 2, oh)) return std::nullopt;
            Expect(text, pos, ':');
            if (!ReadDigits(text, pos, 2, om)) return std::nullopt;
            offsetMinutes = sign * (oh * 60 + om);
        } else {
            return std::nullopt;
        }
        if (pos != text.size()) return std::nullopt;
        t = timegm(&tm) - static_cast<std::time_t>(offsetMinutes) * 60;
    }
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;

    return std::chrono::time_point_cast<microseconds>(domain::Clock::from_time_t(t)) + microseconds(micros);
}

} // namespace finnews::infrastructure
