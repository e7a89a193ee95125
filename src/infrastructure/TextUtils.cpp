#include "infrastructure/TextUtils.hpp"
#include <algorithm>
#include <cctype>

namespace finnews::infrastructure {

namespace {

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool IsAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string TextUtils::Trim(const std::string& s) {
    size_t a = 0;
    size_t b = s.size();
    while (a < b) {
        if (IsAsciiSpace(static_cast<unsigned char>(s[a]))) {
            ++a;
        } else if (b - a >= 2 && static_cast<unsigned char>(s[a]) == 0xC2 && static_cast<unsigned char>(s[a + 1]) == 0xA0) {
            a += 2;
        } else {
            break;
        }
    }
    while (b > a) {
        if (IsAsciiSpace(static_cast<unsigned char>(s[b - 1]))) {
            --b;
        } else if (b - a >= 2 && static_cast<unsigned char>(s[b - 2]) == 0xC2 && static_cast<unsigned char>(s[b - 1]) == 0xA0) {
            b -= 2;
        } else {
            break;
        }
    }
    return s.substr(a, b - a);
}

std::string TextUtils::ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

size_t TextUtils::Utf8Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if (!IsContinuation(c)) ++n;
    }
    return n;
}

size_t TextUtils::Utf8TailOffset(const std::string& s, size_t count) {
    size_t pos = s.size();
    while (pos > 0 && count > 0) {
        --pos;
        if (!IsContinuation(static_cast<unsigned char>(s[pos]))) --count;
    }
    return pos;
}

std::string TextUtils::Utf8Truncate(const std::string& s, size_t maxCodePoints) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!IsContinuation(static_cast<unsigned char>(s[i]))) {
            if (seen == maxCodePoints) return s.substr(0, i);
            ++seen;
        }
    }
    return s;
}

std::string TextUtils::RightStrip(const std::string& s, const std::string& chars) {
    size_t end = s.find_last_not_of(chars);
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

} // namespace finnews::infrastructure
