// TextUtils Header
#pragma once
#include <string>

namespace finnews::infrastructure {

class TextUtils {
public:
    /** @brief Strips ASCII whitespace and non-breaking spaces from both ends. */
    static std::string Trim(const std::string& s);

    static std::string ToLower(std::string s);

    /** @brief Number of UTF-8 code points (invalid bytes count as one each). */
    static size_t Utf8Length(const std::string& s);

    /** @brief Byte offset where the last `count` code points begin. */
    static size_t Utf8TailOffset(const std::string& s, size_t count);

    /** @brief Keeps at most `maxCodePoints` code points, never splitting a sequence. */
    static std::string Utf8Truncate(const std::string& s, size_t maxCodePoints);

    /** @brief Removes trailing characters contained in `chars` (ASCII only). */
    static std::string RightStrip(const std::string& s, const std::string& chars);
};

} // namespace finnews::infrastructure
