// Ansi Header
#pragma once

namespace finnews::ui::ansi {

inline constexpr const char* reset = "\x1b[0m";
inline constexpr const char* bold = "\x1b[1m";
inline constexpr const char* dim = "\x1b[2m";

inline constexpr const char* cyan = "\x1b[36m";
inline constexpr const char* green = "\x1b[32m";
inline constexpr const char* yellow = "\x1b[33m";
inline constexpr const char* magenta = "\x1b[35m";
inline constexpr const char* red = "\x1b[31m";
inline constexpr const char* blue = "\x1b[94m";
inline constexpr const char* muted = "\x1b[90m";

inline constexpr const char* clearScreen = "\x1b[2J\x1b[H";

} // namespace finnews::ui::ansi
