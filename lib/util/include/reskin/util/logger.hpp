#pragma once
#include <fmt/format.h>
#include <reskin/defines.hpp>
#include <string>
#include <string_view>

namespace reskin::logger {
enum class Level : std::uint8_t { eError, eWarn, eInfo, eDebug };

///
/// \brief Format message as "[L] message [HH:MM:SS]".
///
std::string format(Level level, std::string_view message);

///
/// \brief Format and write one line: errors to stderr, everything else to stdout.
///
void log(Level level, std::string_view message);

template <typename... Args>
void error(fmt::format_string<Args const&...> fmt, Args const&... args) {
	log(Level::eError, fmt::format(fmt, args...));
}

template <typename... Args>
void warn(fmt::format_string<Args const&...> fmt, Args const&... args) {
	log(Level::eWarn, fmt::format(fmt, args...));
}

template <typename... Args>
void info(fmt::format_string<Args const&...> fmt, Args const&... args) {
	log(Level::eInfo, fmt::format(fmt, args...));
}

template <typename... Args>
void debug(fmt::format_string<Args const&...> fmt, Args const&... args) {
	if constexpr (debug_v) { log(Level::eDebug, fmt::format(fmt, args...)); }
}
} // namespace reskin::logger
