#include <reskin/util/logger.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace reskin {
namespace {
constexpr char level_tags_v[] = {'E', 'W', 'I', 'D'};

std::string make_timestamp() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	char buffer[16]{};
	if (!std::strftime(buffer, sizeof(buffer), "%H:%M:%S", std::localtime(&now))) { return {}; }
	return buffer;
}
} // namespace

std::string logger::format(Level level, std::string_view message) {
	return fmt::format("[{}] {} [{}]", level_tags_v[static_cast<std::size_t>(level)], message, make_timestamp());
}

void logger::log(Level level, std::string_view message) {
	auto* fd = level == Level::eError ? stderr : stdout;
	auto const line = format(level, message);
	std::fprintf(fd, "%s\n", line.c_str());
	std::fflush(fd);
}
} // namespace reskin
