#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace reskin {
///
/// \brief Command line choices for one transfer run.
///
/// Empty config selects Config::default_path_v (optional); set fields override the loaded Config.
///
struct AppOpts {
	std::string source{};
	std::string mesh{};
	std::string output{};
	std::string config{};
	std::optional<std::string> object{};
	std::uint32_t neighbours{1};
	bool sparse{};
	bool no_normalize{};
};

std::string_view version_string();

///
/// \brief Transfer the skin at opts.source onto the mesh at opts.mesh and write it to opts.output.
///
/// The neighbour count is checked before any file is touched, and opts.output is only written
/// once the new skin has been fully encoded. Errors propagate to the caller.
///
void run(AppOpts const& opts) noexcept(false);

///
/// \brief Describe error as "<Kind>: <message>", Kind naming its reskin error type.
///
std::string describe_failure(std::exception const& error);

///
/// \brief Invoke run(), logging any failure through describe_failure().
/// \returns EXIT_SUCCESS or EXIT_FAILURE
///
int execute(AppOpts const& opts);
} // namespace reskin
