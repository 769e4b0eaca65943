#pragma once
#include <cstdint>
#include <string>

namespace reskin {
struct Config {
	static constexpr char const* default_path_v{"reskin.conf"};

	struct {
		std::string object{"SKINbody"};
		bool normalize_axes{true};
	} mesh{};

	struct {
		bool sparse_output{};
		std::uint32_t leaf_size{8};
	} transfer{};

	///
	/// \brief Load a Config from a JSON file.
	/// \param path Path to the file
	/// \param required Whether a missing file is an error (otherwise defaults are returned)
	/// \returns Config with values not present in the file left at their defaults
	///
	/// Throws LoadError if the file cannot be parsed, holds invalid values, or is required but missing.
	///
	static Config load(char const* path, bool required) noexcept(false);
};
} // namespace reskin
