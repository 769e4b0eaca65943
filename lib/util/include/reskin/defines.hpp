#pragma once
#include <cstdint>

namespace reskin {
struct Version {
	std::uint32_t major{};
	std::uint32_t minor{};
	std::uint32_t patch{};
};

inline constexpr auto version_v = Version{0, 1, 0};

#if defined(NDEBUG)
inline constexpr bool debug_v = false;
#else
inline constexpr bool debug_v = true;
#endif
} // namespace reskin
