#pragma once
#include <glm/vec3.hpp>
#include <span>
#include <vector>

namespace reskin {
///
/// \brief Convert points from the authoring tool's Z-up export convention.
/// \returns (x, -z, y) for each (x, y, z)
///
std::vector<glm::vec3> normalize_axes(std::span<glm::vec3 const> points);
} // namespace reskin
