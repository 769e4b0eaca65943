#include <reskin/mesh/axes.hpp>

std::vector<glm::vec3> reskin::normalize_axes(std::span<glm::vec3 const> points) {
	auto ret = std::vector<glm::vec3>{};
	ret.reserve(points.size());
	// swap y and z, then flip the new y
	for (auto const& p : points) { ret.push_back({p.x, -p.z, p.y}); }
	return ret;
}
