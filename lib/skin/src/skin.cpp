#include <reskin/skin/skin.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace reskin {
namespace {
template <typename T>
bool is_finite(T const& t) {
	for (glm::length_t i = 0; i < T::length(); ++i) {
		if (!std::isfinite(t[i])) { return false; }
	}
	return true;
}
} // namespace

std::string find_violation(Skin const& skin) {
	auto const vertex_count = skin.vertices.size();
	if (!skin.tex_coords.empty() && skin.tex_coords.size() != vertex_count) {
		return fmt::format("{} texture coordinates for {} vertices", skin.tex_coords.size(), vertex_count);
	}
	for (std::size_t i = 0; i < vertex_count; ++i) {
		if (!is_finite(skin.vertices[i])) { return fmt::format("vertex {} is not finite", i); }
	}
	for (std::size_t i = 0; i < skin.tex_coords.size(); ++i) {
		if (!is_finite(skin.tex_coords[i])) { return fmt::format("texture coordinate {} is not finite", i); }
	}
	for (std::size_t i = 0; i < skin.faces.size(); ++i) {
		auto const& face = skin.faces[i];
		for (glm::length_t j = 0; j < 3; ++j) {
			if (face[j] >= vertex_count) { return fmt::format("face {} references vertex {} (of {})", i, face[j], vertex_count); }
		}
	}
	auto seen = std::vector<bool>(vertex_count);
	for (auto const& bone : skin.bones) {
		if (bone.body.size() > Bone::body_max_v) { return fmt::format("bone body [{}] exceeds {} bytes", bone.body, Bone::body_max_v); }
		if (bone.body.find('\0') != std::string::npos) { return fmt::format("bone body [{}] contains a null byte", bone.body); }
		if (!is_finite(bone.bind_position) || !is_finite(bone.bind_rotation)) { return fmt::format("bone [{}] bind pose is not finite", bone.body); }
		std::fill(seen.begin(), seen.end(), false);
		for (auto const& weight : bone.weights) {
			if (weight.vertex >= vertex_count) { return fmt::format("bone [{}] references vertex {} (of {})", bone.body, weight.vertex, vertex_count); }
			if (seen[weight.vertex]) { return fmt::format("bone [{}] lists vertex {} more than once", bone.body, weight.vertex); }
			// negated test so NaN fails too
			if (!(weight.weight >= 0.0f && weight.weight <= 1.0f)) {
				return fmt::format("bone [{}] weight {} for vertex {} is outside [0, 1]", bone.body, weight.weight, weight.vertex);
			}
			seen[weight.vertex] = true;
		}
	}
	return {};
}
} // namespace reskin
