#pragma once
#include <glm/gtc/quaternion.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace reskin {
///
/// \brief Skeletal joint with bind pose and sparse per-vertex weights.
///
struct Bone {
	struct Weight {
		std::uint32_t vertex{};
		float weight{};

		bool operator==(Weight const&) const = default;
	};

	///
	/// \brief Maximum encoded length of body, in bytes.
	///
	static constexpr std::size_t body_max_v{40};

	///
	/// \brief Identifier of the skeleton body this bone drives.
	///
	std::string body{};
	glm::vec3 bind_position{};
	glm::quat bind_rotation{1.0f, 0.0f, 0.0f, 0.0f};
	///
	/// \brief Ordered weight assignments; a vertex appears at most once.
	///
	std::vector<Weight> weights{};

	bool operator==(Bone const&) const = default;
};

///
/// \brief Mesh geometry bound to skeletal bone weights.
///
/// tex_coords is either empty or parallel to vertices.
///
struct Skin {
	std::vector<glm::vec3> vertices{};
	std::vector<glm::vec2> tex_coords{};
	std::vector<glm::uvec3> faces{};
	std::vector<Bone> bones{};

	bool operator==(Skin const&) const = default;
};

///
/// \brief Check a Skin against its structural invariants.
///
/// Besides index ranges, every position, texture coordinate and bind pose component must be finite
/// and every weight must lie in [0, 1].
///
/// \returns Description of the first violation found, or an empty string if valid
///
std::string find_violation(Skin const& skin);
} // namespace reskin
