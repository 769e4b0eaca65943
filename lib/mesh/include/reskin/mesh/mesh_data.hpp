#pragma once
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <vector>

namespace reskin {
///
/// \brief Triangle mesh as handed over by a mesh loader.
///
struct MeshData {
	///
	/// \brief Vertex positions, in file order.
	///
	std::vector<glm::vec3> positions{};
	///
	/// \brief Triangles indexing into positions.
	///
	std::vector<glm::uvec3> faces{};
	///
	/// \brief Texture coordinates, in file order (indexed independently of positions).
	///
	std::vector<glm::vec2> tex_coords{};
};
} // namespace reskin
