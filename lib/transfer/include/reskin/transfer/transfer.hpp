#pragma once
#include <reskin/mesh/mesh_data.hpp>
#include <reskin/skin/skin.hpp>
#include <reskin/spatial/kd_tree.hpp>
#include <reskin/transfer/weight_matrix.hpp>

namespace reskin {
///
/// \brief Parameters for transferring a skin onto a new mesh.
///
struct TransferInfo {
	///
	/// \brief Number of nearest source vertices blended per target vertex.
	///
	/// Only 1 (copy from the single nearest vertex) is implemented.
	///
	std::uint32_t neighbours{1};
	std::uint32_t leaf_size{KdTree::default_leaf_size_v};
	///
	/// \brief Drop zero weights from output bones instead of listing every target vertex.
	///
	bool sparse_output{};
};

///
/// \brief Distances between target vertices and their matched source vertices.
///
struct MatchStats {
	std::size_t count{};
	float max_distance{};
	float mean_distance{};
};

///
/// \brief Throws NotSupportedError unless neighbours is a supported neighbour count.
///
void check_neighbours(std::uint32_t neighbours) noexcept(false);

///
/// \brief Assign each target vertex the weight row of its nearest source vertex.
/// \param source Dense source weights, one row per point in index
/// \param index Spatial index over source vertex positions
/// \param targets Target vertex positions
/// \param neighbours Neighbour count (see TransferInfo)
/// \param out_stats Optional match statistics
/// \returns targets.size() x source.columns() matrix
///
WeightMatrix transfer_weights(WeightMatrix const& source, KdTree const& index, std::span<glm::vec3 const> targets, std::uint32_t neighbours = 1,
							  MatchStats* out_stats = {}) noexcept(false);

///
/// \brief Assign each target vertex the texture coordinate of its nearest source vertex.
/// \param source Source texture coordinates, one per point in index
///
std::vector<glm::vec2> transfer_tex_coords(std::span<glm::vec2 const> source, KdTree const& index, std::span<glm::vec3 const> targets);

///
/// \brief Rebuild source bones with weights taken from a column each of weights.
///
/// Bind pose and body are carried over unchanged. Every row is listed per bone
/// unless sparse is set, in which case zero weights are dropped.
///
std::vector<Bone> rebuild_bones(std::span<Bone const> source, WeightMatrix const& weights, bool sparse = false);

///
/// \brief Produce a skin for target by nearest neighbour transfer from source.
/// \param source Skinned reference record
/// \param target Mesh to receive weights and texture coordinates
/// \param info Transfer parameters
/// \returns New Skin with target's vertices and faces
///
/// Throws NotSupportedError for unsupported neighbour counts, ShapeMismatchError
/// if source has no vertices or no bones.
///
Skin transfer_skin(Skin const& source, MeshData const& target, TransferInfo const& info = {}) noexcept(false);
} // namespace reskin
