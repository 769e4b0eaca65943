#include <reskin/transfer/transfer.hpp>
#include <reskin/util/error.hpp>
#include <reskin/util/logger.hpp>
#include <algorithm>

namespace reskin {
namespace {
MatchStats make_stats(std::span<KdTree::Hit const> hits) {
	auto ret = MatchStats{.count = hits.size()};
	if (hits.empty()) { return ret; }
	auto total = double{};
	for (auto const& hit : hits) {
		ret.max_distance = std::max(ret.max_distance, hit.distance);
		total += hit.distance;
	}
	ret.mean_distance = static_cast<float>(total / static_cast<double>(hits.size()));
	return ret;
}
} // namespace

void check_neighbours(std::uint32_t neighbours) {
	if (neighbours == 1) { return; }
	throw NotSupportedError{fmt::format("Neighbour count {} is not supported: only nearest neighbour (1) transfer is implemented", neighbours)};
}

WeightMatrix transfer_weights(WeightMatrix const& source, KdTree const& index, std::span<glm::vec3 const> targets, std::uint32_t neighbours,
							  MatchStats* out_stats) {
	check_neighbours(neighbours);
	if (source.rows() != index.size()) {
		throw ShapeMismatchError{fmt::format("Weight matrix has {} rows for {} indexed vertices", source.rows(), index.size())};
	}
	auto const hits = index.query_nearest_batch(targets);
	auto ret = WeightMatrix{targets.size(), source.columns()};
	for (std::size_t i = 0; i < hits.size(); ++i) {
		auto const row = source.row(hits[i].index);
		std::copy(row.begin(), row.end(), ret.row(i).begin());
	}
	if (out_stats) { *out_stats = make_stats(hits); }
	return ret;
}

std::vector<glm::vec2> transfer_tex_coords(std::span<glm::vec2 const> source, KdTree const& index, std::span<glm::vec3 const> targets) {
	if (source.size() != index.size()) {
		throw ShapeMismatchError{fmt::format("{} texture coordinates for {} indexed vertices", source.size(), index.size())};
	}
	auto ret = std::vector<glm::vec2>{};
	ret.reserve(targets.size());
	for (auto const& hit : index.query_nearest_batch(targets)) { ret.push_back(source[hit.index]); }
	return ret;
}

std::vector<Bone> rebuild_bones(std::span<Bone const> source, WeightMatrix const& weights, bool sparse) {
	if (source.size() != weights.columns()) {
		throw ShapeMismatchError{fmt::format("{} bones for {} weight columns", source.size(), weights.columns())};
	}
	auto ret = std::vector<Bone>{};
	ret.reserve(source.size());
	for (std::size_t column = 0; column < source.size(); ++column) {
		auto& bone = ret.emplace_back();
		bone.body = source[column].body;
		bone.bind_position = source[column].bind_position;
		bone.bind_rotation = source[column].bind_rotation;
		if (!sparse) { bone.weights.reserve(weights.rows()); }
		for (std::size_t row = 0; row < weights.rows(); ++row) {
			auto const weight = weights.at(row, column);
			if (sparse && weight == 0.0f) { continue; }
			bone.weights.push_back({.vertex = static_cast<std::uint32_t>(row), .weight = weight});
		}
	}
	return ret;
}

Skin transfer_skin(Skin const& source, MeshData const& target, TransferInfo const& info) {
	check_neighbours(info.neighbours);
	if (source.vertices.empty()) { throw ShapeMismatchError{"Source skin has no vertices"}; }
	if (source.bones.empty()) { throw ShapeMismatchError{"Source skin has no bones"}; }
	if (target.positions.empty()) { logger::warn("Target mesh has no vertices"); }

	auto const source_weights = WeightMatrix::from_bones(source.bones, source.vertices.size());
	auto const index = KdTree::build(source.vertices, info.leaf_size);
	logger::debug("Built spatial index: {} points, {} nodes", index.size(), index.node_count());

	auto stats = MatchStats{};
	auto const weights = transfer_weights(source_weights, index, target.positions, info.neighbours, &stats);
	logger::info("Matched {} target vertices: mean distance {:.6f}, max distance {:.6f}", stats.count, stats.mean_distance, stats.max_distance);

	auto ret = Skin{};
	ret.vertices = target.positions;
	if (source.tex_coords.empty()) {
		logger::warn("Source skin has no texture coordinates; output will have none");
	} else {
		ret.tex_coords = transfer_tex_coords(source.tex_coords, index, target.positions);
	}
	ret.faces = target.faces;
	ret.bones = rebuild_bones(source.bones, weights, info.sparse_output);
	return ret;
}
} // namespace reskin
