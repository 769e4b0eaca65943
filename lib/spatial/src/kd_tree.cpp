#include <reskin/spatial/kd_tree.hpp>
#include <reskin/util/error.hpp>
#include <fmt/format.h>
#include <glm/common.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace reskin {
namespace {
bool is_finite(glm::vec3 const& p) { return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z); }

float distance2(glm::vec3 const& a, glm::vec3 const& b) {
	auto const d = a - b;
	return d.x * d.x + d.y * d.y + d.z * d.z;
}

std::uint8_t widest_axis(glm::vec3 const& min, glm::vec3 const& max) {
	auto const extent = max - min;
	if (extent.x >= extent.y && extent.x >= extent.z) { return 0; }
	return extent.y >= extent.z ? 1 : 2;
}
} // namespace

struct KdTree::Builder {
	KdTree& tree;
	std::uint32_t leaf_size{};

	std::uint32_t add_node() {
		tree.m_nodes.emplace_back();
		return static_cast<std::uint32_t>(tree.m_nodes.size() - 1);
	}

	void build_r(std::uint32_t start, std::uint32_t end, std::uint32_t node_index) {
		auto const count = end - start;
		if (count <= leaf_size) {
			tree.m_nodes[node_index].first = start;
			tree.m_nodes[node_index].count = static_cast<std::int32_t>(count);
			return;
		}

		auto min = tree.m_points[tree.m_indices[start]];
		auto max = min;
		for (auto i = start + 1; i < end; ++i) {
			auto const& p = tree.m_points[tree.m_indices[i]];
			min = glm::min(min, p);
			max = glm::max(max, p);
		}
		auto const axis = widest_axis(min, max);

		// order by (coordinate, index) so equal coordinates split deterministically
		auto const mid = start + count / 2;
		auto const first = tree.m_indices.begin();
		auto const& points = tree.m_points;
		std::nth_element(first + start, first + mid, first + end, [&points, axis](std::uint32_t a, std::uint32_t b) {
			auto const pa = points[a][axis];
			auto const pb = points[b][axis];
			return pa < pb || (pa == pb && a < b);
		});

		auto const left = add_node();
		build_r(start, mid, left);
		auto const right = add_node();
		build_r(mid, end, right);

		auto& node = tree.m_nodes[node_index];
		node.first = left;
		node.right = right;
		node.count = branch_v;
		node.axis = axis;
		node.split = points[tree.m_indices[mid]][axis];
	}
};

struct KdTree::Best {
	float distance2{std::numeric_limits<float>::infinity()};
	std::uint32_t index{std::numeric_limits<std::uint32_t>::max()};

	void offer(float d2, std::uint32_t i) {
		if (d2 < distance2 || (d2 == distance2 && i < index)) {
			distance2 = d2;
			index = i;
		}
	}
};

KdTree KdTree::build(std::span<glm::vec3 const> points, std::uint32_t leaf_size) {
	if (points.empty()) { throw EmptyInputError{"Cannot build a spatial index over an empty point set"}; }
	for (std::size_t i = 0; i < points.size(); ++i) {
		if (!is_finite(points[i])) { throw Error{fmt::format("Point {} has a non-finite coordinate", i)}; }
	}
	auto ret = KdTree{};
	ret.m_points.assign(points.begin(), points.end());
	ret.m_indices.resize(points.size());
	for (std::uint32_t i = 0; i < ret.m_indices.size(); ++i) { ret.m_indices[i] = i; }
	auto builder = Builder{.tree = ret, .leaf_size = std::max(leaf_size, 1U)};
	auto const root = builder.add_node();
	builder.build_r(0, static_cast<std::uint32_t>(points.size()), root);
	return ret;
}

void KdTree::search(std::uint32_t node_index, glm::vec3 const& query, Best& out_best) const {
	auto const& node = m_nodes[node_index];
	if (node.count != branch_v) {
		auto const last = node.first + static_cast<std::uint32_t>(node.count);
		for (auto i = node.first; i < last; ++i) {
			auto const index = m_indices[i];
			out_best.offer(distance2(m_points[index], query), index);
		}
		return;
	}
	// left subtree holds coordinates <= split, right subtree >= split
	auto const diff = query[node.axis] - node.split;
	auto const near_child = diff < 0.0f ? node.first : node.right;
	auto const far_child = diff < 0.0f ? node.right : node.first;
	search(near_child, query, out_best);
	// visit on equality too: the far side may hold an equidistant point with a lower index
	if (diff * diff <= out_best.distance2) { search(far_child, query, out_best); }
}

KdTree::Hit KdTree::query_nearest(glm::vec3 const& query) const {
	if (!is_finite(query)) { throw Error{fmt::format("Query point ({}, {}, {}) is not finite", query.x, query.y, query.z)}; }
	auto best = Best{};
	search(0, query, best);
	return Hit{.index = best.index, .distance = std::sqrt(best.distance2)};
}

std::vector<KdTree::Hit> KdTree::query_nearest_batch(std::span<glm::vec3 const> queries) const {
	auto ret = std::vector<Hit>{};
	ret.reserve(queries.size());
	for (auto const& query : queries) { ret.push_back(query_nearest(query)); }
	return ret;
}
} // namespace reskin
