#pragma once
#include <glm/vec3.hpp>
#include <cstdint>
#include <span>
#include <vector>

namespace reskin {
///
/// \brief Static k-d tree over a fixed point set, answering nearest neighbour queries.
///
/// The tree stores its own copy of the points; nothing is mutated after build.
///
class KdTree {
  public:
	///
	/// \brief Result of a nearest neighbour query.
	///
	struct Hit {
		///
		/// \brief Index of the closest point in the build set.
		///
		std::uint32_t index{};
		///
		/// \brief Euclidean distance to that point.
		///
		float distance{};

		bool operator==(Hit const&) const = default;
	};

	static constexpr std::uint32_t default_leaf_size_v{8};

	///
	/// \brief Build a tree over points.
	/// \param points Source point set
	/// \param leaf_size Maximum number of points stored per leaf
	/// \returns KdTree instance
	///
	/// Throws EmptyInputError if points is empty, Error if any coordinate is not finite.
	///
	static KdTree build(std::span<glm::vec3 const> points, std::uint32_t leaf_size = default_leaf_size_v) noexcept(false);

	///
	/// \brief Find the point closest to query.
	///
	/// Ties are broken by lowest source index. Throws Error if query is not finite.
	///
	Hit query_nearest(glm::vec3 const& query) const;
	///
	/// \brief Find the closest point for each of queries, in order.
	///
	/// Identical to calling query_nearest() on each point.
	///
	std::vector<Hit> query_nearest_batch(std::span<glm::vec3 const> queries) const;

	std::size_t size() const { return m_points.size(); }
	std::size_t node_count() const { return m_nodes.size(); }

  private:
	static constexpr std::int32_t branch_v{-1};

	struct Node {
		///
		/// \brief Branch: index of left child. Leaf: start of its range in m_indices.
		///
		std::uint32_t first{};
		///
		/// \brief Number of indices for a leaf, branch_v for a branch.
		///
		std::int32_t count{branch_v};
		std::uint32_t right{};
		float split{};
		std::uint8_t axis{};
	};

	struct Builder;
	struct Best;

	void search(std::uint32_t node, glm::vec3 const& query, Best& out_best) const;

	std::vector<glm::vec3> m_points{};
	std::vector<std::uint32_t> m_indices{};
	std::vector<Node> m_nodes{};
};
} // namespace reskin
