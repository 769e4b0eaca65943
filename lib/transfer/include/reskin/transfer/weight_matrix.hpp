#pragma once
#include <reskin/skin/skin.hpp>
#include <cassert>
#include <span>
#include <vector>

namespace reskin {
///
/// \brief Dense row-major vertices x bones weight table.
///
class WeightMatrix {
  public:
	WeightMatrix() = default;
	///
	/// \brief Construct a zero-filled matrix.
	///
	WeightMatrix(std::size_t rows, std::size_t columns) : m_values(rows * columns), m_rows(rows), m_columns(columns) {}

	///
	/// \brief Expand sparse per-bone weights into a dense matrix.
	/// \param bones Bones, one column each (in order)
	/// \param vertex_count Number of rows
	/// \returns Matrix with unlisted entries set to zero
	///
	/// Throws ShapeMismatchError if a bone references a vertex outside [0, vertex_count).
	///
	static WeightMatrix from_bones(std::span<Bone const> bones, std::size_t vertex_count) noexcept(false);

	std::size_t rows() const { return m_rows; }
	std::size_t columns() const { return m_columns; }

	float at(std::size_t row, std::size_t column) const { return m_values[index(row, column)]; }
	float& at(std::size_t row, std::size_t column) { return m_values[index(row, column)]; }

	std::span<float const> row(std::size_t row) const { return std::span{m_values}.subspan(row * m_columns, m_columns); }
	std::span<float> row(std::size_t row) { return std::span{m_values}.subspan(row * m_columns, m_columns); }

	bool operator==(WeightMatrix const&) const = default;

  private:
	std::size_t index(std::size_t row, std::size_t column) const {
		assert(row < m_rows && column < m_columns);
		return row * m_columns + column;
	}

	std::vector<float> m_values{};
	std::size_t m_rows{};
	std::size_t m_columns{};
};
} // namespace reskin
