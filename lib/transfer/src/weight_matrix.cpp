#include <reskin/transfer/weight_matrix.hpp>
#include <reskin/util/error.hpp>
#include <fmt/format.h>

namespace reskin {
WeightMatrix WeightMatrix::from_bones(std::span<Bone const> bones, std::size_t vertex_count) {
	auto ret = WeightMatrix{vertex_count, bones.size()};
	for (std::size_t column = 0; column < bones.size(); ++column) {
		auto const& bone = bones[column];
		for (auto const& weight : bone.weights) {
			if (weight.vertex >= vertex_count) {
				throw ShapeMismatchError{fmt::format("Bone [{}] references vertex {} (of {})", bone.body, weight.vertex, vertex_count)};
			}
			ret.at(weight.vertex, column) = weight.weight;
		}
	}
	return ret;
}
} // namespace reskin
