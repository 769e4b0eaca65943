#include <reskin/mesh/obj_loader.hpp>
#include <reskin/util/error.hpp>
#include <reskin/util/logger.hpp>
#include <tiny_obj_loader.h>
#include <filesystem>

namespace reskin {
namespace {
std::uint32_t to_vertex(tinyobj::index_t const& index, std::size_t vertex_count, std::string_view shape) {
	if (index.vertex_index < 0 || static_cast<std::size_t>(index.vertex_index) >= vertex_count) {
		throw LoadError{fmt::format("Object [{}] references vertex {} (of {})", shape, index.vertex_index, vertex_count)};
	}
	return static_cast<std::uint32_t>(index.vertex_index);
}

void append_faces(std::vector<glm::uvec3>& out, tinyobj::shape_t const& shape, std::size_t vertex_count) {
	auto const& mesh = shape.mesh;
	std::size_t offset{};
	for (auto const face_size : mesh.num_face_vertices) {
		// triangulated on load; anything else is a point or line element
		if (face_size != 3) {
			offset += face_size;
			continue;
		}
		auto const& is = mesh.indices;
		out.push_back({to_vertex(is[offset], vertex_count, shape.name), to_vertex(is[offset + 1], vertex_count, shape.name),
					   to_vertex(is[offset + 2], vertex_count, shape.name)});
		offset += 3;
	}
}
} // namespace

MeshData load_obj(std::string_view path, std::string_view object) {
	auto config = tinyobj::ObjReaderConfig{};
	config.triangulate = true;
	config.vertex_color = false;
	config.mtl_search_path = std::filesystem::path{path}.parent_path().generic_string();

	auto reader = tinyobj::ObjReader{};
	if (!reader.ParseFromFile(std::string{path}, config)) {
		throw LoadError{fmt::format("Failed to load mesh [{}]: {}", path, reader.Error().empty() ? "unknown error" : reader.Error())};
	}
	if (!reader.Warning().empty()) { logger::warn("[{}]: {}", path, reader.Warning()); }

	auto const& attrib = reader.GetAttrib();
	auto ret = MeshData{};
	ret.positions.reserve(attrib.vertices.size() / 3);
	for (std::size_t i = 0; i + 2 < attrib.vertices.size(); i += 3) {
		ret.positions.push_back({attrib.vertices[i], attrib.vertices[i + 1], attrib.vertices[i + 2]});
	}
	ret.tex_coords.reserve(attrib.texcoords.size() / 2);
	for (std::size_t i = 0; i + 1 < attrib.texcoords.size(); i += 2) { ret.tex_coords.push_back({attrib.texcoords[i], attrib.texcoords[i + 1]}); }

	auto found = false;
	for (auto const& shape : reader.GetShapes()) {
		if (!object.empty() && shape.name != object) { continue; }
		append_faces(ret.faces, shape, ret.positions.size());
		found = true;
	}
	if (!found && !object.empty()) { throw LoadError{fmt::format("Object [{}] not found in [{}]", object, path)}; }

	logger::debug("Loaded [{}]: {} vertices, {} faces, {} texcoords", path, ret.positions.size(), ret.faces.size(), ret.tex_coords.size());
	return ret;
}
} // namespace reskin
