#pragma once
#include <reskin/mesh/mesh_data.hpp>
#include <string_view>

namespace reskin {
///
/// \brief Load a triangulated Wavefront OBJ.
/// \param path Path to the .obj file
/// \param object Name of the object whose faces to collect; empty to collect every object
/// \returns MeshData with every vertex position of the file and the selected faces
///
/// Throws LoadError if the file cannot be parsed, the object is not present,
/// or a face references a missing vertex.
///
MeshData load_obj(std::string_view path, std::string_view object) noexcept(false);
} // namespace reskin
