#include <reskin/skin/skin_codec.hpp>
#include <reskin/util/error.hpp>
#include <algorithm>
#include <bit>
#include <cassert>
#include <cstring>
#include <limits>
#include <fmt/format.h>

namespace reskin {
namespace {
constexpr std::size_t header_size_v{4 * sizeof(std::int32_t)};
constexpr std::size_t bone_fixed_size_v{Bone::body_max_v + 3 * sizeof(float) + 4 * sizeof(float) + sizeof(std::int32_t)};

static_assert(sizeof(float) == 4 && std::numeric_limits<float>::is_iec559);

class Reader {
  public:
	explicit Reader(std::span<std::byte const> bytes) : m_bytes(bytes) {}

	std::size_t remaining() const { return m_bytes.size(); }

	void require(std::size_t count, std::string_view what) const {
		if (m_bytes.size() < count) { throw FormatError{fmt::format("Truncated skin data reading {}: need {} bytes, have {}", what, count, m_bytes.size())}; }
	}

	template <typename T>
	T read() {
		assert(m_bytes.size() >= sizeof(T));
		T ret;
		if constexpr (std::endian::native == std::endian::big) {
			std::byte buffer[sizeof(T)]{};
			std::reverse_copy(m_bytes.begin(), m_bytes.begin() + sizeof(T), buffer);
			std::memcpy(&ret, buffer, sizeof(T));
		} else {
			std::memcpy(&ret, m_bytes.data(), sizeof(T));
		}
		m_bytes = m_bytes.subspan(sizeof(T));
		return ret;
	}

	std::string read_name() {
		auto const* first = reinterpret_cast<char const*>(m_bytes.data());
		auto const* last = first + Bone::body_max_v;
		auto ret = std::string{first, std::find(first, last, '\0')};
		m_bytes = m_bytes.subspan(Bone::body_max_v);
		return ret;
	}

  private:
	std::span<std::byte const> m_bytes;
};

class Writer {
  public:
	explicit Writer(std::span<std::byte> bytes) : m_bytes(bytes) {}

	template <typename T>
	void write(T const t) {
		assert(m_bytes.size() >= sizeof(T));
		std::memcpy(m_bytes.data(), &t, sizeof(T));
		if constexpr (std::endian::native == std::endian::big) { std::reverse(m_bytes.begin(), m_bytes.begin() + sizeof(T)); }
		m_bytes = m_bytes.subspan(sizeof(T));
	}

	void write_name(std::string_view name) {
		assert(name.size() <= Bone::body_max_v && m_bytes.size() >= Bone::body_max_v);
		std::memcpy(m_bytes.data(), name.data(), name.size());
		std::fill(m_bytes.begin() + name.size(), m_bytes.begin() + Bone::body_max_v, std::byte{});
		m_bytes = m_bytes.subspan(Bone::body_max_v);
	}

	std::size_t remaining() const { return m_bytes.size(); }

  private:
	std::span<std::byte> m_bytes;
};

std::size_t to_count(std::int32_t value, std::string_view what) {
	if (value < 0) { throw FormatError{fmt::format("Invalid skin header: negative {} count ({})", what, value)}; }
	return static_cast<std::size_t>(value);
}

std::uint32_t to_vertex(std::int32_t value, std::size_t vertex_count, std::string_view what) {
	if (value < 0 || static_cast<std::size_t>(value) >= vertex_count) {
		throw FormatError{fmt::format("Invalid {}: vertex index {} out of range [0, {})", what, value, vertex_count)};
	}
	return static_cast<std::uint32_t>(value);
}

Bone read_bone(Reader& reader, std::size_t vertex_count, std::vector<bool>& seen) {
	reader.require(bone_fixed_size_v, "bone");
	auto ret = Bone{};
	ret.body = reader.read_name();
	for (glm::length_t i = 0; i < 3; ++i) { ret.bind_position[i] = reader.read<float>(); }
	ret.bind_rotation.w = reader.read<float>();
	ret.bind_rotation.x = reader.read<float>();
	ret.bind_rotation.y = reader.read<float>();
	ret.bind_rotation.z = reader.read<float>();
	auto const count = to_count(reader.read<std::int32_t>(), "bone vertex");
	reader.require(count * (sizeof(std::int32_t) + sizeof(float)), "bone weights");
	ret.weights.resize(count);
	std::fill(seen.begin(), seen.end(), false);
	for (auto& weight : ret.weights) {
		weight.vertex = to_vertex(reader.read<std::int32_t>(), vertex_count, "bone vertex id");
		if (seen[weight.vertex]) { throw FormatError{fmt::format("Bone [{}] lists vertex {} more than once", ret.body, weight.vertex)}; }
		seen[weight.vertex] = true;
	}
	for (auto& weight : ret.weights) { weight.weight = reader.read<float>(); }
	return ret;
}
} // namespace

Skin decode_skin(std::span<std::byte const> bytes) {
	auto reader = Reader{bytes};
	reader.require(header_size_v, "header");
	auto const vertex_count = to_count(reader.read<std::int32_t>(), "vertex");
	auto const tex_coord_count = to_count(reader.read<std::int32_t>(), "texcoord");
	auto const face_count = to_count(reader.read<std::int32_t>(), "face");
	auto const bone_count = to_count(reader.read<std::int32_t>(), "bone");
	if (tex_coord_count != 0 && tex_coord_count != vertex_count) {
		throw FormatError{fmt::format("Invalid skin header: {} texcoords for {} vertices", tex_coord_count, vertex_count)};
	}
	reader.require(vertex_count * 3 * sizeof(float) + tex_coord_count * 2 * sizeof(float) + face_count * 3 * sizeof(std::int32_t), "geometry");

	auto ret = Skin{};
	ret.vertices.resize(vertex_count);
	for (auto& vertex : ret.vertices) {
		for (glm::length_t i = 0; i < 3; ++i) { vertex[i] = reader.read<float>(); }
	}
	ret.tex_coords.resize(tex_coord_count);
	for (auto& uv : ret.tex_coords) {
		for (glm::length_t i = 0; i < 2; ++i) { uv[i] = reader.read<float>(); }
	}
	ret.faces.resize(face_count);
	for (auto& face : ret.faces) {
		for (glm::length_t i = 0; i < 3; ++i) { face[i] = to_vertex(reader.read<std::int32_t>(), vertex_count, "face"); }
	}
	// a bone needs at least bone_fixed_size_v bytes: reject absurd counts before reserving
	if (bone_count > reader.remaining() / bone_fixed_size_v) {
		throw FormatError{fmt::format("Truncated skin data: {} bones declared, {} bytes remain", bone_count, reader.remaining())};
	}
	ret.bones.reserve(bone_count);
	auto seen = std::vector<bool>(vertex_count);
	for (std::size_t i = 0; i < bone_count; ++i) { ret.bones.push_back(read_bone(reader, vertex_count, seen)); }
	if (reader.remaining() > 0) { throw FormatError{fmt::format("Skin data has {} trailing bytes after {} bones", reader.remaining(), bone_count)}; }
	if (auto const violation = find_violation(ret); !violation.empty()) { throw FormatError{"Invalid skin data: " + violation}; }
	return ret;
}

std::size_t encoded_size(Skin const& skin) {
	auto ret = header_size_v;
	ret += skin.vertices.size() * 3 * sizeof(float);
	ret += skin.tex_coords.size() * 2 * sizeof(float);
	ret += skin.faces.size() * 3 * sizeof(std::int32_t);
	for (auto const& bone : skin.bones) { ret += bone_fixed_size_v + bone.weights.size() * (sizeof(std::int32_t) + sizeof(float)); }
	return ret;
}

ByteBuffer encode_skin(Skin const& skin) {
	if (auto const violation = find_violation(skin); !violation.empty()) { throw ShapeMismatchError{"Cannot encode skin: " + violation}; }
	auto ret = ByteBuffer{encoded_size(skin)};
	auto writer = Writer{ret.writable_span()};
	writer.write(static_cast<std::int32_t>(skin.vertices.size()));
	writer.write(static_cast<std::int32_t>(skin.tex_coords.size()));
	writer.write(static_cast<std::int32_t>(skin.faces.size()));
	writer.write(static_cast<std::int32_t>(skin.bones.size()));
	for (auto const& vertex : skin.vertices) {
		for (glm::length_t i = 0; i < 3; ++i) { writer.write(vertex[i]); }
	}
	for (auto const& uv : skin.tex_coords) {
		for (glm::length_t i = 0; i < 2; ++i) { writer.write(uv[i]); }
	}
	for (auto const& face : skin.faces) {
		for (glm::length_t i = 0; i < 3; ++i) { writer.write(static_cast<std::int32_t>(face[i])); }
	}
	for (auto const& bone : skin.bones) {
		writer.write_name(bone.body);
		for (glm::length_t i = 0; i < 3; ++i) { writer.write(bone.bind_position[i]); }
		writer.write(bone.bind_rotation.w);
		writer.write(bone.bind_rotation.x);
		writer.write(bone.bind_rotation.y);
		writer.write(bone.bind_rotation.z);
		writer.write(static_cast<std::int32_t>(bone.weights.size()));
		for (auto const& weight : bone.weights) { writer.write(static_cast<std::int32_t>(weight.vertex)); }
		for (auto const& weight : bone.weights) { writer.write(weight.weight); }
	}
	assert(writer.remaining() == 0);
	return ret;
}
} // namespace reskin
