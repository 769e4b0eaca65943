#include <reskin/mesh/axes.hpp>
#include <reskin/mesh/obj_loader.hpp>
#include <reskin/util/error.hpp>
#include <catch2/catch.hpp>
#include <temp_file.hpp>

namespace reskin::tests {
namespace {
constexpr std::string_view two_objects_v = R"(# exported
o SKINbody
v 0.0 0.0 0.0
v 1.0 0.0 0.0
v 1.0 1.0 0.0
v 0.0 1.0 0.0
vt 0.0 0.0
vt 1.0 0.0
vt 1.0 1.0
vt 0.0 1.0
f 1/1 2/2 3/3
f 1/1 3/3 4/4
o Other
v 5.0 6.0 7.0
f 1 2 5
)";

constexpr std::string_view quad_v = R"(o SKINbody
v 0.0 0.0 0.0
v 1.0 0.0 0.0
v 1.0 1.0 0.0
v 0.0 1.0 0.0
f 1 2 3 4
)";
} // namespace

TEST_CASE("ObjLoader-NamedObject", "[mesh]") {
	auto const file = TempFile{"reskin_test_named.obj", two_objects_v};
	auto const mesh = load_obj(file.path(), "SKINbody");
	// positions are the whole file's vertex list, in order
	REQUIRE(mesh.positions.size() == 5);
	REQUIRE(mesh.positions[1] == glm::vec3{1.0f, 0.0f, 0.0f});
	REQUIRE(mesh.positions[4] == glm::vec3{5.0f, 6.0f, 7.0f});
	REQUIRE(mesh.faces == std::vector<glm::uvec3>{{0, 1, 2}, {0, 2, 3}});
	REQUIRE(mesh.tex_coords.size() == 4);
	REQUIRE(mesh.tex_coords[2] == glm::vec2{1.0f, 1.0f});
}

TEST_CASE("ObjLoader-AllObjects", "[mesh]") {
	auto const file = TempFile{"reskin_test_all.obj", two_objects_v};
	auto const mesh = load_obj(file.path(), {});
	REQUIRE(mesh.faces.size() == 3);
	REQUIRE(mesh.faces[2] == glm::uvec3{0, 1, 4});
}

TEST_CASE("ObjLoader-Triangulates", "[mesh]") {
	auto const file = TempFile{"reskin_test_quad.obj", quad_v};
	auto const mesh = load_obj(file.path(), "SKINbody");
	REQUIRE(mesh.faces.size() == 2);
	for (auto const& face : mesh.faces) {
		for (glm::length_t i = 0; i < 3; ++i) { REQUIRE(face[i] < 4); }
	}
}

TEST_CASE("ObjLoader-Failures", "[mesh]") {
	auto const file = TempFile{"reskin_test_fail.obj", two_objects_v};
	REQUIRE_THROWS_AS(load_obj(file.path(), "Missing"), LoadError);
	REQUIRE_THROWS_AS(load_obj(file.path() + ".absent", "SKINbody"), LoadError);
}

TEST_CASE("Axes-Normalize", "[mesh]") {
	std::vector<glm::vec3> const points = {{1.0f, 2.0f, 3.0f}, {-4.0f, 0.0f, 0.5f}};
	auto const normalized = normalize_axes(points);
	REQUIRE(normalized == std::vector<glm::vec3>{{1.0f, -3.0f, 2.0f}, {-4.0f, -0.5f, 0.0f}});
	REQUIRE(normalize_axes({}).empty());
}
} // namespace reskin::tests
