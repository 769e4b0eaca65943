#include <app/app.hpp>
#include <reskin/skin/skin_codec.hpp>
#include <reskin/util/data_provider.hpp>
#include <reskin/util/error.hpp>
#include <catch2/catch.hpp>
#include <temp_file.hpp>
#include <cstdlib>
#include <filesystem>

namespace reskin::tests {
namespace {
// two bones over a unit square; vertex 1 is shared half and half
Skin make_source() {
	auto ret = Skin{};
	ret.vertices = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
	ret.tex_coords = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}};
	ret.faces = {{0, 1, 2}, {0, 2, 3}};
	auto a = Bone{.body = "hip"};
	a.weights = {{0, 1.0f}, {1, 0.5f}};
	auto b = Bone{.body = "knee", .bind_position = {0.0f, 0.5f, 0.0f}};
	b.weights = {{1, 0.5f}, {2, 1.0f}};
	ret.bones = {a, b};
	return ret;
}

// target vertices sit near source vertices 1, 2 and 0 in that order
constexpr std::string_view target_obj_v = R"(o SKINbody
v 0.9 0.05 0.0
v 1.1 1.0 0.0
v -0.1 0.0 0.0
f 1 2 3
)";

std::string temp_path(std::string_view name) { return (std::filesystem::temp_directory_path() / name).generic_string(); }

std::string to_string(ByteBuffer const& bytes) {
	auto const span = bytes.span();
	return {reinterpret_cast<char const*>(span.data()), span.size()};
}
} // namespace

TEST_CASE("App-RejectsNeighboursBeforeIo", "[app]") {
	auto opts = AppOpts{};
	opts.source = temp_path("reskin_test_absent_source.skn");
	opts.mesh = temp_path("reskin_test_absent_target.obj");
	opts.output = temp_path("reskin_test_absent_output.skn");
	opts.config = temp_path("reskin_test_absent.conf");
	opts.neighbours = 3;
	// every path is missing: reading any of them first would raise LoadError instead
	REQUIRE_THROWS_AS(run(opts), NotSupportedError);
	REQUIRE_FALSE(std::filesystem::exists(opts.output));
	REQUIRE(execute(opts) == EXIT_FAILURE);

	opts.neighbours = 1;
	REQUIRE_THROWS_AS(run(opts), LoadError);
}

TEST_CASE("App-TransfersSkin", "[app]") {
	auto const source = TempFile{"reskin_test_app_source.skn", to_string(encode_skin(make_source()))};
	auto const target = TempFile{"reskin_test_app_target.obj", target_obj_v};
	auto const config = TempFile{"reskin_test_app.conf", "{}"};
	auto const output = TempFile{"reskin_test_app_output.skn", ""};

	auto opts = AppOpts{};
	opts.source = source.path();
	opts.mesh = target.path();
	opts.output = output.path();
	opts.config = config.path();
	opts.no_normalize = true;
	REQUIRE(execute(opts) == EXIT_SUCCESS);
	REQUIRE_FALSE(std::filesystem::exists(output.path() + ".tmp"));

	auto const bytes = FileDataProvider{}.load(output.path());
	REQUIRE(bytes);
	auto const result = decode_skin(bytes.span());
	REQUIRE(result.vertices.size() == 3);
	REQUIRE(result.faces.size() == 1);
	REQUIRE(result.tex_coords == std::vector<glm::vec2>{{1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 0.0f}});
	REQUIRE(result.bones.size() == 2);
	REQUIRE(result.bones[0].body == "hip");
	REQUIRE(result.bones[1].bind_position == glm::vec3{0.0f, 0.5f, 0.0f});
	using W = Bone::Weight;
	REQUIRE(result.bones[0].weights == std::vector<W>{{0, 0.5f}, {1, 0.0f}, {2, 1.0f}});
	REQUIRE(result.bones[1].weights == std::vector<W>{{0, 0.5f}, {1, 1.0f}, {2, 0.0f}});
}

TEST_CASE("App-MalformedSourceLeavesNoOutput", "[app]") {
	auto const source = TempFile{"reskin_test_app_bad.skn", "not a skin"};
	auto const target = TempFile{"reskin_test_app_bad.obj", target_obj_v};
	auto const config = TempFile{"reskin_test_app_bad.conf", "{}"};
	auto opts = AppOpts{};
	opts.source = source.path();
	opts.mesh = target.path();
	opts.output = temp_path("reskin_test_app_bad_output.skn");
	opts.config = config.path();
	REQUIRE_THROWS_AS(run(opts), FormatError);
	REQUIRE(execute(opts) == EXIT_FAILURE);
	REQUIRE_FALSE(std::filesystem::exists(opts.output));
}

TEST_CASE("App-DescribeFailure", "[app]") {
	REQUIRE(describe_failure(NotSupportedError{"k = 3"}) == "NotSupportedError: k = 3");
	REQUIRE(describe_failure(FormatError{"truncated"}) == "FormatError: truncated");
	REQUIRE(describe_failure(EmptyInputError{"no points"}) == "EmptyInputError: no points");
	REQUIRE(describe_failure(ShapeMismatchError{"no bones"}) == "ShapeMismatchError: no bones");
	REQUIRE(describe_failure(LoadError{"missing"}) == "LoadError: missing");
	REQUIRE(describe_failure(Error{"other"}) == "Error: other");
	REQUIRE(describe_failure(std::runtime_error{"boom"}) == "Fatal error: boom");
}
} // namespace reskin::tests
