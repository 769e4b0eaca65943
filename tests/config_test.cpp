#include <config/config.hpp>
#include <reskin/util/error.hpp>
#include <catch2/catch.hpp>
#include <temp_file.hpp>

namespace reskin::tests {
TEST_CASE("Config-Defaults", "[config]") {
	auto const config = Config::load("reskin_test_absent.conf", false);
	REQUIRE(config.mesh.object == "SKINbody");
	REQUIRE(config.mesh.normalize_axes);
	REQUIRE_FALSE(config.transfer.sparse_output);
	REQUIRE(config.transfer.leaf_size == 8);
	REQUIRE_THROWS_AS(Config::load("reskin_test_absent.conf", true), LoadError);
}

TEST_CASE("Config-Values", "[config]") {
	auto const file = TempFile{"reskin_test_values.conf", R"({
  "mesh": { "object": "body_lod0", "normalize_axes": false },
  "transfer": { "sparse_output": true, "leaf_size": 16 }
})"};
	auto const config = Config::load(file.path().c_str(), true);
	REQUIRE(config.mesh.object == "body_lod0");
	REQUIRE_FALSE(config.mesh.normalize_axes);
	REQUIRE(config.transfer.sparse_output);
	REQUIRE(config.transfer.leaf_size == 16);
}

TEST_CASE("Config-Partial", "[config]") {
	auto const file = TempFile{"reskin_test_partial.conf", R"({ "transfer": { "sparse_output": true } })"};
	auto const config = Config::load(file.path().c_str(), true);
	REQUIRE(config.mesh.object == "SKINbody");
	REQUIRE(config.mesh.normalize_axes);
	REQUIRE(config.transfer.sparse_output);
	REQUIRE(config.transfer.leaf_size == 8);
}

TEST_CASE("Config-InvalidLeafSize", "[config]") {
	auto const file = TempFile{"reskin_test_leaf.conf", R"({ "transfer": { "leaf_size": 0 } })"};
	REQUIRE_THROWS_AS(Config::load(file.path().c_str(), true), LoadError);
}
} // namespace reskin::tests
