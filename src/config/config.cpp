#include <config/config.hpp>
#include <djson/json.hpp>
#include <reskin/util/error.hpp>
#include <reskin/util/logger.hpp>
#include <filesystem>

namespace reskin {
namespace {
void from_json(dj::Json const& json, Config& out) {
	auto const& mesh = json["mesh"];
	if (auto const& object = mesh["object"]) { out.mesh.object = object.as_string(); }
	out.mesh.normalize_axes = mesh["normalize_axes"].as_bool(dj::Boolean{out.mesh.normalize_axes}).value;

	auto const& transfer = json["transfer"];
	out.transfer.sparse_output = transfer["sparse_output"].as_bool(dj::Boolean{out.transfer.sparse_output}).value;
	if (auto const& leaf_size = transfer["leaf_size"]) {
		auto const value = leaf_size.as<int>();
		if (value <= 0) { throw LoadError{fmt::format("Invalid transfer.leaf_size: {}", value)}; }
		out.transfer.leaf_size = static_cast<std::uint32_t>(value);
	}
}
} // namespace

Config Config::load(char const* path, bool required) {
	auto ret = Config{};
	if (!std::filesystem::is_regular_file(path)) {
		if (required) { throw LoadError{fmt::format("Config file not found: [{}]", path)}; }
		return ret;
	}
	auto json = dj::Json::from_file(path);
	if (!json) { throw LoadError{fmt::format("Failed to parse config [{}]", path)}; }
	from_json(json, ret);
	logger::info("Loaded config from [{}]", path);
	return ret;
}
} // namespace reskin
