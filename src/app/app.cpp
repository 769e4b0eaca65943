#include <app/app.hpp>
#include <config/config.hpp>
#include <reskin/defines.hpp>
#include <reskin/mesh/axes.hpp>
#include <reskin/mesh/obj_loader.hpp>
#include <reskin/skin/skin_codec.hpp>
#include <reskin/transfer/transfer.hpp>
#include <reskin/util/data_provider.hpp>
#include <reskin/util/error.hpp>
#include <reskin/util/logger.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>

namespace reskin {
namespace {
namespace fs = std::filesystem;

void log_prologue() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	char buf[32]{};
	std::strftime(buf, sizeof(buf), "%F %Z", std::localtime(&now));
	logger::info("reskin {} | {} |", version_string(), buf);
}

Skin read_skin(std::string const& path) {
	auto const provider = FileDataProvider::mount_parent_dir(path);
	auto const bytes = provider.load(fs::path{path}.filename().generic_string());
	if (!bytes) { throw LoadError{fmt::format("Failed to read skin [{}]", path)}; }
	auto ret = decode_skin(bytes.span());
	logger::info("Read skin [{}]: {} vertices, {} faces, {} bones", path, ret.vertices.size(), ret.faces.size(), ret.bones.size());
	return ret;
}

MeshData read_mesh(std::string const& path, Config const& config) {
	auto ret = load_obj(path, config.mesh.object);
	if (config.mesh.normalize_axes) { ret.positions = normalize_axes(ret.positions); }
	logger::info("Read mesh [{}]: {} vertices, {} faces", path, ret.positions.size(), ret.faces.size());
	return ret;
}

void write_skin(std::string const& path, Skin const& skin) {
	auto const bytes = encode_skin(skin);
	if (!FileDataProvider{}.store(path, bytes.span())) { throw LoadError{fmt::format("Failed to write skin [{}]", path)}; }
	logger::info("Wrote skin [{}]: {} vertices, {} bones ({} bytes)", path, skin.vertices.size(), skin.bones.size(), bytes.size());
}

std::string_view error_kind(std::exception const& error) {
	if (dynamic_cast<NotSupportedError const*>(&error)) { return "NotSupportedError"; }
	if (dynamic_cast<FormatError const*>(&error)) { return "FormatError"; }
	if (dynamic_cast<EmptyInputError const*>(&error)) { return "EmptyInputError"; }
	if (dynamic_cast<ShapeMismatchError const*>(&error)) { return "ShapeMismatchError"; }
	if (dynamic_cast<LoadError const*>(&error)) { return "LoadError"; }
	if (dynamic_cast<Error const*>(&error)) { return "Error"; }
	return "Fatal error";
}
} // namespace

std::string_view version_string() {
	static auto const ret = fmt::format("v{}.{}.{}", version_v.major, version_v.minor, version_v.patch);
	return ret;
}

void run(AppOpts const& opts) {
	// fail unsupported modes before touching any file
	check_neighbours(opts.neighbours);

	auto const explicit_config = !opts.config.empty();
	auto config = Config::load(explicit_config ? opts.config.c_str() : Config::default_path_v, explicit_config);
	if (opts.object) { config.mesh.object = *opts.object; }
	if (opts.sparse) { config.transfer.sparse_output = true; }
	if (opts.no_normalize) { config.mesh.normalize_axes = false; }

	log_prologue();
	auto const source = read_skin(opts.source);
	auto const target = read_mesh(opts.mesh, config);

	auto info = TransferInfo{};
	info.neighbours = opts.neighbours;
	info.leaf_size = config.transfer.leaf_size;
	info.sparse_output = config.transfer.sparse_output;
	auto const output = transfer_skin(source, target, info);

	write_skin(opts.output, output);
}

std::string describe_failure(std::exception const& error) { return fmt::format("{}: {}", error_kind(error), error.what()); }

int execute(AppOpts const& opts) {
	try {
		run(opts);
	} catch (std::exception const& e) {
		logger::error("{}", describe_failure(e));
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
} // namespace reskin
