#include <reskin/util/data_provider.hpp>
#include <reskin/util/logger.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace reskin {
namespace fs = std::filesystem;

FileDataProvider FileDataProvider::mount_parent_dir(std::string_view filename) {
	return FileDataProvider{fs::path{filename}.parent_path().generic_string()};
}

FileDataProvider::FileDataProvider(std::string_view directory) : m_directory(directory) {}

std::string FileDataProvider::resolve(std::string_view uri) const {
	if (m_directory.empty()) { return std::string{uri}; }
	return (fs::path{m_directory} / uri).generic_string();
}

ByteBuffer FileDataProvider::load(std::string_view uri) const {
	auto const path = resolve(uri);
	auto file = std::ifstream(path, std::ios::binary | std::ios::ate);
	if (!file) { return {}; }
	auto const size = file.tellg();
	if (size < 0) { return {}; }
	file.seekg(0, std::ios::beg);
	auto ret = ByteBuffer{static_cast<std::size_t>(size)};
	if (!file.read(reinterpret_cast<char*>(ret.writable_span().data()), size)) { return {}; }
	logger::debug("Loaded [{}] ({} bytes)", path, ret.size());
	return ret;
}

bool FileDataProvider::store(std::string_view uri, std::span<std::byte const> bytes) const {
	auto const path = fs::path{resolve(uri)};
	auto temp = path;
	temp += ".tmp";
	auto written = false;
	{
		auto file = std::ofstream(temp, std::ios::binary | std::ios::trunc);
		if (!file) { return false; }
		file.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
		file.close();
		written = !file.fail();
	}
	auto ec = std::error_code{};
	if (written) { fs::rename(temp, path, ec); }
	if (!written || ec) {
		logger::debug("Failed to store [{}]: {}", path.generic_string(), ec ? ec.message() : "write failed");
		fs::remove(temp, ec);
		return false;
	}
	logger::debug("Stored [{}] ({} bytes)", path.generic_string(), bytes.size());
	return true;
}
} // namespace reskin
