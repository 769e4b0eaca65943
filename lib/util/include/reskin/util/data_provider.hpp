#pragma once
#include <reskin/util/byte_buffer.hpp>
#include <string>
#include <string_view>

namespace reskin {
///
/// \brief Reads and writes whole files relative to a mounted directory.
///
class FileDataProvider {
  public:
	///
	/// \brief Create an instance with the parent directory of filename mounted as the root / prefix.
	/// \param filename (Absolute or relative) path to the filename whose parent directory to mount
	/// \returns FileDataProvider instance
	///
	static FileDataProvider mount_parent_dir(std::string_view filename);

	///
	/// \brief Construct an instance with directory mounted as the root / prefix.
	/// \param directory (Absolute or relative) path to the directory to mount; empty for the working directory
	///
	FileDataProvider(std::string_view directory = {});

	///
	/// \brief Load the whole file located at uri.
	/// \returns An empty ByteBuffer if the file could not be read
	///
	ByteBuffer load(std::string_view uri) const;

	///
	/// \brief Write bytes to uri, replacing any existing file.
	///
	/// Bytes go to a sibling "<uri>.tmp" which is renamed over uri once fully written;
	/// on failure the temporary is removed and any existing file at uri is left untouched.
	///
	/// \returns false If the data could not be fully written and moved into place
	///
	bool store(std::string_view uri, std::span<std::byte const> bytes) const;

  private:
	std::string resolve(std::string_view uri) const;

	std::string m_directory{};
};
} // namespace reskin
