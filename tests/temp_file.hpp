#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace reskin::tests {
///
/// \brief Text file in the system temp directory, removed on destruction.
///
class TempFile {
  public:
	TempFile(std::string_view name, std::string_view contents) : m_path(std::filesystem::temp_directory_path() / name) {
		auto file = std::ofstream{m_path, std::ios::binary | std::ios::trunc};
		file << contents;
	}

	~TempFile() {
		auto ec = std::error_code{};
		std::filesystem::remove(m_path, ec);
	}

	TempFile(TempFile const&) = delete;
	TempFile& operator=(TempFile const&) = delete;

	std::string path() const { return m_path.generic_string(); }

  private:
	std::filesystem::path m_path{};
};
} // namespace reskin::tests
