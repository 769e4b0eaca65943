#pragma once
#include <cstddef>
#include <memory>
#include <span>

namespace reskin {
///
/// \brief Owning, zero-initialized block of bytes: a file read whole, or an encoded skin waiting to be written.
///
/// A default constructed buffer holds nothing and tests false; a buffer of size 0 still tests true.
///
class ByteBuffer {
  public:
	ByteBuffer() = default;
	explicit ByteBuffer(std::size_t size) : m_bytes(std::make_unique<std::byte[]>(size)), m_size(size) {}

	std::size_t size() const { return m_size; }
	std::span<std::byte const> span() const { return {m_bytes.get(), m_size}; }
	std::span<std::byte> writable_span() { return {m_bytes.get(), m_size}; }

	explicit operator bool() const { return m_bytes != nullptr; }

  private:
	std::unique_ptr<std::byte[]> m_bytes{};
	std::size_t m_size{};
};
} // namespace reskin
