#pragma once
#include <reskin/skin/skin.hpp>
#include <reskin/util/byte_buffer.hpp>
#include <span>

namespace reskin {
///
/// \brief Decode a binary skin (MuJoCo .skn layout).
/// \param bytes Entire contents of a skin file
/// \returns Decoded Skin
///
/// Throws FormatError if the data is truncated, has an invalid header, references
/// out-of-range vertices, or carries bytes beyond the declared counts.
///
Skin decode_skin(std::span<std::byte const> bytes) noexcept(false);

///
/// \brief Obtain the exact number of bytes encode_skin will produce for skin.
///
std::size_t encoded_size(Skin const& skin);

///
/// \brief Encode skin into its binary representation.
/// \param skin Skin to encode
/// \returns Encoded bytes
///
/// Throws ShapeMismatchError if skin violates its structural invariants.
/// Output is deterministic: equal skins produce identical bytes.
///
ByteBuffer encode_skin(Skin const& skin) noexcept(false);
} // namespace reskin
