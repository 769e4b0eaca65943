#pragma once
#include <stdexcept>

namespace reskin {
///
/// \brief Base reskin exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

///
/// \brief Malformed or truncated binary skin data.
///
struct FormatError : Error {
	using Error::Error;
};

///
/// \brief Empty point set given to a spatial index.
///
struct EmptyInputError : Error {
	using Error::Error;
};

///
/// \brief Structurally empty or inconsistent skin record.
///
struct ShapeMismatchError : Error {
	using Error::Error;
};

///
/// \brief Requested transfer mode is not implemented.
///
struct NotSupportedError : Error {
	using Error::Error;
};

///
/// \brief File could not be read, parsed or written.
///
struct LoadError : Error {
	using Error::Error;
};
} // namespace reskin
