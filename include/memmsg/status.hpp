#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace memmsg
{
enum class ErrorCode : uint8_t {
	/// The caller-supplied buffer is shorter than the message.
	InsufficientLength,
};

/// @brief Runtime error of the copy operations. Only copies into or out of a caller-supplied buffer can fail; the
/// reinterpretations have no failure path.
/// The error is recoverable: retrying with a buffer of at least required() bytes succeeds.
class Error {
    public:
	explicit Error(ErrorCode code_, std::size_t required_, std::size_t available_)
		: error_code(code_), required_length(required_), available_length(available_){};

	static Error insufficient_length(std::size_t required, std::size_t available)
	{
		return Error(ErrorCode::InsufficientLength, required, available);
	}

	inline ErrorCode code() const
	{
		return error_code;
	}

	/// @brief Number of bytes the operation needed, i.e. the size of the message.
	inline std::size_t required() const
	{
		return required_length;
	}

	/// @brief Number of bytes the caller provided.
	inline std::size_t available() const
	{
		return available_length;
	}

	const char *what() const;

	/// @brief what(), with the required and available lengths.
	std::string message() const;

	friend bool operator==(const Error &, const Error &) = default;

    private:
	ErrorCode error_code;
	std::size_t required_length;
	std::size_t available_length;
};

std::ostream &operator<<(std::ostream &stream, const Error &error);
} // namespace memmsg
