#include "memmsg/status.hpp"

#include <string>

namespace memmsg
{
const char *Error::what() const
{
	switch (error_code) {
	case ErrorCode::InsufficientLength:
		return "insufficient buffer length";
	}
	return "unknown error";
}

std::string Error::message() const
{
	return std::string(what()) + ": message requires " + std::to_string(required_length) + " bytes, buffer holds " +
	       std::to_string(available_length);
}

std::ostream &operator<<(std::ostream &stream, const Error &error)
{
	return (stream << error.message());
}
} // namespace memmsg
