#include <sstream>
#include <string>

#include <doctest/doctest.h>

#include "memmsg/status.hpp"

using namespace memmsg;

TEST_CASE("Error")
{
	const Error error = Error::insufficient_length(40, 39);

	CHECK(error.code() == ErrorCode::InsufficientLength);
	CHECK(error.required() == 40);
	CHECK(error.available() == 39);
	CHECK(std::string(error.what()) == "insufficient buffer length");
	CHECK(error.message() == "insufficient buffer length: message requires 40 bytes, buffer holds 39");

	std::ostringstream stream;
	stream << error;
	CHECK(stream.str() == error.message());

	CHECK(error == Error(ErrorCode::InsufficientLength, 40, 39));
	CHECK_FALSE(error == Error::insufficient_length(40, 0));
}
