// Must compile: the same calls on a transfer-safe record.
#include <array>
#include <cstddef>
#include <utility>

#include "memmsg/cast.hpp"

#include "messages.hpp"

int main()
{
	memmsg::test::Sample message{123456789};
	std::array<std::byte, 64> buffer{};
	if (!memmsg::write_into(std::as_const(message), buffer) || !memmsg::read_from(buffer, message))
		return 1;

	memmsg::AlignedBuffer<memmsg::test::Sample> reception;
	memmsg::cast_from_bytes(reception) = message;
	return memmsg::cast_to_bytes(message).size() == std::as_const(reception).bytes().size() ? 0 : 1;
}
