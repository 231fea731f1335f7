// Must not compile: the record holds a pointer.
#include "memmsg/cast.hpp"

#include "messages.hpp"

int main()
{
	memmsg::AlignedBuffer<memmsg::test::WithPointer> buffer;
	return memmsg::cast_from_bytes(buffer).data == nullptr ? 0 : 1;
}
