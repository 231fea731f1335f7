#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <span>
#include <utility>
#include <vector>

#include <cxxopts.hpp>

#include "memmsg/memmsg.hpp"

#include "errorHandler.hpp"
#include "heartbeat.hpp"
#include "inspectorCLI.h"

using inspector::Heartbeat;

static void dump(std::span<const std::byte> bytes)
{
	constexpr size_t BYTES_PER_LINE = 16;
	for (size_t offset = 0; offset < bytes.size(); offset += BYTES_PER_LINE) {
		std::cout << std::setw(4) << std::setfill('0') << std::hex << offset << ':';
		for (size_t i = offset; i < std::min(offset + BYTES_PER_LINE, bytes.size()); ++i)
			std::cout << ' ' << std::setw(2) << static_cast<unsigned>(bytes[i]);
		std::cout << std::dec << std::setfill(' ') << std::endl;
	}
}

static Heartbeat make_heartbeat(const InspectorCLI &cli)
{
	Heartbeat heartbeat{};
	heartbeat.timestamp = cli.timestamp();
	heartbeat.sequence = cli.sequence();
	heartbeat.load = cli.load();
	heartbeat.health = cli.degraded() ? inspector::DEGRADED : inspector::HEALTHY;

	// At most MAX_READINGS: InspectorCLI rejects more.
	std::ranges::copy(cli.readings(), heartbeat.readings.begin());
	return heartbeat;
}

int main(int argc, char *argv[])
{
	ErrorHandler errors;

	try {
		InspectorCLI cli(argc, argv);

		const Heartbeat sent = make_heartbeat(cli);
		std::cout << "Sending " << sent << " (" << sizeof(Heartbeat) << " bytes)" << std::endl;

		std::vector<std::byte> buffer(cli.buffer_size());
		if (auto written = memmsg::write_into(sent, buffer); !written) {
			errors.handle(written.error());
			return EXIT_FAILURE;
		}

		std::cout << "Buffer (" << buffer.size() << " bytes):" << std::endl;
		dump(buffer);

		memmsg::AlignedBuffer<Heartbeat> reception;
		if (auto read = memmsg::read_from(buffer, memmsg::cast_from_bytes(reception)); !read) {
			errors.handle(read.error());
			return EXIT_FAILURE;
		}

		const Heartbeat &received = memmsg::cast_from_bytes(std::as_const(reception));
		std::cout << "Received " << received << std::endl;

		if (!std::ranges::equal(memmsg::cast_to_bytes(sent), reception.bytes())) {
			std::cerr << "error: received message differs from the sent one" << std::endl;
			return EXIT_FAILURE;
		}
	} catch (const cxxopts::exceptions::exception &e) {
		std::cerr << "error: " << e.what() << std::endl;
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
