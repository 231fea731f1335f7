#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

#include "memmsg/layout.hpp"

namespace inspector
{
enum Health : uint8_t {
	HEALTHY = 0x01,
	DEGRADED = 0x02,
};

/// @brief Periodic status message of a sensor node.
struct Heartbeat {
	uint64_t timestamp;
	uint32_t sequence;
	float load;
	std::array<uint16_t, 4> readings;
	uint8_t health;
	uint8_t reserved[7];
};

inline std::ostream &operator<<(std::ostream &stream, const Heartbeat &heartbeat)
{
	stream << "heartbeat #" << heartbeat.sequence << " at " << heartbeat.timestamp << ", load " << heartbeat.load
	       << ", health 0x" << std::hex << static_cast<unsigned>(heartbeat.health) << std::dec << ", readings [";
	for (size_t i = 0; i < heartbeat.readings.size(); ++i)
		stream << (i ? ", " : "") << heartbeat.readings[i];
	return (stream << "]");
}
} // namespace inspector

MEMMSG_EXPLICIT_LAYOUT(inspector::Heartbeat, timestamp, sequence, load, readings, health, reserved);
