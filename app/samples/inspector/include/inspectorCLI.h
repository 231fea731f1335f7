#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

#include <cxxopts.hpp>

#include "heartbeat.hpp"

class InspectorCLI {
    public:
	static constexpr const char *PROGRAM_NAME = "memmsg-inspector";
	static constexpr const char *PROGRAM_HELP =
		"Writes a heartbeat message into a byte buffer, dumps the buffer, and reads the message back.";
	static constexpr uint32_t DEFAULT_SEQUENCE = 1;
	static constexpr uint64_t DEFAULT_TIMESTAMP = 0;
	static constexpr float DEFAULT_LOAD = 0.f;
	static constexpr const char *DEFAULT_READINGS = "0,0,0,0";
	static constexpr size_t DEFAULT_BUFFER_SIZE = sizeof(inspector::Heartbeat);
	static constexpr size_t MAX_READINGS = std::tuple_size_v<decltype(inspector::Heartbeat::readings)>;

	InspectorCLI(int argc, char *argv[])
	{
		parse(argc, argv);
	}

	inline uint32_t sequence() const
	{
		return cli_arguments["sequence"].as<uint32_t>();
	}
	inline uint64_t timestamp() const
	{
		return cli_arguments["timestamp"].as<uint64_t>();
	}
	inline float load() const
	{
		return cli_arguments["load"].as<float>();
	}
	inline std::vector<uint16_t> readings() const
	{
		return cli_arguments["readings"].as<std::vector<uint16_t>>();
	}
	inline bool degraded() const
	{
		return cli_arguments["degraded"].as<bool>();
	}
	inline size_t buffer_size() const
	{
		return cli_arguments["buffer_size"].as<size_t>();
	}

    private:
	cxxopts::ParseResult cli_arguments{};

	void parse(int argc, char *argv[])
	{
		cxxopts::Options cli_options(PROGRAM_NAME, PROGRAM_HELP);

		cli_options.add_options()("s,sequence", "Sequence number",
					  cxxopts::value<uint32_t>()->default_value(std::to_string(DEFAULT_SEQUENCE)));

		cli_options.add_options()("t,timestamp", "Timestamp",
					  cxxopts::value<uint64_t>()->default_value(std::to_string(DEFAULT_TIMESTAMP)));

		cli_options.add_options()("l,load", "Load, between 0 and 1",
					  cxxopts::value<float>()->default_value(std::to_string(DEFAULT_LOAD)));

		cli_options.add_options()(
			"r,readings", "Sensor readings, comma separated (at most 4)",
			cxxopts::value<std::vector<uint16_t>>()->default_value(DEFAULT_READINGS));

		cli_options.add_options()("d,degraded", "Report a degraded node", cxxopts::value<bool>());

		cli_options.add_options()(
			"b,buffer_size", "Size of the transfer buffer, in bytes",
			cxxopts::value<size_t>()->default_value(std::to_string(DEFAULT_BUFFER_SIZE)));

		cli_options.add_options()("h,help", "Print help and exit");

		cli_arguments = cli_options.parse(argc, argv);

		if (cli_arguments.count("help")) {
			std::cout << cli_options.help() << std::endl;
			exit(0);
		}

		if (const size_t count = readings().size(); count > MAX_READINGS)
			throw cxxopts::exceptions::parsing("Option 'readings' takes at most " + std::to_string(MAX_READINGS) +
							   " values, got " + std::to_string(count));
	}
};
