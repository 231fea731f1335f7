#include <cstdint>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <doctest/doctest.h>

#include "inspectorCLI.h"

static InspectorCLI parse(std::vector<std::string> arguments)
{
	arguments.insert(arguments.begin(), InspectorCLI::PROGRAM_NAME);

	std::vector<char *> argv;
	for (std::string &argument : arguments)
		argv.push_back(argument.data());
	argv.push_back(nullptr);

	return InspectorCLI(static_cast<int>(arguments.size()), argv.data());
}

TEST_CASE("Inspector command line")
{
	SUBCASE("Defaults")
	{
		const InspectorCLI cli = parse({});
		CHECK(cli.sequence() == InspectorCLI::DEFAULT_SEQUENCE);
		CHECK(cli.readings() == std::vector<uint16_t>{ 0, 0, 0, 0 });
		CHECK(cli.buffer_size() == sizeof(inspector::Heartbeat));
		CHECK_FALSE(cli.degraded());
	}

	SUBCASE("Fewer readings than the message holds")
	{
		const InspectorCLI cli = parse({ "--readings", "7,8" });
		CHECK(cli.readings() == std::vector<uint16_t>{ 7, 8 });
	}

	SUBCASE("As many readings as the message holds")
	{
		const InspectorCLI cli = parse({ "-r", "1,2,3,4" });
		CHECK(cli.readings().size() == InspectorCLI::MAX_READINGS);
	}

	SUBCASE("More readings than the message holds are rejected")
	{
		CHECK_THROWS_AS(parse({ "--readings", "1,2,3,4,5" }), cxxopts::exceptions::parsing);
		CHECK_THROWS_WITH(parse({ "-r", "1,2,3,4,5,6" }), "Option 'readings' takes at most 4 values, got 6");
	}
}
