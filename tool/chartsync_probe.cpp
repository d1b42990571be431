#include <iostream>
#include <iomanip>
#include <charconv>
#include <string_view>
#include "chartsync/chartsync.hpp"

enum ExitCode : int
{
	kExitSuccess = 0,
	kExitNoArgument,
	kExitConfigError,
	kExitInvalidTick,
};

void PrintHelp()
{
	std::cerr <<
		"chartsync tick/time probe\n"
		"  Usage: chartsync_probe [config JSON file] [tick(s)...]\n"
		"  Prints the playback time of each tick, or the timeline snapshot if no tick is given.\n";
}

void PrintError(chartsync::ErrorType errorType)
{
	std::cerr << "Error: " << chartsync::GetErrorString(errorType) << '\n';
}

bool ParseTick(std::string_view str, chartsync::Tick& tick)
{
	const auto r = std::from_chars(str.data(), str.data() + str.size(), tick, 10);
	return r.ec == std::errc{} && r.ptr == str.data() + str.size();
}

int main(int argc, char *argv[])
{
	if (argc <= 1)
	{
		PrintHelp();
		return kExitNoArgument;
	}

	try
	{
		const chartsync::TimelineConfigResult result = chartsync::LoadTimelineConfig(argv[1]);
		for (const auto& warning : result.warnings)
		{
			std::cerr << "Warning: " << warning << '\n';
		}
		if (result.error != chartsync::ErrorType::None)
		{
			PrintError(result.error);
			return kExitConfigError;
		}

		const chartsync::SongTimeline timeline(result.config);

		if (argc == 2)
		{
			const chartsync::ErrorType error = chartsync::SaveTimelineSnapshot(std::cout, timeline);
			if (error != chartsync::ErrorType::None)
			{
				PrintError(error);
			}
			return kExitSuccess;
		}

		for (int i = 2; i < argc; ++i)
		{
			chartsync::Tick tick = 0;
			if (!ParseTick(argv[i], tick))
			{
				std::cerr << "Error: Invalid tick '" << argv[i] << "'\n";
				return kExitInvalidTick;
			}
			std::cout << tick << '\t' << std::fixed << std::setprecision(6) << timeline.tickToSec(tick) << '\n';
		}
	}
	catch (const std::exception& e)
	{
		std::cerr << "Error: Uncaught exception '" << e.what() << "'\n";
	}

	return kExitSuccess;
}
