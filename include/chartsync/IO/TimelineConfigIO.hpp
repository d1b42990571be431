#pragma once
#ifndef CHARTSYNC_WITHOUT_JSON_DEPENDENCY
#include "chartsync/TimelineConfig.hpp"
#include "chartsync/Error.hpp"
#include <istream>

namespace chartsync
{
	struct TimelineConfigResult
	{
		TimelineConfig config;

		ErrorType error = ErrorType::None;

		std::vector<std::string> warnings;
	};

	// Reads a JSON object such as {"resolution": 480, "bpm": 140.5, "time_sig": [3, 4], "offset": 0.2}
	// Missing keys keep their defaults; invalid values keep their defaults and add a warning
	TimelineConfigResult LoadTimelineConfig(std::istream& stream);

	TimelineConfigResult LoadTimelineConfig(const std::string& filePath);
}
#endif
