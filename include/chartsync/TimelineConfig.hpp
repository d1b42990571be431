#pragma once
#include "chartsync/Common/Common.hpp"
#include <optional>

namespace chartsync
{
	struct TimelineConfig
	{
		std::string name;
		double resolution = kStandardResolution;
		std::uint32_t initialBPMMilli = kDefaultBPMMilli;
		std::uint32_t timeSigNumerator = kDefaultTimeSigNumerator;
		std::uint32_t timeSigDenominator = kDefaultTimeSigDenominator;
		double offsetSec = 0.0;
		double hopoThreshold = kDefaultHopoThreshold;
		std::optional<double> manualLengthSec;
	};
}
