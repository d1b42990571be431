#pragma once
#include "chartsync/Common/Common.hpp"

namespace chartsync
{
	// Converts a tick delta into seconds under one constant tempo
	// Throws std::invalid_argument if resolution or bpm is not finite and positive
	[[nodiscard]]
	double TickDeltaToSec(RelTick tickDelta, double resolution, double bpm);

	// Converts a second delta into ticks under one constant tempo, rounded to the nearest tick
	// Lossy: a round trip through TickDeltaToSec may drift by one tick
	[[nodiscard]]
	RelTick SecDeltaToTick(double secDelta, double resolution, double bpm);

	[[nodiscard]]
	double BPMMilliToBPM(std::uint32_t bpmMilli);

	[[nodiscard]]
	std::uint32_t BPMToBPMMilli(double bpm);
}
