#include "chartsync/Util/TickMath.hpp"

namespace
{
	using namespace chartsync;

	// Tick deltas saturate here so that adding a Tick never overflows RelTick
	constexpr double kRelTickLimit = 4611686018427387904.0; // 2^62

	void ValidateTempoArgs(double resolution, double bpm)
	{
		if (!IsValidResolution(resolution))
		{
			throw std::invalid_argument("chartsync: resolution must be finite and positive");
		}

		if (!std::isfinite(bpm) || bpm <= 0.0)
		{
			throw std::invalid_argument("chartsync: bpm must be finite and positive");
		}
	}
}

double chartsync::TickDeltaToSec(RelTick tickDelta, double resolution, double bpm)
{
	ValidateTempoArgs(resolution, bpm);

	return (static_cast<double>(tickDelta) / resolution) * (60.0 / bpm);
}

chartsync::RelTick chartsync::SecDeltaToTick(double secDelta, double resolution, double bpm)
{
	ValidateTempoArgs(resolution, bpm);

	if (std::isnan(secDelta))
	{
		return 0;
	}

	const double tickDelta = secDelta * (bpm / 60.0) * resolution;
	return static_cast<RelTick>(std::llround(std::clamp(tickDelta, -kRelTickLimit, kRelTickLimit)));
}

double chartsync::BPMMilliToBPM(std::uint32_t bpmMilli)
{
	return static_cast<double>(bpmMilli) / kBPMMilliScale;
}

std::uint32_t chartsync::BPMToBPMMilli(double bpm)
{
	if (!(bpm > 0.0))
	{
		return 0;
	}

	const double bpmMilli = std::round(bpm * kBPMMilliScale);
	if (bpmMilli >= static_cast<double>(std::numeric_limits<std::uint32_t>::max()))
	{
		return std::numeric_limits<std::uint32_t>::max();
	}
	return static_cast<std::uint32_t>(bpmMilli);
}
