#include "chartsync/Sync/TimeSigUtils.hpp"

namespace
{
	bool IsValidTimeSig(const chartsync::TimeSigMarker& timeSig)
	{
		return timeSig.numerator > 0 && timeSig.denominator > 0;
	}
}

double chartsync::TimeSigMeasureTicks(const TimeSigMarker& timeSig, double resolution)
{
	return resolution * 4 * static_cast<double>(timeSig.numerator) / static_cast<double>(timeSig.denominator);
}

double chartsync::TimeSigBeatTicks(const TimeSigMarker& timeSig, double resolution)
{
	return resolution * 4 / static_cast<double>(timeSig.denominator);
}

std::vector<chartsync::BeatMarker> chartsync::GenerateBeatMarkers(const TypedView<TimeSigMarker>& timeSigs, double resolution, Tick endTick)
{
	std::vector<BeatMarker> beats;
	if (timeSigs.empty() || !IsValidResolution(resolution))
	{
		return beats;
	}

	for (std::size_t i = 0; i < timeSigs.size(); ++i)
	{
		const TimeSigMarker& timeSig = timeSigs[i];
		if (!IsValidTimeSig(timeSig) || timeSig.tick > endTick)
		{
			continue;
		}

		// The segment ends at the next time signature change (exclusive) or endTick (inclusive)
		const bool hasNext = i + 1 < timeSigs.size() && timeSigs[i + 1].tick <= endTick;
		const double segmentEnd = hasNext ? static_cast<double>(timeSigs[i + 1].tick) : static_cast<double>(endTick) + 0.5;

		const double beatTicks = TimeSigBeatTicks(timeSig, resolution);
		for (std::uint64_t beatIdx = 0;; ++beatIdx)
		{
			const double tickDouble = static_cast<double>(timeSig.tick) + static_cast<double>(beatIdx) * beatTicks;
			if (tickDouble >= segmentEnd)
			{
				break;
			}

			const BeatType type = (beatIdx % timeSig.numerator == 0) ? BeatType::kMeasure : BeatType::kBeat;
			beats.push_back(BeatMarker{ static_cast<Tick>(std::llround(tickDouble)), type });
		}
	}

	return beats;
}

bool chartsync::IsBarLineTick(Tick tick, const TypedView<TimeSigMarker>& timeSigs, double resolution)
{
	const TimeSigMarker *timeSig = FindPrevious(timeSigs, tick);
	if (timeSig == nullptr || !IsValidTimeSig(*timeSig) || tick < timeSig->tick)
	{
		return false;
	}

	const double measureTicks = TimeSigMeasureTicks(*timeSig, resolution);
	const double measures = static_cast<double>(tick - timeSig->tick) / measureTicks;
	return AlmostEquals(measures, std::round(measures));
}
