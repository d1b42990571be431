#pragma once
#include "chartsync/Common/Common.hpp"
#include "chartsync/Sync/SyncEntry.hpp"
#include "chartsync/Track/TypedView.hpp"

namespace chartsync
{
	[[nodiscard]]
	double TimeSigMeasureTicks(const TimeSigMarker& timeSig, double resolution);

	[[nodiscard]]
	double TimeSigBeatTicks(const TimeSigMarker& timeSig, double resolution);

	// Measure and beat lines from tick 0 up to endTick (inclusive)
	// The grid restarts at each time signature change
	[[nodiscard]]
	std::vector<BeatMarker> GenerateBeatMarkers(const TypedView<TimeSigMarker>& timeSigs, double resolution, Tick endTick);

	[[nodiscard]]
	bool IsBarLineTick(Tick tick, const TypedView<TimeSigMarker>& timeSigs, double resolution);
}
