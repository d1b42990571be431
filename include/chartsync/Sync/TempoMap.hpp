#pragma once
#include "chartsync/Common/Common.hpp"
#include "chartsync/Sync/SyncEntry.hpp"
#include "chartsync/Track/TimelineTrack.hpp"

namespace chartsync
{
	using SyncTrack = TimelineTrack<SyncKind, TempoMarker, TimeSigMarker, BeatMarker>;

	// Recalculates assignedSec of every tempo marker in one forward pass
	// The first marker is placed at 0.0s
	void RecomputeAssignedTimes(TypedView<TempoMarker>& tempos, double resolution);

	[[nodiscard]]
	double TickToSec(Tick tick, const TypedView<TempoMarker>& tempos, double resolution);

	[[nodiscard]]
	double TickToMs(Tick tick, const TypedView<TempoMarker>& tempos, double resolution);

	// Negative time is clamped to zero
	[[nodiscard]]
	Tick SecToTick(double sec, const TypedView<TempoMarker>& tempos, double resolution);

	[[nodiscard]]
	Tick MsToTick(double ms, const TypedView<TempoMarker>& tempos, double resolution);

	// Calculates the time of a tick directly from the backing sync track without assigned times
	// Usable while the typed views are stale
	[[nodiscard]]
	double LiveTickToSec(Tick tick, double resolution, const TempoMarker& initialTempo, const SyncTrack& syncTrack);

	[[nodiscard]]
	const TempoMarker& TempoMarkerAt(Tick tick, const TypedView<TempoMarker>& tempos);

	[[nodiscard]]
	double TempoAt(Tick tick, const TypedView<TempoMarker>& tempos);

	// BPM (truncated to integer) that lasts the longest until lastTick
	[[nodiscard]]
	double GetModeBPM(const TypedView<TempoMarker>& tempos, Tick lastTick);
}
