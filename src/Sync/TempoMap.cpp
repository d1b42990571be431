#include "chartsync/Sync/TempoMap.hpp"
#include "chartsync/Util/TickMath.hpp"
#include <unordered_map>

namespace
{
	using namespace chartsync;

	void RequireAnchoredTempos(const TypedView<TempoMarker>& tempos)
	{
		// There must be at least one tempo change
		if (tempos.empty())
		{
			throw std::logic_error("chartsync: tempo sequence is empty");
		}
	}
}

void chartsync::RecomputeAssignedTimes(TypedView<TempoMarker>& tempos, double resolution)
{
	auto& markers = tempos.editItems();
	if (markers.empty())
	{
		return;
	}

	// The first tempo change should be placed at 0.0s
	markers.front().assignedSec = 0.0;

	// Accumulate from the previous marker only, so the pass stays linear in the number of tempo changes
	for (std::size_t i = 1; i < markers.size(); ++i)
	{
		const TempoMarker& prev = markers[i - 1];
		TempoMarker& cur = markers[i];
		const RelTick tickDelta = static_cast<RelTick>(cur.tick) - static_cast<RelTick>(prev.tick);
		cur.assignedSec = prev.assignedSec + TickDeltaToSec(tickDelta, resolution, prev.bpm());
	}
}

double chartsync::TickToSec(Tick tick, const TypedView<TempoMarker>& tempos, double resolution)
{
	RequireAnchoredTempos(tempos);

	// Fetch the last tempo change at or before tick (the latest inserted one wins on equal ticks)
	std::size_t idx = FindClosestIdx(tempos, tick);
	if (tempos[idx].tick > tick && idx > 0)
	{
		--idx;
	}
	while (idx + 1 < tempos.size() && tempos[idx + 1].tick <= tick)
	{
		++idx;
	}
	const TempoMarker& nearest = tempos[idx];

	// Calculate sec using tick difference from nearest tempo change
	const RelTick tickDelta = static_cast<RelTick>(tick) - static_cast<RelTick>(nearest.tick);
	return nearest.assignedSec + TickDeltaToSec(tickDelta, resolution, nearest.bpm());
}

double chartsync::TickToMs(Tick tick, const TypedView<TempoMarker>& tempos, double resolution)
{
	return TickToSec(tick, tempos, resolution) * 1000;
}

chartsync::Tick chartsync::SecToTick(double sec, const TypedView<TempoMarker>& tempos, double resolution)
{
	RequireAnchoredTempos(tempos);

	if (!(sec > 0.0))
	{
		sec = 0.0;
	}

	// Assigned times are non-decreasing, so the last tempo change at or before sec can be found by binary search
	auto itr = std::upper_bound(tempos.begin(), tempos.end(), sec,
		[](double s, const TempoMarker& marker) { return s < marker.assignedSec; });
	if (itr != tempos.begin())
	{
		--itr;
	}
	const TempoMarker& nearest = *itr;

	// Calculate tick using time difference from nearest tempo change
	// The delta saturates for huge or infinite sec, so the sum cannot overflow
	const RelTick tick = static_cast<RelTick>(nearest.tick) + SecDeltaToTick(sec - nearest.assignedSec, resolution, nearest.bpm());
	return ClampToTick(tick);
}

chartsync::Tick chartsync::MsToTick(double ms, const TypedView<TempoMarker>& tempos, double resolution)
{
	return SecToTick(ms / 1000, tempos, resolution);
}

double chartsync::LiveTickToSec(Tick tick, double resolution, const TempoMarker& initialTempo, const SyncTrack& syncTrack)
{
	double sec = 0.0;
	const TempoMarker *prev = &initialTempo;

	for (const auto& entry : syncTrack.entries())
	{
		const auto *tempo = std::get_if<TempoMarker>(&entry.value);
		if (tempo == nullptr)
		{
			continue;
		}

		if (tempo->tick > tick)
		{
			break;
		}

		sec += TickDeltaToSec(static_cast<RelTick>(tempo->tick) - static_cast<RelTick>(prev->tick), resolution, prev->bpm());
		prev = tempo;
	}

	sec += TickDeltaToSec(static_cast<RelTick>(tick) - static_cast<RelTick>(prev->tick), resolution, prev->bpm());

	return sec;
}

const chartsync::TempoMarker& chartsync::TempoMarkerAt(Tick tick, const TypedView<TempoMarker>& tempos)
{
	RequireAnchoredTempos(tempos);

	return *FindPrevious(tempos, tick);
}

double chartsync::TempoAt(Tick tick, const TypedView<TempoMarker>& tempos)
{
	return TempoMarkerAt(tick, tempos).bpm();
}

double chartsync::GetModeBPM(const TypedView<TempoMarker>& tempos, Tick lastTick)
{
	constexpr double kErrorBPM = 120.0;

	if (tempos.empty())
	{
		return kErrorBPM;
	}

	if (tempos.size() == 1U)
	{
		return tempos.front().bpm();
	}

	// Calculate total tick duration for each BPM value
	std::unordered_map<std::int32_t, RelTick> bpmTotalTicks;
	for (std::size_t i = 0; i < tempos.size(); ++i)
	{
		const Tick startTick = tempos[i].tick;
		const Tick endTick = (i + 1 < tempos.size()) ? tempos[i + 1].tick : std::max(lastTick, startTick);
		const auto bpmInt = static_cast<std::int32_t>(tempos[i].bpm());
		bpmTotalTicks[bpmInt] += static_cast<RelTick>(endTick) - static_cast<RelTick>(startTick);
	}

	// Find BPM with largest total tick duration (the lower BPM wins a tie)
	const auto itr = std::max_element(
		bpmTotalTicks.begin(),
		bpmTotalTicks.end(),
		[](const auto& a, const auto& b) { return a.second < b.second || (a.second == b.second && a.first > b.first); });

	return static_cast<double>(itr->first);
}
