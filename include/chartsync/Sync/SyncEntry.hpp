#pragma once
#include "chartsync/Common/Common.hpp"

namespace chartsync
{
	struct TempoMarker
	{
		Tick tick = 0;

		std::uint32_t bpmMilli = kDefaultBPMMilli; // BPM * 1000

		// Playback time of this tick, derived by RecomputeAssignedTimes()
		double assignedSec = 0.0;

		[[nodiscard]]
		double bpm() const
		{
			return static_cast<double>(bpmMilli) / kBPMMilliScale;
		}
	};

	struct TimeSigMarker
	{
		Tick tick = 0;
		std::uint32_t numerator = kDefaultTimeSigNumerator;
		std::uint32_t denominator = kDefaultTimeSigDenominator;
	};

	enum class BeatType : std::uint8_t
	{
		kMeasure,
		kBeat,
	};

	// Generated from tempo and time signature data, never authored directly
	struct BeatMarker
	{
		Tick tick = 0;
		BeatType type = BeatType::kBeat;
	};

	// Matches the alternative order of SyncEntryValue
	enum class SyncKind : std::uint8_t
	{
		kTempo,
		kTimeSig,
		kBeat,
	};

	using SyncEntryValue = std::variant<TempoMarker, TimeSigMarker, BeatMarker>;
}
