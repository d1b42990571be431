#pragma once
#include <algorithm>
#include <string>
#include <string_view>
#include <array>
#include <vector>
#include <variant>
#include <stdexcept>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <type_traits>

namespace chartsync
{
	using Tick = std::uint32_t;
	using RelTick = std::int64_t;

	// Stable handle of an entry, unique within its track (0 is never issued)
	using EntryId = std::uint32_t;

	constexpr EntryId kInvalidEntryId = 0;

	// Ticks per beat
	constexpr double kStandardResolution = 192.0;

	// Tempo is stored as BPM * 1000
	constexpr std::uint32_t kBPMMilliScale = 1000;
	constexpr std::uint32_t kDefaultBPMMilli = 120000;

	constexpr std::uint32_t kDefaultTimeSigNumerator = 4;
	constexpr std::uint32_t kDefaultTimeSigDenominator = 4;

	// Notes closer than this to the previous note (in ticks at the standard resolution) become forced HOPOs
	constexpr double kDefaultHopoThreshold = 65.0;

	static_assert(std::is_unsigned_v<Tick>);
	static_assert(std::is_signed_v<RelTick>);

	[[nodiscard]]
	inline bool IsValidResolution(double resolution)
	{
		return std::isfinite(resolution) && resolution > 0.0;
	}

	constexpr Tick kMaxTick = std::numeric_limits<Tick>::max();

	[[nodiscard]]
	inline Tick ClampToTick(RelTick value)
	{
		return static_cast<Tick>(std::clamp(value, RelTick{ 0 }, static_cast<RelTick>(kMaxTick)));
	}

	// Rounds to the nearest tick, saturating at both ends of the tick range (NaN becomes 0)
	[[nodiscard]]
	inline Tick RoundToTick(double value)
	{
		if (!(value > 0.0))
		{
			return 0;
		}

		if (value >= static_cast<double>(kMaxTick))
		{
			return kMaxTick;
		}

		return static_cast<Tick>(std::llround(value));
	}

	[[nodiscard]]
	inline double RemoveFloatingPointError(double value)
	{
		// Round the value to eight decimal places (e.g. "0.700000004" -> "0.7")
		const double rounded = std::round(value * 1e8) / 1e8;

		// Return rounded only for almost exact values
		// (e.g. "0.700000001" -> "0.7",  "1.66666666667" -> "1.66666666667")
		if (std::abs(rounded - value) < 1e-9)
		{
			return rounded;
		}
		else
		{
			return value;
		}
	}

	[[nodiscard]]
	inline bool AlmostEquals(double a, double b)
	{
		return std::round(a * 1e8) == std::round(b * 1e8);
	}
}
