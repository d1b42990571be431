#pragma once
#include "chartsync/Common/Common.hpp"

namespace chartsync
{
	enum class Instrument : std::int32_t
	{
		kGuitar,
		kGuitarCoop,
		kBass,
		kRhythm,
		kKeys,
		kDrums,
		kGHLiveGuitar,
		kGHLiveBass,
		kGHLiveRhythm,
		kGHLiveCoop,
		kProGuitar17Fret,
		kProGuitar22Fret,
		kProBass17Fret,
		kProBass22Fret,
		kVocals,
		kHarmony1,
		kHarmony2,
		kHarmony3,
	};

	enum class Difficulty : std::int32_t
	{
		kExpert,
		kHard,
		kMedium,
		kEasy,
	};

	enum class GameMode : std::int32_t
	{
		kGuitar,
		kDrums,
		kGHLGuitar,
		kProGuitar,
		kVocals,
	};

	constexpr std::int32_t kNumInstruments = 18;
	constexpr std::int32_t kNumDifficulties = 4;

	constexpr std::size_t kNumInstrumentsSZ = std::size_t{ kNumInstruments };
	constexpr std::size_t kNumDifficultiesSZ = std::size_t{ kNumDifficulties };

	[[nodiscard]]
	inline bool IsValidInstrument(Instrument instrument)
	{
		const auto idx = static_cast<std::int32_t>(instrument);
		return 0 <= idx && idx < kNumInstruments;
	}

	[[nodiscard]]
	inline bool IsValidDifficulty(Difficulty difficulty)
	{
		const auto idx = static_cast<std::int32_t>(difficulty);
		return 0 <= idx && idx < kNumDifficulties;
	}

	// Throws std::out_of_range for values outside the enumeration
	[[nodiscard]]
	GameMode InstrumentToGameMode(Instrument instrument);

	[[nodiscard]]
	const char *GetInstrumentName(Instrument instrument);

	[[nodiscard]]
	const char *GetDifficultyName(Difficulty difficulty);
}
