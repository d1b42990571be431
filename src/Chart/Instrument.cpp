#include "chartsync/Chart/Instrument.hpp"

chartsync::GameMode chartsync::InstrumentToGameMode(Instrument instrument)
{
	switch (instrument)
	{
	case Instrument::kGuitar:
	case Instrument::kGuitarCoop:
	case Instrument::kBass:
	case Instrument::kRhythm:
	case Instrument::kKeys:
		return GameMode::kGuitar;

	case Instrument::kDrums:
		return GameMode::kDrums;

	case Instrument::kGHLiveGuitar:
	case Instrument::kGHLiveBass:
	case Instrument::kGHLiveRhythm:
	case Instrument::kGHLiveCoop:
		return GameMode::kGHLGuitar;

	case Instrument::kProGuitar17Fret:
	case Instrument::kProGuitar22Fret:
	case Instrument::kProBass17Fret:
	case Instrument::kProBass22Fret:
		return GameMode::kProGuitar;

	case Instrument::kVocals:
	case Instrument::kHarmony1:
	case Instrument::kHarmony2:
	case Instrument::kHarmony3:
		return GameMode::kVocals;
	}

	throw std::out_of_range("chartsync: unhandled instrument " + std::to_string(static_cast<std::int32_t>(instrument)));
}

const char *chartsync::GetInstrumentName(Instrument instrument)
{
	switch (instrument)
	{
	case Instrument::kGuitar:
		return "guitar";
	case Instrument::kGuitarCoop:
		return "guitar_coop";
	case Instrument::kBass:
		return "bass";
	case Instrument::kRhythm:
		return "rhythm";
	case Instrument::kKeys:
		return "keys";
	case Instrument::kDrums:
		return "drums";
	case Instrument::kGHLiveGuitar:
		return "ghl_guitar";
	case Instrument::kGHLiveBass:
		return "ghl_bass";
	case Instrument::kGHLiveRhythm:
		return "ghl_rhythm";
	case Instrument::kGHLiveCoop:
		return "ghl_coop";
	case Instrument::kProGuitar17Fret:
		return "pro_guitar_17";
	case Instrument::kProGuitar22Fret:
		return "pro_guitar_22";
	case Instrument::kProBass17Fret:
		return "pro_bass_17";
	case Instrument::kProBass22Fret:
		return "pro_bass_22";
	case Instrument::kVocals:
		return "vocals";
	case Instrument::kHarmony1:
		return "harmony1";
	case Instrument::kHarmony2:
		return "harmony2";
	case Instrument::kHarmony3:
		return "harmony3";
	default:
		return "unknown";
	}
}

const char *chartsync::GetDifficultyName(Difficulty difficulty)
{
	switch (difficulty)
	{
	case Difficulty::kExpert:
		return "expert";
	case Difficulty::kHard:
		return "hard";
	case Difficulty::kMedium:
		return "medium";
	case Difficulty::kEasy:
		return "easy";
	default:
		return "unknown";
	}
}
