#pragma once
#include "chartsync/Common/Common.hpp"

namespace chartsync
{
	struct TextEvent
	{
		Tick tick = 0;
		std::string text;
	};

	struct Section
	{
		Tick tick = 0;
		std::string name;
	};

	enum class VenueEventType : std::uint8_t
	{
		kLighting,
		kPostProcessing,
		kPerformer,
		kCamera,
		kStage,
		kOther,
	};

	struct VenueEvent
	{
		Tick tick = 0;
		VenueEventType type = VenueEventType::kOther;
		std::string text;
		RelTick length = 0;
	};

	// Matches the alternative order of EventEntryValue
	enum class EventKind : std::uint8_t
	{
		kText,
		kSection,
		kVenue,
	};

	using EventEntryValue = std::variant<TextEvent, Section, VenueEvent>;

	[[nodiscard]]
	const char *GetVenueEventTypeName(VenueEventType type);
}
