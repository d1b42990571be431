#ifndef CHARTSYNC_WITHOUT_JSON_DEPENDENCY
#include "chartsync/IO/SnapshotIO.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace
{
	using namespace chartsync;

	void Write(nlohmann::json& json, const char* key, nlohmann::json&& value)
	{
		if (!value.is_array() || !value.empty())
		{
			json.emplace(key, std::move(value));
		}
	}

	nlohmann::json TemposToJSON(const TypedView<TempoMarker>& tempos)
	{
		nlohmann::json j = nlohmann::json::array();
		for (const auto& tempo : tempos)
		{
			j.push_back(nlohmann::json::array({ tempo.tick, RemoveFloatingPointError(tempo.bpm()), RemoveFloatingPointError(tempo.assignedSec) }));
		}
		return j;
	}

	nlohmann::json TimeSigsToJSON(const TypedView<TimeSigMarker>& timeSigs)
	{
		nlohmann::json j = nlohmann::json::array();
		for (const auto& timeSig : timeSigs)
		{
			j.push_back(nlohmann::json::array({ timeSig.tick, nlohmann::json::array({ timeSig.numerator, timeSig.denominator }) }));
		}
		return j;
	}

	nlohmann::json SectionsToJSON(const TypedView<Section>& sections)
	{
		nlohmann::json j = nlohmann::json::array();
		for (const auto& section : sections)
		{
			j.push_back(nlohmann::json::array({ section.tick, section.name }));
		}
		return j;
	}

	nlohmann::json TextEventsToJSON(const TypedView<TextEvent>& events)
	{
		nlohmann::json j = nlohmann::json::array();
		for (const auto& event : events)
		{
			j.push_back(nlohmann::json::array({ event.tick, event.text }));
		}
		return j;
	}

	nlohmann::json VenueEventsToJSON(const TypedView<VenueEvent>& venueEvents)
	{
		nlohmann::json j = nlohmann::json::array();
		for (const auto& venueEvent : venueEvents)
		{
			nlohmann::json item = nlohmann::json::array({ venueEvent.tick, GetVenueEventTypeName(venueEvent.type), venueEvent.text });
			if (venueEvent.length > 0)
			{
				item.push_back(venueEvent.length);
			}
			j.push_back(std::move(item));
		}
		return j;
	}

	nlohmann::json ChartsToJSON(const SongTimeline& timeline)
	{
		nlohmann::json j = nlohmann::json::object();
		for (std::int32_t i = 0; i < kNumInstruments; ++i)
		{
			const auto instrument = static_cast<Instrument>(i);
			nlohmann::json difficulties = nlohmann::json::object();
			for (std::int32_t k = 0; k < kNumDifficulties; ++k)
			{
				const auto difficulty = static_cast<Difficulty>(k);
				const Chart& chart = timeline.chart(instrument, difficulty);
				if (!chart.empty())
				{
					difficulties.emplace(GetDifficultyName(difficulty), chart.objects().size());
				}
			}

			if (!difficulties.empty())
			{
				j.emplace(GetInstrumentName(instrument), std::move(difficulties));
			}
		}
		return j;
	}
}

chartsync::ErrorType chartsync::SaveTimelineSnapshot(std::ostream& stream, const SongTimeline& timeline)
{
	if (!stream.good())
	{
		return ErrorType::GeneralIOError;
	}

	nlohmann::json j = nlohmann::json::object();
	if (!timeline.name.empty())
	{
		j.emplace("name", timeline.name);
	}
	j.emplace("resolution", RemoveFloatingPointError(timeline.resolution()));
	if (!AlmostEquals(timeline.offsetSec, 0.0))
	{
		j.emplace("offset", RemoveFloatingPointError(timeline.offsetSec));
	}

	nlohmann::json beat = nlohmann::json::object();
	Write(beat, "bpm", TemposToJSON(timeline.tempos()));
	Write(beat, "time_sig", TimeSigsToJSON(timeline.timeSignatures()));
	j.emplace("beat", std::move(beat));

	nlohmann::json events = nlohmann::json::object();
	Write(events, "section", SectionsToJSON(timeline.sections()));
	Write(events, "text", TextEventsToJSON(timeline.textEvents()));
	Write(events, "venue", VenueEventsToJSON(timeline.venueEvents()));
	if (!events.empty())
	{
		j.emplace("events", std::move(events));
	}

	nlohmann::json charts = ChartsToJSON(timeline);
	if (!charts.empty())
	{
		j.emplace("charts", std::move(charts));
	}

	stream << j.dump(4) << '\n';

	if (!stream.good())
	{
		return ErrorType::GeneralIOError;
	}

	return ErrorType::None;
}

chartsync::ErrorType chartsync::SaveTimelineSnapshot(const std::string& filePath, const SongTimeline& timeline)
{
	std::ofstream ofs(filePath);
	if (!ofs.good())
	{
		return ErrorType::CouldNotOpenOutputFileStream;
	}
	return chartsync::SaveTimelineSnapshot(ofs, timeline);
}
#endif
