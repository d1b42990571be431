#include <catch2/catch.hpp>
#include <chartsync/SongTimeline.hpp>

namespace
{
	using chartsync::EventTrack;
	using chartsync::Section;
	using chartsync::TextEvent;
	using chartsync::VenueEvent;
}

TEST_CASE("TimelineTrack insertion order", "[track]")
{
	EventTrack track;
	const auto idA = track.insert(TextEvent{ .tick = 100, .text = "a" });
	const auto idSection = track.insert(Section{ .tick = 50, .name = "intro" });
	const auto idB = track.insert(TextEvent{ .tick = 100, .text = "b" });
	const auto idVenue = track.insert(VenueEvent{ .tick = 0, .type = chartsync::VenueEventType::kLighting, .text = "verse" });
	const auto idC = track.insert(TextEvent{ .tick = 20, .text = "c" });

	SECTION("Ids are unique and valid")
	{
		const std::vector<chartsync::EntryId> ids{ idA, idSection, idB, idVenue, idC };
		for (std::size_t i = 0; i < ids.size(); ++i)
		{
			REQUIRE(ids[i] != chartsync::kInvalidEntryId);
			for (std::size_t k = i + 1; k < ids.size(); ++k)
			{
				REQUIRE(ids[i] != ids[k]);
			}
		}
	}

	SECTION("Tick lookup by id")
	{
		REQUIRE(track.tickOf(idSection) == std::optional<chartsync::Tick>(50));
		REQUIRE(track.tickOf(idVenue) == std::optional<chartsync::Tick>(0));
		REQUIRE_FALSE(track.tickOf(chartsync::kInvalidEntryId).has_value());
	}

	SECTION("Backing sequence is sorted by tick with insertion order for ties")
	{
		const auto& entries = track.entries();
		REQUIRE(entries.size() == 5);
		REQUIRE(entries[0].id == idVenue);
		REQUIRE(entries[1].id == idC);
		REQUIRE(entries[2].id == idSection);
		REQUIRE(entries[3].id == idA);
		REQUIRE(entries[4].id == idB);

		for (std::size_t i = 1; i < entries.size(); ++i)
		{
			REQUIRE(entries[i - 1].tick() <= entries[i].tick());
		}
	}

	SECTION("Entries carry their kind tag")
	{
		REQUIRE(track.find(idA)->kind() == chartsync::EventKind::kText);
		REQUIRE(track.find(idSection)->kind() == chartsync::EventKind::kSection);
		REQUIRE(track.find(idVenue)->kind() == chartsync::EventKind::kVenue);
		REQUIRE(track.countOf<TextEvent>() == 3);
		REQUIRE(track.countOf<Section>() == 1);
	}

	SECTION("Typed views contain exactly one kind in tick order")
	{
		track.refreshTypedViews();

		const auto& texts = track.view<TextEvent>();
		REQUIRE(texts.size() == 3);
		REQUIRE(texts[0].text == "c");
		REQUIRE(texts[1].text == "a");
		REQUIRE(texts[2].text == "b");
		REQUIRE(texts.idAt(1) == idA);
		REQUIRE(texts.indexOf(idB) == std::optional<std::size_t>{ 2 });
		REQUIRE_FALSE(texts.indexOf(idSection).has_value());

		REQUIRE(track.view<Section>().size() == 1);
		REQUIRE(track.view<Section>()[0].name == "intro");
		REQUIRE(track.view<VenueEvent>().size() == 1);
		REQUIRE(track.view<VenueEvent>()[0].text == "verse");
	}

	SECTION("Views are not updated until refreshed")
	{
		track.refreshTypedViews();
		track.insert(TextEvent{ .tick = 10, .text = "d" });
		REQUIRE(track.view<TextEvent>().size() == 3);

		track.refreshTypedViews();
		REQUIRE(track.view<TextEvent>().size() == 4);
		REQUIRE(track.view<TextEvent>()[0].text == "d");
	}
}

TEST_CASE("TimelineTrack removal", "[track]")
{
	EventTrack track;
	const auto idA = track.insert(TextEvent{ .tick = 100, .text = "same" });
	const auto idB = track.insert(TextEvent{ .tick = 100, .text = "same" });
	const auto idSection = track.insert(Section{ .tick = 200, .name = "chorus" });

	SECTION("Removal is by identity, not by value")
	{
		REQUIRE(track.remove(idB));
		REQUIRE(track.size() == 2);
		REQUIRE(track.find(idA) != nullptr);
		REQUIRE(track.find(idB) == nullptr);
	}

	SECTION("Removing twice fails the second time")
	{
		REQUIRE(track.remove(idA));
		REQUIRE_FALSE(track.remove(idA));
		REQUIRE(track.size() == 2);
	}

	SECTION("Typed removal rejects another kind")
	{
		REQUIRE_FALSE(track.remove<TextEvent>(idSection));
		REQUIRE(track.size() == 3);
		REQUIRE(track.remove<Section>(idSection));
		REQUIRE(track.size() == 2);
	}

	SECTION("Unknown id")
	{
		REQUIRE_FALSE(track.remove(chartsync::kInvalidEntryId));
		REQUIRE_FALSE(track.remove(12345));
		REQUIRE(track.size() == 3);
	}

	SECTION("Remove all of one kind")
	{
		REQUIRE(track.removeAll<TextEvent>() == 2);
		REQUIRE(track.size() == 1);
		REQUIRE(track.entries()[0].id == idSection);
	}

	SECTION("Ids are not reused after removal")
	{
		REQUIRE(track.remove(idSection));
		const auto idNew = track.insert(Section{ .tick = 200, .name = "chorus" });
		REQUIRE(idNew != idSection);
	}
}

TEST_CASE("Search in typed views", "[track]")
{
	EventTrack track;
	track.insert(Section{ .tick = 100, .name = "a" });
	track.insert(Section{ .tick = 200, .name = "b" });
	track.insert(Section{ .tick = 300, .name = "c" });
	track.refreshTypedViews();
	const auto& sections = track.view<Section>();

	SECTION("FindClosestIdx")
	{
		REQUIRE(chartsync::FindClosestIdx(sections, 0) == 0);
		REQUIRE(chartsync::FindClosestIdx(sections, 100) == 0);
		REQUIRE(chartsync::FindClosestIdx(sections, 149) == 0);
		REQUIRE(chartsync::FindClosestIdx(sections, 150) == 0); // Tie favors the earlier index
		REQUIRE(chartsync::FindClosestIdx(sections, 151) == 1);
		REQUIRE(chartsync::FindClosestIdx(sections, 200) == 1);
		REQUIRE(chartsync::FindClosestIdx(sections, 299) == 2);
		REQUIRE(chartsync::FindClosestIdx(sections, 1000) == 2);
	}

	SECTION("FindPrevious")
	{
		REQUIRE(chartsync::FindPrevious(sections, 100)->name == "a");
		REQUIRE(chartsync::FindPrevious(sections, 199)->name == "a");
		REQUIRE(chartsync::FindPrevious(sections, 200)->name == "b");
		REQUIRE(chartsync::FindPrevious(sections, 5000)->name == "c");
	}

	SECTION("FindPrevious clamps to the first entry")
	{
		REQUIRE(chartsync::FindPrevious(sections, 0)->name == "a");
		REQUIRE(chartsync::FindPrevious(sections, 99)->name == "a");
	}

	SECTION("FindPrevious on an empty view")
	{
		REQUIRE(chartsync::FindPrevious(track.view<TextEvent>(), 100) == nullptr);
	}

	SECTION("FindPrevious returns the last of equal ticks")
	{
		track.insert(Section{ .tick = 200, .name = "b2" });
		track.refreshTypedViews();
		REQUIRE(chartsync::FindPrevious(track.view<Section>(), 250)->name == "b2");
	}
}
