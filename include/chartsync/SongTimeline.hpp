#pragma once
#include "chartsync/Common/Common.hpp"
#include "chartsync/Error.hpp"
#include "chartsync/TimelineConfig.hpp"
#include "chartsync/Sync/SyncEntry.hpp"
#include "chartsync/Sync/TempoMap.hpp"
#include "chartsync/Event/EventEntry.hpp"
#include "chartsync/Track/TimelineTrack.hpp"
#include "chartsync/Chart/Chart.hpp"

namespace chartsync
{
	using EventTrack = TimelineTrack<EventKind, TextEvent, Section, VenueEvent>;

	class SongTimeline;

	// Defers the refresh of a SongTimeline until the outermost guard is released
	class BatchUpdate
	{
	private:
		SongTimeline *m_pTimeline = nullptr;

	public:
		explicit BatchUpdate(SongTimeline& timeline);

		~BatchUpdate();

		BatchUpdate(const BatchUpdate&) = delete;

		BatchUpdate& operator=(const BatchUpdate&) = delete;

		BatchUpdate(BatchUpdate&& other) noexcept;

		BatchUpdate& operator=(BatchUpdate&& other) noexcept;

		// Ends the batch before the guard goes out of scope
		void release();
	};

	// Tempo, time signature and event timeline of a song with per-instrument chart slots
	// Not thread-safe; all calls on one instance must be serialized by the caller
	class SongTimeline
	{
	private:
		double m_resolution = kStandardResolution;

		SyncTrack m_syncTrack;
		EventTrack m_eventTrack;

		std::array<Chart, kNumInstrumentsSZ * kNumDifficultiesSZ> m_charts;

		std::int32_t m_batchDepth = 0;

		void refreshIfNotBatching();

		friend class BatchUpdate;

		void beginBatchInternal();

		void endBatchInternal();

	public:
		std::string name;

		// Audio offset in seconds
		double offsetSec = 0.0;

		double hopoThreshold = kDefaultHopoThreshold;

		std::optional<double> manualLengthSec;

		// Throws std::invalid_argument if resolution is not finite and positive
		explicit SongTimeline(double resolution = kStandardResolution);

		explicit SongTimeline(const TimelineConfig& config);

		[[nodiscard]]
		double resolution() const
		{
			return m_resolution;
		}

		[[nodiscard]]
		double resolutionScaleRatio(double targetResolution) const
		{
			return targetResolution / m_resolution;
		}

		// Changes the resolution and scales every tick to keep the timing (rounded to the nearest tick)
		void rescale(double newResolution);

		// Sync track

		EntryId addTempoMarker(const TempoMarker& marker);

		EntryId addTimeSignatureMarker(const TimeSigMarker& marker);

		// Returns AnchorNotRemovable for a marker at tick 0 and EntryNotFound for an unknown id
		ErrorType removeTempoMarker(EntryId id);

		ErrorType removeTimeSignatureMarker(EntryId id);

		// Replaces the beat markers with a grid generated from the time signatures up to endTick
		void regenerateBeatMarkers(Tick endTick);

		// Event track

		EntryId addEvent(const TextEvent& event);

		EntryId addEvent(const Section& section);

		EntryId addEvent(const VenueEvent& venueEvent);

		ErrorType removeEvent(EntryId id);

		// Cache

		[[nodiscard]]
		BatchUpdate beginBatch();

		[[nodiscard]]
		bool isBatching() const
		{
			return m_batchDepth > 0;
		}

		// Rebuilds every typed view and recalculates the assigned time of each tempo marker
		void refresh();

		// Conversion

		[[nodiscard]]
		double tickToSec(Tick tick) const;

		[[nodiscard]]
		double tickToMs(Tick tick) const;

		// May be inaccurate by one tick due to rounding
		[[nodiscard]]
		Tick secToTick(double sec) const;

		[[nodiscard]]
		Tick msToTick(double ms) const;

		// Same as tickToSec() but calculated from the backing sync track, valid inside a batch
		[[nodiscard]]
		double liveTickToSec(Tick tick) const;

		// Queries

		[[nodiscard]]
		const TempoMarker& previousTempoMarker(Tick tick) const;

		[[nodiscard]]
		const TimeSigMarker& previousTimeSignature(Tick tick) const;

		// nullptr if the song has no sections
		[[nodiscard]]
		const Section *previousSection(Tick tick) const;

		[[nodiscard]]
		double tempoAt(Tick tick) const;

		// Last tick used by any entry or chart object
		[[nodiscard]]
		Tick lastTick() const;

		// Views

		[[nodiscard]]
		const TypedView<TempoMarker>& tempos() const
		{
			return m_syncTrack.view<TempoMarker>();
		}

		[[nodiscard]]
		const TypedView<TimeSigMarker>& timeSignatures() const
		{
			return m_syncTrack.view<TimeSigMarker>();
		}

		[[nodiscard]]
		const TypedView<BeatMarker>& beats() const
		{
			return m_syncTrack.view<BeatMarker>();
		}

		[[nodiscard]]
		const TypedView<TextEvent>& textEvents() const
		{
			return m_eventTrack.view<TextEvent>();
		}

		[[nodiscard]]
		const TypedView<Section>& sections() const
		{
			return m_eventTrack.view<Section>();
		}

		[[nodiscard]]
		const TypedView<VenueEvent>& venueEvents() const
		{
			return m_eventTrack.view<VenueEvent>();
		}

		[[nodiscard]]
		const SyncTrack& syncTrack() const
		{
			return m_syncTrack;
		}

		[[nodiscard]]
		const EventTrack& eventTrack() const
		{
			return m_eventTrack;
		}

		// Charts (throw std::out_of_range for an instrument or difficulty outside the enumeration)

		[[nodiscard]]
		Chart& chart(Instrument instrument, Difficulty difficulty);

		[[nodiscard]]
		const Chart& chart(Instrument instrument, Difficulty difficulty) const;

		[[nodiscard]]
		bool chartExists(Instrument instrument, Difficulty difficulty) const;

		[[nodiscard]]
		bool chartExistsForInstrument(Instrument instrument) const;
	};
}
