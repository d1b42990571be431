#include "chartsync/SongTimeline.hpp"
#include "chartsync/Sync/TimeSigUtils.hpp"
#include "chartsync/Util/TickMath.hpp"

namespace
{
	using namespace chartsync;

	std::size_t ChartIdx(Instrument instrument, Difficulty difficulty)
	{
		if (!IsValidInstrument(instrument))
		{
			throw std::out_of_range("chartsync: invalid instrument " + std::to_string(static_cast<std::int32_t>(instrument)));
		}

		if (!IsValidDifficulty(difficulty))
		{
			throw std::out_of_range("chartsync: invalid difficulty " + std::to_string(static_cast<std::int32_t>(difficulty)));
		}

		return static_cast<std::size_t>(instrument) * kNumDifficultiesSZ + static_cast<std::size_t>(difficulty);
	}

	Tick ScaleTick(Tick tick, double ratio)
	{
		return RoundToTick(static_cast<double>(tick) * ratio);
	}
}

chartsync::BatchUpdate::BatchUpdate(SongTimeline& timeline)
	: m_pTimeline(&timeline)
{
	m_pTimeline->beginBatchInternal();
}

chartsync::BatchUpdate::~BatchUpdate()
{
	release();
}

chartsync::BatchUpdate::BatchUpdate(BatchUpdate&& other) noexcept
	: m_pTimeline(other.m_pTimeline)
{
	other.m_pTimeline = nullptr;
}

chartsync::BatchUpdate& chartsync::BatchUpdate::operator=(BatchUpdate&& other) noexcept
{
	if (this != &other)
	{
		release();
		m_pTimeline = other.m_pTimeline;
		other.m_pTimeline = nullptr;
	}
	return *this;
}

void chartsync::BatchUpdate::release()
{
	if (m_pTimeline != nullptr)
	{
		SongTimeline *pTimeline = m_pTimeline;
		m_pTimeline = nullptr;
		pTimeline->endBatchInternal();
	}
}

chartsync::SongTimeline::SongTimeline(double resolution)
	: SongTimeline(TimelineConfig{ .resolution = resolution })
{
}

chartsync::SongTimeline::SongTimeline(const TimelineConfig& config)
	: m_resolution(config.resolution)
	, name(config.name)
	, offsetSec(config.offsetSec)
	, hopoThreshold(config.hopoThreshold)
	, manualLengthSec(config.manualLengthSec)
{
	if (!IsValidResolution(m_resolution))
	{
		throw std::invalid_argument("chartsync: resolution must be finite and positive");
	}

	for (std::size_t i = 0; i < m_charts.size(); ++i)
	{
		m_charts[i] = Chart{ static_cast<Instrument>(i / kNumDifficultiesSZ) };
	}

	// Anchors at tick 0
	const auto batch = beginBatch();
	addTempoMarker(TempoMarker{ .tick = 0, .bpmMilli = config.initialBPMMilli });
	addTimeSignatureMarker(TimeSigMarker{ .tick = 0, .numerator = config.timeSigNumerator, .denominator = config.timeSigDenominator });
}

void chartsync::SongTimeline::rescale(double newResolution)
{
	if (!IsValidResolution(newResolution))
	{
		throw std::invalid_argument("chartsync: resolution must be finite and positive");
	}

	const double ratio = resolutionScaleRatio(newResolution);

	m_syncTrack.transformValues([ratio](auto& v) { v.tick = ScaleTick(v.tick, ratio); });
	m_eventTrack.transformValues([ratio](auto& v)
		{
			v.tick = ScaleTick(v.tick, ratio);
			if constexpr (std::is_same_v<std::decay_t<decltype(v)>, VenueEvent>)
			{
				v.length = static_cast<RelTick>(std::llround(static_cast<double>(v.length) * ratio));
			}
		});

	for (auto& chart : m_charts)
	{
		chart.rescale(ratio);
	}

	hopoThreshold *= ratio;
	m_resolution = newResolution;

	refreshIfNotBatching();
}

chartsync::EntryId chartsync::SongTimeline::addTempoMarker(const TempoMarker& marker)
{
	if (marker.bpmMilli == 0)
	{
		throw std::invalid_argument("chartsync: tempo must be positive");
	}

	// Assigned time is always derived
	const EntryId id = m_syncTrack.insert(TempoMarker{ .tick = marker.tick, .bpmMilli = marker.bpmMilli });
	refreshIfNotBatching();
	return id;
}

chartsync::EntryId chartsync::SongTimeline::addTimeSignatureMarker(const TimeSigMarker& marker)
{
	if (marker.numerator == 0 || marker.denominator == 0)
	{
		throw std::invalid_argument("chartsync: time signature must have a positive numerator and denominator");
	}

	const EntryId id = m_syncTrack.insert(marker);
	refreshIfNotBatching();
	return id;
}

chartsync::ErrorType chartsync::SongTimeline::removeTempoMarker(EntryId id)
{
	const auto *entry = m_syncTrack.find(id);
	if (entry == nullptr || entry->kind() != SyncKind::kTempo)
	{
		return ErrorType::EntryNotFound;
	}

	if (entry->tick() == 0)
	{
		return ErrorType::AnchorNotRemovable;
	}

	m_syncTrack.remove<TempoMarker>(id);
	refreshIfNotBatching();
	return ErrorType::None;
}

chartsync::ErrorType chartsync::SongTimeline::removeTimeSignatureMarker(EntryId id)
{
	const auto *entry = m_syncTrack.find(id);
	if (entry == nullptr || entry->kind() != SyncKind::kTimeSig)
	{
		return ErrorType::EntryNotFound;
	}

	if (entry->tick() == 0)
	{
		return ErrorType::AnchorNotRemovable;
	}

	m_syncTrack.remove<TimeSigMarker>(id);
	refreshIfNotBatching();
	return ErrorType::None;
}

void chartsync::SongTimeline::regenerateBeatMarkers(Tick endTick)
{
	// Read time signatures from the backing track since the view may be stale inside a batch
	TypedView<TimeSigMarker> timeSigs;
	for (const auto& entry : m_syncTrack.entries())
	{
		if (const auto *timeSig = std::get_if<TimeSigMarker>(&entry.value))
		{
			timeSigs.push(entry.id, *timeSig);
		}
	}

	m_syncTrack.removeAll<BeatMarker>();
	for (const auto& beat : GenerateBeatMarkers(timeSigs, m_resolution, endTick))
	{
		m_syncTrack.insert(beat);
	}

	refreshIfNotBatching();
}

chartsync::EntryId chartsync::SongTimeline::addEvent(const TextEvent& event)
{
	const EntryId id = m_eventTrack.insert(event);
	refreshIfNotBatching();
	return id;
}

chartsync::EntryId chartsync::SongTimeline::addEvent(const Section& section)
{
	const EntryId id = m_eventTrack.insert(section);
	refreshIfNotBatching();
	return id;
}

chartsync::EntryId chartsync::SongTimeline::addEvent(const VenueEvent& venueEvent)
{
	const EntryId id = m_eventTrack.insert(venueEvent);
	refreshIfNotBatching();
	return id;
}

chartsync::ErrorType chartsync::SongTimeline::removeEvent(EntryId id)
{
	if (!m_eventTrack.remove(id))
	{
		return ErrorType::EntryNotFound;
	}

	refreshIfNotBatching();
	return ErrorType::None;
}

chartsync::BatchUpdate chartsync::SongTimeline::beginBatch()
{
	return BatchUpdate(*this);
}

void chartsync::SongTimeline::beginBatchInternal()
{
	++m_batchDepth;
}

void chartsync::SongTimeline::endBatchInternal()
{
	assert(m_batchDepth > 0);

	--m_batchDepth;
	if (m_batchDepth == 0)
	{
		refresh();
	}
}

void chartsync::SongTimeline::refreshIfNotBatching()
{
	if (!isBatching())
	{
		refresh();
	}
}

void chartsync::SongTimeline::refresh()
{
	m_eventTrack.refreshTypedViews();
	m_syncTrack.refreshTypedViews();

	RecomputeAssignedTimes(m_syncTrack.editView<TempoMarker>(), m_resolution);
}

double chartsync::SongTimeline::tickToSec(Tick tick) const
{
	return TickToSec(tick, tempos(), m_resolution);
}

double chartsync::SongTimeline::tickToMs(Tick tick) const
{
	return TickToMs(tick, tempos(), m_resolution);
}

chartsync::Tick chartsync::SongTimeline::secToTick(double sec) const
{
	return SecToTick(sec, tempos(), m_resolution);
}

chartsync::Tick chartsync::SongTimeline::msToTick(double ms) const
{
	return MsToTick(ms, tempos(), m_resolution);
}

double chartsync::SongTimeline::liveTickToSec(Tick tick) const
{
	// The first tempo entry in the backing track is the anchor at tick 0
	for (const auto& entry : m_syncTrack.entries())
	{
		if (const auto *tempo = std::get_if<TempoMarker>(&entry.value))
		{
			return LiveTickToSec(tick, m_resolution, *tempo, m_syncTrack);
		}
	}

	throw std::logic_error("chartsync: tempo sequence is empty");
}

const chartsync::TempoMarker& chartsync::SongTimeline::previousTempoMarker(Tick tick) const
{
	return TempoMarkerAt(tick, tempos());
}

const chartsync::TimeSigMarker& chartsync::SongTimeline::previousTimeSignature(Tick tick) const
{
	const TimeSigMarker *timeSig = FindPrevious(timeSignatures(), tick);
	if (timeSig == nullptr)
	{
		throw std::logic_error("chartsync: time signature sequence is empty");
	}
	return *timeSig;
}

const chartsync::Section *chartsync::SongTimeline::previousSection(Tick tick) const
{
	return FindPrevious(sections(), tick);
}

double chartsync::SongTimeline::tempoAt(Tick tick) const
{
	return TempoAt(tick, tempos());
}

chartsync::Tick chartsync::SongTimeline::lastTick() const
{
	Tick maxTick = 0;

	if (!m_syncTrack.empty())
	{
		maxTick = std::max(maxTick, m_syncTrack.entries().back().tick());
	}

	for (const auto& entry : m_eventTrack.entries())
	{
		RelTick endTick = static_cast<RelTick>(entry.tick());
		if (const auto *venueEvent = std::get_if<VenueEvent>(&entry.value))
		{
			endTick += std::max(venueEvent->length, RelTick{ 0 });
		}
		maxTick = std::max(maxTick, ClampToTick(endTick));
	}

	for (const auto& chart : m_charts)
	{
		maxTick = std::max(maxTick, chart.lastTick());
	}

	return maxTick;
}

chartsync::Chart& chartsync::SongTimeline::chart(Instrument instrument, Difficulty difficulty)
{
	return m_charts[ChartIdx(instrument, difficulty)];
}

const chartsync::Chart& chartsync::SongTimeline::chart(Instrument instrument, Difficulty difficulty) const
{
	return m_charts[ChartIdx(instrument, difficulty)];
}

bool chartsync::SongTimeline::chartExists(Instrument instrument, Difficulty difficulty) const
{
	return !chart(instrument, difficulty).empty();
}

bool chartsync::SongTimeline::chartExistsForInstrument(Instrument instrument) const
{
	for (std::int32_t i = 0; i < kNumDifficulties; ++i)
	{
		if (chartExists(instrument, static_cast<Difficulty>(i)))
		{
			return true;
		}
	}
	return false;
}
