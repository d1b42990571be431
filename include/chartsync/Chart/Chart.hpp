#pragma once
#include "chartsync/Common/Common.hpp"
#include "chartsync/Chart/Instrument.hpp"

namespace chartsync
{
	// Opaque note-level object; its meaning belongs to the instrument-specific collaborators
	struct ChartObject
	{
		Tick tick = 0;
		std::int32_t type = 0;
		RelTick length = 0;
	};

	class Chart
	{
	private:
		Instrument m_instrument = Instrument::kGuitar;
		std::vector<ChartObject> m_objects;

	public:
		Chart() = default;

		explicit Chart(Instrument instrument)
			: m_instrument(instrument)
		{
		}

		[[nodiscard]]
		Instrument instrument() const
		{
			return m_instrument;
		}

		[[nodiscard]]
		GameMode gameMode() const
		{
			return InstrumentToGameMode(m_instrument);
		}

		// Inserts after any objects with an equal tick
		void add(const ChartObject& object);

		// Removes the first object with the same tick and type
		bool remove(Tick tick, std::int32_t type);

		void clear()
		{
			m_objects.clear();
		}

		[[nodiscard]]
		const std::vector<ChartObject>& objects() const
		{
			return m_objects;
		}

		[[nodiscard]]
		bool empty() const
		{
			return m_objects.empty();
		}

		// End tick of the last object including its length
		[[nodiscard]]
		Tick lastTick() const;

		// Scales ticks and lengths by ratio, rounding to the nearest tick
		void rescale(double ratio);
	};
}
