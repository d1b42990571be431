#include "chartsync/Chart/Chart.hpp"

void chartsync::Chart::add(const ChartObject& object)
{
	const auto itr = std::upper_bound(m_objects.begin(), m_objects.end(), object.tick,
		[](Tick t, const ChartObject& o) { return t < o.tick; });
	m_objects.insert(itr, object);
}

bool chartsync::Chart::remove(Tick tick, std::int32_t type)
{
	auto itr = std::lower_bound(m_objects.begin(), m_objects.end(), tick,
		[](const ChartObject& o, Tick t) { return o.tick < t; });
	for (; itr != m_objects.end() && itr->tick == tick; ++itr)
	{
		if (itr->type == type)
		{
			m_objects.erase(itr);
			return true;
		}
	}
	return false;
}

chartsync::Tick chartsync::Chart::lastTick() const
{
	RelTick maxTick = 0;
	for (const auto& object : m_objects)
	{
		maxTick = std::max(maxTick, static_cast<RelTick>(object.tick) + std::max(object.length, RelTick{ 0 }));
	}
	return ClampToTick(maxTick);
}

void chartsync::Chart::rescale(double ratio)
{
	for (auto& object : m_objects)
	{
		object.tick = RoundToTick(static_cast<double>(object.tick) * ratio);
		object.length = static_cast<RelTick>(std::llround(static_cast<double>(object.length) * ratio));
	}
}
