#pragma once
#include "chartsync/Common/Common.hpp"
#include <optional>

namespace chartsync
{
	// Contiguous, tick-ordered sequence holding entries of exactly one kind
	// Rebuilt by TimelineTrack::refreshTypedViews()
	template <typename T>
	class TypedView
	{
	private:
		std::vector<T> m_items;
		std::vector<EntryId> m_ids;

	public:
		using value_type = T;
		using const_iterator = typename std::vector<T>::const_iterator;

		TypedView() = default;

		[[nodiscard]]
		const T& operator[](std::size_t idx) const
		{
			return m_items[idx];
		}

		[[nodiscard]]
		const T& at(std::size_t idx) const
		{
			return m_items.at(idx);
		}

		[[nodiscard]]
		std::size_t size() const
		{
			return m_items.size();
		}

		[[nodiscard]]
		bool empty() const
		{
			return m_items.empty();
		}

		[[nodiscard]]
		const T& front() const
		{
			return m_items.front();
		}

		[[nodiscard]]
		const T& back() const
		{
			return m_items.back();
		}

		[[nodiscard]]
		const_iterator begin() const
		{
			return m_items.cbegin();
		}

		[[nodiscard]]
		const_iterator end() const
		{
			return m_items.cend();
		}

		[[nodiscard]]
		EntryId idAt(std::size_t idx) const
		{
			return m_ids.at(idx);
		}

		[[nodiscard]]
		std::optional<std::size_t> indexOf(EntryId id) const
		{
			const auto itr = std::find(m_ids.begin(), m_ids.end(), id);
			if (itr == m_ids.end())
			{
				return std::nullopt;
			}
			return static_cast<std::size_t>(std::distance(m_ids.begin(), itr));
		}

		// Mutable access for derived fields (e.g. assigned time of tempo markers)
		// Must not change the tick order
		[[nodiscard]]
		std::vector<T>& editItems()
		{
			return m_items;
		}

		void clear()
		{
			m_items.clear();
			m_ids.clear();
		}

		void push(EntryId id, const T& item)
		{
			m_ids.push_back(id);
			m_items.push_back(item);
		}
	};

	// Index of the entry with the tick closest to the query (ties favor the earlier index)
	// The view must not be empty
	template <typename T>
	[[nodiscard]]
	std::size_t FindClosestIdx(const TypedView<T>& view, Tick tick)
	{
		assert(!view.empty());

		std::size_t lowerIdx = 0;
		std::size_t upperIdx = view.size() - 1;
		while (lowerIdx < upperIdx)
		{
			const std::size_t midIdx = lowerIdx + (upperIdx - lowerIdx) / 2;
			if (view[midIdx].tick < tick)
			{
				lowerIdx = midIdx + 1;
			}
			else
			{
				upperIdx = midIdx;
			}
		}

		// lowerIdx is now the first entry with tick >= query (or the last entry)
		if (lowerIdx > 0)
		{
			const std::size_t prevIdx = lowerIdx - 1;
			const Tick prevDiff = tick - view[prevIdx].tick;
			const Tick nextDiff = view[lowerIdx].tick >= tick ? view[lowerIdx].tick - tick : tick - view[lowerIdx].tick;
			if (prevDiff <= nextDiff)
			{
				return prevIdx;
			}
		}
		return lowerIdx;
	}

	// Index of the last entry with tick <= query
	// Clamped to 0 if the query is before the first entry
	template <typename T>
	[[nodiscard]]
	std::optional<std::size_t> FindPreviousIdx(const TypedView<T>& view, Tick tick)
	{
		if (view.empty())
		{
			return std::nullopt;
		}

		const auto itr = std::upper_bound(view.begin(), view.end(), tick,
			[](Tick t, const T& item) { return t < item.tick; });
		if (itr == view.begin())
		{
			return std::size_t{ 0 };
		}
		return static_cast<std::size_t>(std::distance(view.begin(), itr)) - 1;
	}

	// Last entry with tick <= query, clamped to the first entry
	// Returns nullptr only if the view is empty
	template <typename T>
	[[nodiscard]]
	const T *FindPrevious(const TypedView<T>& view, Tick tick)
	{
		const auto idx = FindPreviousIdx(view, tick);
		if (!idx.has_value())
		{
			return nullptr;
		}
		return &view[*idx];
	}
}
