#pragma once
#include "chartsync/Common/Common.hpp"
#include "chartsync/Track/TypedView.hpp"
#include <tuple>

namespace chartsync
{
	// Tick-ordered arena of heterogeneous entries sharing one backing sequence
	// KindT is an enum whose values match the alternative order of Ts...
	template <typename KindT, typename... Ts>
	class TimelineTrack
	{
	public:
		using Value = std::variant<Ts...>;

		struct Entry
		{
			EntryId id = kInvalidEntryId;
			Value value;

			[[nodiscard]]
			Tick tick() const
			{
				return std::visit([](const auto& v) { return v.tick; }, value);
			}

			[[nodiscard]]
			KindT kind() const
			{
				return static_cast<KindT>(value.index());
			}
		};

	private:
		std::vector<Entry> m_entries;
		std::tuple<TypedView<Ts>...> m_views;
		EntryId m_nextId = kInvalidEntryId + 1;

	public:
		TimelineTrack() = default;

		// Inserts after any entries with an equal tick and returns the identity of the new entry
		EntryId insert(Value value)
		{
			const Tick tick = std::visit([](const auto& v) { return v.tick; }, value);
			const auto itr = std::upper_bound(m_entries.begin(), m_entries.end(), tick,
				[](Tick t, const Entry& entry) { return t < entry.tick(); });

			const EntryId id = m_nextId++;
			m_entries.insert(itr, Entry{ id, std::move(value) });
			return id;
		}

		// Removes the entry with the given identity if it holds a T
		template <typename T>
		bool remove(EntryId id)
		{
			const auto itr = std::find_if(m_entries.begin(), m_entries.end(),
				[id](const Entry& entry) { return entry.id == id; });
			if (itr == m_entries.end() || !std::holds_alternative<T>(itr->value))
			{
				return false;
			}

			m_entries.erase(itr);
			return true;
		}

		// Removes the entry with the given identity regardless of its kind
		bool remove(EntryId id)
		{
			const auto itr = std::find_if(m_entries.begin(), m_entries.end(),
				[id](const Entry& entry) { return entry.id == id; });
			if (itr == m_entries.end())
			{
				return false;
			}

			m_entries.erase(itr);
			return true;
		}

		// Removes every entry holding a T
		template <typename T>
		std::size_t removeAll()
		{
			const auto itr = std::remove_if(m_entries.begin(), m_entries.end(),
				[](const Entry& entry) { return std::holds_alternative<T>(entry.value); });
			const auto count = static_cast<std::size_t>(std::distance(itr, m_entries.end()));
			m_entries.erase(itr, m_entries.end());
			return count;
		}

		[[nodiscard]]
		const Entry *find(EntryId id) const
		{
			const auto itr = std::find_if(m_entries.begin(), m_entries.end(),
				[id](const Entry& entry) { return entry.id == id; });
			if (itr == m_entries.end())
			{
				return nullptr;
			}
			return &*itr;
		}

		[[nodiscard]]
		std::optional<Tick> tickOf(EntryId id) const
		{
			if (const Entry *entry = find(id))
			{
				return entry->tick();
			}
			return std::nullopt;
		}

		[[nodiscard]]
		const std::vector<Entry>& entries() const
		{
			return m_entries;
		}

		[[nodiscard]]
		std::size_t size() const
		{
			return m_entries.size();
		}

		[[nodiscard]]
		bool empty() const
		{
			return m_entries.empty();
		}

		template <typename T>
		[[nodiscard]]
		std::size_t countOf() const
		{
			return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(),
				[](const Entry& entry) { return std::holds_alternative<T>(entry.value); }));
		}

		void clear()
		{
			m_entries.clear();
			std::apply([](auto&... views) { (views.clear(), ...); }, m_views);
		}

		// Visits every value in place
		// func must not change the tick order of entries (e.g. a monotonic tick scale is fine)
		template <typename Func>
		void transformValues(Func func)
		{
			for (auto& entry : m_entries)
			{
				std::visit(func, entry.value);
			}
		}

		// Rebuilds the view of each kind from the backing sequence, keeping tick order
		void refreshTypedViews()
		{
			std::apply([](auto&... views) { (views.clear(), ...); }, m_views);

			for (const auto& entry : m_entries)
			{
				std::visit([this, &entry](const auto& v)
					{
						using T = std::decay_t<decltype(v)>;
						std::get<TypedView<T>>(m_views).push(entry.id, v);
					}, entry.value);
			}
		}

		template <typename T>
		[[nodiscard]]
		const TypedView<T>& view() const
		{
			return std::get<TypedView<T>>(m_views);
		}

		template <typename T>
		[[nodiscard]]
		TypedView<T>& editView()
		{
			return std::get<TypedView<T>>(m_views);
		}
	};
}
