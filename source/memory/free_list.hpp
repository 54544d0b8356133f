#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "memory/options.hpp"

namespace Recycler::memory
{
    /**
     * An idle instance together with the size it was last handed out for.
     * Reuse matches on that size class exactly.
     */
    template<typename T>
    struct idle_entry
    {
        T value;
        std::size_t size_class{};
    };

    /**
     * Single mutex guarded list. Acquisition only scans the last scan_window
     * entries, so its cost does not grow with the number of idle instances.
     * Recently released instances are the likeliest to match the working set.
     */
    template<typename T>
    class recent_scan_store
    {
    public:
        explicit recent_scan_store(pool_options const& options) : m_scan_window(options.scan_window)
        {
            if (m_scan_window == 0)
            {
                throw std::invalid_argument("The scan window must cover at least one entry");
            }
        }

        recent_scan_store(recent_scan_store const&) = delete;
        recent_scan_store& operator=(recent_scan_store const&) = delete;

        [[nodiscard]] std::optional<T> take(std::size_t size_class)
        {
            auto lock = std::unique_lock{m_mutex};

            auto const end   = m_entries.size();
            auto const start = end > m_scan_window ? end - m_scan_window : 0;

            for (std::size_t i = start; i < end; ++i)
            {
                if (m_entries[i].size_class == size_class)
                {
                    auto const it = m_entries.begin() + static_cast<std::ptrdiff_t>(i);
                    std::optional<T> found{std::move(it->value)};
                    m_entries.erase(it);
                    return found;
                }
            }

            return std::nullopt;
        }

        void put(T&& value, std::size_t size_class)
        {
            auto lock = std::unique_lock{m_mutex};
            m_entries.push_back({ std::move(value), size_class });
        }

        [[nodiscard]] std::vector<idle_entry<T>> drain()
        {
            auto lock = std::unique_lock{m_mutex};
            return std::exchange(m_entries, {});
        }

        [[nodiscard]] std::size_t idle_count() const
        {
            auto lock = std::unique_lock{m_mutex};
            return m_entries.size();
        }

        [[nodiscard]] std::size_t idle_count(std::size_t size_class) const
        {
            auto lock = std::unique_lock{m_mutex};
            return static_cast<std::size_t>(std::ranges::count_if(m_entries,
                [size_class](auto const& entry) { return entry.size_class == size_class; }));
        }

        [[nodiscard]] std::size_t scan_window() const noexcept { return m_scan_window; }

    private:
        std::size_t m_scan_window{};

        mutable std::mutex m_mutex{};
        std::vector<idle_entry<T>> m_entries{};
    };

    /**
     * Idle instances split into independent queues by size class, each with
     * its own lock. Acquisition looks at a single entry: if it does not match
     * exactly it goes back to the tail and the caller allocates fresh.
     */
    template<typename T>
    class partitioned_store
    {
    public:
        explicit partitioned_store(pool_options const& options) : m_thresholds(options.size_class_thresholds)
        {
            if (m_thresholds.empty())
            {
                throw std::invalid_argument("At least one size class threshold is required");
            }
            if (not std::ranges::is_sorted(m_thresholds) or
                std::ranges::adjacent_find(m_thresholds) != m_thresholds.end())
            {
                throw std::invalid_argument("Size class thresholds must be strictly ascending");
            }

            m_partitions.reserve(m_thresholds.size() + 1);
            for (std::size_t i = 0; i <= m_thresholds.size(); ++i)
            {
                m_partitions.emplace_back(std::make_unique<partition>());
            }
        }

        partitioned_store(partitioned_store const&) = delete;
        partitioned_store& operator=(partitioned_store const&) = delete;

        [[nodiscard]] std::optional<T> take(std::size_t size_class)
        {
            auto& part = *m_partitions[get_partition(size_class)];
            auto lock  = std::unique_lock{part.mutex};

            if (part.entries.empty())
            {
                return std::nullopt;
            }

            auto entry = std::move(part.entries.front());
            part.entries.pop_front();

            if (entry.size_class != size_class)
            {
                part.entries.push_back(std::move(entry));
                return std::nullopt;
            }

            return std::optional<T>{std::move(entry.value)};
        }

        void put(T&& value, std::size_t size_class)
        {
            auto& part = *m_partitions[get_partition(size_class)];
            auto lock  = std::unique_lock{part.mutex};
            part.entries.push_back({ std::move(value), size_class });
        }

        [[nodiscard]] std::vector<idle_entry<T>> drain()
        {
            std::vector<idle_entry<T>> drained{};
            for (auto& part : m_partitions)
            {
                auto lock = std::unique_lock{part->mutex};
                std::ranges::move(part->entries, std::back_inserter(drained));
                part->entries.clear();
            }
            return drained;
        }

        [[nodiscard]] std::size_t idle_count() const
        {
            std::size_t count = 0;
            for (auto const& part : m_partitions)
            {
                auto lock = std::unique_lock{part->mutex};
                count += part->entries.size();
            }
            return count;
        }

        [[nodiscard]] std::size_t idle_count(std::size_t size_class) const
        {
            auto const& part = *m_partitions[get_partition(size_class)];
            auto lock        = std::unique_lock{part.mutex};
            return static_cast<std::size_t>(std::ranges::count_if(part.entries,
                [size_class](auto const& entry) { return entry.size_class == size_class; }));
        }

        [[nodiscard]] std::size_t get_partition(std::size_t size_class) const noexcept
        {
            auto const it = std::ranges::upper_bound(m_thresholds, size_class);
            return static_cast<std::size_t>(std::distance(m_thresholds.begin(), it));
        }

        [[nodiscard]] std::size_t partition_count() const noexcept { return m_partitions.size(); }

    private:
        struct partition
        {
            mutable std::mutex mutex{};
            std::deque<idle_entry<T>> entries{};
        };

        std::vector<std::size_t> m_thresholds{};
        std::vector<std::unique_ptr<partition>> m_partitions{};
    };
}
