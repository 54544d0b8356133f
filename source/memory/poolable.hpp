#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <new>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>
#include <unordered_map>
#include <vector>

#include "memory/fail_fast.hpp"
#include "memory/raw_buffer.hpp"

#include <spdlog/fmt/fmt.h>

namespace Recycler::memory
{
    /**
     * Describes how the pool allocates, measures, resizes and resets a
     * pooled type. Specialise it to make a new container kind poolable;
     * the pool itself never needs to change.
     *
     * Required:  alloc(size), capacity(x), len(x), empty(x), resize(x, n), reset(x)
     * Optional:  realloc(x, new_size), see reallocatable
     */
    template<typename T>
    struct poolable_traits;

    template<typename T>
    concept poolable = std::movable<T> and requires(T& value, T const& cvalue, std::size_t n)
    {
        { poolable_traits<T>::alloc(n) } -> std::same_as<T>;
        { poolable_traits<T>::capacity(cvalue) } -> std::convertible_to<std::size_t>;
        { poolable_traits<T>::len(cvalue) } -> std::convertible_to<std::size_t>;
        { poolable_traits<T>::empty(cvalue) } -> std::convertible_to<bool>;
        poolable_traits<T>::resize(value, n);
        poolable_traits<T>::reset(value);
    };

    template<typename T>
    concept reallocatable = poolable<T> and requires(T& value, std::size_t n)
    {
        poolable_traits<T>::realloc(value, n);
    };

    /**
     * Runs a container allocation and turns allocator exhaustion into a fatal
     * error, the same way raw_buffer treats a failed operator new.
     */
    template<typename TAllocation>
    decltype(auto) allocate_or_fail(std::string_view what, std::size_t size, TAllocation&& allocation)
    {
        try
        {
            return std::forward<TAllocation>(allocation)();
        }
        catch (std::bad_alloc const& e)
        {
            fail_fast(fmt::format("{} of {} elements failed: {}", what, size, e.what()));
        }
        catch (std::length_error const& e)
        {
            fail_fast(fmt::format("{} of {} elements failed: {}", what, size, e.what()));
        }
    }

    template<>
    struct poolable_traits<raw_buffer>
    {
        [[nodiscard]] static raw_buffer alloc(std::size_t size) noexcept { return raw_buffer(size); }

        [[nodiscard]] static std::size_t capacity(raw_buffer const& buffer) noexcept { return buffer.size(); }
        [[nodiscard]] static std::size_t len(raw_buffer const& buffer) noexcept { return buffer.size(); }
        [[nodiscard]] static bool empty(raw_buffer const& buffer) noexcept { return buffer.empty(); }

        // Every byte of a raw buffer is in use, so the length can only change with the region
        static void resize(raw_buffer& buffer, std::size_t count) noexcept { buffer.realloc(count); }
        static void reset(raw_buffer& buffer) noexcept { buffer.fill(0); }

        static void realloc(raw_buffer& buffer, std::size_t new_size) noexcept { buffer.realloc(new_size); }
    };

    template<typename T, typename TAllocator>
        requires std::default_initializable<T> and std::copyable<T>
    struct poolable_traits<std::vector<T, TAllocator>>
    {
        using vector_t = std::vector<T, TAllocator>;

        [[nodiscard]] static vector_t alloc(std::size_t size)
        {
            if (size == 0)
            {
                fail_fast("Can not allocate an empty vector");
            }
            return allocate_or_fail("Vector allocation", size, [size]() { return vector_t(size, T{}); });
        }

        [[nodiscard]] static std::size_t capacity(vector_t const& vector) noexcept { return vector.capacity(); }
        [[nodiscard]] static std::size_t len(vector_t const& vector) noexcept { return vector.size(); }
        [[nodiscard]] static bool empty(vector_t const& vector) noexcept { return vector.empty(); }

        /**
         * Leaves the capacity at exactly count, a vector grown by hand while
         * checked out goes back to the size it is requested with.
         */
        static void resize(vector_t& vector, std::size_t count)
        {
            allocate_or_fail("Vector resize", count, [&vector, count]()
            {
                vector.resize(count, T{});
                if (vector.capacity() > count)
                {
                    vector.shrink_to_fit();
                }
            });
        }

        static void reset(vector_t& vector) { std::fill(vector.begin(), vector.end(), T{}); }

        static void realloc(vector_t& vector, std::size_t new_size)
        {
            if (new_size == 0)
            {
                fail_fast("Can not reallocate a vector to zero elements");
            }

            // Compare against the length, not the capacity, the pool hands out
            // vectors whose length is the requested size
            allocate_or_fail("Vector reallocation", new_size, [&vector, new_size]()
            {
                if (new_size > vector.size())
                {
                    vector.reserve(new_size);
                    vector.resize(new_size, T{});
                }
                else if (new_size < vector.size())
                {
                    vector.resize(new_size);
                    vector.shrink_to_fit();
                }
            });
        }
    };

    template<typename TKey, typename TValue, typename THash, typename TEqual, typename TAllocator>
    struct poolable_traits<std::unordered_map<TKey, TValue, THash, TEqual, TAllocator>>
    {
        using map_t = std::unordered_map<TKey, TValue, THash, TEqual, TAllocator>;

        [[nodiscard]] static map_t alloc(std::size_t size)
        {
            if (size == 0)
            {
                fail_fast("Can not allocate an empty map");
            }

            return allocate_or_fail("Map allocation", size, [size]()
            {
                map_t map{};
                map.reserve(size);
                return map;
            });
        }

        /**
         * Number of entries the map can hold before it has to rehash.
         */
        [[nodiscard]] static std::size_t capacity(map_t const& map) noexcept
        {
            return static_cast<std::size_t>(std::floor(static_cast<double>(map.bucket_count()) * map.max_load_factor()));
        }

        [[nodiscard]] static std::size_t len(map_t const& map) noexcept { return map.size(); }
        [[nodiscard]] static bool empty(map_t const& map) noexcept { return map.empty(); }

        static void resize(map_t& map, std::size_t count)
        {
            allocate_or_fail("Map resize", count, [&map, count]() { map.reserve(count); });
        }

        // clear() keeps the bucket array, so the capacity survives
        static void reset(map_t& map) noexcept { map.clear(); }

        static void realloc(map_t& map, std::size_t new_size)
        {
            if (new_size == 0)
            {
                fail_fast("Can not reallocate a map to zero entries");
            }

            allocate_or_fail("Map reallocation", new_size, [&map, new_size]()
            {
                if (new_size > capacity(map))
                {
                    map.reserve(new_size);
                }
                else if (new_size < capacity(map))
                {
                    // Entries are never dropped, there is no prefix to truncate in a hash map
                    auto const needed = std::max(new_size, map.size());
                    map.rehash(static_cast<std::size_t>(std::ceil(static_cast<double>(needed) / map.max_load_factor())));
                }
            });
        }
    };

    static_assert(reallocatable<raw_buffer>);
    static_assert(reallocatable<std::vector<int>>);
    static_assert(reallocatable<std::unordered_map<int, int>>);
}
