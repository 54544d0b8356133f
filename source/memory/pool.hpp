#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "memory/fail_fast.hpp"
#include "memory/free_list.hpp"
#include "memory/options.hpp"
#include "memory/poolable.hpp"
#include "memory/raw_buffer.hpp"

namespace Recycler::memory
{
    template<poolable T, template<typename> typename TStore = recent_scan_store>
    class pool;

    /**
     * Exclusive checkout of one pooled instance. On destruction the instance
     * is moved out of the block and handed back to the pool exactly once.
     *
     * A block is not meant to be shared between threads; the pool is.
     */
    template<poolable T, template<typename> typename TStore = recent_scan_store>
    class block
    {
    public:
        using value_type = T;
        using traits_t   = poolable_traits<T>;
        using pool_t     = pool<T, TStore>;

        block(block&& other) noexcept
            : m_value(std::move(other.m_value)), m_size_class(other.m_size_class), m_pool(std::exchange(other.m_pool, nullptr))
        {
            other.m_value.reset();
        }

        block& operator=(block&& other) noexcept
        {
            if (this != &other)
            {
                give_back();
                m_value      = std::move(other.m_value);
                m_size_class = other.m_size_class;
                m_pool       = std::exchange(other.m_pool, nullptr);
                other.m_value.reset();
            }
            return *this;
        }

        block(block const&) = delete;
        block& operator=(block const&) = delete;

        ~block()
        {
            give_back();
        }

        [[nodiscard]] T& get() noexcept { return *m_value; }
        [[nodiscard]] T const& get() const noexcept { return *m_value; }

        [[nodiscard]] T& operator*() noexcept { return *m_value; }
        [[nodiscard]] T const& operator*() const noexcept { return *m_value; }
        [[nodiscard]] T* operator->() noexcept { return std::addressof(*m_value); }
        [[nodiscard]] T const* operator->() const noexcept { return std::addressof(*m_value); }

        [[nodiscard]] std::size_t size() const noexcept { return traits_t::len(*m_value); }
        [[nodiscard]] std::size_t capacity() const noexcept { return traits_t::capacity(*m_value); }
        [[nodiscard]] bool empty() const noexcept { return traits_t::empty(*m_value); }

        /**
         * The size this block was requested or last reallocated with. The
         * instance is filed under it when it returns to the pool.
         */
        [[nodiscard]] std::size_t size_class() const noexcept { return m_size_class; }

        T& realloc(std::size_t new_size) requires reallocatable<T>
        {
            traits_t::realloc(*m_value, new_size);
            m_size_class = new_size;
            return *m_value;
        }

        template<typename TIndex>
            requires requires(T& value, TIndex&& index) { value[std::forward<TIndex>(index)]; }
        [[nodiscard]] decltype(auto) operator[](TIndex&& index)
        {
            return (*m_value)[std::forward<TIndex>(index)];
        }

        template<typename TIndex>
            requires requires(T const& value, TIndex&& index) { value[std::forward<TIndex>(index)]; }
        [[nodiscard]] decltype(auto) operator[](TIndex&& index) const
        {
            return (*m_value)[std::forward<TIndex>(index)];
        }

        [[nodiscard]] auto begin() requires std::ranges::range<T> { return std::ranges::begin(*m_value); }
        [[nodiscard]] auto end() requires std::ranges::range<T> { return std::ranges::end(*m_value); }
        [[nodiscard]] auto begin() const requires std::ranges::range<T const> { return std::ranges::begin(*m_value); }
        [[nodiscard]] auto end() const requires std::ranges::range<T const> { return std::ranges::end(*m_value); }

        [[nodiscard]] auto data() requires std::ranges::contiguous_range<T> { return std::ranges::data(*m_value); }
        [[nodiscard]] auto data() const requires std::ranges::contiguous_range<T const> { return std::ranges::data(*m_value); }

        [[nodiscard]] auto as_span() requires std::ranges::contiguous_range<T> and std::ranges::sized_range<T>
        {
            return std::span{ std::ranges::data(*m_value), std::ranges::size(*m_value) };
        }

        [[nodiscard]] auto as_span() const requires std::ranges::contiguous_range<T const> and std::ranges::sized_range<T const>
        {
            return std::span{ std::ranges::data(*m_value), std::ranges::size(*m_value) };
        }

    private:
        friend pool_t;

        block(T&& value, std::size_t size_class, pool_t* pool) noexcept
            : m_value(std::move(value)), m_size_class(size_class), m_pool(pool) { }

        std::optional<T> m_value{};
        std::size_t m_size_class{};
        pool_t* m_pool{};

        void give_back() noexcept
        {
            if (not m_pool or not m_value)
            {
                return;
            }

            // Take the instance out by value first, so the block can never hand it over twice
            T value = std::move(*m_value);
            m_value.reset();
            std::exchange(m_pool, nullptr)->release(std::move(value), m_size_class);
        }
    };

    /**
     * Recycles instances of T between callers. alloc() reuses an idle
     * instance of exactly the requested size class when the store has one,
     * and allocates a fresh one otherwise. Instances only ever enter the
     * store through a block being destroyed. A reused instance is resized to
     * the request, so its length matches the size and, for raw buffers and
     * vectors, so does its capacity.
     *
     * The pool must outlive every block it handed out; destroying it while
     * blocks are checked out is a fatal error.
     */
    template<poolable T, template<typename> typename TStore>
    class pool
    {
    public:
        using value_type = T;
        using traits_t   = poolable_traits<T>;
        using block_t    = block<T, TStore>;
        using store_t    = TStore<T>;

        pool() : pool(pool_options{}) { }

        explicit pool(pool_options const& options)
            : m_store(options), m_reset_on_release(options.reset_on_release),
              m_logger(options.logger ? options.logger : spdlog::default_logger())
        {
            if (not m_logger)
            {
                throw std::invalid_argument("No logger was provided and spdlog has no default logger");
            }

            m_logger->debug("Pool created");
        }

        pool(pool const&) = delete;
        pool& operator=(pool const&) = delete;

        ~pool()
        {
            if (auto const live = m_outstanding.load(std::memory_order_acquire); live != 0)
            {
                fail_fast(fmt::format("Pool destroyed while {} blocks are still checked out", live));
            }

            // Freed outside the store's lock when this goes out of scope
            auto const drained = m_store.drain();
            m_logger->debug("Pool destroyed, freeing {} idle instances", drained.size());
        }

        [[nodiscard]] block_t alloc(std::size_t size)
        {
            if (size == 0)
            {
                fail_fast("Can not allocate empty blocks");
            }

            if (auto idle = m_store.take(size))
            {
                traits_t::resize(*idle, size);
                m_logger->trace("Reusing idle instance for size {}", size);
                return checkout(std::move(*idle), size);
            }

            m_logger->trace("Allocating new instance for size {}", size);
            return checkout(traits_t::alloc(size), size);
        }

        [[nodiscard]] std::size_t idle_count() const { return m_store.idle_count(); }
        [[nodiscard]] std::size_t idle_count(std::size_t size_class) const { return m_store.idle_count(size_class); }
        [[nodiscard]] std::size_t outstanding() const noexcept { return m_outstanding.load(std::memory_order_acquire); }

    private:
        friend block_t;

        store_t m_store;
        bool m_reset_on_release{};
        std::shared_ptr<spdlog::logger> m_logger{};

        std::atomic<std::size_t> m_outstanding{};

        block_t checkout(T&& value, std::size_t size_class) noexcept
        {
            m_outstanding.fetch_add(1, std::memory_order_acq_rel);
            return block_t(std::move(value), size_class, this);
        }

        // A failure in here leaves the store in an unknown state, so it terminates
        void release(T&& value, std::size_t size_class) noexcept
        {
            if (m_reset_on_release)
            {
                traits_t::reset(value);
            }

            m_store.put(std::move(value), size_class);
            m_outstanding.fetch_sub(1, std::memory_order_acq_rel);
        }
    };

    using byte_pool  = pool<raw_buffer>;
    using byte_block = block<raw_buffer>;
}
