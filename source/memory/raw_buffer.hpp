#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace Recycler::memory
{
    /**
     * Size and alignment of a raw allocation. Kept beside the pointer so that
     * a region is always released with the layout it was allocated with.
     */
    struct layout
    {
        std::size_t size{};
        std::size_t alignment{alignof(std::uint8_t)};

        [[nodiscard]] static layout for_bytes(std::size_t n) noexcept;

        bool operator==(layout const&) const = default;
    };

    /**
     * Manually managed, contiguous, zero-initialised byte region.
     *
     * Length and capacity are the same thing for a raw buffer: exactly
     * get_layout().size bytes are addressable. Shrinking is eager, the tail is
     * given back to the allocator immediately.
     */
    class raw_buffer
    {
    public:
        using value_type     = std::uint8_t;
        using iterator       = value_type*;
        using const_iterator = value_type const*;

        raw_buffer() noexcept = default;
        explicit raw_buffer(std::size_t size) noexcept;

        raw_buffer(raw_buffer&& other) noexcept;
        raw_buffer& operator=(raw_buffer&& other) noexcept;

        raw_buffer(raw_buffer const&) = delete;
        raw_buffer& operator=(raw_buffer const&) = delete;

        ~raw_buffer();

        /**
         * Moves the region to a new allocation of new_size bytes. Bytes in
         * [0, min(old, new)) are preserved, a grown tail is zeroed.
         */
        void realloc(std::size_t new_size) noexcept;

        void fill(value_type value) noexcept;

        [[nodiscard]] value_type* data() noexcept { return m_data; }
        [[nodiscard]] value_type const* data() const noexcept { return m_data; }
        [[nodiscard]] std::size_t size() const noexcept { return m_layout.size; }
        [[nodiscard]] bool empty() const noexcept { return m_layout.size == 0; }
        [[nodiscard]] layout get_layout() const noexcept { return m_layout; }

        [[nodiscard]] value_type& operator[](std::size_t i) noexcept { return m_data[i]; }
        [[nodiscard]] value_type const& operator[](std::size_t i) const noexcept { return m_data[i]; }

        [[nodiscard]] iterator begin() noexcept { return m_data; }
        [[nodiscard]] iterator end() noexcept { return m_data + m_layout.size; }
        [[nodiscard]] const_iterator begin() const noexcept { return m_data; }
        [[nodiscard]] const_iterator end() const noexcept { return m_data + m_layout.size; }

        [[nodiscard]] std::span<value_type> as_span() noexcept { return { m_data, m_layout.size }; }
        [[nodiscard]] std::span<value_type const> as_span() const noexcept { return { m_data, m_layout.size }; }

    private:
        value_type* m_data{};
        layout m_layout{0, alignof(value_type)};

        [[nodiscard]] static value_type* allocate(layout const& region) noexcept;
        static void deallocate(value_type* data, layout const& region) noexcept;

        static void move_impl(raw_buffer& to, raw_buffer& from) noexcept;
        void release() noexcept;
    };
}
