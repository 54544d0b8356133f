#include "memory/raw_buffer.hpp"

#include <algorithm>
#include <cstring>
#include <new>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "memory/fail_fast.hpp"

Recycler::memory::layout Recycler::memory::layout::for_bytes(std::size_t n) noexcept
{
    if (n == 0)
    {
        fail_fast("Can not lay out an empty byte region");
    }

    // One byte per element, so the element count is the byte count
    return { n * sizeof(std::uint8_t), alignof(std::uint8_t) };
}

Recycler::memory::raw_buffer::raw_buffer(std::size_t size) noexcept
{
    auto const requested = layout::for_bytes(size);

    m_data   = allocate(requested);
    m_layout = requested;
    std::memset(m_data, 0, m_layout.size);
}

Recycler::memory::raw_buffer::raw_buffer(raw_buffer&& other) noexcept
{
    move_impl(*this, other);
}

Recycler::memory::raw_buffer& Recycler::memory::raw_buffer::operator=(raw_buffer&& other) noexcept
{
    if (this != &other)
    {
        release();
        move_impl(*this, other);
    }
    return *this;
}

Recycler::memory::raw_buffer::~raw_buffer()
{
    release();
}

void Recycler::memory::raw_buffer::realloc(std::size_t new_size) noexcept
{
    auto const new_layout = layout::for_bytes(new_size);
    if (new_layout == m_layout)
    {
        return;
    }

    value_type* new_data = allocate(new_layout);

    auto const preserved = std::min(m_layout.size, new_layout.size);
    if (preserved > 0)
    {
        std::memcpy(new_data, m_data, preserved);
    }
    if (new_layout.size > preserved)
    {
        std::memset(new_data + preserved, 0, new_layout.size - preserved);
    }

    // The live pointer moves to the new region before the old one is freed
    value_type* old_data  = std::exchange(m_data, new_data);
    auto const old_layout = std::exchange(m_layout, new_layout);
    deallocate(old_data, old_layout);
}

void Recycler::memory::raw_buffer::fill(value_type value) noexcept
{
    if (m_data)
    {
        std::memset(m_data, value, m_layout.size);
    }
}

Recycler::memory::raw_buffer::value_type* Recycler::memory::raw_buffer::allocate(layout const& region) noexcept
{
    void* memory = ::operator new(region.size, std::align_val_t{region.alignment}, std::nothrow);
    if (not memory) [[unlikely]]
    {
        fail_fast(fmt::format("Memory allocation of {} bytes (alignment {}) failed", region.size, region.alignment));
    }

    return static_cast<value_type*>(memory);
}

void Recycler::memory::raw_buffer::deallocate(value_type* data, layout const& region) noexcept
{
    if (data)
    {
        ::operator delete(data, region.size, std::align_val_t{region.alignment});
    }
}

void Recycler::memory::raw_buffer::move_impl(raw_buffer& to, raw_buffer& from) noexcept
{
    to.m_data = from.m_data;
    from.m_data = nullptr;

    to.m_layout = from.m_layout;
    from.m_layout.size = 0;
}

void Recycler::memory::raw_buffer::release() noexcept
{
    deallocate(m_data, m_layout);
    m_data = nullptr;
    m_layout.size = 0;
}
