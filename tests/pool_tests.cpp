#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <gtest/gtest.h>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include "memory/pool.hpp"
#include "stderr_default_logger.hpp"

namespace PoolTests
{
    using Recycler::memory::partitioned_store;
    using Recycler::memory::pool;
    using Recycler::memory::pool_options;
    using Recycler::memory::raw_buffer;
    using Recycler::memory::recent_scan_store;

    template<typename TPool>
    struct PoolFixture : public testing::Test
    {
        TPool pool{};
    };

    TYPED_TEST_SUITE_P(PoolFixture);

    TYPED_TEST_P(PoolFixture, ColdPoolAllocatesFresh)
    {
        EXPECT_EQ(this->pool.idle_count(), 0u);

        auto block = this->pool.alloc(1024);

        EXPECT_EQ(block.capacity(), 1024u);
        EXPECT_EQ(block.size(), 1024u);
        EXPECT_EQ(this->pool.outstanding(), 1u);
        EXPECT_EQ(this->pool.idle_count(), 0u);
    }

    TYPED_TEST_P(PoolFixture, WarmPoolReusesExactMatch)
    {
        std::uint8_t const* memory = nullptr;
        {
            auto block = this->pool.alloc(1024);
            for (std::size_t i = 0; i < block.size(); ++i)
            {
                block[i] = static_cast<std::uint8_t>(i % 256);
            }
            memory = block.data();
        }
        ASSERT_EQ(this->pool.idle_count(1024), 1u);

        auto block = this->pool.alloc(1024);

        EXPECT_EQ(block.capacity(), 1024u);
        EXPECT_EQ(block.data(), memory);
        EXPECT_EQ(this->pool.idle_count(), 0u);
    }

    TYPED_TEST_P(PoolFixture, DifferentSizeIsNotReused)
    {
        {
            auto block = this->pool.alloc(1024);
        }

        auto block = this->pool.alloc(2048);

        EXPECT_EQ(block.capacity(), 2048u);
        EXPECT_EQ(this->pool.idle_count(1024), 1u);
    }

    TYPED_TEST_P(PoolFixture, EveryDropReleasesExactlyOnce)
    {
        {
            auto a = this->pool.alloc(64);
            auto b = this->pool.alloc(64);
            auto c = this->pool.alloc(8192);
            EXPECT_EQ(this->pool.outstanding(), 3u);
            EXPECT_EQ(this->pool.idle_count(), 0u);
        }

        EXPECT_EQ(this->pool.outstanding(), 0u);
        EXPECT_EQ(this->pool.idle_count(), 3u);
        EXPECT_EQ(this->pool.idle_count(64), 2u);
        EXPECT_EQ(this->pool.idle_count(8192), 1u);
    }

    TYPED_TEST_P(PoolFixture, ZeroSizeIsFatal)
    {
        EXPECT_DEATH((void)this->pool.alloc(0), "");
    }

    REGISTER_TYPED_TEST_SUITE_P(PoolFixture, ColdPoolAllocatesFresh, WarmPoolReusesExactMatch, DifferentSizeIsNotReused,
                                EveryDropReleasesExactlyOnce, ZeroSizeIsFatal);

    using Pool_Types = ::testing::Types<pool<raw_buffer, recent_scan_store>, pool<raw_buffer, partitioned_store>,
                                        pool<std::vector<std::uint8_t>, recent_scan_store>>;
    INSTANTIATE_TYPED_TEST_SUITE_P(BytePools, PoolFixture, Pool_Types);

    TEST(BytePoolTest, BasicsAcrossSizeClasses)
    {
        Recycler::memory::byte_pool pool{};

        for (int i = 0; i < 100; ++i)
        {
            auto block_1k = pool.alloc(1 * 1024);
            auto block_4k = pool.alloc(4 * 1024);

            std::ranges::fill(block_1k, static_cast<std::uint8_t>(i));
            std::ranges::fill(block_4k, static_cast<std::uint8_t>(i));

            EXPECT_TRUE(std::ranges::all_of(block_1k, [i](auto b) { return b == static_cast<std::uint8_t>(i); }));
            EXPECT_TRUE(std::ranges::all_of(block_4k, [i](auto b) { return b == static_cast<std::uint8_t>(i); }));
        }

        EXPECT_EQ(pool.idle_count(1024), 1u);
        EXPECT_EQ(pool.idle_count(4096), 1u);
    }

    TEST(BytePoolTest, ContentsSurviveReleaseByDefault)
    {
        Recycler::memory::byte_pool pool{};
        {
            auto block = pool.alloc(32);
            std::ranges::fill(block, 0xAB);
        }

        auto block = pool.alloc(32);
        EXPECT_TRUE(std::ranges::all_of(block, [](auto b) { return b == 0xAB; }));
    }

    TEST(BytePoolTest, ResetOnReleaseClearsContents)
    {
        Recycler::memory::byte_pool pool(pool_options{ .reset_on_release = true });
        {
            auto block = pool.alloc(32);
            std::ranges::fill(block, 0xAB);
        }

        auto block = pool.alloc(32);
        EXPECT_EQ(block.capacity(), 32u);
        EXPECT_TRUE(std::ranges::all_of(block, [](auto b) { return b == 0; }));
    }

    TEST(BytePoolTest, ScanWindowLimitsReuse)
    {
        Recycler::memory::byte_pool pool(pool_options{ .scan_window = 2 });
        {
            auto a = pool.alloc(10);
            auto b = pool.alloc(20);
            auto c = pool.alloc(30);
        }
        // Released in reverse declaration order: 30, 20, 10 sit in the store

        auto buried = pool.alloc(30);
        EXPECT_EQ(pool.idle_count(30), 1u);
        EXPECT_EQ(pool.idle_count(), 3u);

        auto recent = pool.alloc(10);
        EXPECT_EQ(pool.idle_count(10), 0u);
    }

    TEST(BytePoolTest, DestroyingPoolWithLiveBlockIsFatal)
    {
        EXPECT_DEATH(
            {
                auto pool = std::make_unique<Recycler::memory::byte_pool>();
                auto block = pool->alloc(16);
                pool.reset();
            },
            "");
    }

    TEST(BytePoolTest, LogsToConfiguredLogger)
    {
        auto stream = std::make_shared<std::ostringstream>();
        auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(*stream);
        auto logger = std::make_shared<spdlog::logger>("PoolTest", sink);
        logger->set_level(spdlog::level::trace);

        {
            Recycler::memory::byte_pool pool(pool_options{ .logger = logger });
            {
                auto block = pool.alloc(64);
            }
            auto block = pool.alloc(64);
        }
        logger->flush();

        auto const output = stream->str();
        EXPECT_NE(output.find("Allocating new instance for size 64"), std::string::npos);
        EXPECT_NE(output.find("Reusing idle instance for size 64"), std::string::npos);
        EXPECT_NE(output.find("freeing 1 idle instances"), std::string::npos);
    }

    TEST(VectorPoolTest, ReusedVectorHasRequestedLength)
    {
        pool<std::vector<int>> vector_pool{};
        {
            auto block = vector_pool.alloc(16);
            block->push_back(5);
            block->push_back(6);
        }

        auto block = vector_pool.alloc(16);
        EXPECT_EQ(block.size(), 16u);
        EXPECT_EQ(block.capacity(), 16u);
    }

    TEST(VectorPoolTest, ExhaustedAllocatorIsFatal)
    {
        pool<std::vector<std::uint64_t>> vector_pool{};

        Recycler::testing::stderr_default_logger diagnostics{};
        EXPECT_DEATH((void)vector_pool.alloc(std::numeric_limits<std::size_t>::max() / 4), "Vector allocation");
    }

    TEST(MapPoolTest, ExhaustedAllocatorIsFatal)
    {
        pool<std::unordered_map<int, int>> map_pool{};

        Recycler::testing::stderr_default_logger diagnostics{};
        EXPECT_DEATH((void)map_pool.alloc(std::numeric_limits<std::size_t>::max() / 4), "Map allocation");
    }

    TEST(MapPoolTest, MapsAreReusedBySizeClass)
    {
        pool<std::unordered_map<int, int>> map_pool(pool_options{ .reset_on_release = true });
        {
            auto block = map_pool.alloc(100);
            EXPECT_TRUE(block.empty());
            EXPECT_GE(block.capacity(), 100u);
            (*block)[1] = 10;
            block[2] = 20;
            EXPECT_EQ(block.size(), 2u);
        }
        ASSERT_EQ(map_pool.idle_count(100), 1u);

        auto block = map_pool.alloc(100);
        EXPECT_EQ(map_pool.idle_count(), 0u);
        EXPECT_TRUE(block.empty());
        EXPECT_GE(block.capacity(), 100u);
    }
}
