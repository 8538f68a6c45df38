#include "bytekit/core/Binary.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

namespace
{
using bytekit::core::Binary;
using bytekit::core::Index;
using bytekit::core::Kind;

constexpr Index g_kThreads{ 8 };
constexpr Index g_kWritesPerThread{ 2000 };
} // namespace

TEST(BinaryConcurrency, ConcurrentSetsOnDistinctIndexesAreAllKept)
{
    const auto a{ Binary::empty(Kind::ByteArray) };

    std::vector<std::thread> writers;
    for (Index t{}; t < g_kThreads; ++t)
    {
        writers.emplace_back([a, t]() {
            for (Index i{}; i < g_kWritesPerThread; ++i)
            {
                const Index index{ (i * g_kThreads) + t };
                a->set(index, index);
            }
        });
    }
    for (auto& w : writers)
    {
        w.join();
    }

    const Index total{ g_kThreads * g_kWritesPerThread };
    ASSERT_EQ(a->length(), static_cast<std::size_t>(total));
    for (Index i{}; i < total; ++i)
    {
        ASSERT_EQ(a->get(i), std::optional<std::uint8_t>{ static_cast<std::uint8_t>(i & 0xFF) }) << "index " << i;
    }
}

TEST(BinaryConcurrency, ReadersNeverObserveBytesPastLength)
{
    constexpr std::size_t kMaxLength{ 256U };
    constexpr int kRounds{ 2000 };
    const auto a{ Binary::ofSize(Kind::ByteArray, static_cast<Index>(kMaxLength)) };

    std::atomic<bool> done{ false };
    std::atomic<std::size_t> violations{ 0U };

    std::thread writer{ [&]() {
        for (int r{}; r < kRounds; ++r)
        {
            const auto len{ static_cast<Index>((r * 37) % static_cast<int>(kMaxLength)) };
            a->setLength(len);
            for (Index i{}; i < len; ++i)
            {
                a->set(i, 0x7F);
            }
        }
        done = true;
    } };

    std::vector<std::thread> readers;
    for (int t{}; t < 3; ++t)
    {
        readers.emplace_back([&]() {
            while (!done)
            {
                const auto copy{ a->slice() };
                if (copy->length() > kMaxLength)
                {
                    ++violations;
                }
                for (Index i{}; i < static_cast<Index>(copy->length()); ++i)
                {
                    const auto v{ copy->get(i) };
                    if (!v.has_value() || (*v != 0U && *v != 0x7FU))
                    {
                        ++violations;
                    }
                }
                (void)a->toString();
                (void)a->indexOf(0x7F);
            }
        });
    }

    writer.join();
    for (auto& r : readers)
    {
        r.join();
    }

    EXPECT_EQ(violations.load(), 0U);
}

TEST(BinaryConcurrency, ConcatWithItselfWhileGrowing)
{
    const auto a{ Binary::ofSize(Kind::ByteArray, 4) };
    std::atomic<bool> done{ false };

    std::thread writer{ [&]() {
        for (Index i{ 4 }; i < 4000; ++i)
        {
            a->set(i, 1);
        }
        done = true;
    } };

    while (!done)
    {
        const auto joined{ a->concat({ a }) };
        EXPECT_GE(joined->length(), 8U);
    }
    writer.join();

    EXPECT_EQ(a->concat({ a })->length(), 8000U);
}
