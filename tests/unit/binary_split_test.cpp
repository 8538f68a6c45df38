#include "bytekit/core/Binary.hpp"
#include "bytekit/core/BinaryErrors.hpp"
#include "test_utils/TestUtils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

namespace
{
using bytekit::core::Binary;
using bytekit::core::BinaryPtr;
using bytekit::core::Kind;
using bytekit::core::SplitOptions;
using bytekit::core::Value;
using bytekit::test_utils::bytesOf;
using bytekit::test_utils::contentOf;

const std::vector<std::uint8_t> g_kNone{};

[[nodiscard]] std::vector<std::vector<std::uint8_t>> contents(const std::vector<BinaryPtr>& parts)
{
    std::vector<std::vector<std::uint8_t>> out;
    out.reserve(parts.size());
    for (const auto& p : parts)
    {
        out.push_back(contentOf(*p));
    }
    return out;
}
} // namespace

TEST(BinarySplit, SplitsOnSingleByte)
{
    const auto b{ Binary::fromBytes(Kind::ByteString, bytesOf({ 0x41, 0x42, 0x43 })) };

    const auto parts{ b->split(0x42) };

    EXPECT_THAT(contents(parts), ::testing::ElementsAre(bytesOf({ 0x41 }), bytesOf({ 0x43 })));
    EXPECT_EQ(parts.front()->kind(), Kind::ByteString);
}

TEST(BinarySplit, NoMatchReturnsReceiverItself)
{
    const auto b{ Binary::fromBytes(Kind::ByteArray, bytesOf({ 1, 2, 3 })) };

    const auto parts{ b->split(9) };

    ASSERT_EQ(parts.size(), 1U);
    EXPECT_EQ(parts[0], b);
}

TEST(BinarySplit, EmptyBufferReturnsReceiverItself)
{
    const auto b{ Binary::empty(Kind::ByteString) };
    const auto parts{ b->split(0) };

    ASSERT_EQ(parts.size(), 1U);
    EXPECT_EQ(parts[0], b);
}

TEST(BinarySplit, LeadingAndTrailingDelimitersYieldEmptySegments)
{
    const auto b{ Binary::fromBytes(Kind::ByteArray, bytesOf({ 0, 1, 0 })) };

    const auto parts{ b->split(0) };

    EXPECT_THAT(contents(parts), ::testing::ElementsAre(g_kNone, bytesOf({ 1 }), g_kNone));
}

TEST(BinarySplit, IncludeDelimiterReassemblesOriginal)
{
    const auto original{ bytesOf({ 1, 0, 2, 0, 3 }) };
    const auto b{ Binary::fromBytes(Kind::ByteArray, original) };

    const auto parts{ b->split(0, SplitOptions{ .includeDelimiter = true }) };

    EXPECT_THAT(contents(parts), ::testing::ElementsAre(bytesOf({ 1 }), bytesOf({ 0 }), bytesOf({ 2 }),
                                                        bytesOf({ 0 }), bytesOf({ 3 })));

    const std::vector<Value> rest(parts.begin() + 1, parts.end());
    EXPECT_EQ(contentOf(*parts.front()->concat(rest)), original);
}

TEST(BinarySplit, MultiByteDelimiterDoesNotOverlap)
{
    const auto b{ Binary::fromBytes(Kind::ByteString, bytesOf("a--b---c")) };
    const auto dash2{ Binary::fromBytes(Kind::ByteString, bytesOf("--")) };

    const auto parts{ b->split(dash2) };

    EXPECT_THAT(contents(parts), ::testing::ElementsAre(bytesOf("a"), bytesOf("b"), bytesOf("-c")));
}

TEST(BinarySplit, FirstCandidateWinsOverLongerOne)
{
    const auto b{ Binary::fromBytes(Kind::ByteString, bytesOf({ 1, 2, 3 })) };
    const auto one{ Binary::fromBytes(Kind::ByteString, bytesOf({ 1 })) };
    const auto oneTwo{ Binary::fromBytes(Kind::ByteString, bytesOf({ 1, 2 })) };

    const auto shortFirst{ b->split(Value::Sequence{ one, oneTwo }, SplitOptions{ .includeDelimiter = true }) };
    const auto longFirst{ b->split(Value::Sequence{ oneTwo, one }, SplitOptions{ .includeDelimiter = true }) };

    EXPECT_THAT(contents(shortFirst), ::testing::ElementsAre(g_kNone, bytesOf({ 1 }), bytesOf({ 2, 3 })));
    EXPECT_THAT(contents(longFirst), ::testing::ElementsAre(g_kNone, bytesOf({ 1, 2 }), bytesOf({ 3 })));
}

TEST(BinarySplit, MixedDelimiterCollection)
{
    const auto b{ Binary::fromBytes(Kind::ByteString, bytesOf("a,b;;c")) };
    const auto semis{ Binary::fromBytes(Kind::ByteArray, bytesOf(";;")) };

    const auto parts{ b->split(Value::Sequence{ ',', semis }) };

    EXPECT_THAT(contents(parts), ::testing::ElementsAre(bytesOf("a"), bytesOf("b"), bytesOf("c")));
}

TEST(BinarySplit, RawBytesDelimiter)
{
    const auto b{ Binary::fromBytes(Kind::ByteString, bytesOf("x\r\ny")) };

    const auto parts{ b->split(bytesOf("\r\n")) };

    EXPECT_THAT(contents(parts), ::testing::ElementsAre(bytesOf("x"), bytesOf("y")));
}

TEST(BinarySplit, ReceiverAsItsOwnDelimiter)
{
    const auto b{ Binary::fromBytes(Kind::ByteArray, bytesOf({ 5, 6 })) };

    const auto parts{ b->split(b) };

    EXPECT_THAT(contents(parts), ::testing::ElementsAre(g_kNone, g_kNone));
}

TEST(BinarySplit, EmptyDelimiterNeverMatches)
{
    const auto b{ Binary::fromBytes(Kind::ByteString, bytesOf({ 1, 2 })) };

    const auto parts{ b->split(Binary::empty(Kind::ByteString)) };

    ASSERT_EQ(parts.size(), 1U);
    EXPECT_EQ(parts[0], b);
}

TEST(BinarySplit, UnsupportedDelimiterIsRejected)
{
    const auto b{ Binary::fromBytes(Kind::ByteString, bytesOf({ 1, 2 })) };

    EXPECT_THROW((void)b->split("x"), bytekit::core::InvalidArgument);
    EXPECT_THROW((void)b->split(Value{}), bytekit::core::InvalidArgument);
    EXPECT_THROW((void)b->split(Value::Sequence{ 1, "x" }), bytekit::core::InvalidArgument);
}
