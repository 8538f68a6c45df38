#include "bytekit/core/Binary.hpp"
#include "test_utils/TestUtils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace
{
using bytekit::core::Binary;
using bytekit::core::BinaryPtr;
using bytekit::core::g_kNotFound;
using bytekit::core::Kind;
using bytekit::core::Value;
using bytekit::test_utils::bytesOf;
using bytekit::test_utils::contentOf;

[[nodiscard]] BinaryPtr abc(Kind kind = Kind::ByteString)
{
    return Binary::fromBytes(kind, bytesOf({ 0x41, 0x42, 0x43 }));
}
} // namespace

TEST(BinarySlice, NegativeBeginCountsFromEnd)
{
    EXPECT_THAT(contentOf(*abc()->slice(-2)), ::testing::ElementsAre(0x42, 0x43));
}

TEST(BinarySlice, WithoutBoundsCopiesEverything)
{
    const auto b{ abc() };
    const auto copy{ b->slice() };

    EXPECT_NE(copy, b);
    EXPECT_EQ(contentOf(*copy), contentOf(*b));
    EXPECT_EQ(contentOf(*b->slice(0, static_cast<bytekit::core::Index>(b->length()))), contentOf(*b));
}

TEST(BinarySlice, BoundsAreClamped)
{
    const auto b{ abc() };

    EXPECT_THAT(contentOf(*b->slice(1, 2)), ::testing::ElementsAre(0x42));
    EXPECT_THAT(contentOf(*b->slice(0, -1)), ::testing::ElementsAre(0x41, 0x42));
    EXPECT_THAT(contentOf(*b->slice(-10)), ::testing::ElementsAre(0x41, 0x42, 0x43));
    EXPECT_THAT(contentOf(*b->slice(1, 100)), ::testing::ElementsAre(0x42, 0x43));
    EXPECT_EQ(b->slice(2, 1)->length(), 0U);
    EXPECT_EQ(b->slice(5)->length(), 0U);
    EXPECT_EQ(b->slice(std::nullopt, 2)->length(), 2U);
}

TEST(BinarySlice, KeepsReceiverKind)
{
    EXPECT_EQ(abc(Kind::ByteArray)->slice(1)->kind(), Kind::ByteArray);
    EXPECT_EQ(abc(Kind::ByteString)->slice(1)->kind(), Kind::ByteString);
}

TEST(BinaryConcat, NoArgumentsCopiesReceiver)
{
    const auto b{ abc() };
    const auto joined{ b->concat({}) };

    EXPECT_NE(joined, b);
    EXPECT_EQ(contentOf(*joined), contentOf(*b));
}

TEST(BinaryConcat, AppendsBinariesAndSkipsOtherValues)
{
    const auto head{ Binary::fromBytes(Kind::ByteArray, bytesOf({ 1 })) };
    const auto mid{ Binary::fromBytes(Kind::ByteString, bytesOf({ 2, 3 })) };
    const auto tail{ Binary::fromBytes(Kind::ByteArray, bytesOf({ 4 })) };

    const auto joined{ head->concat({ mid, 99, "text", Value{}, tail }) };

    EXPECT_EQ(joined->kind(), Kind::ByteArray);
    EXPECT_THAT(contentOf(*joined), ::testing::ElementsAre(1, 2, 3, 4));
}

TEST(BinaryConcat, ReceiverMayAppearAsArgument)
{
    const auto b{ abc() };
    const auto twice{ b->concat({ b }) };

    EXPECT_THAT(contentOf(*twice), ::testing::ElementsAre(0x41, 0x42, 0x43, 0x41, 0x42, 0x43));
}

TEST(BinaryIndexOf, FindsFirstMatch)
{
    const auto b{ abc() };

    EXPECT_EQ(b->indexOf(0x43), 2);
    EXPECT_EQ(b->indexOf(0x44), g_kNotFound);
    EXPECT_EQ(b->indexOf(0x143), 2);
}

TEST(BinaryIndexOf, RangeIsClamped)
{
    const auto b{ abc() };

    EXPECT_EQ(b->indexOf(0x41, 1), g_kNotFound);
    EXPECT_EQ(b->indexOf(0x41, -5), 0);
    EXPECT_EQ(b->indexOf(0x43, 0, 2), g_kNotFound);
    EXPECT_EQ(b->indexOf(0x43, 0, 100), 2);
    EXPECT_EQ(b->indexOf(0x43, 10), 2);
    EXPECT_EQ(Binary::empty(Kind::ByteArray)->indexOf(0), g_kNotFound);
}

TEST(BinaryIndexOf, LastIndexOfScansBackwards)
{
    const auto b{ Binary::fromBytes(Kind::ByteString, bytesOf({ 1, 2, 1, 2 })) };

    EXPECT_EQ(b->lastIndexOf(1), 2);
    EXPECT_EQ(b->lastIndexOf(1, 0, 2), 0);
    EXPECT_EQ(b->lastIndexOf(2, 2), 3);
    EXPECT_EQ(b->lastIndexOf(3), g_kNotFound);
    EXPECT_EQ(Binary::empty(Kind::ByteString)->lastIndexOf(0), g_kNotFound);
}
