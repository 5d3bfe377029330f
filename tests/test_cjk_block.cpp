#include <cstdint>
#include <gtest/gtest.h>

#include "codec/cjk_block.hpp"

using namespace codec;
using cjkpost::Status;

static char32_t cp_of(std::int64_t n)
{
    char32_t cp = 0;
    EXPECT_EQ(int_to_codepoint(n, cp), Status::Ok) << "n=" << n;
    return cp;
}

TEST(CjkBlock, SegmentEdges)
{
    EXPECT_EQ(cp_of(0), char32_t{0x20000});
    EXPECT_EQ(cp_of(42719), char32_t{0x2A6DF});
    EXPECT_EQ(cp_of(42720), char32_t{0x4E00});
    EXPECT_EQ(cp_of(63711), char32_t{0x9FFF});
    EXPECT_EQ(cp_of(63712), char32_t{0x3400});
    EXPECT_EQ(cp_of(70303), char32_t{0x4DBF});
}

TEST(CjkBlock, IntOutOfDomain)
{
    char32_t cp = 0;
    EXPECT_EQ(int_to_codepoint(-1, cp), Status::InvalidInput);
    EXPECT_EQ(int_to_codepoint(70304, cp), Status::InvalidInput);
    EXPECT_EQ(int_to_codepoint(1 << 20, cp), Status::InvalidInput);
}

TEST(CjkBlock, WholeDomainRoundtrip)
{
    for (std::int64_t n = 0; n < DOMAIN_SIZE; ++n)
    {
        char32_t cp = 0;
        ASSERT_EQ(int_to_codepoint(n, cp), Status::Ok);
        std::int32_t back = -1;
        ASSERT_EQ(codepoint_to_int(cp, back), Status::Ok);
        ASSERT_EQ(back, n);
    }
}

TEST(CjkBlock, CodepointOutsideBlocks)
{
    std::int32_t n = 0;
    EXPECT_EQ(codepoint_to_int(U'a', n), Status::InvalidInput);
    EXPECT_EQ(codepoint_to_int(0x33FF, n), Status::InvalidInput);
    EXPECT_EQ(codepoint_to_int(0x4DC0, n), Status::InvalidInput);
    EXPECT_EQ(codepoint_to_int(0x4DFF, n), Status::InvalidInput);
    EXPECT_EQ(codepoint_to_int(0xA000, n), Status::InvalidInput);
    EXPECT_EQ(codepoint_to_int(0x1FFFF, n), Status::InvalidInput);
    EXPECT_EQ(codepoint_to_int(0x2A6E0, n), Status::InvalidInput);
}
