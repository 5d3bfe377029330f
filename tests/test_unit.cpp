#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "codec/cp_string.hpp"
#include "proto/unit.hpp"
#include "test_support.hpp"

using namespace frag;
using cjkpost::Status;

static HeaderBytes sample_header()
{
    return HeaderBytes{0xDE, 0xAD, 0xBE, 0xEF, 0x01, 0x02, 0x03, 0x04};
}

TEST(Unit, PackUnpack)
{
    test_support::CountingRandom rng;
    const auto                   chunk = test_support::gen_bytes(100);

    std::string unit;
    ASSERT_EQ(pack_unit(sample_header(), chunk, rng, unit), Status::Ok);
    EXPECT_EQ(codec::codepoint_count(unit), UNIT_CODEPOINTS);

    HeaderBytes               hdr{};
    std::vector<std::uint8_t> slot;
    ASSERT_EQ(unpack_unit(unit, hdr, slot), Status::Ok);
    EXPECT_EQ(hdr, sample_header());
    ASSERT_EQ(slot.size(), SLOT_SIZE);
    EXPECT_TRUE(std::equal(chunk.begin(), chunk.end(), slot.begin()));
    // padding comes from the random source: CountingRandom starts at 0
    EXPECT_EQ(slot[100], 0);
    EXPECT_EQ(slot[101], 1);
}

TEST(Unit, FullAndEmptyChunk)
{
    test_support::CountingRandom rng;
    for (std::size_t n : {std::size_t{0}, SLOT_SIZE})
    {
        std::string unit;
        ASSERT_EQ(pack_unit(sample_header(), test_support::gen_bytes(n), rng, unit), Status::Ok);
        EXPECT_EQ(codec::codepoint_count(unit), UNIT_CODEPOINTS);
    }
}

TEST(Unit, RejectOversizedChunk)
{
    test_support::CountingRandom rng;
    std::string                  unit;
    EXPECT_EQ(pack_unit(sample_header(), test_support::gen_bytes(SLOT_SIZE + 1), rng, unit),
              Status::InvalidInput);
}

TEST(Unit, RejectWrongLength)
{
    std::string short_unit;
    ASSERT_EQ(codec::bytes_to_string(test_support::gen_bytes(UNIT_SIZE - 2), short_unit),
              Status::Ok);

    HeaderBytes               hdr{};
    std::vector<std::uint8_t> slot;
    EXPECT_EQ(unpack_unit(short_unit, hdr, slot), Status::InvalidInput);
    EXPECT_EQ(unpack_unit("", hdr, slot), Status::InvalidInput);
    EXPECT_EQ(unpack_unit("hello", hdr, slot), Status::InvalidInput);
}

TEST(Unit, RandomUnitHasUnitShape)
{
    test_support::CountingRandom rng;
    std::string                  unit;
    ASSERT_EQ(random_unit(rng, unit), Status::Ok);
    EXPECT_EQ(codec::codepoint_count(unit), UNIT_CODEPOINTS);

    HeaderBytes               hdr{};
    std::vector<std::uint8_t> slot;
    EXPECT_EQ(unpack_unit(unit, hdr, slot), Status::Ok);
}
