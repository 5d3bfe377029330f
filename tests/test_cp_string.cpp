#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "codec/cp_string.hpp"
#include "codec/utf8.hpp"
#include "test_support.hpp"

using namespace codec;
using cjkpost::Status;

TEST(CpString, BytesStringBytes)
{
    std::vector<std::uint8_t> all(256);
    for (int i = 0; i < 256; ++i)
        all[i] = static_cast<std::uint8_t>(i);

    for (const auto &bytes : {all, test_support::gen_bytes(280), std::vector<std::uint8_t>{}})
    {
        std::string s;
        ASSERT_EQ(bytes_to_string(bytes, s), Status::Ok);
        EXPECT_EQ(codepoint_count(s), bytes.size() / 2);

        std::vector<std::uint8_t> back;
        ASSERT_EQ(string_to_bytes(s, back), Status::Ok);
        EXPECT_EQ(back, bytes);
    }
}

TEST(CpString, OddByteCountRejected)
{
    std::string s = "unchanged";
    EXPECT_EQ(bytes_to_string({1, 2, 3}, s), Status::InvalidInput);
    EXPECT_EQ(s, "unchanged");
}

TEST(CpString, FourByteCodepointConsumedWhole)
{
    // U+20000 then U+4E00 then U+3400
    const std::string s = "\xF0\xA0\x80\x80"
                          "\xE4\xB8\x80"
                          "\xE3\x90\x80";
    std::vector<std::int32_t> ints;
    ASSERT_EQ(string_to_ints(s, ints), Status::Ok);
    ASSERT_EQ(ints.size(), 3u);
    EXPECT_EQ(ints[0], 0);
    EXPECT_EQ(ints[1], 42720);
    EXPECT_EQ(ints[2], 63712);

    std::string back;
    ASSERT_EQ(ints_to_string(ints, back), Status::Ok);
    EXPECT_EQ(back, s);
}

TEST(CpString, NonCjkCharacterRejected)
{
    std::vector<std::int32_t> ints;
    EXPECT_EQ(string_to_ints("a", ints), Status::InvalidInput);
    EXPECT_EQ(string_to_ints("\xE4\xB8\x80" "a", ints), Status::InvalidInput);
}

TEST(CpString, MalformedUtf8Rejected)
{
    std::vector<std::int32_t> ints;
    // truncated 4-byte sequence
    EXPECT_EQ(string_to_ints(std::string("\xF0\xA0\x80"), ints), Status::InvalidInput);
    // lone continuation byte
    EXPECT_EQ(string_to_ints(std::string("\x80"), ints), Status::InvalidInput);
    // overlong encoding of U+4E00 is not accepted
    EXPECT_EQ(string_to_ints(std::string("\xF0\x84\xB8\x80"), ints), Status::InvalidInput);
    EXPECT_EQ(codepoint_count(std::string("\xE4\xB8")), std::string::npos);
}

TEST(CpString, IntOutsideDomainRejected)
{
    std::string s;
    EXPECT_EQ(ints_to_string({0, 70304}, s), Status::InvalidInput);
    EXPECT_EQ(ints_to_string({-5}, s), Status::InvalidInput);
}

TEST(Utf8, AppendAndNext)
{
    std::string s;
    ASSERT_TRUE(utf8_append(s, U'A'));
    ASSERT_TRUE(utf8_append(s, 0xE9));
    ASSERT_TRUE(utf8_append(s, 0x4E00));
    ASSERT_TRUE(utf8_append(s, 0x2A6DF));
    EXPECT_EQ(s.size(), 1u + 2u + 3u + 4u);
    EXPECT_FALSE(utf8_append(s, 0xD800));
    EXPECT_FALSE(utf8_append(s, 0x110000));

    std::size_t pos = 0;
    char32_t    cp  = 0;
    ASSERT_TRUE(utf8_next(s, pos, cp));
    EXPECT_EQ(cp, U'A');
    ASSERT_TRUE(utf8_next(s, pos, cp));
    EXPECT_EQ(cp, char32_t{0xE9});
    ASSERT_TRUE(utf8_next(s, pos, cp));
    EXPECT_EQ(cp, char32_t{0x4E00});
    ASSERT_TRUE(utf8_next(s, pos, cp));
    EXPECT_EQ(cp, char32_t{0x2A6DF});
    EXPECT_EQ(pos, s.size());
    EXPECT_FALSE(utf8_next(s, pos, cp));
}
