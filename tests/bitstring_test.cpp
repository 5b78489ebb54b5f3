/*! @file bitstring_test.cpp
 *  @brief Unit tests for ising_exact::bitstring
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-10
 */

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <vector>

#include "bitstring.hpp"
#include "misc.hpp"

using ising_exact::bitstring;

TEST(Bitstring, ConstructsAllZero)
{
    bitstring bs(4);
    EXPECT_EQ(bs.size(), 4);
    EXPECT_EQ(bs.bits(), std::vector<int>({0, 0, 0, 0}));
    EXPECT_EQ(bs.count_on(), 0);
    EXPECT_EQ(bs.count_off(), 4);
}

TEST(Bitstring, RejectsNonPositiveLength)
{
    EXPECT_THROW(bitstring(0), std::invalid_argument);
    EXPECT_THROW(bitstring(-3), std::invalid_argument);
}

TEST(Bitstring, Equality)
{
    bitstring bs1(4), bs2(4), bs3(4);
    bs1.set_bits({1, 0, 1, 0});
    bs2.set_bits({1, 0, 1, 0});
    bs3.set_bits({1, 1, 1, 0});

    EXPECT_TRUE(bs1 == bs1);
    EXPECT_TRUE(bs1 == bs2);
    EXPECT_TRUE(bs2 == bs1);
    EXPECT_TRUE(bs1 != bs3);
    EXPECT_TRUE(bs2 != bs3);
}

TEST(Bitstring, DifferentLengthsAreUnequal)
{
    bitstring a(3), b(4);
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(a != b);
}

TEST(Bitstring, ToString)
{
    bitstring bs(4);
    bs.set_bits({1, 0, 1, 0});
    EXPECT_EQ(bs.to_string(), "[ 1 0 1 0 ]");

    std::ostringstream os;
    os << bs;
    EXPECT_EQ(os.str(), "[ 1 0 1 0 ]");
}

TEST(Bitstring, SetBits)
{
    bitstring bs(5);
    bs.set_bits({1, 0, 0, 1, 0});
    EXPECT_EQ(bs.bits(), std::vector<int>({1, 0, 0, 1, 0}));
}

TEST(Bitstring, SetBitsRejectsWrongLength)
{
    bitstring bs(5);
    EXPECT_THROW(bs.set_bits({1, 0, 1}), ising_exact::dimension_mismatch);
}

TEST(Bitstring, SetBitsRejectsNonBinaryAndLeavesBitsAlone)
{
    bitstring bs(3);
    bs.set_bits({1, 1, 0});
    EXPECT_THROW(bs.set_bits({0, 2, 0}), std::invalid_argument);
    EXPECT_EQ(bs.bits(), std::vector<int>({1, 1, 0}));
}

TEST(Bitstring, FromInteger)
{
    bitstring bs(8);
    bs.from_integer(97);
    EXPECT_EQ(bs.bits(), std::vector<int>({0, 1, 1, 0, 0, 0, 0, 1}));
}

TEST(Bitstring, ToInteger)
{
    bitstring bs1(8), bs2(8);
    bs1.set_bits({0, 1, 1, 0, 0, 0, 0, 1});
    EXPECT_EQ(bs1.to_integer(), 97u);
    EXPECT_EQ(bs2.to_integer(), 0u);
}

TEST(Bitstring, IntegerRoundTripCoversRange)
{
    bitstring bs(6);
    for (std::uint64_t d = 0; d < 64; d++)
    {
        bs.from_integer(d);
        EXPECT_EQ(bs.to_integer(), d);
        EXPECT_EQ(bs.count_on() + bs.count_off(), 6);
    }
}

TEST(Bitstring, FromIntegerRejectsOutOfRange)
{
    bitstring bs(3);
    EXPECT_NO_THROW(bs.from_integer(7));
    EXPECT_THROW(bs.from_integer(8), std::invalid_argument);
}

TEST(Bitstring, FromIntegerRejectsNegativeCast)
{
    bitstring bs(8);
    bs.from_integer(5);
    EXPECT_THROW(bs.from_integer(static_cast<std::uint64_t>(-1)), std::invalid_argument);
    EXPECT_THROW(bs.from_integer(static_cast<std::uint64_t>(-97)), std::invalid_argument);
    EXPECT_EQ(bs.to_integer(), 5u);
}

TEST(Bitstring, SixtyFourBitsUseFullRange)
{
    bitstring bs(64);
    bs.from_integer(~std::uint64_t{0});
    EXPECT_EQ(bs.count_on(), 64);
    EXPECT_EQ(bs.to_integer(), ~std::uint64_t{0});
}

TEST(Bitstring, ToIntegerOverflows)
{
    bitstring bs(65);
    EXPECT_THROW(bs.to_integer(), std::overflow_error);
}

TEST(Bitstring, FlipSite)
{
    bitstring bs(8);
    bs.set_bits({0, 1, 1, 0, 0, 0, 0, 1});
    bs.flip(7);
    bs.flip(6);
    EXPECT_EQ(bs.bits(), std::vector<int>({0, 1, 1, 0, 0, 0, 1, 0}));
}

TEST(Bitstring, FlipTwiceRestores)
{
    bitstring bs(5), orig(5);
    bs.set_bits({1, 0, 0, 1, 1});
    orig.set_bits({1, 0, 0, 1, 1});
    for (auto i = 0; i < 5; i++)
    {
        bs.flip(i);
        EXPECT_NE(bs, orig);
        bs.flip(i);
        EXPECT_EQ(bs, orig);
    }
}

TEST(Bitstring, FlipOutOfRange)
{
    bitstring bs(4);
    EXPECT_THROW(bs.flip(4), ising_exact::index_out_of_range);
    EXPECT_THROW(bs.flip(-1), ising_exact::index_out_of_range);
}

TEST(Bitstring, OnOff)
{
    bitstring bs(8);
    bs.set_bits({0, 1, 1, 0, 0, 0, 0, 1});
    EXPECT_EQ(bs.count_on(), 3);
    EXPECT_EQ(bs.count_off(), 5);
}

TEST(Bitstring, SiteAccess)
{
    bitstring bs(3);
    bs.set(1, 1);
    EXPECT_EQ(bs.at(1), 1);
    EXPECT_EQ(bs[0], 0);
    EXPECT_EQ(bs.spin(0), -1);
    EXPECT_EQ(bs.spin(1), 1);
    EXPECT_EQ(bs.magnetization(), -1);

    EXPECT_THROW(bs.at(3), ising_exact::index_out_of_range);
    EXPECT_THROW(bs.set(0, 5), std::invalid_argument);
}
