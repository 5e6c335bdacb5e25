#include <gtest/gtest.h>
#include <array>
#include <vector>
#include "Trove/Table/Group.hpp"

using namespace Trove;

class GroupTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        bytes.fill(Ctrl::EMPTY);
    }

    std::vector<int> Offsets(BitMask mask)
    {
        std::vector<int> result;
        for (int i : mask)
        {
            result.push_back(i);
        }
        return result;
    }

    // One spare byte in front so loads can start unaligned
    std::array<CtrlByte, 17> bytes{};
};

TEST_F(GroupTest, AllEmpty)
{
    Group group(bytes.data());
    EXPECT_EQ(group.MatchEmpty().Raw(), 0xFFFF);
    EXPECT_EQ(group.MatchEmptyOrDeleted().Raw(), 0xFFFF);
    EXPECT_FALSE(group.MatchFull());
    EXPECT_FALSE(group.Match(0x00));
}

TEST_F(GroupTest, ClassifiesEveryControlKind)
{
    bytes[0] = 0x00;
    bytes[1] = Ctrl::DELETED;
    bytes[2] = Ctrl::SENTINEL;
    bytes[3] = 0x7F;
    bytes[4] = 0x11;
    bytes[5] = 0x11;

    Group group(bytes.data());
    EXPECT_EQ(Offsets(group.MatchFull()), (std::vector<int>{0, 3, 4, 5}));
    EXPECT_EQ(Offsets(group.Match(0x11)), (std::vector<int>{4, 5}));
    EXPECT_EQ(Offsets(group.Match(0x7F)), (std::vector<int>{3}));

    // Sentinel is neither empty, deleted nor full
    EXPECT_FALSE(group.MatchEmptyOrDeleted().Raw() & (1u << 2));
    EXPECT_FALSE(group.MatchEmpty().Raw() & (1u << 2));
    EXPECT_FALSE(group.MatchFull().Raw() & (1u << 2));

    EXPECT_TRUE(group.MatchEmptyOrDeleted().Raw() & (1u << 1));
    EXPECT_FALSE(group.MatchEmpty().Raw() & (1u << 1));
}

TEST_F(GroupTest, UnalignedLoad)
{
    bytes[1] = 0x2A;
    bytes[16] = 0x2A;

    Group group(bytes.data() + 1);
    EXPECT_EQ(Offsets(group.Match(0x2A)), (std::vector<int>{0, 15}));
    EXPECT_EQ(group.MatchFull().Count(), 2);
}

TEST_F(GroupTest, BitMaskQueries)
{
    BitMask mask(0b0010'0000'0100'1000);
    EXPECT_TRUE(mask.AnyBitSet());
    EXPECT_EQ(mask.LowestBitSet(), 3);
    EXPECT_EQ(mask.TrailingZeros(), 3);
    EXPECT_EQ(mask.HighestBitSet(), 13);
    EXPECT_EQ(mask.LeadingZeros(), 2);
    EXPECT_EQ(mask.Count(), 3);
    EXPECT_EQ(Offsets(mask), (std::vector<int>{3, 6, 13}));

    BitMask none;
    EXPECT_FALSE(none.AnyBitSet());
    EXPECT_EQ(none.TrailingZeros(), BitMask::WIDTH);
    EXPECT_EQ(none.LeadingZeros(), BitMask::WIDTH);
    EXPECT_TRUE(Offsets(none).empty());
}

TEST_F(GroupTest, ControlByteHelpers)
{
    EXPECT_TRUE(Ctrl::IsFull(0x00));
    EXPECT_TRUE(Ctrl::IsFull(0x7F));
    EXPECT_FALSE(Ctrl::IsFull(Ctrl::EMPTY));
    EXPECT_TRUE(Ctrl::IsEmptyOrDeleted(Ctrl::EMPTY));
    EXPECT_TRUE(Ctrl::IsEmptyOrDeleted(Ctrl::DELETED));
    EXPECT_FALSE(Ctrl::IsEmptyOrDeleted(Ctrl::SENTINEL));

    const std::uint64_t hash = 0xABCDEF0123456789ULL;
    EXPECT_EQ(Ctrl::H2(hash), 0x09);
    EXPECT_EQ(Ctrl::H1(hash), static_cast<std::size_t>(hash >> 7));
}
