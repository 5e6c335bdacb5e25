#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include "Trove/Binding/KeyDescMap.hpp"
#include "Trove/Binding/TypedEntrySpec.hpp"
#include "../TestSupport.hpp"

using namespace Trove;
using namespace Trove::Test;

class AllocationFailureTest : public ::testing::Test
{
protected:
    using Map = TypedMap<std::int32_t, std::int32_t, std::hash<std::int32_t>, std::equal_to<std::int32_t>, TrackingAllocator>;

    AllocationStats stats;
};

// Let the n-th allocation fail for every n a 2000-item fill needs
TEST_F(AllocationFailureTest, EveryGrowthStepFailsCleanly)
{
    for (std::size_t allowed = 0; allowed < 12; ++allowed)
    {
        stats = AllocationStats{};
        {
            auto created = MakeTypedMap<std::int32_t, std::int32_t, std::hash<std::int32_t>, std::equal_to<std::int32_t>>(0, TrackingAllocator(&stats));
            ASSERT_TRUE(created.IsOk());
            Map storage = std::move(created).Value();
            auto map = storage.AsMap<std::int32_t, std::int32_t>();

            stats.allowance = allowed;
            std::int32_t inserted = 0;
            for (; inserted < 2000; ++inserted)
            {
                auto result = map.Insert(inserted, inserted * 2);
                if (result.IsErr())
                {
                    EXPECT_EQ(result.Error().code, ErrorCode::AllocationFailed);
                    break;
                }
            }

            EXPECT_EQ(map.Size(), static_cast<std::size_t>(inserted)) << "allowed " << allowed;
            for (std::int32_t key = 0; key < inserted; ++key)
            {
                ASSERT_NE(map.Get(key), nullptr) << "allowed " << allowed << " key " << key;
                EXPECT_EQ(*map.Get(key), key * 2);
            }
            EXPECT_EQ(map.Get(inserted), nullptr);
            EXPECT_LE(stats.currentCount, 1u);

            // Recovery once memory is available again
            stats.allowance = std::numeric_limits<std::size_t>::max();
            ASSERT_TRUE(map.Insert(inserted, inserted * 2).IsOk());
            EXPECT_EQ(map.Size(), static_cast<std::size_t>(inserted) + 1);
        }
        EXPECT_EQ(stats.currentCount, 0u) << "allowed " << allowed;
        EXPECT_EQ(stats.currentBytes, 0u) << "allowed " << allowed;
    }
}

TEST_F(AllocationFailureTest, ReserveFailureKeepsTable)
{
    auto created = KeyDescMap<Int32KeyDesc, TrackingAllocator>::Create(10, EntryLayout::Of<std::int32_t, std::int32_t>(), Int32KeyDesc{}, TrackingAllocator(&stats));
    ASSERT_TRUE(created.IsOk());
    auto map = std::move(created).Value();

    for (std::int32_t i = 0; i < 10; ++i)
    {
        auto slot = map.Assign(Bytes(i));
        ASSERT_TRUE(slot.IsOk());
        WriteInt32(slot.Value(), i);
    }

    const std::size_t capacity = map.Capacity();
    const std::size_t growthLeft = map.GrowthLeft();
    stats.allowance = 0;

    auto reserved = map.Reserve(10000);
    ASSERT_TRUE(reserved.IsErr());
    EXPECT_EQ(reserved.Error().code, ErrorCode::AllocationFailed);
    EXPECT_EQ(map.Capacity(), capacity);
    EXPECT_EQ(map.GrowthLeft(), growthLeft);
    EXPECT_EQ(map.Size(), 10u);

    // Requests beyond the address space are refused before allocating
    auto overflow = map.Reserve(std::numeric_limits<std::size_t>::max() - 4);
    ASSERT_TRUE(overflow.IsErr());
    EXPECT_EQ(overflow.Error().code, ErrorCode::CapacityOverflow);
    EXPECT_EQ(stats.failedCount, 1u);

    for (std::int32_t i = 0; i < 10; ++i)
    {
        ASSERT_NE(map.Access(Bytes(i)), nullptr);
        EXPECT_EQ(ReadInt32(map.Access(Bytes(i))), i);
    }
}
