#include <gtest/gtest.h>
#include <cstdint>
#include <cstring>
#include <optional>
#include "Trove/Binding/EntrySpecMap.hpp"
#include "Trove/Binding/TypedEntrySpec.hpp"
#include "../TestSupport.hpp"

using namespace Trove;
using namespace Trove::Test;

class EntrySpecMapTest : public ::testing::Test
{
protected:
    using Spec = TypedEntrySpec<double, double, Float64Hash>;
    using Map = EntrySpecMap<Spec, TrackingAllocator>;

    Map Make(std::size_t capacity = 0)
    {
        auto result = Map::Create(capacity, Spec::Layout(), Spec(), TrackingAllocator(&stats));
        EXPECT_TRUE(result.IsOk());
        return std::move(result).Value();
    }

    static const std::uint8_t* Bytes(const double& value)
    {
        return reinterpret_cast<const std::uint8_t*>(&value);
    }

    static void Put(Map& map, double key, double value)
    {
        ASSERT_TRUE(map.Insert(Bytes(key), Bytes(value)).IsOk());
    }

    static std::optional<double> Get(const Map& map, double key)
    {
        const std::uint8_t* value = map.Access(Bytes(key));
        if (!value)
        {
            return std::nullopt;
        }
        double result = 0.0;
        std::memcpy(&result, value, sizeof(result));
        return result;
    }

    AllocationStats stats;
};

TEST_F(EntrySpecMapTest, LayoutOfDoublePair)
{
    const EntryLayout layout = Spec::Layout();
    EXPECT_EQ(layout.entrySize, 16u);
    EXPECT_EQ(layout.valueOffset, 8u);
    EXPECT_EQ(layout.alignment, alignof(double));
    EXPECT_EQ(layout.KeySize(), 8u);
    EXPECT_EQ(layout.ValueSize(), 8u);
}

TEST_F(EntrySpecMapTest, GrowthPreservesEntries)
{
    Map map = Make();
    for (int i = 0; i < 10000; ++i)
    {
        Put(map, static_cast<double>(i), static_cast<double>(i));
    }

    EXPECT_EQ(map.Size(), 10000u);
    EXPECT_EQ(Get(map, 42.0), 42.0);
    for (int i = 0; i < 10000; ++i)
    {
        ASSERT_EQ(Get(map, static_cast<double>(i)), static_cast<double>(i)) << "key " << i;
    }
    EXPECT_FALSE(Get(map, 10000.0).has_value());
    EXPECT_FALSE(Get(map, 0.5).has_value());
    EXPECT_EQ(stats.currentCount, 1u);
}

TEST_F(EntrySpecMapTest, ExtendThenClearSource)
{
    Map first = Make();
    for (int i = 0; i < 10000; ++i)
    {
        Put(first, static_cast<double>(i), static_cast<double>(i));
    }

    Map second = Make();
    ASSERT_TRUE(second.Extend(first).IsOk());
    first.Clear();

    EXPECT_EQ(first.Size(), 0u);
    EXPECT_EQ(second.Size(), 10000u);
    EXPECT_EQ(Get(second, 42.0), 42.0);
    EXPECT_FALSE(Get(first, 42.0).has_value());
}

TEST_F(EntrySpecMapTest, InsertOverwrites)
{
    Map map = Make();
    Put(map, 1.5, 10.0);
    Put(map, 1.5, 20.0);
    EXPECT_EQ(map.Size(), 1u);
    EXPECT_EQ(Get(map, 1.5), 20.0);
}

TEST_F(EntrySpecMapTest, SignedZerosShareOneEntry)
{
    Map map = Make();
    Put(map, 0.0, 1.0);
    Put(map, -0.0, 2.0);

    EXPECT_EQ(map.Size(), 1u);
    EXPECT_EQ(Get(map, 0.0), 2.0);
    EXPECT_EQ(Get(map, -0.0), 2.0);

    const double negativeZero = -0.0;
    EXPECT_TRUE(map.Delete(Bytes(negativeZero)));
    EXPECT_TRUE(map.Empty());
}

TEST_F(EntrySpecMapTest, DeleteAndReinsert)
{
    Map map = Make();
    for (int i = 0; i < 256; ++i)
    {
        Put(map, i * 0.25, i);
    }

    for (int i = 0; i < 256; i += 2)
    {
        const double key = i * 0.25;
        ASSERT_TRUE(map.Delete(Bytes(key)));
    }
    EXPECT_EQ(map.Size(), 128u);

    for (int i = 0; i < 256; i += 2)
    {
        Put(map, i * 0.25, -i);
    }
    EXPECT_EQ(map.Size(), 256u);
    EXPECT_EQ(Get(map, 2.0), -8.0);
    EXPECT_EQ(Get(map, 2.25), 9.0);
}

TEST_F(EntrySpecMapTest, ExtendSelfAndEmpty)
{
    Map map = Make();
    Map empty = Make();
    Put(map, 3.0, 9.0);

    ASSERT_TRUE(map.Extend(map).IsOk());
    ASSERT_TRUE(map.Extend(empty).IsOk());
    EXPECT_EQ(map.Size(), 1u);

    ASSERT_TRUE(empty.Extend(map).IsOk());
    EXPECT_EQ(Get(empty, 3.0), 9.0);
}

TEST_F(EntrySpecMapTest, MoveLeavesSourceEmpty)
{
    Map map = Make();
    Put(map, 7.0, 49.0);

    Map moved(std::move(map));
    EXPECT_EQ(moved.Size(), 1u);
    EXPECT_EQ(Get(moved, 7.0), 49.0);
    EXPECT_EQ(map.Size(), 0u);
    EXPECT_EQ(map.Capacity(), 0u);
    EXPECT_FALSE(Get(map, 7.0).has_value());

    // A moved-from map is still usable
    Put(map, 1.0, 1.0);
    EXPECT_EQ(Get(map, 1.0), 1.0);
}

TEST_F(EntrySpecMapTest, InsertFailureLeavesMapIntact)
{
    Map map = Make(14);
    for (int i = 0; i < 14; ++i)
    {
        Put(map, i, i);
    }

    stats.allowance = 0;
    const double key = 99.0;
    auto result = map.Insert(Bytes(key), Bytes(key));
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().code, ErrorCode::AllocationFailed);
    EXPECT_EQ(map.Size(), 14u);
    EXPECT_FALSE(Get(map, 99.0).has_value());
    EXPECT_EQ(Get(map, 13.0), 13.0);
}
