#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>

#include "Trove/Memory/Allocator.hpp"
#include "Trove/Platform/Simd.hpp"

namespace Trove::Test
{
    // Counters live outside the allocator so they survive the allocator
    // being moved into a table.
    struct AllocationStats
    {
        std::size_t currentBytes = 0;
        std::size_t peakBytes = 0;
        std::size_t currentCount = 0;
        std::size_t totalCount = 0;
        std::size_t failedCount = 0;

        // Successful allocations still permitted before requests start failing
        std::size_t allowance = std::numeric_limits<std::size_t>::max();
    };

    // SystemAllocator decorated with statistics and a failure switch
    class TrackingAllocator
    {
    public:
        explicit TrackingAllocator(AllocationStats* stats) noexcept : m_stats(stats) {}

        void* Allocate(std::size_t size, std::size_t alignment) noexcept
        {
            if (m_stats->allowance == 0)
            {
                ++m_stats->failedCount;
                return nullptr;
            }

            void* ptr = m_inner.Allocate(size, alignment);
            if (ptr)
            {
                --m_stats->allowance;
                m_stats->currentBytes += size;
                m_stats->currentCount += 1;
                m_stats->totalCount += 1;
                if (m_stats->currentBytes > m_stats->peakBytes)
                {
                    m_stats->peakBytes = m_stats->currentBytes;
                }
            }
            return ptr;
        }

        void Deallocate(void* ptr, std::size_t size, std::size_t alignment) noexcept
        {
            if (ptr)
            {
                m_stats->currentBytes -= size;
                m_stats->currentCount -= 1;
            }
            m_inner.Deallocate(ptr, size, alignment);
        }

    private:
        SystemAllocator m_inner;
        AllocationStats* m_stats;
    };

    static_assert(RawAllocator<TrackingAllocator>);

    // Caps every request; used to exercise the max-size check
    struct BoundedAllocator
    {
        std::size_t limit = 0;

        void* Allocate(std::size_t size, std::size_t alignment) noexcept
        {
            return SystemAllocator().Allocate(size, alignment);
        }

        void Deallocate(void* ptr, std::size_t size, std::size_t alignment) noexcept
        {
            SystemAllocator().Deallocate(ptr, size, alignment);
        }

        std::size_t MaxSize() const noexcept { return limit; }
    };

    static_assert(RawAllocator<BoundedAllocator>);

    // Hashes doubles by bit pattern with -0.0 folded onto +0.0
    struct Float64Hash
    {
        std::size_t operator()(double value) const noexcept
        {
            const double normalized = value == 0.0 ? 0.0 : value;
            std::uint64_t bits = 0;
            std::memcpy(&bits, &normalized, sizeof(bits));
            return static_cast<std::size_t>(bits);
        }
    };

    // Key descriptor for a 4-byte integer key
    struct Int32KeyDesc
    {
        std::uint64_t Hash(const std::uint8_t* key) const noexcept
        {
            std::int32_t value = 0;
            std::memcpy(&value, key, sizeof(value));
            return Simd::Ops::HashCombine(static_cast<std::uint64_t>(static_cast<std::uint32_t>(value)), 0x9E3779B97F4A7C15ULL);
        }

        bool Equals(const std::uint8_t* a, const std::uint8_t* b) const noexcept
        {
            return std::memcmp(a, b, sizeof(std::int32_t)) == 0;
        }
    };

    // Every key lands on the same probe start with the same tag
    struct CollidingKeyDesc
    {
        std::uint64_t Hash(const std::uint8_t*) const noexcept
        {
            return 0;
        }

        bool Equals(const std::uint8_t* a, const std::uint8_t* b) const noexcept
        {
            return std::memcmp(a, b, sizeof(std::int32_t)) == 0;
        }
    };

    struct IntPair
    {
        std::int32_t key;
        std::int32_t value;
    };

    inline const std::uint8_t* Bytes(const std::int32_t& value) noexcept
    {
        return reinterpret_cast<const std::uint8_t*>(&value);
    }

    inline std::int32_t ReadInt32(const std::uint8_t* bytes) noexcept
    {
        std::int32_t value = 0;
        std::memcpy(&value, bytes, sizeof(value));
        return value;
    }

    inline void WriteInt32(std::uint8_t* bytes, std::int32_t value) noexcept
    {
        std::memcpy(bytes, &value, sizeof(value));
    }
}
