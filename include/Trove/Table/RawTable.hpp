#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Result.hpp"
#include "../Memory/Allocator.hpp"
#include "../Platform/Simd.hpp"
#include "Control.hpp"
#include "Group.hpp"
#include "Layout.hpp"

namespace Trove
{
    namespace TableMath
    {
        // Valid capacities have the form 2^k - 1
        TROVE_NODISCARD constexpr bool IsValidCapacity(std::size_t capacity) noexcept
        {
            return capacity > 0 && ((capacity + 1) & capacity) == 0;
        }

        // Smallest 2^k - 1 that is >= n
        TROVE_NODISCARD constexpr std::size_t NormalizeCapacity(std::size_t n) noexcept
        {
            return n ? (~std::size_t{0} >> std::countl_zero(n)) : 1;
        }

        // Number of items a table of this capacity holds before it must grow
        TROVE_NODISCARD constexpr std::size_t CapacityToGrowth(std::size_t capacity) noexcept
        {
            constexpr std::size_t reserved = config::MAX_LOAD_DENOMINATOR - config::MAX_LOAD_NUMERATOR;
            return capacity - (capacity / config::MAX_LOAD_DENOMINATOR) * reserved;
        }

        // Smallest valid capacity whose growth budget covers `items`
        TROVE_NODISCARD inline Result<std::size_t, Error> CapacityForItems(std::size_t items) noexcept
        {
            if (items == 0)
            {
                return config::MIN_CAPACITY;
            }
            if (items > std::numeric_limits<std::size_t>::max() / 2) TROVE_UNLIKELY
            {
                return Err(ErrorCode::CapacityOverflow);
            }

            constexpr std::size_t reserved = config::MAX_LOAD_DENOMINATOR - config::MAX_LOAD_NUMERATOR;
            const std::size_t lowerBound = items + (items - 1) / config::MAX_LOAD_NUMERATOR * reserved;
            return std::max(NormalizeCapacity(lowerBound), config::MIN_CAPACITY);
        }
    }

    // Type-erased Swiss table core.
    //
    // Owns one allocation holding the control bytes followed by `capacity`
    // buckets of `layout.entrySize` bytes. It never interprets bucket
    // contents: hashing and key comparison come from the caller, and no
    // constructors or destructors are ever run on bucket memory.
    //
    // Thread Safety: not thread-safe. Concurrent readers are fine only while
    // nothing mutates the table.
    template<RawAllocator Alloc = SystemAllocator>
    class RawTable
    {
    public:
        using SizeType = std::size_t;
        using AllocatorType = Alloc;

        static constexpr SizeType GROUP_WIDTH = config::GROUP_WIDTH;

        // Builds a table able to hold `capacity` items without growing.
        // A capacity of 0 allocates nothing.
        TROVE_NODISCARD static Result<RawTable, Error> Create(SizeType capacity, TableLayout layout, Alloc alloc = Alloc())
        {
            if (!layout.IsValid()) TROVE_UNLIKELY
            {
                return Err(ErrorCode::InvalidArgument, "Invalid table layout");
            }

            RawTable table(layout, std::move(alloc));
            if (capacity == 0)
            {
                return std::move(table);
            }

            auto target = TableMath::CapacityForItems(capacity);
            if (!target) TROVE_UNLIKELY
            {
                return Err(target.Error());
            }

            auto storage = table.AllocateStorage(target.Value());
            if (!storage) TROVE_UNLIKELY
            {
                return Err(storage.Error());
            }
            table.InstallStorage(storage.Value(), target.Value());
            table.m_growthLeft = TableMath::CapacityToGrowth(target.Value());
            return std::move(table);
        }

        RawTable(const RawTable&) = delete;
        RawTable& operator=(const RawTable&) = delete;

        RawTable(RawTable&& other) noexcept
            : m_ctrl(std::exchange(other.m_ctrl, nullptr))
            , m_slots(std::exchange(other.m_slots, nullptr))
            , m_capacity(std::exchange(other.m_capacity, 0))
            , m_items(std::exchange(other.m_items, 0))
            , m_growthLeft(std::exchange(other.m_growthLeft, 0))
            , m_layout(other.m_layout)
            , m_alloc(std::move(other.m_alloc))
        {
        }

        RawTable& operator=(RawTable&& other) noexcept
        {
            if (this != &other) TROVE_LIKELY
            {
                Release();
                m_ctrl = std::exchange(other.m_ctrl, nullptr);
                m_slots = std::exchange(other.m_slots, nullptr);
                m_capacity = std::exchange(other.m_capacity, 0);
                m_items = std::exchange(other.m_items, 0);
                m_growthLeft = std::exchange(other.m_growthLeft, 0);
                m_layout = other.m_layout;
                m_alloc = std::move(other.m_alloc);
            }
            return *this;
        }

        ~RawTable() noexcept
        {
            Release();
        }

        TROVE_NODISCARD bool Empty() const noexcept { return m_items == 0; }
        TROVE_NODISCARD SizeType Size() const noexcept { return m_items; }
        TROVE_NODISCARD SizeType Capacity() const noexcept { return m_capacity; }
        TROVE_NODISCARD SizeType GrowthLeft() const noexcept { return m_growthLeft; }
        TROVE_NODISCARD const TableLayout& Layout() const noexcept { return m_layout; }
        TROVE_NODISCARD const Alloc& GetAllocator() const noexcept { return m_alloc; }

        TROVE_NODISCARD CtrlByte CtrlAt(SizeType index) const noexcept
        {
            TROVE_ASSERT(index < Trove::TableLayout::CtrlBytes(m_capacity), "Control index out of range");
            return m_ctrl[index];
        }

        TROVE_NODISCARD std::uint8_t* Bucket(SizeType index) noexcept
        {
            TROVE_ASSERT(index < m_capacity, "Bucket index out of range");
            return m_slots + index * m_layout.entrySize;
        }

        TROVE_NODISCARD const std::uint8_t* Bucket(SizeType index) const noexcept
        {
            TROVE_ASSERT(index < m_capacity, "Bucket index out of range");
            return m_slots + index * m_layout.entrySize;
        }

        // Probes for a FULL slot whose fragment matches `hash` and for which
        // `equals(index)` holds. Stops at the first group containing EMPTY.
        template<typename Eq>
        TROVE_NODISCARD std::optional<SizeType> Find(std::uint64_t hash, Eq&& equals) const
        {
            if (m_capacity == 0) TROVE_UNLIKELY
            {
                return std::nullopt;
            }

            const CtrlByte h2 = Ctrl::H2(hash);
            ProbeSeq seq(Ctrl::H1(hash), m_capacity);
            while (true)
            {
                const Group group(m_ctrl + seq.Offset());
                const BitMask candidates = group.Match(h2);
                if (candidates)
                {
                    Simd::Ops::PrefetchT0(Bucket(seq.Offset(static_cast<SizeType>(candidates.LowestBitSet()))));
                }
                for (int i : candidates)
                {
                    const SizeType index = seq.Offset(static_cast<SizeType>(i));
                    if (equals(index)) TROVE_LIKELY
                    {
                        return index;
                    }
                }

                if (group.MatchEmpty()) TROVE_LIKELY
                {
                    return std::nullopt;
                }

                seq.Next();
                if (seq.Index() > m_capacity) TROVE_UNLIKELY
                {
                    TROVE_ASSERT(false, "Probe sequence exhausted without an EMPTY slot");
                    return std::nullopt;
                }
            }
        }

        // Same probe as Find. Returns {index, true} on a match, otherwise
        // {slot, false} where slot is the first EMPTY or DELETED position on
        // the probe path. The slot is valid until the next mutation. A slot
        // equal to Capacity() means the probe found no vacant position.
        template<typename Eq>
        TROVE_NODISCARD std::pair<SizeType, bool> FindOrFindInsertSlot(std::uint64_t hash, Eq&& equals) const
        {
            TROVE_ASSERT(m_capacity > 0, "FindOrFindInsertSlot on a table without storage");

            const CtrlByte h2 = Ctrl::H2(hash);
            ProbeSeq seq(Ctrl::H1(hash), m_capacity);
            std::optional<SizeType> insertSlot;
            while (true)
            {
                const Group group(m_ctrl + seq.Offset());
                for (int i : group.Match(h2))
                {
                    const SizeType index = seq.Offset(static_cast<SizeType>(i));
                    if (equals(index)) TROVE_LIKELY
                    {
                        return {index, true};
                    }
                }

                if (!insertSlot)
                {
                    const BitMask vacant = group.MatchEmptyOrDeleted();
                    if (vacant)
                    {
                        insertSlot = seq.Offset(static_cast<SizeType>(vacant.LowestBitSet()));
                    }
                }

                if (group.MatchEmpty()) TROVE_LIKELY
                {
                    TROVE_ASSERT(insertSlot.has_value(), "EMPTY byte seen without recording a slot");
                    return {*insertSlot, false};
                }

                seq.Next();
                if (seq.Index() > m_capacity) TROVE_UNLIKELY
                {
                    TROVE_ASSERT(insertSlot.has_value(), "Probe sequence exhausted without a vacant slot");
                    return {insertSlot.value_or(m_capacity), false};
                }
            }
        }

        // Marks a slot returned by FindOrFindInsertSlot as FULL. Reusing a
        // tombstone consumes no growth headroom.
        void RecordItemInsertAt(SizeType index, CtrlByte oldCtrl, std::uint64_t hash) noexcept
        {
            TROVE_ASSERT(Ctrl::IsEmptyOrDeleted(oldCtrl), "Insert slot is not vacant");
            TROVE_ASSERT(m_growthLeft > 0 || Ctrl::IsDeleted(oldCtrl), "No growth left for an EMPTY slot");

            m_growthLeft -= static_cast<SizeType>(Ctrl::IsEmpty(oldCtrl));
            SetCtrl(m_ctrl, m_capacity, index, Ctrl::H2(hash));
            ++m_items;
        }

        // The slot goes back to EMPTY when every GROUP_WIDTH window covering
        // it also covers an EMPTY byte: no probe can then have walked past it.
        void Erase(SizeType index) noexcept
        {
            TROVE_ASSERT(index < m_capacity, "Erase index out of range");
            TROVE_ASSERT(Ctrl::IsFull(m_ctrl[index]), "Erasing a slot that is not FULL");

            const SizeType indexBefore = (index - GROUP_WIDTH) & m_capacity;
            const BitMask emptyAfter = Group(m_ctrl + index).MatchEmpty();
            const BitMask emptyBefore = Group(m_ctrl + indexBefore).MatchEmpty();

            const bool wasNeverFull = emptyBefore && emptyAfter &&
                static_cast<SizeType>(emptyAfter.TrailingZeros() + emptyBefore.LeadingZeros()) < GROUP_WIDTH;

            SetCtrl(m_ctrl, m_capacity, index, wasNeverFull ? Ctrl::EMPTY : Ctrl::DELETED);
            m_growthLeft += static_cast<SizeType>(wasNeverFull);
            --m_items;
        }

        // Forgets every entry while keeping the allocation
        void ClearNoDrop() noexcept
        {
            if (m_capacity == 0)
            {
                return;
            }
            ResetCtrl(m_ctrl, m_capacity);
            m_items = 0;
            m_growthLeft = TableMath::CapacityToGrowth(m_capacity);
        }

        // Ensures `additional` more items can be inserted without growing.
        // `hasher(const std::uint8_t* bucket) -> std::uint64_t` must reproduce
        // the hash each live bucket was inserted with. On failure the table
        // is left exactly as it was.
        template<typename Hasher>
        TROVE_NODISCARD Result<void, Error> Reserve(SizeType additional, Hasher&& hasher)
        {
            if (additional <= m_growthLeft) TROVE_LIKELY
            {
                return OK;
            }
            return ReserveRehash(additional, hasher);
        }

        // First FULL index at or after `index`
        TROVE_NODISCARD std::optional<SizeType> NextFullAfter(SizeType index) const noexcept
        {
            while (index < m_capacity)
            {
                const BitMask full = Group(m_ctrl + index).MatchFull();
                if (full)
                {
                    const SizeType found = index + static_cast<SizeType>(full.LowestBitSet());
                    if (found < m_capacity) TROVE_LIKELY
                    {
                        return found;
                    }
                    return std::nullopt;
                }
                index += GROUP_WIDTH;
            }
            return std::nullopt;
        }

    private:
        // Triangular probing over group-sized steps. With a 2^k - 1 mask the
        // sequence visits every group position before repeating.
        class ProbeSeq
        {
        public:
            ProbeSeq(SizeType hash, SizeType mask) noexcept
                : m_mask(mask), m_offset(hash & mask)
            {
            }

            SizeType Offset() const noexcept { return m_offset; }
            SizeType Offset(SizeType i) const noexcept { return (m_offset + i) & m_mask; }
            SizeType Index() const noexcept { return m_index; }

            void Next() noexcept
            {
                m_index += GROUP_WIDTH;
                m_offset += m_index;
                m_offset &= m_mask;
            }

        private:
            SizeType m_mask;
            SizeType m_offset;
            SizeType m_index = 0;
        };

        // Frees a fresh region unless ownership is handed over
        class StorageGuard
        {
        public:
            StorageGuard(Alloc& alloc, void* memory, const AllocationLayout& layout) noexcept
                : m_alloc(alloc), m_memory(memory), m_layout(layout)
            {
            }

            StorageGuard(const StorageGuard&) = delete;
            StorageGuard& operator=(const StorageGuard&) = delete;

            ~StorageGuard() noexcept
            {
                if (m_memory) TROVE_UNLIKELY
                {
                    m_alloc.Deallocate(m_memory, m_layout.size, m_layout.alignment);
                }
            }

            void Dismiss() noexcept { m_memory = nullptr; }

        private:
            Alloc& m_alloc;
            void* m_memory;
            AllocationLayout m_layout;
        };

        struct Storage
        {
            CtrlByte* ctrl = nullptr;
            std::uint8_t* slots = nullptr;
            AllocationLayout layout;
        };

        RawTable(TableLayout layout, Alloc alloc) noexcept
            : m_layout(layout)
            , m_alloc(std::move(alloc))
        {
        }

        TROVE_NODISCARD Result<Storage, Error> AllocateStorage(SizeType capacity)
        {
            TROVE_ASSERT(TableMath::IsValidCapacity(capacity), "Capacity must be 2^k - 1");

            auto layout = m_layout.CalculateFor(capacity);
            if (!layout) TROVE_UNLIKELY
            {
                return Err(layout.Error());
            }
            if (layout->size > AllocatorMaxSize(m_alloc)) TROVE_UNLIKELY
            {
                return Err(ErrorCode::CapacityOverflow, "Table exceeds allocator max size");
            }

            void* memory = m_alloc.Allocate(layout->size, layout->alignment);
            if (!memory) TROVE_UNLIKELY
            {
                return Err(ErrorCode::AllocationFailed);
            }
            TROVE_ASSERT(reinterpret_cast<std::uintptr_t>(memory) % layout->alignment == 0, "Allocator ignored alignment");

            Storage storage;
            storage.ctrl = static_cast<CtrlByte*>(memory);
            storage.slots = static_cast<std::uint8_t*>(memory) + layout->bucketOffset;
            storage.layout = layout.Value();
            ResetCtrl(storage.ctrl, capacity);
            return storage;
        }

        void InstallStorage(const Storage& storage, SizeType capacity) noexcept
        {
            m_ctrl = storage.ctrl;
            m_slots = storage.slots;
            m_capacity = capacity;
        }

        template<typename Hasher>
        TROVE_NOINLINE Result<void, Error> ReserveRehash(SizeType additional, Hasher& hasher)
        {
            SizeType newItems = 0;
            if (!CheckedAdd(m_items, additional, newItems)) TROVE_UNLIKELY
            {
                return Err(ErrorCode::CapacityOverflow);
            }

            const SizeType fullCapacity = m_capacity == 0 ? 0 : TableMath::CapacityToGrowth(m_capacity);
            if (m_capacity > 0 && newItems <= fullCapacity / 2)
            {
                // Mostly tombstones: rebuild at the same size
                return ResizeTo(m_capacity, hasher);
            }

            auto target = TableMath::CapacityForItems(std::max(newItems, fullCapacity + 1));
            if (!target) TROVE_UNLIKELY
            {
                return Err(target.Error());
            }
            return ResizeTo(target.Value(), hasher);
        }

        template<typename Hasher>
        Result<void, Error> ResizeTo(SizeType newCapacity, Hasher& hasher)
        {
            auto allocated = AllocateStorage(newCapacity);
            if (!allocated) TROVE_UNLIKELY
            {
                return Err(allocated.Error());
            }

            const Storage fresh = allocated.Value();
            StorageGuard guard(m_alloc, fresh.ctrl, fresh.layout);

            const SizeType entrySize = m_layout.entrySize;
            const SizeType items = m_items;
            for (SizeType base = 0; base < m_capacity; base += GROUP_WIDTH)
            {
                for (int i : Group(m_ctrl + base).MatchFull())
                {
                    const SizeType index = base + static_cast<SizeType>(i);
                    if (index >= m_capacity)
                    {
                        break;
                    }

                    const std::uint8_t* source = m_slots + index * entrySize;
                    const std::uint64_t hash = hasher(source);
                    const SizeType target = FindFirstNonFull(fresh.ctrl, newCapacity, hash);
                    if (target == newCapacity) TROVE_UNLIKELY
                    {
                        return Err(ErrorCode::Unknown, "Rehash found no vacant slot");
                    }
                    SetCtrl(fresh.ctrl, newCapacity, target, Ctrl::H2(hash));
                    std::memcpy(fresh.slots + target * entrySize, source, entrySize);
                }
            }

            guard.Dismiss();
            Release();
            InstallStorage(fresh, newCapacity);
            m_items = items;
            m_growthLeft = TableMath::CapacityToGrowth(newCapacity) - items;
            return OK;
        }

        // First EMPTY or DELETED slot on the probe path of `hash`, or
        // `capacity` when the whole table is FULL
        static SizeType FindFirstNonFull(const CtrlByte* ctrl, SizeType capacity, std::uint64_t hash) noexcept
        {
            ProbeSeq seq(Ctrl::H1(hash), capacity);
            while (seq.Index() <= capacity)
            {
                const BitMask vacant = Group(ctrl + seq.Offset()).MatchEmptyOrDeleted();
                if (vacant) TROVE_LIKELY
                {
                    return seq.Offset(static_cast<SizeType>(vacant.LowestBitSet()));
                }
                seq.Next();
            }
            TROVE_ASSERT(false, "No vacant slot in table");
            return capacity;
        }

        // Writes the byte and its mirror in the cloned tail
        static void SetCtrl(CtrlByte* ctrl, SizeType capacity, SizeType index, CtrlByte value) noexcept
        {
            TROVE_ASSERT(index < capacity, "SetCtrl index out of range");
            constexpr SizeType cloned = GROUP_WIDTH - 1;
            ctrl[index] = value;
            ctrl[((index - cloned) & capacity) + (cloned & capacity)] = value;
        }

        static void ResetCtrl(CtrlByte* ctrl, SizeType capacity) noexcept
        {
            std::memset(ctrl, Ctrl::EMPTY, Trove::TableLayout::CtrlBytes(capacity));
            ctrl[capacity] = Ctrl::SENTINEL;
        }

        void Release() noexcept
        {
            if (m_ctrl)
            {
                auto layout = m_layout.CalculateFor(m_capacity);
                TROVE_ASSERT(layout.IsOk(), "Layout of a live allocation must be computable");
                m_alloc.Deallocate(m_ctrl, layout->size, layout->alignment);
                m_ctrl = nullptr;
                m_slots = nullptr;
            }
            m_capacity = 0;
            m_items = 0;
            m_growthLeft = 0;
        }

        CtrlByte* m_ctrl = nullptr;
        std::uint8_t* m_slots = nullptr;
        SizeType m_capacity = 0;
        SizeType m_items = 0;
        SizeType m_growthLeft = 0;
        TableLayout m_layout;
        Alloc m_alloc;
    };
}
