#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Memory/Allocator.hpp"
#include "../Table/Layout.hpp"
#include "../Table/RawTable.hpp"
#include "Concepts.hpp"

namespace Trove
{
    // Entry-level operations shared by every binding. Works on whole entry
    // addresses; the bindings decide where hashing, equality and key
    // materialization come from.
    template<RawAllocator Alloc = SystemAllocator>
    class BindingCore
    {
    public:
        using SizeType = std::size_t;
        using TableType = RawTable<Alloc>;
        using EntryRef = std::pair<SizeType, const std::uint8_t*>;

        TROVE_NODISCARD static Result<BindingCore, Error> Create(SizeType capacity, EntryLayout layout, Alloc alloc = Alloc())
        {
            if (!layout.IsValid()) TROVE_UNLIKELY
            {
                return Err(ErrorCode::InvalidArgument, "Invalid entry layout");
            }

            auto table = TableType::Create(capacity, layout.ToTableLayout(), std::move(alloc));
            if (!table) TROVE_UNLIKELY
            {
                return Err(table.Error());
            }
            return BindingCore(std::move(table).Value(), layout);
        }

        BindingCore(BindingCore&&) noexcept = default;
        BindingCore& operator=(BindingCore&&) noexcept = default;
        BindingCore(const BindingCore&) = delete;
        BindingCore& operator=(const BindingCore&) = delete;

        template<EntryPredicate Eq>
        TROVE_NODISCARD const std::uint8_t* Lookup(std::uint64_t hash, Eq&& equals) const
        {
            auto index = m_table.Find(hash, [&](SizeType i) { return equals(m_table.Bucket(i)); });
            return index ? m_table.Bucket(*index) : nullptr;
        }

        template<EntryPredicate Eq>
        TROVE_NODISCARD std::uint8_t* Lookup(std::uint64_t hash, Eq&& equals)
        {
            auto index = m_table.Find(hash, [&](SizeType i) { return equals(m_table.Bucket(i)); });
            return index ? m_table.Bucket(*index) : nullptr;
        }

        // Returns the entry for the key together with whether it was just
        // claimed. A claimed entry's bytes are unspecified until the caller
        // writes its key.
        template<EntryPredicate Eq, BucketHasher Hasher>
        TROVE_NODISCARD Result<std::pair<std::uint8_t*, bool>, Error> Upsert(std::uint64_t hash, Eq&& equals, Hasher&& hasher)
        {
            auto reserved = m_table.Reserve(1, hasher);
            if (!reserved) TROVE_UNLIKELY
            {
                return Err(reserved.Error());
            }

            const auto [index, found] = m_table.FindOrFindInsertSlot(hash, [&](SizeType i) { return equals(m_table.Bucket(i)); });
            if (!found)
            {
                if (index == m_table.Capacity()) TROVE_UNLIKELY
                {
                    return Err(ErrorCode::Unknown, "No vacant slot after reserving");
                }
                m_table.RecordItemInsertAt(index, m_table.CtrlAt(index), hash);
            }
            return std::make_pair(m_table.Bucket(index), !found);
        }

        template<EntryPredicate Eq>
        bool Remove(std::uint64_t hash, Eq&& equals)
        {
            auto index = m_table.Find(hash, [&](SizeType i) { return equals(m_table.Bucket(i)); });
            if (!index)
            {
                return false;
            }
            m_table.Erase(*index);
            return true;
        }

        template<BucketHasher Hasher>
        TROVE_NODISCARD Result<void, Error> Reserve(SizeType additional, Hasher&& hasher)
        {
            return m_table.Reserve(additional, hasher);
        }

        // First live entry at or after `index`, with its index
        TROVE_NODISCARD std::optional<EntryRef> NextEntry(SizeType index) const noexcept
        {
            auto full = m_table.NextFullAfter(index);
            if (!full)
            {
                return std::nullopt;
            }
            return EntryRef{*full, m_table.Bucket(*full)};
        }

        void Clear() noexcept { m_table.ClearNoDrop(); }

        TROVE_NODISCARD SizeType Size() const noexcept { return m_table.Size(); }
        TROVE_NODISCARD bool Empty() const noexcept { return m_table.Empty(); }
        TROVE_NODISCARD SizeType Capacity() const noexcept { return m_table.Capacity(); }
        TROVE_NODISCARD SizeType GrowthLeft() const noexcept { return m_table.GrowthLeft(); }
        TROVE_NODISCARD const EntryLayout& Layout() const noexcept { return m_layout; }
        TROVE_NODISCARD const TableType& Table() const noexcept { return m_table; }

        TROVE_NODISCARD const std::uint8_t* ValueOf(const std::uint8_t* entry) const noexcept
        {
            return entry + m_layout.valueOffset;
        }

        TROVE_NODISCARD std::uint8_t* ValueOf(std::uint8_t* entry) const noexcept
        {
            return entry + m_layout.valueOffset;
        }

    private:
        BindingCore(TableType&& table, EntryLayout layout) noexcept
            : m_table(std::move(table))
            , m_layout(layout)
        {
        }

        TableType m_table;
        EntryLayout m_layout;
    };
}
