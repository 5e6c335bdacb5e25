#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Memory/Allocator.hpp"
#include "../Table/Layout.hpp"
#include "BindingCore.hpp"
#include "Concepts.hpp"

namespace Trove
{
    // Map that owns no capabilities: every call brings the hash of its key,
    // an equality predicate over entries and, when it may grow, a hasher
    // for live entries. Addresses handed out are whole entries.
    template<RawAllocator Alloc = SystemAllocator>
    class ClosureMap
    {
    public:
        using SizeType = std::size_t;
        using EntryRef = typename BindingCore<Alloc>::EntryRef;

        struct AssignResult
        {
            std::uint8_t* entry;
            bool inserted;
        };

        TROVE_NODISCARD static Result<ClosureMap, Error> Create(SizeType capacity, EntryLayout layout, Alloc alloc = Alloc())
        {
            auto core = BindingCore<Alloc>::Create(capacity, layout, std::move(alloc));
            if (!core) TROVE_UNLIKELY
            {
                return Err(core.Error());
            }
            return ClosureMap(std::move(core).Value());
        }

        ClosureMap(ClosureMap&&) noexcept = default;
        ClosureMap& operator=(ClosureMap&&) noexcept = default;
        ClosureMap(const ClosureMap&) = delete;
        ClosureMap& operator=(const ClosureMap&) = delete;

        template<EntryPredicate Eq>
        TROVE_NODISCARD const std::uint8_t* Access(std::uint64_t hash, Eq&& equals) const
        {
            return m_core.Lookup(hash, equals);
        }

        template<EntryPredicate Eq>
        TROVE_NODISCARD std::uint8_t* Access(std::uint64_t hash, Eq&& equals)
        {
            return m_core.Lookup(hash, equals);
        }

        // On insertion the entry's bytes are unspecified; the caller must
        // write a key that hashes to `hash` before the next operation.
        template<EntryPredicate Eq, BucketHasher Hasher>
        TROVE_NODISCARD Result<AssignResult, Error> Assign(std::uint64_t hash, Eq&& equals, Hasher&& hasher)
        {
            auto slot = m_core.Upsert(hash, equals, hasher);
            if (!slot) TROVE_UNLIKELY
            {
                return Err(slot.Error());
            }
            return AssignResult{slot->first, slot->second};
        }

        template<EntryPredicate Eq>
        bool Delete(std::uint64_t hash, Eq&& equals)
        {
            return m_core.Remove(hash, equals);
        }

        template<BucketHasher Hasher>
        TROVE_NODISCARD Result<void, Error> Reserve(SizeType additional, Hasher&& hasher)
        {
            return m_core.Reserve(additional, hasher);
        }

        TROVE_NODISCARD std::optional<EntryRef> NextEntry(SizeType index) const noexcept
        {
            return m_core.NextEntry(index);
        }

        void Clear() noexcept { m_core.Clear(); }

        TROVE_NODISCARD SizeType Size() const noexcept { return m_core.Size(); }
        TROVE_NODISCARD bool Empty() const noexcept { return m_core.Empty(); }
        TROVE_NODISCARD SizeType Capacity() const noexcept { return m_core.Capacity(); }
        TROVE_NODISCARD SizeType GrowthLeft() const noexcept { return m_core.GrowthLeft(); }
        TROVE_NODISCARD const EntryLayout& Layout() const noexcept { return m_core.Layout(); }

    private:
        explicit ClosureMap(BindingCore<Alloc>&& core) noexcept
            : m_core(std::move(core))
        {
        }

        BindingCore<Alloc> m_core;
    };
}
