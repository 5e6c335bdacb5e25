#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../Container/TypedMap.hpp"
#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Memory/Allocator.hpp"
#include "../Table/Layout.hpp"
#include "BindingCore.hpp"
#include "Concepts.hpp"

namespace Trove
{
    // Map whose spec writes both keys and values. The only binding the typed
    // facade sits on, since it never leaves a value unwritten.
    template<EntrySpec Spec, RawAllocator Alloc>
    class EntrySpecMap
    {
    public:
        using SizeType = std::size_t;
        using SpecType = Spec;
        using AllocatorType = Alloc;
        using EntryRef = typename BindingCore<Alloc>::EntryRef;

        TROVE_NODISCARD static Result<EntrySpecMap, Error> Create(SizeType capacity, EntryLayout layout, Spec spec = Spec(), Alloc alloc = Alloc())
        {
            auto core = BindingCore<Alloc>::Create(capacity, layout, std::move(alloc));
            if (!core) TROVE_UNLIKELY
            {
                return Err(core.Error());
            }
            return EntrySpecMap(std::move(core).Value(), std::move(spec));
        }

        EntrySpecMap(EntrySpecMap&&) noexcept = default;
        EntrySpecMap& operator=(EntrySpecMap&&) noexcept = default;
        EntrySpecMap(const EntrySpecMap&) = delete;
        EntrySpecMap& operator=(const EntrySpecMap&) = delete;

        TROVE_NODISCARD const std::uint8_t* Access(const std::uint8_t* key) const
        {
            const std::uint8_t* entry = m_core.Lookup(m_spec.Hash(key), Matcher{m_spec, key});
            return entry ? m_core.ValueOf(entry) : nullptr;
        }

        TROVE_NODISCARD std::uint8_t* Access(const std::uint8_t* key)
        {
            std::uint8_t* entry = m_core.Lookup(m_spec.Hash(key), Matcher{m_spec, key});
            return entry ? m_core.ValueOf(entry) : nullptr;
        }

        TROVE_NODISCARD bool Contains(const std::uint8_t* key) const
        {
            return Access(key) != nullptr;
        }

        // Writes `value` under `key`, replacing any previous value
        TROVE_NODISCARD Result<void, Error> Insert(const std::uint8_t* key, const std::uint8_t* value)
        {
            auto slot = m_core.Upsert(m_spec.Hash(key), Matcher{m_spec, key}, Rehasher{m_spec});
            if (!slot) TROVE_UNLIKELY
            {
                return Err(slot.Error());
            }

            auto [entry, inserted] = slot.Value();
            if (inserted)
            {
                m_spec.AssignKey(entry, key);
            }
            m_spec.AssignValue(m_core.ValueOf(entry), value);
            return OK;
        }

        bool Delete(const std::uint8_t* key)
        {
            return m_core.Remove(m_spec.Hash(key), Matcher{m_spec, key});
        }

        TROVE_NODISCARD Result<void, Error> Extend(const EntrySpecMap& other)
        {
            if (&other == this)
            {
                return OK;
            }
            TROVE_ASSERT(other.Layout() == Layout(), "Extending from a map with a different layout");

            auto reserved = Reserve(Empty() ? other.Size() : (other.Size() + 1) / 2);
            if (!reserved) TROVE_UNLIKELY
            {
                return reserved;
            }

            for (auto entry = other.NextEntry(0); entry; entry = other.NextEntry(entry->first + 1))
            {
                auto inserted = Insert(entry->second, other.m_core.ValueOf(entry->second));
                if (!inserted) TROVE_UNLIKELY
                {
                    return inserted;
                }
            }
            return OK;
        }

        TROVE_NODISCARD Result<void, Error> Reserve(SizeType additional)
        {
            return m_core.Reserve(additional, Rehasher{m_spec});
        }

        TROVE_NODISCARD std::optional<EntryRef> NextEntry(SizeType index) const noexcept
        {
            return m_core.NextEntry(index);
        }

        void Clear() noexcept { m_core.Clear(); }

        // Typed view over this map. K and V must be the types the layout and
        // spec were built for.
        template<typename K, typename V>
        TROVE_NODISCARD MapView<K, V, Spec, Alloc> AsMap() noexcept
        {
            TROVE_ASSERT((Layout() == EntryLayout::Of<K, V>()), "Typed view does not match the entry layout");
            return MapView<K, V, Spec, Alloc>(*this);
        }

        TROVE_NODISCARD SizeType Size() const noexcept { return m_core.Size(); }
        TROVE_NODISCARD bool Empty() const noexcept { return m_core.Empty(); }
        TROVE_NODISCARD SizeType Capacity() const noexcept { return m_core.Capacity(); }
        TROVE_NODISCARD SizeType GrowthLeft() const noexcept { return m_core.GrowthLeft(); }
        TROVE_NODISCARD const EntryLayout& Layout() const noexcept { return m_core.Layout(); }
        TROVE_NODISCARD const Spec& GetSpec() const noexcept { return m_spec; }

    private:
        struct Matcher
        {
            const Spec& spec;
            const std::uint8_t* key;

            bool operator()(const std::uint8_t* entry) const
            {
                return spec.Equals(key, entry);
            }
        };

        struct Rehasher
        {
            const Spec& spec;

            std::uint64_t operator()(const std::uint8_t* entry) const
            {
                return spec.Hash(entry);
            }
        };

        EntrySpecMap(BindingCore<Alloc>&& core, Spec&& spec) noexcept
            : m_core(std::move(core))
            , m_spec(std::move(spec))
        {
        }

        BindingCore<Alloc> m_core;
        Spec m_spec;
    };
}
