#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
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
    // Map driven by a key descriptor alone. Keys are copied into the table
    // byte for byte; values are never written by the map, callers fill the
    // address Assign hands back.
    template<KeyDesc Desc, RawAllocator Alloc = SystemAllocator>
    class KeyDescMap
    {
    public:
        using SizeType = std::size_t;
        using DescType = Desc;
        using EntryRef = typename BindingCore<Alloc>::EntryRef;

        TROVE_NODISCARD static Result<KeyDescMap, Error> Create(SizeType capacity, EntryLayout layout, Desc desc = Desc(), Alloc alloc = Alloc())
        {
            auto core = BindingCore<Alloc>::Create(capacity, layout, std::move(alloc));
            if (!core) TROVE_UNLIKELY
            {
                return Err(core.Error());
            }
            return KeyDescMap(std::move(core).Value(), std::move(desc));
        }

        KeyDescMap(KeyDescMap&&) noexcept = default;
        KeyDescMap& operator=(KeyDescMap&&) noexcept = default;
        KeyDescMap(const KeyDescMap&) = delete;
        KeyDescMap& operator=(const KeyDescMap&) = delete;

        // Value address for `key`, or nullptr
        TROVE_NODISCARD const std::uint8_t* Access(const std::uint8_t* key) const
        {
            const std::uint8_t* entry = m_core.Lookup(m_desc.Hash(key), Matcher{m_desc, key});
            return entry ? m_core.ValueOf(entry) : nullptr;
        }

        TROVE_NODISCARD std::uint8_t* Access(const std::uint8_t* key)
        {
            std::uint8_t* entry = m_core.Lookup(m_desc.Hash(key), Matcher{m_desc, key});
            return entry ? m_core.ValueOf(entry) : nullptr;
        }

        TROVE_NODISCARD bool Contains(const std::uint8_t* key) const
        {
            return Access(key) != nullptr;
        }

        // Value address for `key`, claiming an entry and copying the key in
        // when absent. An existing value is left untouched.
        TROVE_NODISCARD Result<std::uint8_t*, Error> Assign(const std::uint8_t* key)
        {
            auto slot = m_core.Upsert(m_desc.Hash(key), Matcher{m_desc, key}, Rehasher{m_desc});
            if (!slot) TROVE_UNLIKELY
            {
                return Err(slot.Error());
            }

            auto [entry, inserted] = slot.Value();
            if (inserted)
            {
                std::memcpy(entry, key, m_core.Layout().KeySize());
            }
            return m_core.ValueOf(entry);
        }

        bool Delete(const std::uint8_t* key)
        {
            return m_core.Remove(m_desc.Hash(key), Matcher{m_desc, key});
        }

        // Copies every entry of `other` in, overwriting values of keys
        // already present. Both maps must share the same layout.
        TROVE_NODISCARD Result<void, Error> Extend(const KeyDescMap& other)
        {
            if (&other == this)
            {
                return OK;
            }
            TROVE_ASSERT(other.Layout() == Layout(), "Extending from a map with a different layout");

            const SizeType hint = Empty() ? other.Size() : (other.Size() + 1) / 2;
            auto reserved = Reserve(hint);
            if (!reserved) TROVE_UNLIKELY
            {
                return reserved;
            }

            const SizeType valueSize = Layout().ValueSize();
            for (auto entry = other.NextEntry(0); entry; entry = other.NextEntry(entry->first + 1))
            {
                auto value = Assign(entry->second);
                if (!value) TROVE_UNLIKELY
                {
                    return Err(value.Error());
                }
                std::memcpy(value.Value(), other.m_core.ValueOf(entry->second), valueSize);
            }
            return OK;
        }

        TROVE_NODISCARD Result<void, Error> Reserve(SizeType additional)
        {
            return m_core.Reserve(additional, Rehasher{m_desc});
        }

        // First live entry at or after `index`; the address is the entry's
        // key, the value sits at Layout().valueOffset.
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
        TROVE_NODISCARD const Desc& Descriptor() const noexcept { return m_desc; }

    private:
        struct Matcher
        {
            const Desc& desc;
            const std::uint8_t* key;

            bool operator()(const std::uint8_t* entry) const
            {
                return desc.Equals(key, entry);
            }
        };

        struct Rehasher
        {
            const Desc& desc;

            std::uint64_t operator()(const std::uint8_t* entry) const
            {
                return desc.Hash(entry);
            }
        };

        KeyDescMap(BindingCore<Alloc>&& core, Desc&& desc) noexcept
            : m_core(std::move(core))
            , m_desc(std::move(desc))
        {
        }

        BindingCore<Alloc> m_core;
        Desc m_desc;
    };
}
