#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include "../Binding/Concepts.hpp"
#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Memory/Allocator.hpp"

namespace Trove
{
    template<EntrySpec Spec, RawAllocator Alloc = SystemAllocator>
    class EntrySpecMap;

    // Typed, non-owning view over an EntrySpecMap. Translates typed keys and
    // values to and from bucket bytes; all storage stays in the map.
    //
    // Thread Safety: same as the underlying map.
    template<typename K, typename V, EntrySpec Spec, RawAllocator Alloc = SystemAllocator>
    class MapView
    {
        static_assert(std::is_trivially_copyable_v<K>, "Keys must be trivially copyable");
        static_assert(std::is_trivially_copyable_v<V>, "Values must be trivially copyable");

    public:
        using KeyType = K;
        using MappedType = V;
        using SizeType = std::size_t;
        using MapType = EntrySpecMap<Spec, Alloc>;

        class const_iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = std::pair<K, V>;
            using difference_type = std::ptrdiff_t;
            using reference = std::pair<const K&, const V&>;

            const_iterator() = default;

            const_iterator(const MapType* map, SizeType index) noexcept
                : m_map(map)
            {
                Seek(index);
            }

            reference operator*() const noexcept
            {
                TROVE_ASSERT(m_entry != nullptr, "Dereferencing end iterator");
                return reference(*reinterpret_cast<const K*>(m_entry),
                                 *reinterpret_cast<const V*>(m_entry + m_map->Layout().valueOffset));
            }

            const_iterator& operator++() noexcept
            {
                Seek(m_index + 1);
                return *this;
            }

            const_iterator operator++(int) noexcept
            {
                const_iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const const_iterator& other) const noexcept
            {
                return m_entry == other.m_entry;
            }

        private:
            void Seek(SizeType index) noexcept
            {
                auto next = m_map ? m_map->NextEntry(index) : std::nullopt;
                if (next)
                {
                    m_index = next->first;
                    m_entry = next->second;
                }
                else
                {
                    m_index = 0;
                    m_entry = nullptr;
                }
            }

            const MapType* m_map = nullptr;
            SizeType m_index = 0;
            const std::uint8_t* m_entry = nullptr;
        };

        using iterator = const_iterator;

        explicit MapView(MapType& map) noexcept : m_map(&map) {}

        TROVE_NODISCARD const V* Get(const K& key) const
        {
            const std::uint8_t* value = std::as_const(*m_map).Access(Bytes(key));
            return value ? reinterpret_cast<const V*>(value) : nullptr;
        }

        TROVE_NODISCARD bool Contains(const K& key) const
        {
            return Get(key) != nullptr;
        }

        TROVE_NODISCARD Result<void, Error> Insert(const K& key, V value)
        {
            return m_map->Insert(Bytes(key), reinterpret_cast<const std::uint8_t*>(&value));
        }

        bool Delete(const K& key)
        {
            return m_map->Delete(Bytes(key));
        }

        TROVE_NODISCARD Result<void, Error> Extend(const MapView& other)
        {
            return m_map->Extend(*other.m_map);
        }

        void Clear() noexcept { m_map->Clear(); }

        TROVE_NODISCARD SizeType Size() const noexcept { return m_map->Size(); }
        TROVE_NODISCARD bool Empty() const noexcept { return m_map->Empty(); }

        TROVE_NODISCARD const_iterator begin() const noexcept { return const_iterator(m_map, 0); }
        TROVE_NODISCARD const_iterator end() const noexcept { return const_iterator(); }

        TROVE_NODISCARD MapType& Map() const noexcept { return *m_map; }

    private:
        static const std::uint8_t* Bytes(const K& key) noexcept
        {
            return reinterpret_cast<const std::uint8_t*>(&key);
        }

        MapType* m_map;
    };
}

#include "../Binding/EntrySpecMap.hpp"
