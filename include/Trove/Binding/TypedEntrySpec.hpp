#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <type_traits>

#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Memory/Allocator.hpp"
#include "../Platform/Simd.hpp"
#include "../Table/Layout.hpp"
#include "Concepts.hpp"
#include "EntrySpecMap.hpp"

namespace Trove
{
    // EntrySpec for a concrete (K, V) pair. The user hash is run through a
    // finalizer before the table splits it into probe start and tag.
    template<typename K, typename V, typename HashFn = std::hash<K>, typename EqualFn = std::equal_to<K>>
    struct TypedEntrySpec
    {
        static_assert(std::is_trivially_copyable_v<K>, "Keys must be trivially copyable");
        static_assert(std::is_trivially_copyable_v<V>, "Values must be trivially copyable");

        using KeyType = K;
        using MappedType = V;

        static constexpr std::uint64_t HASH_SEED = 0x9E3779B97F4A7C15ULL;

        HashFn hasher;
        EqualFn equal;

        static constexpr EntryLayout Layout() noexcept
        {
            return EntryLayout::Of<K, V>();
        }

        std::uint64_t Hash(const std::uint8_t* key) const
        {
            const std::uint64_t raw = static_cast<std::uint64_t>(hasher(Load<K>(key)));
            return Simd::Ops::HashCombine(raw, HASH_SEED);
        }

        bool Equals(const std::uint8_t* a, const std::uint8_t* b) const
        {
            return equal(Load<K>(a), Load<K>(b));
        }

        void AssignKey(std::uint8_t* dst, const std::uint8_t* src) const noexcept
        {
            std::memcpy(dst, src, sizeof(K));
        }

        void AssignValue(std::uint8_t* dst, const std::uint8_t* src) const noexcept
        {
            std::memcpy(dst, src, sizeof(V));
        }

    private:
        template<typename T>
        static T Load(const std::uint8_t* bytes) noexcept
        {
            T value;
            std::memcpy(&value, bytes, sizeof(T));
            return value;
        }
    };

    template<typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>, RawAllocator Alloc = SystemAllocator>
    using TypedMap = EntrySpecMap<TypedEntrySpec<K, V, Hash, KeyEqual>, Alloc>;

    // Builds an EntrySpecMap for (K, V); view it with AsMap<K, V>()
    template<typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>, RawAllocator Alloc = SystemAllocator>
    TROVE_NODISCARD Result<TypedMap<K, V, Hash, KeyEqual, Alloc>, Error> MakeTypedMap(std::size_t capacity = 0, Alloc alloc = Alloc())
    {
        using Spec = TypedEntrySpec<K, V, Hash, KeyEqual>;
        return TypedMap<K, V, Hash, KeyEqual, Alloc>::Create(capacity, Spec::Layout(), Spec(), std::move(alloc));
    }
}
