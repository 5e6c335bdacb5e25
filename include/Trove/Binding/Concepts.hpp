#pragma once

#include <concepts>
#include <cstdint>

namespace Trove
{
    // Hashing and equality over raw key bytes. Pointers address the first
    // byte of a key, which is also the first byte of its entry.
    template<typename D>
    concept KeyDesc = std::movable<D> &&
        requires(const D desc, const std::uint8_t* key) {
            { desc.Hash(key) } -> std::convertible_to<std::uint64_t>;
            { desc.Equals(key, key) } -> std::convertible_to<bool>;
        };

    // A KeyDesc that also knows how to materialize keys and values into
    // bucket memory. Destinations are uninitialized or hold a previous value
    // of the same type; both copies must be plain byte-level assignments.
    template<typename S>
    concept EntrySpec = KeyDesc<S> &&
        requires(const S spec, std::uint8_t* dst, const std::uint8_t* src) {
            { spec.AssignKey(dst, src) } -> std::same_as<void>;
            { spec.AssignValue(dst, src) } -> std::same_as<void>;
        };

    // Per-bucket hasher handed to growth: must reproduce the hash each live
    // entry was inserted with.
    template<typename H>
    concept BucketHasher =
        requires(H& hasher, const std::uint8_t* bucket) {
            { hasher(bucket) } -> std::convertible_to<std::uint64_t>;
        };

    template<typename F>
    concept EntryPredicate =
        requires(F& pred, const std::uint8_t* entry) {
            { pred(entry) } -> std::convertible_to<bool>;
        };
}
