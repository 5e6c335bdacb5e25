#pragma once

#include <bit>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "../Core/Base.hpp"

#if defined(TROVE_HAS_SSE2)
    #if defined(TROVE_COMPILER_MSVC)
        #include <intrin.h>
    #endif
    #include <emmintrin.h>
#elif defined(TROVE_HAS_NEON)
    #include <arm_neon.h>
#endif

namespace Trove::Simd
{
    // All 16-byte operations use unaligned loads: probe windows start at any
    // control byte, not only at group boundaries.
    namespace Ops
    {
        namespace Detail
        {
#if defined(TROVE_HAS_NEON)
            // Collapse a 0x00/0xFF lane vector into one bit per lane
            TROVE_FORCEINLINE std::uint16_t MoveMask(uint8x16_t lanes) noexcept
            {
                const uint8x16_t bitMask = {
                    0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80,
                    0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80
                };
                const uint8x16_t masked = vandq_u8(lanes, bitMask);
                const std::uint8_t low = vaddv_u8(vget_low_u8(masked));
                const std::uint8_t high = vaddv_u8(vget_high_u8(masked));
                return static_cast<std::uint16_t>((static_cast<std::uint16_t>(high) << 8) | low);
            }
#endif
        }

        // Bit i set iff byte i equals value
        TROVE_FORCEINLINE std::uint16_t MatchByteMask(const void* data, std::uint8_t value) noexcept
        {
#if defined(TROVE_HAS_SSE2)
            const __m128i group = _mm_loadu_si128(static_cast<const __m128i*>(data));
            const __m128i match = _mm_set1_epi8(static_cast<char>(value));
            return static_cast<std::uint16_t>(_mm_movemask_epi8(_mm_cmpeq_epi8(group, match)));
#elif defined(TROVE_HAS_NEON)
            const uint8x16_t group = vld1q_u8(static_cast<const std::uint8_t*>(data));
            return Detail::MoveMask(vceqq_u8(group, vdupq_n_u8(value)));
#else
            std::uint16_t mask = 0;
            const std::uint8_t* bytes = static_cast<const std::uint8_t*>(data);
            for (int i = 0; i < 16; ++i)
            {
                if (bytes[i] == value)
                {
                    mask |= static_cast<std::uint16_t>(1u << i);
                }
            }
            return mask;
#endif
        }

        // Bit i set iff the high bit of byte i is set
        TROVE_FORCEINLINE std::uint16_t MatchHighBitMask(const void* data) noexcept
        {
#if defined(TROVE_HAS_SSE2)
            const __m128i group = _mm_loadu_si128(static_cast<const __m128i*>(data));
            return static_cast<std::uint16_t>(_mm_movemask_epi8(group));
#elif defined(TROVE_HAS_NEON)
            const int8x16_t group = vreinterpretq_s8_u8(vld1q_u8(static_cast<const std::uint8_t*>(data)));
            return Detail::MoveMask(vcltq_s8(group, vdupq_n_s8(0)));
#else
            std::uint16_t mask = 0;
            const std::uint8_t* bytes = static_cast<const std::uint8_t*>(data);
            for (int i = 0; i < 16; ++i)
            {
                if (bytes[i] & 0x80u)
                {
                    mask |= static_cast<std::uint16_t>(1u << i);
                }
            }
            return mask;
#endif
        }

        // Bit i set iff byte i, read as a signed value, is less than value
        TROVE_FORCEINLINE std::uint16_t MatchSignedLessMask(const void* data, std::int8_t value) noexcept
        {
#if defined(TROVE_HAS_SSE2)
            const __m128i group = _mm_loadu_si128(static_cast<const __m128i*>(data));
            const __m128i bound = _mm_set1_epi8(static_cast<char>(value));
            return static_cast<std::uint16_t>(_mm_movemask_epi8(_mm_cmpgt_epi8(bound, group)));
#elif defined(TROVE_HAS_NEON)
            const int8x16_t group = vreinterpretq_s8_u8(vld1q_u8(static_cast<const std::uint8_t*>(data)));
            return Detail::MoveMask(vcltq_s8(group, vdupq_n_s8(value)));
#else
            std::uint16_t mask = 0;
            const std::uint8_t* bytes = static_cast<const std::uint8_t*>(data);
            for (int i = 0; i < 16; ++i)
            {
                std::int8_t signedByte;
                std::memcpy(&signedByte, &bytes[i], 1);
                if (signedByte < value)
                {
                    mask |= static_cast<std::uint16_t>(1u << i);
                }
            }
            return mask;
#endif
        }

        // Count trailing zeros; returns the bit width for a zero mask
        template<typename MaskType>
        TROVE_FORCEINLINE int CountTrailingZeros(MaskType mask) noexcept
        {
            static_assert(std::is_unsigned_v<MaskType>, "Mask must be unsigned");
            return std::countr_zero(mask);
        }

        // Count leading zeros within the mask's own width
        template<typename MaskType>
        TROVE_FORCEINLINE int CountLeadingZeros(MaskType mask) noexcept
        {
            static_assert(std::is_unsigned_v<MaskType>, "Mask must be unsigned");
            return std::countl_zero(mask);
        }

        template<typename MaskType>
        TROVE_FORCEINLINE int PopCount(MaskType mask) noexcept
        {
            static_assert(std::is_unsigned_v<MaskType>, "Mask must be unsigned");
            return std::popcount(mask);
        }

        // MurmurHash3 finalizer over seed ^ value
        TROVE_FORCEINLINE constexpr std::uint64_t HashCombine(std::uint64_t seed, std::uint64_t value) noexcept
        {
            std::uint64_t h = seed ^ value;
            h ^= h >> 33;
            h *= 0xff51afd7ed558ccdULL;
            h ^= h >> 33;
            h *= 0xc4ceb9fe1a85ec53ULL;
            h ^= h >> 33;
            return h;
        }

        enum class PrefetchHint
        {
            T0 = 0,  // All cache levels
            T1 = 1,  // L2 and higher
            NTA = 3  // Non-temporal
        };

        TROVE_FORCEINLINE void PrefetchRead(const void* ptr, PrefetchHint hint = PrefetchHint::T0) noexcept
        {
#if defined(TROVE_HAS_SSE2) && defined(TROVE_COMPILER_MSVC)
            switch (hint)
            {
            case PrefetchHint::T0:  _mm_prefetch(static_cast<const char*>(ptr), _MM_HINT_T0); break;
            case PrefetchHint::T1:  _mm_prefetch(static_cast<const char*>(ptr), _MM_HINT_T1); break;
            case PrefetchHint::NTA: _mm_prefetch(static_cast<const char*>(ptr), _MM_HINT_NTA); break;
            }
#elif TROVE_HAS_BUILTIN(__builtin_prefetch) || defined(TROVE_COMPILER_GCC)
            switch (hint)
            {
            case PrefetchHint::T0:  __builtin_prefetch(ptr, 0, 3); break;
            case PrefetchHint::T1:  __builtin_prefetch(ptr, 0, 2); break;
            case PrefetchHint::NTA: __builtin_prefetch(ptr, 0, 0); break;
            }
#else
            (void)ptr;
            (void)hint;
#endif
        }

        TROVE_FORCEINLINE void PrefetchT0(const void* ptr) noexcept { PrefetchRead(ptr, PrefetchHint::T0); }
        TROVE_FORCEINLINE void PrefetchT1(const void* ptr) noexcept { PrefetchRead(ptr, PrefetchHint::T1); }
    }
}
