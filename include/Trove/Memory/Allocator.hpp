#pragma once

#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <limits>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"

#if defined(TROVE_PLATFORM_WINDOWS)
    #include <malloc.h>
#endif

namespace Trove
{
    // Allocator capability consumed by RawTable.
    //
    // Allocate returns nullptr on exhaustion and never throws; the table turns
    // that into ErrorCode::AllocationFailed. The pointer must honour the
    // requested power-of-two alignment. Deallocate receives the same size and
    // alignment that were passed to Allocate.
    template<class A>
    concept RawAllocator =
        std::movable<A> &&
        requires(A a, std::size_t size, std::size_t alignment, void* ptr) {
            { a.Allocate(size, alignment) } -> std::same_as<void*>;
            { a.Deallocate(ptr, size, alignment) } noexcept;
        };

    // Optional capability: an upper bound checked before a request is made
    template<class A>
    concept AllocatorReportsMaxSize =
        requires(const A a) {
            { a.MaxSize() } -> std::same_as<std::size_t>;
        };

    template<class A>
    inline std::size_t AllocatorMaxSize(const A& allocator) noexcept
    {
        if constexpr (AllocatorReportsMaxSize<A>)
        {
            return allocator.MaxSize();
        }
        else
        {
            return std::numeric_limits<std::size_t>::max();
        }
    }

    // Stateless aligned allocator on top of the C runtime
    struct SystemAllocator
    {
        TROVE_NODISCARD void* Allocate(std::size_t size, std::size_t alignment) noexcept
        {
            if (size == 0) TROVE_UNLIKELY
            {
                return nullptr;
            }
            if (!IsPowerOfTwo(alignment)) TROVE_UNLIKELY
            {
                return nullptr;
            }

#if defined(TROVE_PLATFORM_WINDOWS)
            return _aligned_malloc(size, alignment);
#else
            if (alignment < sizeof(void*))
            {
                alignment = sizeof(void*);
            }
            void* ptr = nullptr;
            if (posix_memalign(&ptr, alignment, size) != 0)
            {
                return nullptr;
            }
            return ptr;
#endif
        }

        void Deallocate(void* ptr, std::size_t, std::size_t) noexcept
        {
            if (!ptr)
            {
                return;
            }
#if defined(TROVE_PLATFORM_WINDOWS)
            _aligned_free(ptr);
#else
            std::free(ptr);
#endif
        }

        TROVE_NODISCARD constexpr std::size_t MaxSize() const noexcept
        {
            return static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max());
        }
    };

    static_assert(RawAllocator<SystemAllocator>);
}
