#pragma once

#include <algorithm>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

#include "Base.hpp"
#include "Error.hpp"

namespace Trove
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    // Shorthand for the error type every Trove operation reports
    inline constexpr ErrorValue<Error> Err(ErrorCode code, const char* message = nullptr)
    {
        return ErrorValue<Error>(Error(code, message));
    }

    struct OkTag {};
    inline constexpr OkTag OK{};

    namespace internal
    {
        template<typename T, typename E>
        struct VariantStorage
        {
            static constexpr std::size_t size = std::max(sizeof(T), sizeof(E));
            static constexpr std::size_t alignment = std::max(alignof(T), alignof(E));

            alignas(alignment) std::uint8_t data[size];

            template<typename U>
            U* as() noexcept
            {
                return std::launder(reinterpret_cast<U*>(&data));
            }

            template<typename U>
            const U* as() const noexcept
            {
                return std::launder(reinterpret_cast<const U*>(&data));
            }
        };
    }

    template<typename T, typename E = Error>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>) : m_hasValue(true)
        {
            ConstructValue(value);
        }

        Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) : m_hasValue(true)
        {
            ConstructValue(std::move(value));
        }

        Result(const ErrorValue<E>& err) noexcept(std::is_nothrow_copy_constructible_v<E>) : m_hasValue(false)
        {
            ConstructError(err.value);
        }

        Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(false)
        {
            ConstructError(std::move(err.value));
        }

        Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
            {
                ConstructValue(other.Value());
            }
            else
            {
                ConstructError(other.Error());
            }
        }

        Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
            {
                ConstructValue(std::move(*other.ValPtr()));
            }
            else
            {
                ConstructError(std::move(*other.ErrPtr()));
            }
        }

        ~Result()
        {
            Destroy();
        }

        Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                {
                    ConstructValue(std::move(*other.ValPtr()));
                }
                else
                {
                    ConstructError(std::move(*other.ErrPtr()));
                }
            }
            return *this;
        }

        Result& operator=(const Result& other)
        {
            if (this != &other)
            {
                Result tmp(other);
                *this = std::move(tmp);
            }
            return *this;
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        T& Value() &
        {
            TROVE_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return *ValPtr();
        }

        const T& Value() const&
        {
            TROVE_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return *ValPtr();
        }

        T&& Value() &&
        {
            TROVE_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(*ValPtr());
        }

        E& Error() &
        {
            TROVE_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return *ErrPtr();
        }

        const E& Error() const&
        {
            TROVE_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return *ErrPtr();
        }

        T& operator*() & { return Value(); }
        const T& operator*() const& { return Value(); }
        T&& operator*() && { return std::move(*this).Value(); }

        T* operator->() noexcept
        {
            TROVE_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return ValPtr();
        }

        const T* operator->() const noexcept
        {
            TROVE_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return ValPtr();
        }

        template<typename U>
        [[nodiscard]] T ValueOr(U&& defaultValue) const&
        {
            return m_hasValue ? Value() : static_cast<T>(std::forward<U>(defaultValue));
        }

    private:
        template<typename... Args>
        void ConstructValue(Args&&... args)
        {
            ::new(ValPtr()) T(std::forward<Args>(args)...);
        }

        template<typename... Args>
        void ConstructError(Args&&... args)
        {
            ::new(ErrPtr()) E(std::forward<Args>(args)...);
        }

        void Destroy() noexcept
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                {
                    ValPtr()->~T();
                }
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                {
                    ErrPtr()->~E();
                }
            }
        }

        T* ValPtr() noexcept { return m_storage.template as<T>(); }
        const T* ValPtr() const noexcept { return m_storage.template as<T>(); }
        E* ErrPtr() noexcept { return m_storage.template as<E>(); }
        const E* ErrPtr() const noexcept { return m_storage.template as<E>(); }

        internal::VariantStorage<T, E> m_storage;
        bool m_hasValue;
    };

    template<typename E>
    class Result<void, E>
    {
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Result() noexcept : m_hasValue(true), m_error() {}
        constexpr Result(OkTag) noexcept : m_hasValue(true), m_error() {}

        constexpr Result(const ErrorValue<E>& err) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_hasValue(false), m_error(err.value)
        {}

        constexpr Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(false), m_error(std::move(err.value))
        {}

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr void Value() const noexcept { TROVE_ASSERT(m_hasValue, "Called Value() on Result containing error"); }

        constexpr E& Error() & noexcept
        {
            TROVE_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr const E& Error() const& noexcept
        {
            TROVE_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

    private:
        bool m_hasValue;
        E m_error;
    };

    template<typename T, typename E>
    [[nodiscard]] bool operator==(const Result<T, E>& lhs, const ErrorValue<E>& rhs)
    {
        return !lhs.HasValue() && lhs.Error() == rhs.value;
    }

    template<typename T, typename E>
    [[nodiscard]] bool operator!=(const Result<T, E>& lhs, const ErrorValue<E>& rhs)
    {
        return !(lhs == rhs);
    }

    inline Result<void, Error> Ok() noexcept
    {
        return Result<void, Error>();
    }
}
