#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include <aiomega/common/expected_forward.h>
#include <aiomega/common/unexpected.h>

namespace aiomega
{
namespace common
{

template<typename T>
constexpr bool IsExpectedV = false;

template<typename E, typename T>
constexpr bool IsExpectedV<Expected<E, T>> = true;

// Holds either a value of type T or an error of type E.
//
// A default constructed E must describe success.
template<typename E, typename T>
class Expected
{
    static_assert(!IsExpectedV<T>, "Expected can't hold another Expected");
    static_assert(!IsUnexpectedV<T>, "Expected can't hold an Unexpected");

    // Can a U be used to initialize our value?
    template<typename U>
    static constexpr bool IsValueV =
      !IsExpectedV<std::decay_t<U>>
      && !IsUnexpectedV<std::decay_t<U>>
      && std::is_constructible_v<T, U>;

    std::variant<E, T> mState;

public:
    template<typename F>
    Expected(Unexpected<F> error)
      : mState(std::in_place_index<0>, std::move(error).error())
    {
    }

    template<typename U, typename = std::enable_if_t<IsValueV<U>>>
    Expected(U&& value)
      : mState(std::in_place_index<1>, std::forward<U>(value))
    {
    }

    Expected(const Expected& other) = default;

    Expected(Expected&& other) = default;

    Expected& operator=(const Expected& rhs) = default;

    Expected& operator=(Expected&& rhs) = default;

    explicit operator bool() const
    {
        return hasValue();
    }

    bool operator!() const
    {
        return hasError();
    }

    T& operator*() &
    {
        return value();
    }

    T&& operator*() &&
    {
        return std::move(*this).value();
    }

    const T& operator*() const&
    {
        return value();
    }

    T* operator->()
    {
        return &value();
    }

    const T* operator->() const
    {
        return &value();
    }

    E& error() &
    {
        assert(hasError());

        return std::get<0>(mState);
    }

    E&& error() &&
    {
        assert(hasError());

        return std::get<0>(std::move(mState));
    }

    const E& error() const&
    {
        assert(hasError());

        return std::get<0>(mState);
    }

    bool hasError() const
    {
        return mState.index() == 0;
    }

    bool hasValue() const
    {
        return mState.index() == 1;
    }

    // Our error or a default constructed E if we hold a value.
    E status() const
    {
        if (hasError())
            return std::get<0>(mState);

        return E();
    }

    T& value() &
    {
        assert(hasValue());

        return std::get<1>(mState);
    }

    T&& value() &&
    {
        assert(hasValue());

        return std::get<1>(std::move(mState));
    }

    const T& value() const&
    {
        assert(hasValue());

        return std::get<1>(mState);
    }
}; // Expected<E, T>

} // common
} // aiomega

