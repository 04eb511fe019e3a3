#pragma once

#include <type_traits>
#include <utility>

#include <aiomega/common/unexpected_forward.h>

namespace aiomega
{
namespace common
{

// Marks a value as an error so that it can initialize an Expected.
template<typename E>
class Unexpected
{
    E mError;

public:
    explicit Unexpected(E error)
      : mError(std::move(error))
    {
    }

    E& error() &
    {
        return mError;
    }

    E&& error() &&
    {
        return std::move(mError);
    }

    const E& error() const&
    {
        return mError;
    }
}; // Unexpected<E>

template<typename T>
constexpr bool IsUnexpectedV = false;

template<typename E>
constexpr bool IsUnexpectedV<Unexpected<E>> = true;

template<typename E>
Unexpected<std::decay_t<E>> unexpected(E&& error)
{
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

} // common
} // aiomega

