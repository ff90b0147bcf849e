#pragma once

#include <cumulus/common/unexpected_forward.h>

#include <type_traits>
#include <utility>

namespace cumulus
{
namespace common
{

template<typename T>
struct IsUnexpected: std::false_type
{}; // IsUnexpected<T>

template<typename T>
struct IsUnexpected<Unexpected<T>>: std::true_type
{}; // IsUnexpected<Unexpected<T>>

// Marks a value as an error when initializing an Expected.
template<typename T>
class Unexpected
{
    T mError;

public:
    explicit Unexpected(T error)
      : mError(std::move(error))
    {
    }

    T& value() &
    {
        return mError;
    }

    const T& value() const&
    {
        return mError;
    }

    T&& value() &&
    {
        return std::move(mError);
    }
}; // Unexpected<T>

template<typename T>
Unexpected<std::decay_t<T>> unexpected(T&& error)
{
    return Unexpected<std::decay_t<T>>(std::forward<T>(error));
}

} // common
} // cumulus
