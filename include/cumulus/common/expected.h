#pragma once

#include <cumulus/common/expected_forward.h>
#include <cumulus/common/unexpected.h>

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

namespace cumulus
{
namespace common
{

template<typename T>
struct IsExpected: std::false_type
{}; // IsExpected<T>

template<typename E, typename T>
struct IsExpected<Expected<E, T>>: std::true_type
{}; // IsExpected<Expected<E, T>>

// Holds either a value of type T or an error of type E.
//
// A default constructed instance holds a default constructed error.
template<typename E, typename T>
class Expected
{
    template<typename F, typename U>
    friend class Expected;

    using Storage = std::variant<E, T>;

    // Can U be used to initialize our value?
    template<typename U>
    static constexpr bool IsValueV =
        !IsExpectedV<std::decay_t<U>>
        && !IsUnexpectedV<std::decay_t<U>>
        && std::is_constructible_v<T, U>;

    // Rewrap whatever other holds.
    template<typename Other>
    static Storage convert(Other&& other)
    {
        return std::visit([](auto&& value) {
            return Storage(std::forward<decltype(value)>(value));
        }, std::forward<Other>(other).mStorage);
    }

    Storage mStorage;

public:
    Expected() = default;

    Expected(const Expected& other) = default;

    Expected(Expected&& other) = default;

    template<typename F, typename U>
    Expected(Expected<F, U>&& other)
      : mStorage(convert(std::move(other)))
    {
    }

    template<typename F, typename U>
    Expected(const Expected<F, U>& other)
      : mStorage(convert(other))
    {
    }

    template<typename F>
    Expected(Unexpected<F> other)
      : mStorage(std::in_place_index<0>, std::move(other).value())
    {
    }

    template<typename U, std::enable_if_t<IsValueV<U>>* = nullptr>
    Expected(U&& value)
      : mStorage(std::in_place_index<1>, std::forward<U>(value))
    {
    }

    Expected& operator=(const Expected& rhs) = default;

    Expected& operator=(Expected&& rhs) = default;

    template<typename F>
    Expected& operator=(Unexpected<F> rhs)
    {
        mStorage.template emplace<0>(std::move(rhs).value());

        return *this;
    }

    template<typename U, std::enable_if_t<IsValueV<U>>* = nullptr>
    Expected& operator=(U&& rhs)
    {
        mStorage.template emplace<1>(std::forward<U>(rhs));

        return *this;
    }

    operator bool() const
    {
        return hasValue();
    }

    bool operator!() const
    {
        return hasError();
    }

    template<typename F>
    bool operator==(const Unexpected<F>& rhs) const
    {
        return hasError() && error() == rhs.value();
    }

    template<typename U, std::enable_if_t<IsValueV<const U&>>* = nullptr>
    bool operator==(const U& rhs) const
    {
        return hasValue() && value() == rhs;
    }

    T* operator->()
    {
        return &value();
    }

    const T* operator->() const
    {
        return &value();
    }

    T& operator*() &
    {
        return value();
    }

    const T& operator*() const&
    {
        return value();
    }

    T&& operator*() &&
    {
        return std::move(*this).value();
    }

    bool hasError() const
    {
        return mStorage.index() == 0;
    }

    bool hasValue() const
    {
        return mStorage.index() == 1;
    }

    E& error() &
    {
        assert(hasError());

        return std::get<0>(mStorage);
    }

    const E& error() const&
    {
        assert(hasError());

        return std::get<0>(mStorage);
    }

    E&& error() &&
    {
        assert(hasError());

        return std::get<0>(std::move(mStorage));
    }

    // Our error or defaultError if we hold a value.
    E errorOr(E defaultError) const
    {
        return hasError() ? error() : std::move(defaultError);
    }

    T& value() &
    {
        assert(hasValue());

        return std::get<1>(mStorage);
    }

    const T& value() const&
    {
        assert(hasValue());

        return std::get<1>(mStorage);
    }

    T&& value() &&
    {
        assert(hasValue());

        return std::get<1>(std::move(mStorage));
    }

    // Our value or defaultValue if we hold an error.
    T valueOr(T defaultValue) const
    {
        return hasValue() ? value() : std::move(defaultValue);
    }
}; // Expected<E, T>

} // common
} // cumulus
