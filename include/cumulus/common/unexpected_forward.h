#pragma once

#include <type_traits>

namespace cumulus
{
namespace common
{

template<typename T>
class Unexpected;

template<typename T>
struct IsUnexpected;

template<typename T>
constexpr auto IsUnexpectedV = IsUnexpected<T>::value;

template<typename T>
Unexpected<std::decay_t<T>> unexpected(T&& error);

} // common
} // cumulus
