#pragma once

namespace cumulus
{
namespace common
{

template<typename E, typename T>
class Expected;

template<typename T>
struct IsExpected;

template<typename T>
constexpr auto IsExpectedV = IsExpected<T>::value;

} // common
} // cumulus
