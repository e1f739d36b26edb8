/*
 * Some basic helper functions
 */

#pragma once
#include <stddef.h>
#include <stdint.h>

// Just putting this here, so we don't need to include all of <algorithm>
template<class T>
inline constexpr const T& min(const T& a, const T& b)
{
  return a < b ? a : b;
}

// Rounds up, rather than performing truncating integer division.
// Assumes positive integers.
// roundUpDiv(9, 4) == 3
template<class T>
inline constexpr T roundUpDiv(const T& n, const T& d)
{
  return (n + d - 1) / d;
}

// Number of elements in a fixed-size array
template<class T, size_t N>
inline constexpr size_t countOf(const T (&)[N])
{
  return N;
}

// Could combine this macro with enum definition,
// but might lose some IDE autocompletion
#define ENUM_STRING(enumType, enumName) \
  case enumType::enumName: return #enumName;
