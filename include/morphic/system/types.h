#pragma once

//  types.h
//
//  Basic types shared by all Morphic modules.

#include <type_traits>
#include <cstdint>
#include <cmath>

#ifndef IS
#define IS ==
#endif

typedef const char * CSTRING;

#ifndef DEFINE_ENUM_FLAG_OPERATORS
#define DEFINE_ENUM_FLAG_OPERATORS(ENUMTYPE) \
constexpr ENUMTYPE operator | (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(std::underlying_type_t<ENUMTYPE>(a) | std::underlying_type_t<ENUMTYPE>(b)); } \
constexpr ENUMTYPE operator & (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(std::underlying_type_t<ENUMTYPE>(a) & std::underlying_type_t<ENUMTYPE>(b)); } \
constexpr ENUMTYPE operator ~ (ENUMTYPE a) { return ENUMTYPE(~std::underlying_type_t<ENUMTYPE>(a)); } \
constexpr ENUMTYPE &operator |= (ENUMTYPE &a, ENUMTYPE b) { a = a | b; return a; } \
constexpr ENUMTYPE &operator &= (ENUMTYPE &a, ENUMTYPE b) { a = a & b; return a; }
#endif

namespace mx {

static const double DEG2RAD = 0.01745329251994329576923690768489;  // Multiply any angle by this value to convert to radians
static const double RAD2DEG = 57.295779513082320876798154814105;

//********************************************************************************************************************
// Mutable 2D coordinate.  Interpolation writes into existing points via ilerp() so that reusable buffers never need
// to allocate.

template <class T = double> struct POINT {
   T x, y;

   constexpr POINT() : x(0), y(0) { }
   constexpr POINT(T X, T Y) : x(X), y(Y) { }

   inline bool operator==(const POINT &Other) const { return (x IS Other.x) and (y IS Other.y); }
   inline bool operator!=(const POINT &Other) const { return (x != Other.x) or (y != Other.y); }

   inline POINT operator+(const POINT &Other) const { return POINT(x + Other.x, y + Other.y); }
   inline POINT operator-(const POINT &Other) const { return POINT(x - Other.x, y - Other.y); }
   inline POINT operator*(T Scale) const { return POINT(x * Scale, y * Scale); }
   inline POINT operator/(T Scale) const { return POINT(x / Scale, y / Scale); }

   inline POINT & operator+=(const POINT &Other) { x += Other.x; y += Other.y; return *this; }
   inline POINT & operator-=(const POINT &Other) { x -= Other.x; y -= Other.y; return *this; }

   inline double distance(const POINT &Other) const { return std::hypot(Other.x - x, Other.y - y); }

   // In-place linear interpolation between A and B.  The result is written to this point.

   inline void ilerp(const POINT &A, const POINT &B, double Time) {
      x = std::lerp(A.x, B.x, Time);
      y = std::lerp(A.y, B.y, Time);
   }
};

} // namespace
