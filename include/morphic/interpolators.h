#pragma once

// Scalar interpolation primitives.  Time values outside of 0 - 1 extrapolate.

#include <cmath>
#include <vector>
#include <morphic/main.hpp>

namespace mx {

// Exact at both end points: a Time of 1 always returns End.

inline double lerp(double Start, double End, double Time) {
   return std::lerp(Start, End, Time);
}

// Discrete switch at the midpoint; Start is returned while Time < 0.5

template <class T> inline const T & step(const T &Start, const T &End, double Time) {
   return (Time < 0.5) ? Start : End;
}

extern double angle(double Start, double End, double Time);
extern double circular_midpoint(double Angle1, double Angle2);
extern ERR inbetween(double Start, double End, int Count, std::vector<double> &Result);

} // namespace
