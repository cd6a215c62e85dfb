/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

*********************************************************************************************************************/

#include <morphic/interpolators.h>

namespace mx {

static double wrap_degrees(double Angle)
{
   double result = std::fmod(Angle, 360.0);
   if (result < 0) result += 360.0;
   return result;
}

/*********************************************************************************************************************

-FUNCTION-
angle: Interpolates between two angles along the shortest arc.

Both angles are normalised to the range 0 - 360 before the difference is folded into -180 to 180, and the result is
normalised to 0 - 360 again.  Interpolating from 350 to 10 at 0.5 produces 0 rather than 180.  A Time of exactly 0 or 1
returns Start or End unmodified.

-INPUT-
double Start: Start angle in degrees.
double End: End angle in degrees.
double Time: Interpolation position.

-RESULT-
double: The interpolated angle in degrees.

*********************************************************************************************************************/

double angle(double Start, double End, double Time)
{
   if (Time IS 0.0) return Start;
   else if (Time IS 1.0) return End;

   double s = wrap_degrees(Start);
   double e = wrap_degrees(End);
   double diff = e - s;
   if (diff > 180.0) diff -= 360.0;
   else if (diff < -180.0) diff += 360.0;
   return wrap_degrees(s + diff * Time);
}

//********************************************************************************************************************
// Midpoint of two angles computed from the mean of their unit vectors.  Result is in degrees, 0 - 360.

double circular_midpoint(double Angle1, double Angle2)
{
   double xm = (std::cos(Angle1 * DEG2RAD) + std::cos(Angle2 * DEG2RAD)) * 0.5;
   double ym = (std::sin(Angle1 * DEG2RAD) + std::sin(Angle2 * DEG2RAD)) * 0.5;
   return wrap_degrees(std::atan2(ym, xm) * RAD2DEG);
}

/*********************************************************************************************************************

-FUNCTION-
inbetween: Generates evenly spaced values between two end points.

The end points are excluded from the result, e.g. `inbetween(0, 10, 4)` produces `2, 4, 6, 8`.  A Count of zero
produces an empty list.

-ERRORS-
Okay
InvalidValue: Count is negative.

*********************************************************************************************************************/

ERR inbetween(double Start, double End, int Count, std::vector<double> &Result)
{
   Log log(__FUNCTION__);

   Result.clear();
   if (Count < 0) {
      log.warning("Count must be non-negative, got %d", Count);
      return ERR::InvalidValue;
   }

   if (!Count) return ERR::Okay;

   double step = (End - Start) / double(Count + 1);
   Result.reserve(Count);
   for (int i=0; i < Count; i++) Result.push_back(Start + step * double(i + 1));
   return ERR::Okay;
}

} // namespace
