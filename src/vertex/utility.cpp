/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

*********************************************************************************************************************/

#include <algorithm>
#include <numbers>
#include <morphic/vertex.h>

namespace mx {

/*********************************************************************************************************************

-FUNCTION-
centroid: Returns the mean position of a vertex list.

The origin is returned for an empty list.

*********************************************************************************************************************/

POINT<double> centroid(const VERTICES &Vertices)
{
   if (Vertices.empty()) return POINT<double>(0, 0);

   double sx = 0, sy = 0;
   for (auto &v : Vertices) {
      sx += v.x;
      sy += v.y;
   }
   return POINT<double>(sx / double(Vertices.size()), sy / double(Vertices.size()));
}

/*********************************************************************************************************************

-FUNCTION-
angle_from_centroid: Returns the angle of a vertex around a centre point.

Angles are measured clockwise from 'up' (negative Y in a Y-down coordinate system) and are returned in radians, in
the range 0 to 2PI.

-INPUT-
point Vertex: The vertex to measure.
point Centroid: The centre of rotation.

-RESULT-
double: Angle in radians.

*********************************************************************************************************************/

double angle_from_centroid(POINT<double> Vertex, POINT<double> Centroid)
{
   double angle = std::atan2(Vertex.x - Centroid.x, -(Vertex.y - Centroid.y));
   if (angle < 0) angle += 2.0 * std::numbers::pi;
   return angle;
}

//********************************************************************************************************************
// Shortest circular distance between two angles (radians).  The result is in the range 0 to PI.

double angle_distance(double Angle1, double Angle2)
{
   const double circle = 2.0 * std::numbers::pi;
   double diff = std::fmod(Angle2 - Angle1, circle);
   if (diff < 0) diff += circle;
   if (diff > std::numbers::pi) diff = circle - diff;
   return diff;
}

//********************************************************************************************************************
// Rotates vertices in place about the origin.

void rotate_vertices(VERTICES &Vertices, double Degrees)
{
   if (Degrees IS 0) return;

   const double cos_a = std::cos(Degrees * DEG2RAD);
   const double sin_a = std::sin(Degrees * DEG2RAD);
   for (auto &v : Vertices) {
      double x = v.x;
      v.x = x * cos_a - v.y * sin_a;
      v.y = x * sin_a + v.y * cos_a;
   }
}

//********************************************************************************************************************
// Left rotation in place, i.e. new[i] = old[(i + Offset) % n]

void rotate_list(VERTICES &Vertices, size_t Offset)
{
   if (Vertices.empty()) return;
   Offset %= Vertices.size();
   if (Offset IS 0) return;
   std::rotate(Vertices.begin(), Vertices.begin() + Offset, Vertices.end());
}

} // namespace
