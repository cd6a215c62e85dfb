/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
VertexLoop: An ordered sequence of vertices forming an open or closed path.

Closed loops connect the last vertex to the first.  The centroid of a closed loop is computed with the signed area
(polygon) formula, while open loops use the mean of their vertices.  Transforms are applied in place and return a
reference to the loop for chaining.

-END-

*********************************************************************************************************************/

#include <algorithm>
#include <morphic/vertex.h>

namespace mx {

//********************************************************************************************************************

ERR VertexLoop::create(VERTICES Vertices, bool Closed, VertexLoop &Result)
{
   Log log("VertexLoop");

   if (Vertices.empty()) {
      log.warning("A vertex loop requires at least one vertex.");
      return ERR::NoData;
   }

   Result.vertices = std::move(Vertices);
   Result.closed = Closed;
   return ERR::Okay;
}

//********************************************************************************************************************
// Degenerate closed loops (zero area) fall back to the vertex mean.

POINT<double> VertexLoop::centroid() const
{
   if (vertices.empty()) return POINT<double>(0, 0);
   if (!closed) return mx::centroid(vertices);

   double area = 0, cx = 0, cy = 0;
   auto n = vertices.size();
   for (size_t i=0; i < n; i++) {
      auto &v1 = vertices[i];
      auto &v2 = vertices[(i + 1) % n];
      double cross = v1.x * v2.y - v2.x * v1.y;
      area += cross;
      cx += (v1.x + v2.x) * cross;
      cy += (v1.y + v2.y) * cross;
   }

   if (std::abs(area) < 1e-10) return mx::centroid(vertices);

   area *= 0.5;
   return POINT<double>(cx / (6.0 * area), cy / (6.0 * area));
}

//********************************************************************************************************************
// Positive for counter-clockwise winding.  Open loops and loops of less than 3 vertices have no area.

double VertexLoop::signed_area() const
{
   if ((!closed) or (vertices.size() < 3)) return 0;

   double area = 0;
   auto n = vertices.size();
   for (size_t i=0; i < n; i++) {
      auto &v1 = vertices[i];
      auto &v2 = vertices[(i + 1) % n];
      area += v1.x * v2.y - v2.x * v1.y;
   }
   return area * 0.5;
}

//********************************************************************************************************************

BOUNDS VertexLoop::bounds() const
{
   if (vertices.empty()) return BOUNDS { 0, 0, 0, 0 };

   BOUNDS b = { vertices[0].x, vertices[0].y, vertices[0].x, vertices[0].y };
   for (auto &v : vertices) {
      if (v.x < b.min_x) b.min_x = v.x;
      if (v.y < b.min_y) b.min_y = v.y;
      if (v.x > b.max_x) b.max_x = v.x;
      if (v.y > b.max_y) b.max_y = v.y;
   }
   return b;
}

//********************************************************************************************************************

VertexLoop VertexLoop::reversed() const
{
   return VertexLoop(VERTICES(vertices.rbegin(), vertices.rend()), closed);
}

VertexLoop & VertexLoop::reverse()
{
   std::reverse(vertices.begin(), vertices.end());
   return *this;
}

VertexLoop & VertexLoop::translate(double DX, double DY)
{
   for (auto &v : vertices) {
      v.x += DX;
      v.y += DY;
   }
   return *this;
}

VertexLoop & VertexLoop::scale(double SX, double SY)
{
   for (auto &v : vertices) {
      v.x *= SX;
      v.y *= SY;
   }
   return *this;
}

//********************************************************************************************************************
// Positive angles rotate counter-clockwise in a Y-up coordinate system.

VertexLoop & VertexLoop::rotate(double Degrees, POINT<double> Centre)
{
   const double cos_a = std::cos(Degrees * DEG2RAD);
   const double sin_a = std::sin(Degrees * DEG2RAD);

   for (auto &v : vertices) {
      double dx = v.x - Centre.x;
      double dy = v.y - Centre.y;
      v.x = dx * cos_a - dy * sin_a + Centre.x;
      v.y = dx * sin_a + dy * cos_a + Centre.y;
   }
   return *this;
}

/*********************************************************************************************************************

-CLASS-
VertexContours: A shape defined by an outer loop and optional holes.

If any holes are present then the outer loop and every hole must be closed.  Hole order is significant for matching.
Bounds and centroid are derived from the outer loop only.

-END-

*********************************************************************************************************************/

ERR VertexContours::create(VertexLoop Outer, LOOPS Holes, VertexContours &Result)
{
   Log log("VertexContours");

   if ((!Outer.closed) and (!Holes.empty())) {
      log.warning("The outer loop must be closed if holes are defined.");
      return ERR::InvalidValue;
   }

   for (size_t i=0; i < Holes.size(); i++) {
      if (!Holes[i].closed) {
         log.warning("Hole %d must be closed.", int(i));
         return ERR::InvalidValue;
      }
   }

   Result.outer = std::move(Outer);
   Result.holes = std::move(Holes);
   return ERR::Okay;
}

//********************************************************************************************************************

VertexContours VertexContours::from_single_loop(VERTICES Vertices, bool Closed)
{
   return VertexContours(VertexLoop(std::move(Vertices), Closed));
}

//********************************************************************************************************************
// All loops produced by this function are closed.

ERR VertexContours::from_vertex_lists(VERTICES Outer, const std::vector<VERTICES> &Holes, VertexContours &Result)
{
   VertexLoop outer;
   if (auto error = VertexLoop::create(std::move(Outer), true, outer); error != ERR::Okay) return error;

   LOOPS holes;
   holes.reserve(Holes.size());
   for (auto &list : Holes) {
      auto &hole = holes.emplace_back();
      if (auto error = VertexLoop::create(list, true, hole); error != ERR::Okay) return error;
   }

   return create(std::move(outer), std::move(holes), Result);
}

//********************************************************************************************************************

LOOPS VertexContours::all_loops() const
{
   LOOPS loops;
   loops.reserve(holes.size() + 1);
   loops.push_back(outer);
   loops.insert(loops.end(), holes.begin(), holes.end());
   return loops;
}

size_t VertexContours::total_vertices() const
{
   size_t total = outer.size();
   for (auto &hole : holes) total += hole.size();
   return total;
}

//********************************************************************************************************************

VertexContours & VertexContours::translate(double DX, double DY)
{
   outer.translate(DX, DY);
   for (auto &hole : holes) hole.translate(DX, DY);
   return *this;
}

VertexContours & VertexContours::scale(double SX, double SY)
{
   outer.scale(SX, SY);
   for (auto &hole : holes) hole.scale(SX, SY);
   return *this;
}

VertexContours & VertexContours::rotate(double Degrees, POINT<double> Centre)
{
   outer.rotate(Degrees, Centre);
   for (auto &hole : holes) hole.rotate(Degrees, Centre);
   return *this;
}

} // namespace
