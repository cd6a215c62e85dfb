#pragma once

// Vertex geometry model.  A VertexLoop is an ordered point sequence with a closure flag; VertexContours is an outer
// loop with optional holes.  Loops own their vertices by value so that working copies are cheap to take.

#include <vector>
#include <morphic/main.hpp>

namespace mx {

typedef std::vector<POINT<double>> VERTICES;

struct BOUNDS {
   double min_x, min_y, max_x, max_y;
};

//********************************************************************************************************************

class VertexLoop {
public:
   VERTICES vertices;
   bool closed = true;

   VertexLoop() = default;
   VertexLoop(VERTICES Vertices, bool Closed = true) : vertices(std::move(Vertices)), closed(Closed) { }

   // Checked constructor; rejects an empty vertex list with ERR::NoData.

   static ERR create(VERTICES Vertices, bool Closed, VertexLoop &Result);

   inline size_t size() const { return vertices.size(); }
   inline bool empty() const { return vertices.empty(); }
   inline POINT<double> & operator[](size_t Index) { return vertices[Index]; }
   inline const POINT<double> & operator[](size_t Index) const { return vertices[Index]; }

   bool operator==(const VertexLoop &Other) const {
      return (closed IS Other.closed) and (vertices IS Other.vertices);
   }

   POINT<double> centroid() const;
   double signed_area() const;
   double area() const { return std::abs(signed_area()); }
   BOUNDS bounds() const;
   bool is_clockwise() const { return signed_area() < 0; }

   VertexLoop reversed() const;
   VertexLoop & reverse();
   VertexLoop & translate(double DX, double DY);
   VertexLoop & scale(double SX, double SY);
   VertexLoop & scale(double Scale) { return scale(Scale, Scale); }
   VertexLoop & rotate(double Degrees, POINT<double> Centre = POINT<double>());
};

typedef std::vector<VertexLoop> LOOPS;

//********************************************************************************************************************

class VertexContours {
public:
   VertexLoop outer;
   LOOPS holes;

   VertexContours() = default;
   VertexContours(VertexLoop Outer, LOOPS Holes = LOOPS()) : outer(std::move(Outer)), holes(std::move(Holes)) { }

   // Checked constructor; holes require a closed outer loop and every hole must be closed.

   static ERR create(VertexLoop Outer, LOOPS Holes, VertexContours &Result);
   static VertexContours from_single_loop(VERTICES Vertices, bool Closed = true);
   static ERR from_vertex_lists(VERTICES Outer, const std::vector<VERTICES> &Holes, VertexContours &Result);

   bool operator==(const VertexContours &Other) const {
      return (outer IS Other.outer) and (holes IS Other.holes);
   }

   inline bool has_holes() const { return !holes.empty(); }
   inline size_t num_holes() const { return holes.size(); }

   LOOPS all_loops() const;
   size_t total_vertices() const;
   BOUNDS bounds() const { return outer.bounds(); }
   POINT<double> centroid() const { return outer.centroid(); }

   VertexContours & translate(double DX, double DY);
   VertexContours & scale(double SX, double SY);
   VertexContours & scale(double Scale) { return scale(Scale, Scale); }
   VertexContours & rotate(double Degrees, POINT<double> Centre = POINT<double>());
};

//********************************************************************************************************************
// Vertex utilities.  Angles are in radians unless stated otherwise.

extern POINT<double> centroid(const VERTICES &Vertices);
extern double angle_from_centroid(POINT<double> Vertex, POINT<double> Centroid);
extern double angle_distance(double Angle1, double Angle2);
extern void rotate_vertices(VERTICES &Vertices, double Degrees);
extern void rotate_list(VERTICES &Vertices, size_t Offset);

} // namespace
