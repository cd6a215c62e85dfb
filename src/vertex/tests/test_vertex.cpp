#include <morphic/vertex.h>
#include <numbers>
#include "test_context.h"

using namespace mx;

static VERTICES unit_square() {
   return VERTICES { { 0, 0 }, { 10, 0 }, { 10, 10 }, { 0, 10 } };
}

void test_point_operations(TestContext &Context) {
   POINT<double> a(1, 2), b(4, 6);
   Context.expect_near(a.distance(b), 5.0, 1e-12, "Distance is Euclidean");
   Context.expect_true((a + b) IS POINT<double>(5, 8), "Addition");
   Context.expect_true((b - a) IS POINT<double>(3, 4), "Subtraction");
   Context.expect_true((a * 2.0) IS POINT<double>(2, 4), "Scalar multiplication");
   Context.expect_true((b / 2.0) IS POINT<double>(2, 3), "Scalar division");

   POINT<double> out(99, 99);
   out.ilerp(a, b, 0.5);
   Context.expect_near(out.x, 2.5, 1e-12, "ilerp writes x in place");
   Context.expect_near(out.y, 4.0, 1e-12, "ilerp writes y in place");
}

void test_loop_creation(TestContext &Context) {
   VertexLoop loop;
   Context.expect_error(VertexLoop::create(VERTICES(), true, loop), ERR::NoData, "Empty vertex lists are rejected");
   Context.expect_ok(VertexLoop::create(unit_square(), false, loop), "Valid loops are created");
   Context.expect_equal(loop.size(), std::size_t(4), "Vertex count is retained");
   Context.expect_false(loop.closed, "Closure flag is retained");
}

void test_loop_geometry(TestContext &Context) {
   VertexLoop square(unit_square(), true);
   auto c = square.centroid();
   Context.expect_near(c.x, 5.0, 1e-9, "Square centroid x");
   Context.expect_near(c.y, 5.0, 1e-9, "Square centroid y");
   Context.expect_near(square.signed_area(), 100.0, 1e-9, "Counter-clockwise area is positive");
   Context.expect_false(square.is_clockwise(), "Counter-clockwise winding");
   Context.expect_true(square.reversed().is_clockwise(), "Reversed winding is clockwise");
   Context.expect_near(square.reversed().area(), 100.0, 1e-9, "Area is unsigned");

   // An L-shaped polygon: the area-weighted centroid differs from the vertex mean.

   VertexLoop ell(VERTICES { { 0, 0 }, { 20, 0 }, { 20, 10 }, { 10, 10 }, { 10, 20 }, { 0, 20 } }, true);
   auto poly = ell.centroid();
   auto mean = centroid(ell.vertices);
   Context.expect_near(poly.x, 25.0 / 3.0, 1e-9, "Polygon centroid x");
   Context.expect_near(poly.y, 25.0 / 3.0, 1e-9, "Polygon centroid y");
   Context.expect_near(mean.x, 10.0, 1e-9, "Vertex mean x");

   VertexLoop open(ell.vertices, false);
   Context.expect_near(open.centroid().x, 10.0, 1e-9, "Open loops use the vertex mean");
   Context.expect_near(open.signed_area(), 0.0, 1e-12, "Open loops have no area");

   VertexLoop flat(VERTICES { { 0, 0 }, { 5, 0 }, { 10, 0 } }, true);
   Context.expect_near(flat.centroid().x, 5.0, 1e-9, "Degenerate loops fall back to the mean");

   auto b = ell.bounds();
   Context.expect_near(b.max_x, 20.0, 1e-12, "Bounds max x");
   Context.expect_near(b.min_y, 0.0, 1e-12, "Bounds min y");
}

void test_loop_transforms(TestContext &Context) {
   VertexLoop loop(unit_square(), true);
   loop.translate(5, -5).scale(2);
   Context.expect_near(loop[1].x, 30.0, 1e-12, "Translate then scale x");
   Context.expect_near(loop[1].y, -10.0, 1e-12, "Translate then scale y");

   VertexLoop point(VERTICES { { 10, 0 } }, true);
   point.rotate(90);
   Context.expect_near(point[0].x, 0.0, 1e-9, "Rotation by 90 degrees x");
   Context.expect_near(point[0].y, 10.0, 1e-9, "Rotation by 90 degrees y");

   point.rotate(180, POINT<double>(0, 5));
   Context.expect_near(point[0].y, 0.0, 1e-9, "Rotation about a centre");

   VertexLoop rev(unit_square(), true);
   rev.reverse();
   Context.expect_true(rev[0] IS POINT<double>(0, 10), "In-place reversal");
}

void test_contours(TestContext &Context) {
   VertexContours contours;
   Context.expect_error(VertexContours::create(VertexLoop(unit_square(), false), LOOPS { VertexLoop(unit_square(), true) }, contours),
      ERR::InvalidValue, "Holes require a closed outer loop");
   Context.expect_error(VertexContours::create(VertexLoop(unit_square(), true), LOOPS { VertexLoop(unit_square(), false) }, contours),
      ERR::InvalidValue, "Holes must be closed");

   VERTICES hole { { 2, 2 }, { 4, 2 }, { 4, 4 } };
   Context.expect_ok(VertexContours::from_vertex_lists(unit_square(), { hole, hole }, contours), "Contours from vertex lists");
   Context.expect_equal(contours.num_holes(), std::size_t(2), "Hole count");
   Context.expect_true(contours.has_holes(), "has_holes()");
   Context.expect_equal(contours.total_vertices(), std::size_t(10), "Total vertices include holes");
   Context.expect_equal(contours.all_loops().size(), std::size_t(3), "all_loops() lists the outer loop first");
   Context.expect_error(VertexContours::from_vertex_lists(unit_square(), { VERTICES() }, contours), ERR::NoData,
      "Empty hole lists are rejected");

   auto single = VertexContours::from_single_loop(unit_square(), false);
   Context.expect_false(single.outer.closed, "Single loop closure");
   Context.expect_false(single.has_holes(), "Single loop has no holes");

   VertexContours moved;
   Context.expect_ok(VertexContours::from_vertex_lists(unit_square(), { hole }, moved), "Contours for translation");
   moved.translate(1, 1);
   Context.expect_true(moved.holes[0][0] IS POINT<double>(3, 3), "Translation applies to holes");
}

void test_utilities(TestContext &Context) {
   const POINT<double> origin(0, 0);
   Context.expect_near(angle_from_centroid(POINT<double>(0, -1), origin), 0.0, 1e-12, "Up is angle zero");
   Context.expect_near(angle_from_centroid(POINT<double>(1, 0), origin), std::numbers::pi / 2, 1e-12, "Right is a quarter turn");
   Context.expect_near(angle_from_centroid(POINT<double>(-1, 0), origin), 3 * std::numbers::pi / 2, 1e-12, "Angles are positive");

   Context.expect_near(angle_distance(0.1, 2 * std::numbers::pi - 0.1), 0.2, 1e-12, "Distance wraps around");
   Context.expect_near(angle_distance(0, std::numbers::pi), std::numbers::pi, 1e-12, "Maximum distance is PI");

   VERTICES list { { 0, 0 }, { 1, 0 }, { 2, 0 }, { 3, 0 } };
   rotate_list(list, 5);
   Context.expect_true(list[0] IS POINT<double>(1, 0), "rotate_list wraps the offset");
   Context.expect_true(list[3] IS POINT<double>(0, 0), "rotate_list is a left rotation");

   VERTICES rotated { { 1, 0 } };
   rotate_vertices(rotated, 180);
   Context.expect_near(rotated[0].x, -1.0, 1e-12, "rotate_vertices about the origin");
}

int main() {
   TestContext test_context;
   test_point_operations(test_context);
   test_loop_creation(test_context);
   test_loop_geometry(test_context);
   test_loop_transforms(test_context);
   test_contours(test_context);
   test_utilities(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
