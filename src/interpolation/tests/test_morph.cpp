// End to end morph of a circle into a rectangle: alignment, then eased interpolation over a sequence of frames.

#include <morphic/alignment.h>
#include <morphic/interpolation.h>
#include <numbers>
#include "test_context.h"

using namespace mx;

static const int VERTEX_COUNT = 64;

static VERTICES circle_outline(double CX, double CY, double Radius) {
   VERTICES result;
   for (int i=0; i < VERTEX_COUNT; i++) {
      double a = 2.0 * std::numbers::pi * i / VERTEX_COUNT;
      result.emplace_back(CX + Radius * std::cos(a), CY + Radius * std::sin(a));
   }
   return result;
}

// Evenly spaced points around the perimeter of a rectangle, counter-clockwise from the top-left corner.

static VERTICES rectangle_outline(double X, double Y, double Width, double Height) {
   const double perimeter = 2.0 * (Width + Height);
   VERTICES result;
   for (int i=0; i < VERTEX_COUNT; i++) {
      double d = perimeter * i / VERTEX_COUNT;
      if (d < Width) result.emplace_back(X + d, Y);
      else if (d < Width + Height) result.emplace_back(X + Width, Y + (d - Width));
      else if (d < 2.0 * Width + Height) result.emplace_back(X + Width - (d - Width - Height), Y + Height);
      else result.emplace_back(X, Y + Height - (d - 2.0 * Width - Height));
   }
   return result;
}

void test_circle_to_rectangle(TestContext &Context) {
   auto circle = VertexContours::from_single_loop(circle_outline(100, 100, 50));
   auto rectangle = VertexContours::from_single_loop(rectangle_outline(200, 50, 200, 100));

   AngularAligner aligner(NORM::L1);
   VertexContours aligned_circle, aligned_rectangle;
   Context.expect_ok(align_contours(circle, rectangle, AlignmentContext(), aligned_circle, aligned_rectangle, &aligner),
      "The shapes align");
   Context.expect_equal(aligned_rectangle.outer.size(), std::size_t(VERTEX_COUNT), "Alignment keeps every vertex");

   PropertyState start { { "path", aligned_circle }, { "fill", Colour(255, 0, 0) }, { "opacity", 1.0 } };
   PropertyState end { { "path", aligned_rectangle }, { "fill", Colour(0, 0, 255) }, { "opacity", 0.5 } };

   InterpolationEngine engine(EasingResolver(EASING_MAP { { "path", ease::linear } }));

   std::unique_ptr<State> frame;
   Context.expect_ok(engine.create_eased_state(start, end, 0.5, frame), "The midpoint frame is created");

   auto state = static_cast<PropertyState *>(frame.get());
   auto path = state->get_as<VertexContours>("path");
   if (!path) {
      Context.expect_true(false, "The midpoint frame has a path");
      return;
   }

   Context.expect_true(path->outer.closed, "The morphed outline is closed");
   Context.expect_equal(path->outer.size(), std::size_t(VERTEX_COUNT), "The morphed outline has every vertex");
   Context.expect_true(path->outer.vertices.back() IS path->outer.vertices.front(), "The first and last vertices meet");

   auto c = path->outer.centroid();
   auto c1 = circle.outer.centroid();
   auto c2 = rectangle.outer.centroid();
   Context.expect_true((c.x > c1.x) and (c.x < c2.x), "The centroid lies between the two shapes");
   Context.expect_near(c.y, 100.0, 5.0, "The centroid stays on the common axis");

   Context.expect_near(*state->get_as<double>("opacity"), 0.75, 1e-12, "Scalar fields morph alongside the path");
   Context.expect_true(*state->get_as<Colour>("fill") IS Colour(202, 0, 136), "Colour fields morph alongside the path");

   // Render a sequence of frames with a shared buffer; every frame must keep the vertex count and closure.

   VertexBuffer buffer;
   bool consistent = true;
   double previous_x = c1.x - 1.0;
   for (int i=0; i <= 10; i++) {
      double t = i / 10.0;
      if (engine.create_eased_state(start, end, t, frame, nullptr, nullptr, &buffer) != ERR::Okay) {
         consistent = false;
         break;
      }

      auto frame_path = static_cast<PropertyState *>(frame.get())->get_as<VertexContours>("path");
      if ((!frame_path) or (frame_path->outer.size() != std::size_t(VERTEX_COUNT)) or (!frame_path->outer.closed)) {
         consistent = false;
         break;
      }

      auto fc = centroid(frame_path->outer.vertices);
      if (fc.x <= previous_x) consistent = false;
      previous_x = fc.x;
   }

   Context.expect_true(consistent, "Every frame is closed, complete and moves towards the rectangle");
   Context.expect_equal(buffer.outer.size(), std::size_t(VERTEX_COUNT), "Frames share a single buffer");
}

int main() {
   TestContext test_context;
   test_circle_to_rectangle(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
