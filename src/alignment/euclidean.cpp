/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
EuclideanAligner: Aligns an open shape with a closed shape by straight line distance.

The open shape is held fixed while every cyclic offset of the closed shape is scored by the configured norm over the
distances between vertex `i` of the open shape and vertex `(i + offset) % n` of the closed shape, both in world
orientation.  This preserves the intuitive start-to-end correspondence of lines, which angular alignment does not.

After the closed list is reordered its last vertex is set equal to its first so that the outline remains closed.
The caller's argument order is preserved regardless of which shape is the open one.

-END-

*********************************************************************************************************************/

#include <limits>
#include <morphic/alignment.h>

namespace mx {

//********************************************************************************************************************

static double norm_distance(NORM Norm, const VERTICES &Open, const VERTICES &Closed, size_t Offset)
{
   const size_t n = Open.size();
   double total = 0;
   for (size_t i=0; i < n; i++) {
      auto &a = Open[i];
      auto &b = Closed[(i + Offset) % n];
      double sq = (a.x - b.x) * (a.x - b.x) + (a.y - b.y) * (a.y - b.y);
      if (Norm IS NORM::L2) total += sq;
      else if (Norm IS NORM::LINF) { double d = std::sqrt(sq); if (d > total) total = d; }
      else total += std::sqrt(sq);
   }
   return (Norm IS NORM::L2) ? std::sqrt(total) : total;
}

//********************************************************************************************************************

ERR EuclideanAligner::align(VERTICES &Verts1, VERTICES &Verts2, const AlignmentContext &Context,
   std::optional<double> RotationTarget)
{
   Log log("EuclideanAligner");

   if ((norm IS NORM::CUSTOM) and (!custom)) {
      log.warning("The custom norm requires a distance function.");
      return ERR::NullArgs;
   }

   if (Verts1.size() != Verts2.size()) {
      log.warning("Vertex lists must have the same length: %d != %d", int(Verts1.size()), int(Verts2.size()));
      return ERR::LengthMismatch;
   }

   if (Context.closed1 IS Context.closed2) {
      log.error("Called with %s shapes; this aligner is only for open <-> closed pairs.  Returning unaligned vertices.",
         Context.closed1 ? "both closed" : "both open");
      return ERR::Okay;
   }

   if (Verts1.empty()) return ERR::Okay;

   const double rot1 = Context.rotation1;
   const double rot2 = RotationTarget ? *RotationTarget : Context.rotation2;

   const VERTICES *work1 = &Verts1, *work2 = &Verts2;
   VERTICES rotated1, rotated2;
   if ((rot1 != 0) or (rot2 != 0)) {
      rotated1 = Verts1;
      rotated2 = Verts2;
      rotate_vertices(rotated1, rot1);
      rotate_vertices(rotated2, rot2);
      work1 = &rotated1;
      work2 = &rotated2;
   }

   const bool swap = Context.closed1; // True if the first shape is the closed one
   const VERTICES &open_work   = swap ? *work2 : *work1;
   const VERTICES &closed_work = swap ? *work1 : *work2;
   VERTICES &closed_result     = swap ? Verts1 : Verts2;

   size_t best_offset = 0;
   double min_distance = std::numeric_limits<double>::infinity();
   for (size_t offset=0; offset < closed_work.size(); offset++) {
      double dist = (norm IS NORM::CUSTOM) ? custom(open_work, closed_work, offset) : norm_distance(norm, open_work, closed_work, offset);
      if (dist < min_distance) {
         min_distance = dist;
         best_offset = offset;
      }
   }

   log.trace("Best offset %d of %d, distance %.4f", int(best_offset), int(closed_work.size()), min_distance);

   rotate_list(closed_result, best_offset);
   closed_result.back() = closed_result.front();
   return ERR::Okay;
}

} // namespace
