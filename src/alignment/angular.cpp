/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
AngularAligner: Aligns closed shapes by the angle of each vertex around its centroid.

Both lists are rotated to their world orientation (working copies only), then the angle of every vertex around the
mean centroid of its shape is computed.  Every cyclic offset of the second list is scored against the first using the
configured norm over the shortest circular angle differences.  The winning offset is applied to the caller's second
list; the first list is never modified.

-END-

*********************************************************************************************************************/

#include <limits>
#include <morphic/alignment.h>

namespace mx {

//********************************************************************************************************************

static double norm_distance(NORM Norm, const std::vector<double> &Angles1, const std::vector<double> &Angles2,
   size_t Offset)
{
   const size_t n = Angles1.size();
   double total = 0;
   for (size_t i=0; i < n; i++) {
      double d = angle_distance(Angles1[i], Angles2[(i + Offset) % n]);
      if (Norm IS NORM::L2) total += d * d;
      else if (Norm IS NORM::LINF) { if (d > total) total = d; }
      else total += d;
   }
   return (Norm IS NORM::L2) ? std::sqrt(total) : total;
}

//********************************************************************************************************************

ERR AngularAligner::align(VERTICES &Verts1, VERTICES &Verts2, const AlignmentContext &Context,
   std::optional<double> RotationTarget)
{
   Log log("AngularAligner");

   if ((norm IS NORM::CUSTOM) and (!custom)) {
      log.warning("The custom norm requires a distance function.");
      return ERR::NullArgs;
   }

   if (Verts1.size() != Verts2.size()) {
      log.warning("Vertex lists must have the same length: %d != %d", int(Verts1.size()), int(Verts2.size()));
      return ERR::LengthMismatch;
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

   auto c1 = centroid(*work1);
   auto c2 = centroid(*work2);

   std::vector<double> angles1, angles2;
   angles1.reserve(work1->size());
   angles2.reserve(work2->size());
   for (auto &v : *work1) angles1.push_back(angle_from_centroid(v, c1));
   for (auto &v : *work2) angles2.push_back(angle_from_centroid(v, c2));

   size_t best_offset = 0;
   double min_distance = std::numeric_limits<double>::infinity();
   for (size_t offset=0; offset < Verts2.size(); offset++) {
      double dist = (norm IS NORM::CUSTOM) ? custom(angles1, angles2, offset) : norm_distance(norm, angles1, angles2, offset);
      if (dist < min_distance) {
         min_distance = dist;
         best_offset = offset;
      }
   }

   log.trace("Best offset %d of %d, distance %.4f", int(best_offset), int(Verts2.size()), min_distance);

   rotate_list(Verts2, best_offset);
   return ERR::Okay;
}

} // namespace
