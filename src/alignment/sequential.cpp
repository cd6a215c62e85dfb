/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

*********************************************************************************************************************/

#include <algorithm>
#include <morphic/alignment.h>

namespace mx {

static double total_distance(const VERTICES &Verts1, const VERTICES &Verts2)
{
   double total = 0;
   for (size_t i=0; i < Verts1.size(); i++) total += Verts1[i].distance(Verts2[i]);
   return total;
}

//********************************************************************************************************************
// Open shapes have a natural start and end, so the only choice is the direction of the second list.  The reversed
// order is kept only if it is strictly closer.

ERR SequentialAligner::align(VERTICES &Verts1, VERTICES &Verts2, const AlignmentContext &, std::optional<double>)
{
   Log log("SequentialAligner");

   if (Verts1.size() != Verts2.size()) {
      log.warning("Vertex lists must have the same length: %d != %d", int(Verts1.size()), int(Verts2.size()));
      return ERR::LengthMismatch;
   }

   VERTICES reversed(Verts2.rbegin(), Verts2.rend());
   if (total_distance(Verts1, reversed) < total_distance(Verts1, Verts2)) {
      log.trace("Reversing the second vertex list.");
      Verts2 = std::move(reversed);
   }
   return ERR::Okay;
}

} // namespace
