/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

*********************************************************************************************************************/

#include <morphic/alignment.h>
#include <morphic/mapping.h>

namespace mx {

/*********************************************************************************************************************

-FUNCTION-
align_contours: Prepares two contours for interpolation.

The outer loops are aligned with `Aligner`, or with the aligner that get_aligner() selects for the closure of the two
outer loops.  The holes are paired with `Mapper` (the configured mapper if null), after which every matched hole pair
of equal, non-zero length is aligned angularly around its own centroid with no rotation.  Pairs that differ in length
are passed through unchanged.

The outer loops keep their closure flags.  Aligned holes are always closed.

-INPUT-
cpp(VertexContours) Contours1: The start contours.
cpp(VertexContours) Contours2: The end contours.
cpp(AlignmentContext) Context: Rotation and closure of each shape.
&cpp(VertexContours) Result1: Receives the aligned start contours.
&cpp(VertexContours) Result2: Receives the aligned end contours.
ptr(VertexAligner) Aligner: Optional aligner for the outer loops.
ptr(LoopMapper) Mapper: Optional mapper for the holes.
cpp(optional(double)) RotationTarget: Optional rotation override for the second shape.

-ERRORS-
Okay
InvalidValue: A configured strategy name is invalid.
LengthMismatch: The outer loops differ in vertex count.
MissingDependency: The mapper requires a component that is not available.

*********************************************************************************************************************/

ERR align_contours(const VertexContours &Contours1, const VertexContours &Contours2, const AlignmentContext &Context,
   VertexContours &Result1, VertexContours &Result2, VertexAligner *Aligner, LoopMapper *Mapper,
   std::optional<double> RotationTarget)
{
   Log log(__FUNCTION__);

   std::unique_ptr<VertexAligner> auto_aligner;
   if (!Aligner) {
      if (auto error = get_aligner(Context.closed1, Context.closed2, "", auto_aligner); error != ERR::Okay) return error;
      Aligner = auto_aligner.get();
   }

   auto outer1 = Contours1.outer.vertices;
   auto outer2 = Contours2.outer.vertices;
   if (auto error = Aligner->align(outer1, outer2, Context, RotationTarget); error != ERR::Okay) return error;

   LOOPS holes1, holes2;
   if ((Contours1.has_holes()) or (Contours2.has_holes())) {
      std::unique_ptr<LoopMapper> auto_mapper;
      if (!Mapper) {
         if (auto error = get_loop_mapper("", auto_mapper); error != ERR::Okay) return error;
         Mapper = auto_mapper.get();
      }

      LOOPS matched1, matched2;
      if (auto error = Mapper->map(Contours1.holes, Contours2.holes, matched1, matched2); error != ERR::Okay) {
         return error;
      }

      log.trace("Mapped %d -> %d holes into %d pairs with the %s mapper.", int(Contours1.num_holes()),
         int(Contours2.num_holes()), int(matched1.size()), Mapper->name());

      const AlignmentContext hole_context { 0, 0, true, true };
      for (size_t i=0; i < matched1.size(); i++) {
         auto &h1 = matched1[i];
         auto &h2 = matched2[i];
         if ((h1.size() IS h2.size()) and (!h1.empty())) {
            AngularAligner aligner(NORM::L1);
            auto verts1 = h1.vertices;
            auto verts2 = h2.vertices;
            if (auto error = aligner.align(verts1, verts2, hole_context); error != ERR::Okay) return error;
            holes1.emplace_back(std::move(verts1), true);
            holes2.emplace_back(std::move(verts2), true);
         }
         else {
            holes1.push_back(h1);
            holes2.push_back(h2);
         }
      }
   }

   Result1 = VertexContours(VertexLoop(std::move(outer1), Contours1.outer.closed), std::move(holes1));
   Result2 = VertexContours(VertexLoop(std::move(outer2), Contours2.outer.closed), std::move(holes2));
   return ERR::Okay;
}

} // namespace
