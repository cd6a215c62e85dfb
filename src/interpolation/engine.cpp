/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
InterpolationEngine: Produces the in-between state of two keystates.

The engine walks the fields of the start state and blends each one with its counterpart in the end state.  The
blending strategy is chosen by the value type and field, the first match winning:

<list type="ordered">
<li>Contours are interpolated vertex by vertex (see interpolate_contours()).</li>
<li>Colours are interpolated in LAB space.</li>
<li>Angle fields follow the shortest arc around the circle.</li>
<li>Numbers are interpolated linearly.</li>
<li>All other values switch from start to end at the midpoint.</li>
</list>

The easing for each field is chosen by the engine's EasingResolver and applied to the time value before blending.

-END-

*********************************************************************************************************************/

#include <morphic/interpolation.h>

namespace mx {

//********************************************************************************************************************
// Blends two equal length point lists into Output.  If a scratch list is provided, the blend is computed in place
// within it and the scratch list grows as necessary.

static void lerp_points(const VERTICES &A, const VERTICES &B, double Time, VERTICES *Scratch, VERTICES &Output)
{
   const size_t n = A.size();
   if (Scratch) {
      while (Scratch->size() < n) Scratch->emplace_back();
      for (size_t i=0; i < n; i++) (*Scratch)[i].ilerp(A[i], B[i], Time);
      Output.assign(Scratch->begin(), Scratch->begin() + n);
   }
   else {
      Output.resize(n);
      for (size_t i=0; i < n; i++) Output[i].ilerp(A[i], B[i], Time);
   }
}

/*********************************************************************************************************************

-FUNCTION-
interpolate_contours: Blends two vertex contours.

The outer loops must have the same vertex count.  Each outer vertex is interpolated linearly; if both shapes are closed
and there is more than one vertex, the last vertex is then set equal to the first so that the outline stays closed.
The result is closed only if both shapes are closed.

If the number of holes differs, the hole list is stepped as a whole.  Otherwise each hole pair with matching vertex
counts is interpolated and closed, and pairs that differ are stepped individually.

A contour with an empty outer loop on either side results in a step between the two inputs.

-INPUT-
cpp(VertexContours) Start: The start contours.
cpp(VertexContours) End: The end contours.
bool StartClosed: Closure of the start shape.
bool EndClosed: Closure of the end shape.
double Time: Eased time value.
&cpp(VertexContours) Result: Receives the interpolated contours.
ptr(VertexBuffer) Buffer: Optional scratch space.

-ERRORS-
Okay
VertexCountMismatch: The outer loops differ in vertex count.

*********************************************************************************************************************/

ERR interpolate_contours(const VertexContours &Start, const VertexContours &End, bool StartClosed, bool EndClosed,
   double Time, VertexContours &Result, VertexBuffer *Buffer)
{
   Log log(__FUNCTION__);

   if ((Start.outer.empty()) or (End.outer.empty())) {
      log.warning("Cannot interpolate an empty contour; stepping instead.");
      Result = step(Start, End, Time);
      return ERR::Okay;
   }

   if (Start.outer.size() != End.outer.size()) {
      log.warning("Outer vertex counts differ: %d != %d", int(Start.outer.size()), int(End.outer.size()));
      return ERR::VertexCountMismatch;
   }

   VERTICES outer;
   lerp_points(Start.outer.vertices, End.outer.vertices, Time, Buffer ? &Buffer->outer : nullptr, outer);

   const bool closed = StartClosed and EndClosed;
   if ((closed) and (outer.size() > 1)) outer.back() = outer.front();

   LOOPS holes;
   if (Start.holes.size() != End.holes.size()) {
      log.warning("Hole counts differ (%d != %d); holes will switch at the midpoint.  Align the contours to map them.",
         int(Start.holes.size()), int(End.holes.size()));
      holes = step(Start.holes, End.holes, Time);
   }
   else {
      if (Buffer) {
         while (Buffer->holes.size() < Start.holes.size()) Buffer->holes.emplace_back();
      }

      holes.reserve(Start.holes.size());
      for (size_t i=0; i < Start.holes.size(); i++) {
         auto &h1 = Start.holes[i];
         auto &h2 = End.holes[i];
         if (h1.size() != h2.size()) {
            holes.push_back(step(h1, h2, Time));
            continue;
         }

         VERTICES verts;
         lerp_points(h1.vertices, h2.vertices, Time, Buffer ? &Buffer->holes[i] : nullptr, verts);
         if (verts.size() > 1) verts.back() = verts.front();
         holes.emplace_back(std::move(verts), true);
      }
   }

   Result = VertexContours(VertexLoop(std::move(outer), closed), std::move(holes));
   return ERR::Okay;
}

/*********************************************************************************************************************

-METHOD-
interpolate_value: Blends a single field value.

The strategy is selected by the types of the two values and by the field name (see the class description).  Values of
differing types are stepped.

-INPUT-
cpp(State) StateA: The state that ValueA belongs to.
cpp(State) StateB: The state that ValueB belongs to.
cpp(strview) Field: The field name.
cpp(FieldValue) ValueA: The start value.
cpp(FieldValue) ValueB: The end value.
double EasedT: The eased time value.
&cpp(FieldValue) Result: Receives the blended value.
ptr(VertexBuffer) Buffer: Optional scratch space for contours.

-ERRORS-
Okay
VertexCountMismatch: Contour values differ in outer vertex count.

*********************************************************************************************************************/

ERR InterpolationEngine::interpolate_value(const State &StateA, const State &StateB, std::string_view Field,
   const FieldValue &ValueA, const FieldValue &ValueB, double EasedT, FieldValue &Result, VertexBuffer *Buffer) const
{
   auto contours_a = std::get_if<VertexContours>(&ValueA);
   auto contours_b = std::get_if<VertexContours>(&ValueB);
   if ((contours_a) and (contours_b)) {
      VertexContours contours;
      if (auto error = interpolate_contours(*contours_a, *contours_b, StateA.closed(), StateB.closed(), EasedT, contours, Buffer); error != ERR::Okay) {
         return error;
      }
      Result = std::move(contours);
      return ERR::Okay;
   }

   auto colour_a = std::get_if<Colour>(&ValueA);
   auto colour_b = std::get_if<Colour>(&ValueB);
   if ((colour_a) and (colour_b)) {
      Result = colour_a->interpolate(*colour_b, EasedT);
      return ERR::Okay;
   }

   auto num_a = std::get_if<double>(&ValueA);
   auto num_b = std::get_if<double>(&ValueB);
   if ((num_a) and (num_b)) {
      if (StateA.is_angle(Field)) Result = angle(*num_a, *num_b, EasedT);
      else Result = lerp(*num_a, *num_b, EasedT);
      return ERR::Okay;
   }

   Result = step(ValueA, ValueB, EasedT);
   return ERR::Okay;
}

/*********************************************************************************************************************

-METHOD-
create_eased_state: Creates the state at Time between two keystates.

Every field of the start state is processed in order:

<list type="unordered">
<li>Fields named in KeystateFields are skipped; they are managed by per-property timelines.</li>
<li>Non-interpolatable fields switch at the midpoint of the raw time value.  If the end state lacks the field, the
start value is kept.</li>
<li>Fields that the end state lacks are skipped.</li>
<li>Identical values are copied through.</li>
<li>Otherwise the field's easing is resolved and the value is blended with interpolate_value().</li>
</list>

The result is a clone of the start state if Time is less than 0.5, otherwise a clone of the end state, with the
processed fields written over it.

-INPUT-
cpp(State) Start: The start keystate.
cpp(State) End: The end keystate.
double Time: Linear time between the two keystates.
&cpp(unique_ptr(State)) Result: Receives the new state.
ptr(cpp(EASING_MAP)) SegmentOverrides: Optional easing overrides for this segment.
ptr(cpp(FIELDS)) KeystateFields: Optional fields to leave untouched.
ptr(VertexBuffer) Buffer: Optional scratch space for contours.

-ERRORS-
Okay
VertexCountMismatch: A contour field differs in outer vertex count.

*********************************************************************************************************************/

ERR InterpolationEngine::create_eased_state(const State &Start, const State &End, double Time,
   std::unique_ptr<State> &Result, const EASING_MAP *SegmentOverrides, const FIELDS *KeystateFields,
   VertexBuffer *Buffer) const
{
   Log log(__FUNCTION__);

   std::vector<std::pair<std::string, FieldValue>> values;
   auto &fixed = Start.non_interpolatable();

   for (auto &name : Start.field_names()) {
      if ((KeystateFields) and (KeystateFields->contains(name))) continue;

      auto start_value = Start.get(name);
      if (!start_value) continue;

      auto end_value = End.get(name);

      if (fixed.contains(name)) {
         if ((Time < 0.5) or (!end_value)) values.emplace_back(name, *start_value);
         else values.emplace_back(name, *end_value);
         continue;
      }

      if (!end_value) continue;

      if (*start_value IS *end_value) {
         values.emplace_back(name, *start_value);
         continue;
      }

      auto easing = resolver.resolve(Start, name, SegmentOverrides);
      double eased_t = easing ? easing(Time) : Time;

      FieldValue blended;
      if (auto error = interpolate_value(Start, End, name, *start_value, *end_value, eased_t, blended, Buffer); error != ERR::Okay) {
         log.warning("Failed to interpolate field '%s': %s", name.c_str(), GetErrorMsg(error));
         return error;
      }
      values.emplace_back(name, std::move(blended));
   }

   auto result = (Time < 0.5) ? Start.clone() : End.clone();
   for (auto &[name, value] : values) {
      if (auto error = result->set(name, std::move(value)); error != ERR::Okay) return error;
   }

   Result = std::move(result);
   return ERR::Okay;
}

} // namespace
