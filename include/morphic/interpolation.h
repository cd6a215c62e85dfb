#pragma once

// The interpolation engine blends two states field by field.  Contours are blended vertex by vertex, colours in LAB
// space, angle fields along the shortest arc, numbers linearly and everything else is stepped at the midpoint.

#include <morphic/state.h>
#include <morphic/interpolators.h>

namespace mx {

// Caller-owned scratch space for contour interpolation.  Points are overwritten in place and the lists are grown when
// too small, never shrunk.  The engine does not retain the buffer after a call returns.

struct VertexBuffer {
   std::vector<POINT<double>> outer;
   std::vector<std::vector<POINT<double>>> holes;
};

class InterpolationEngine {
   public:
      EasingResolver resolver;

      InterpolationEngine() = default;
      InterpolationEngine(EasingResolver Resolver) : resolver(std::move(Resolver)) { }

      ERR interpolate_value(const State &StateA, const State &StateB, std::string_view Field,
         const FieldValue &ValueA, const FieldValue &ValueB, double EasedT, FieldValue &Result,
         VertexBuffer *Buffer = nullptr) const;

      ERR create_eased_state(const State &Start, const State &End, double Time, std::unique_ptr<State> &Result,
         const EASING_MAP *SegmentOverrides = nullptr, const FIELDS *KeystateFields = nullptr,
         VertexBuffer *Buffer = nullptr) const;
};

extern ERR interpolate_contours(const VertexContours &Start, const VertexContours &End, bool StartClosed,
   bool EndClosed, double Time, VertexContours &Result, VertexBuffer *Buffer = nullptr);

} // namespace
