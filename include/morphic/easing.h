#pragma once

// Easing functions map linear progress in [0, 1] to eased progress.  Inputs outside [0, 1] are clamped.  Back and
// elastic curves overshoot, so their output is not bounded to [0, 1].

#include <map>
#include <string>
#include <string_view>
#include <morphic/main.hpp>

namespace mx {

class State;

typedef double (*EASING)(double);
typedef std::map<std::string, EASING, std::less<>> EASING_MAP;

namespace ease {
   extern double linear(double);
   extern double step(double);
   extern double none(double);
   extern double in_out(double);

   extern double in_quad(double);
   extern double out_quad(double);
   extern double in_out_quad(double);
   extern double in_cubic(double);
   extern double out_cubic(double);
   extern double in_out_cubic(double);
   extern double in_quart(double);
   extern double out_quart(double);
   extern double in_out_quart(double);
   extern double in_quint(double);
   extern double out_quint(double);
   extern double in_out_quint(double);
   extern double in_sine(double);
   extern double out_sine(double);
   extern double in_out_sine(double);
   extern double in_expo(double);
   extern double out_expo(double);
   extern double in_out_expo(double);
   extern double in_circ(double);
   extern double out_circ(double);
   extern double in_out_circ(double);
   extern double in_back(double);
   extern double out_back(double);
   extern double in_out_back(double);
   extern double in_elastic(double);
   extern double out_elastic(double);
   extern double in_out_elastic(double);
   extern double in_bounce(double);
   extern double out_bounce(double);
   extern double in_out_bounce(double);
}

// Returns the easing function registered under Name, or nullptr if the name is unknown.

extern EASING get_easing(std::string_view Name);

//********************************************************************************************************************
// Chooses the easing for a field.  Priority, highest first: segment override, instance override, the state's default
// easing, linear.

class EasingResolver {
   public:
      EASING_MAP property_easing;

      EasingResolver() = default;
      EasingResolver(EASING_MAP PropertyEasing) : property_easing(std::move(PropertyEasing)) { }

      EASING resolve(const State &Source, std::string_view Field, const EASING_MAP *SegmentOverrides = nullptr) const;

      // For per-property timelines.  The segment level does not apply and Source may be null.

      EASING resolve_timeline(const State *Source, std::string_view Field) const;
};

} // namespace
