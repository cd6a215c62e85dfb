/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CATEGORY-
Name: Easing
-END-

Each easing function receives linear progress `t` and returns eased progress.  `t` is clamped to `[0, 1]` before
evaluation, so every function returns exactly its end points at 0 and 1 (`none` excepted, which always returns 0).
The curves follow the conventional Penner definitions.

*********************************************************************************************************************/

#include <algorithm>
#include <cmath>
#include <numbers>
#include <morphic/easing.h>

namespace mx {

static const double BACK_C1 = 1.70158;
static const double BACK_C2 = BACK_C1 * 1.525;
static const double BACK_C3 = BACK_C1 + 1.0;
static const double ELASTIC_C4 = (2.0 * std::numbers::pi) / 3.0;
static const double ELASTIC_C5 = (2.0 * std::numbers::pi) / 4.5;
static const double BOUNCE_N1 = 7.5625;
static const double BOUNCE_D1 = 2.75;

static inline double clamp01(double T) { return std::clamp(T, 0.0, 1.0); }

namespace ease {

double linear(double T) { return clamp01(T); }
double step(double T)   { return (clamp01(T) < 0.5) ? 0.0 : 1.0; }
double none(double)     { return 0; }

double in_out(double T) // Smoothstep
{
   T = clamp01(T);
   return T * T * (3.0 - 2.0 * T);
}

//********************************************************************************************************************
// Polynomial

double in_quad(double T)  { T = clamp01(T); return T * T; }
double out_quad(double T) { T = clamp01(T); return 1.0 - (1.0 - T) * (1.0 - T); }
double in_out_quad(double T)
{
   T = clamp01(T);
   return (T < 0.5) ? 2.0 * T * T : 1.0 - std::pow(-2.0 * T + 2.0, 2) / 2.0;
}

double in_cubic(double T)  { T = clamp01(T); return T * T * T; }
double out_cubic(double T) { T = clamp01(T); return 1.0 - std::pow(1.0 - T, 3); }
double in_out_cubic(double T)
{
   T = clamp01(T);
   return (T < 0.5) ? 4.0 * T * T * T : 1.0 - std::pow(-2.0 * T + 2.0, 3) / 2.0;
}

double in_quart(double T)  { T = clamp01(T); return T * T * T * T; }
double out_quart(double T) { T = clamp01(T); return 1.0 - std::pow(1.0 - T, 4); }
double in_out_quart(double T)
{
   T = clamp01(T);
   return (T < 0.5) ? 8.0 * T * T * T * T : 1.0 - std::pow(-2.0 * T + 2.0, 4) / 2.0;
}

double in_quint(double T)  { T = clamp01(T); return T * T * T * T * T; }
double out_quint(double T) { T = clamp01(T); return 1.0 - std::pow(1.0 - T, 5); }
double in_out_quint(double T)
{
   T = clamp01(T);
   return (T < 0.5) ? 16.0 * T * T * T * T * T : 1.0 - std::pow(-2.0 * T + 2.0, 5) / 2.0;
}

//********************************************************************************************************************
// Sine, exponential and circular

double in_sine(double T)     { T = clamp01(T); return 1.0 - std::cos((T * std::numbers::pi) / 2.0); }
double out_sine(double T)    { T = clamp01(T); return std::sin((T * std::numbers::pi) / 2.0); }
double in_out_sine(double T) { T = clamp01(T); return -(std::cos(std::numbers::pi * T) - 1.0) / 2.0; }

double in_expo(double T)
{
   T = clamp01(T);
   return (T IS 0) ? 0 : std::pow(2.0, 10.0 * T - 10.0);
}

double out_expo(double T)
{
   T = clamp01(T);
   return (T IS 1.0) ? 1.0 : 1.0 - std::pow(2.0, -10.0 * T);
}

double in_out_expo(double T)
{
   T = clamp01(T);
   if (T IS 0) return 0;
   if (T IS 1.0) return 1.0;
   if (T < 0.5) return std::pow(2.0, 20.0 * T - 10.0) / 2.0;
   return (2.0 - std::pow(2.0, -20.0 * T + 10.0)) / 2.0;
}

double in_circ(double T)  { T = clamp01(T); return 1.0 - std::sqrt(1.0 - T * T); }
double out_circ(double T) { T = clamp01(T); return std::sqrt(1.0 - (T - 1.0) * (T - 1.0)); }
double in_out_circ(double T)
{
   T = clamp01(T);
   if (T < 0.5) return (1.0 - std::sqrt(1.0 - std::pow(2.0 * T, 2))) / 2.0;
   return (std::sqrt(1.0 - std::pow(-2.0 * T + 2.0, 2)) + 1.0) / 2.0;
}

//********************************************************************************************************************
// Overshooting curves

double in_back(double T)
{
   T = clamp01(T);
   return BACK_C3 * T * T * T - BACK_C1 * T * T;
}

double out_back(double T)
{
   T = clamp01(T);
   return 1.0 + BACK_C3 * std::pow(T - 1.0, 3) + BACK_C1 * std::pow(T - 1.0, 2);
}

double in_out_back(double T)
{
   T = clamp01(T);
   if (T < 0.5) return (std::pow(2.0 * T, 2) * ((BACK_C2 + 1.0) * 2.0 * T - BACK_C2)) / 2.0;
   return (std::pow(2.0 * T - 2.0, 2) * ((BACK_C2 + 1.0) * (T * 2.0 - 2.0) + BACK_C2) + 2.0) / 2.0;
}

double in_elastic(double T)
{
   T = clamp01(T);
   if ((T IS 0) or (T IS 1.0)) return T;
   return -std::pow(2.0, 10.0 * T - 10.0) * std::sin((T * 10.0 - 10.75) * ELASTIC_C4);
}

double out_elastic(double T)
{
   T = clamp01(T);
   if ((T IS 0) or (T IS 1.0)) return T;
   return std::pow(2.0, -10.0 * T) * std::sin((T * 10.0 - 0.75) * ELASTIC_C4) + 1.0;
}

double in_out_elastic(double T)
{
   T = clamp01(T);
   if ((T IS 0) or (T IS 1.0)) return T;
   if (T < 0.5) return -(std::pow(2.0, 20.0 * T - 10.0) * std::sin((20.0 * T - 11.125) * ELASTIC_C5)) / 2.0;
   return (std::pow(2.0, -20.0 * T + 10.0) * std::sin((20.0 * T - 11.125) * ELASTIC_C5)) / 2.0 + 1.0;
}

double out_bounce(double T)
{
   T = clamp01(T);
   if (T < 1.0 / BOUNCE_D1) return BOUNCE_N1 * T * T;
   else if (T < 2.0 / BOUNCE_D1) {
      T -= 1.5 / BOUNCE_D1;
      return BOUNCE_N1 * T * T + 0.75;
   }
   else if (T < 2.5 / BOUNCE_D1) {
      T -= 2.25 / BOUNCE_D1;
      return BOUNCE_N1 * T * T + 0.9375;
   }
   else {
      T -= 2.625 / BOUNCE_D1;
      return BOUNCE_N1 * T * T + 0.984375;
   }
}

double in_bounce(double T) { return 1.0 - out_bounce(1.0 - clamp01(T)); }

double in_out_bounce(double T)
{
   T = clamp01(T);
   if (T < 0.5) return (1.0 - out_bounce(1.0 - 2.0 * T)) / 2.0;
   return (1.0 + out_bounce(2.0 * T - 1.0)) / 2.0;
}

} // namespace ease

//********************************************************************************************************************

static const struct {
   CSTRING Name;
   EASING Function;
} glEasings[] = {
   { "linear", ease::linear }, { "step", ease::step }, { "none", ease::none }, { "in_out", ease::in_out },
   { "in_quad", ease::in_quad }, { "out_quad", ease::out_quad }, { "in_out_quad", ease::in_out_quad },
   { "in_cubic", ease::in_cubic }, { "out_cubic", ease::out_cubic }, { "in_out_cubic", ease::in_out_cubic },
   { "in_quart", ease::in_quart }, { "out_quart", ease::out_quart }, { "in_out_quart", ease::in_out_quart },
   { "in_quint", ease::in_quint }, { "out_quint", ease::out_quint }, { "in_out_quint", ease::in_out_quint },
   { "in_sine", ease::in_sine }, { "out_sine", ease::out_sine }, { "in_out_sine", ease::in_out_sine },
   { "in_expo", ease::in_expo }, { "out_expo", ease::out_expo }, { "in_out_expo", ease::in_out_expo },
   { "in_circ", ease::in_circ }, { "out_circ", ease::out_circ }, { "in_out_circ", ease::in_out_circ },
   { "in_back", ease::in_back }, { "out_back", ease::out_back }, { "in_out_back", ease::in_out_back },
   { "in_elastic", ease::in_elastic }, { "out_elastic", ease::out_elastic }, { "in_out_elastic", ease::in_out_elastic },
   { "in_bounce", ease::in_bounce }, { "out_bounce", ease::out_bounce }, { "in_out_bounce", ease::in_out_bounce }
};

/*********************************************************************************************************************

-FUNCTION-
get_easing: Looks up an easing function by name.

Names are the function names of the `ease` namespace, e.g. `in_out_cubic`.  The comparison is case sensitive.

-INPUT-
cpp(strview) Name: The easing name.

-RESULT-
ptr(func): The easing function, or NULL if the name is not recognised.

*********************************************************************************************************************/

EASING get_easing(std::string_view Name)
{
   for (auto &entry : glEasings) {
      if (Name IS entry.Name) return entry.Function;
   }
   return nullptr;
}

} // namespace
