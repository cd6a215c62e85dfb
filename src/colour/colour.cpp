/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
Colour: 8-bit RGB colour value with interpolation support.

A colour is either an RGB triplet or the special `none` value, which represents the absence of a colour.  Interpolating
with a `none` colour always produces the other colour, i.e. the transition is a step.

Interpolation is available in four colour spaces.  RGB is a truncating linear blend of the channels.  HSV follows the
shortest path around the hue circle.  LAB (the default) is perceptually uniform and avoids the muddy midpoints of RGB
blending; for instance red to blue at 0.5 gives `(202, 0, 136)` rather than `(127, 0, 127)`.  LCH is the cylindrical
form of LAB and takes the shortest hue path.

-END-

*********************************************************************************************************************/

#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <algorithm>
#include <array>
#include <morphic/colour.h>

namespace mx {

struct LAB {
   double L, A, B;
};

static const struct {
   CSTRING Name;
   RGB8 Value;
} glColourNames[] = {
   { "red",     { 255, 0, 0 } },
   { "green",   { 0, 255, 0 } },
   { "blue",    { 0, 0, 255 } },
   { "white",   { 255, 255, 255 } },
   { "black",   { 0, 0, 0 } },
   { "yellow",  { 255, 255, 0 } },
   { "cyan",    { 0, 255, 255 } },
   { "magenta", { 255, 0, 255 } },
   { "orange",  { 255, 165, 0 } },
   { "purple",  { 128, 0, 128 } },
   { "pink",    { 255, 192, 203 } },
   { "brown",   { 165, 42, 42 } },
   { "gray",    { 128, 128, 128 } },
   { "grey",    { 128, 128, 128 } }
};

//********************************************************************************************************************
// Floored modulo; the result takes the sign of the divisor.

static double fmod_floor(double Value, double Divisor)
{
   double result = std::fmod(Value, Divisor);
   if ((result != 0) and ((result < 0) != (Divisor < 0))) result += Divisor;
   return result;
}

static uint8_t clamp_channel(int Value)
{
   return uint8_t(std::clamp(Value, 0, 255));
}

static int hex_value(char Char)
{
   if ((Char >= '0') and (Char <= '9')) return Char - '0';
   if ((Char >= 'a') and (Char <= 'f')) return Char - 'a' + 10;
   if ((Char >= 'A') and (Char <= 'F')) return Char - 'A' + 10;
   return -1;
}

/*********************************************************************************************************************

-METHOD-
Parse: Converts a hex string or colour name to a Colour.

Hex strings may be expressed as `#RRGGBB` or the short form `#RGB`, which is expanded so that `#F00` is equivalent to
`#FF0000`.  The leading `#` is optional.  Colour names are case insensitive.

-ERRORS-
Okay
InvalidValue: The string is neither a valid hex code nor a known colour name.

*********************************************************************************************************************/

ERR Colour::parse(std::string_view Value, Colour &Result)
{
   Log log("Colour");

   auto hex = Value;
   while ((!hex.empty()) and (hex.front() IS '#')) hex.remove_prefix(1);

   if ((hex.size() IS 3) or (hex.size() IS 6)) {
      std::array<int, 6> digits;
      bool valid = true;
      for (size_t i=0; i < hex.size(); i++) {
         if ((digits[i] = hex_value(hex[i])) < 0) { valid = false; break; }
      }

      if (valid) {
         if (hex.size() IS 3) Result = Colour(digits[0] * 17, digits[1] * 17, digits[2] * 17);
         else Result = Colour((digits[0]<<4) | digits[1], (digits[2]<<4) | digits[3], (digits[4]<<4) | digits[5]);
         return ERR::Okay;
      }
   }

   for (auto &entry : glColourNames) {
      if ((Value.size() IS strlen(entry.Name)) and (!strncasecmp(entry.Name, Value.data(), Value.size()))) {
         Result = Colour(entry.Value.Red, entry.Value.Green, entry.Value.Blue);
         return ERR::Okay;
      }
   }

   log.warning("Cannot convert '%.*s' to a colour.", int(Value.size()), Value.data());
   return ERR::InvalidValue;
}

//********************************************************************************************************************

std::string Colour::to_hex() const
{
   if (none) return "none";
   char buffer[8];
   snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", rgb.Red, rgb.Green, rgb.Blue);
   return buffer;
}

std::string Colour::to_rgb_string() const
{
   if (none) return "none";
   char buffer[24];
   snprintf(buffer, sizeof(buffer), "rgb(%d,%d,%d)", rgb.Red, rgb.Green, rgb.Blue);
   return buffer;
}

//********************************************************************************************************************

Colour Colour::darken(int Amount) const
{
   return Colour(clamp_channel(rgb.Red - Amount), clamp_channel(rgb.Green - Amount), clamp_channel(rgb.Blue - Amount));
}

Colour Colour::lighten(int Amount) const
{
   return Colour(clamp_channel(rgb.Red + Amount), clamp_channel(rgb.Green + Amount), clamp_channel(rgb.Blue + Amount));
}

//********************************************************************************************************************
// Hue is expressed in degrees (0 - 360), saturation and value are 0 - 100.

static void rgb_to_hsv(RGB8 Source, double &Hue, double &Sat, double &Value)
{
   double r = Source.Red / 255.0, g = Source.Green / 255.0, b = Source.Blue / 255.0;
   double vmax = std::max({ r, g, b });
   double vmin = std::min({ r, g, b });

   Value = vmax * 100.0;
   if (vmax IS vmin) {
      Hue = 0;
      Sat = 0;
      return;
   }

   double d = vmax - vmin;
   Sat = (d / vmax) * 100.0;

   double rc = (vmax - r) / d;
   double gc = (vmax - g) / d;
   double bc = (vmax - b) / d;
   double h;
   if (r IS vmax) h = bc - gc;
   else if (g IS vmax) h = 2.0 + rc - bc;
   else h = 4.0 + gc - rc;

   Hue = fmod_floor(h / 6.0, 1.0) * 360.0;
}

static RGB8 hsv_to_rgb(double Hue, double Sat, double Value)
{
   double h = Hue / 360.0, s = Sat / 100.0, v = Value / 100.0;
   double r, g, b;

   if (s IS 0) r = g = b = v;
   else {
      int i = int(h * 6.0);
      double f = (h * 6.0) - i;
      double p = v * (1.0 - s);
      double q = v * (1.0 - s * f);
      double t = v * (1.0 - s * (1.0 - f));
      switch (((i % 6) + 6) % 6) {
         case 0:  r = v; g = t; b = p; break;
         case 1:  r = q; g = v; b = p; break;
         case 2:  r = p; g = v; b = t; break;
         case 3:  r = p; g = q; b = v; break;
         case 4:  r = t; g = p; b = v; break;
         default: r = v; g = p; b = q; break;
      }
   }

   return RGB8 { clamp_channel(int(r * 255.0)), clamp_channel(int(g * 255.0)), clamp_channel(int(b * 255.0)) };
}

//********************************************************************************************************************
// sRGB to CIE LAB (D65)

static LAB rgb_to_lab(RGB8 Source)
{
   auto linear = [](double C) {
      return (C > 0.04045) ? std::pow((C + 0.055) / 1.055, 2.4) : C / 12.92;
   };

   double r = linear(Source.Red / 255.0);
   double g = linear(Source.Green / 255.0);
   double b = linear(Source.Blue / 255.0);

   double x = (r * 0.4124564 + g * 0.3575761 + b * 0.1804375) / 0.95047;
   double y = (r * 0.2126729 + g * 0.7151522 + b * 0.0721750) / 1.00000;
   double z = (r * 0.0193339 + g * 0.1191920 + b * 0.9503041) / 1.08883;

   auto f = [](double T) {
      return (T > 0.008856) ? std::pow(T, 1.0 / 3.0) : (7.787 * T) + (16.0 / 116.0);
   };

   x = f(x);
   y = f(y);
   z = f(z);

   return LAB { (116.0 * y) - 16.0, 500.0 * (x - y), 200.0 * (y - z) };
}

static RGB8 lab_to_rgb(const LAB &Lab)
{
   double y = (Lab.L + 16.0) / 116.0;
   double x = Lab.A / 500.0 + y;
   double z = y - Lab.B / 200.0;

   auto finv = [](double T) {
      double t3 = T * T * T;
      return (t3 > 0.008856) ? t3 : (T - 16.0 / 116.0) / 7.787;
   };

   x = 0.95047 * finv(x);
   y = 1.00000 * finv(y);
   z = 1.08883 * finv(z);

   double r = x *  3.2404542 + y * -1.5371385 + z * -0.4985314;
   double g = x * -0.9692660 + y *  1.8760108 + z *  0.0415560;
   double b = x *  0.0556434 + y * -0.2040259 + z *  1.0572252;

   auto gamma = [](double C) {
      return (C > 0.0031308) ? 1.055 * std::pow(C, 1.0 / 2.4) - 0.055 : 12.92 * C;
   };

   return RGB8 {
      clamp_channel(int(gamma(r) * 255.0 + 0.5)),
      clamp_channel(int(gamma(g) * 255.0 + 0.5)),
      clamp_channel(int(gamma(b) * 255.0 + 0.5))
   };
}

//********************************************************************************************************************
// Adjusts a pair of hue angles (degrees) so that interpolating between them takes the shortest path.

static void shortest_hue(double &Start, double &End)
{
   if (std::abs(End - Start) > 180.0) {
      if (End > Start) Start += 360.0;
      else End += 360.0;
   }
}

/*********************************************************************************************************************

-METHOD-
Interpolate: Blends this colour towards another.

If either colour is `none` then the other colour is returned unmodified.  A Time of exactly 0 or 1 returns the
corresponding colour without a round trip through the blending colour space.

-INPUT-
obj(Colour) Other: The target colour.
double Time: Blend position, where 0 is this colour and 1 is the target.
int(CSPACE) Space: The colour space in which to interpolate.

-RESULT-
obj(Colour): The blended colour.

*********************************************************************************************************************/

Colour Colour::interpolate(const Colour &Other, double Time, CSPACE Space) const
{
   if (none) return Other;
   if (Other.none) return *this;
   if (Time IS 0.0) return *this;
   else if (Time IS 1.0) return Other;

   switch (Space) {
      case CSPACE::RGB:
         return Colour(
            clamp_channel(int(rgb.Red + (Other.rgb.Red - rgb.Red) * Time)),
            clamp_channel(int(rgb.Green + (Other.rgb.Green - rgb.Green) * Time)),
            clamp_channel(int(rgb.Blue + (Other.rgb.Blue - rgb.Blue) * Time)));

      case CSPACE::HSV: {
         double hs, ss, vs, he, se, ve;
         rgb_to_hsv(rgb, hs, ss, vs);
         rgb_to_hsv(Other.rgb, he, se, ve);
         shortest_hue(hs, he);

         auto result = hsv_to_rgb(fmod_floor(hs + (he - hs) * Time, 360.0), ss + (se - ss) * Time, vs + (ve - vs) * Time);
         return Colour(result.Red, result.Green, result.Blue);
      }

      case CSPACE::LCH: {
         auto start = rgb_to_lab(rgb);
         auto end   = rgb_to_lab(Other.rgb);

         double cs = std::hypot(start.A, start.B);
         double ce = std::hypot(end.A, end.B);
         double hs = std::atan2(start.B, start.A) * RAD2DEG;
         double he = std::atan2(end.B, end.A) * RAD2DEG;
         if (hs < 0) hs += 360.0;
         if (he < 0) he += 360.0;
         shortest_hue(hs, he);

         double l = start.L + (end.L - start.L) * Time;
         double c = cs + (ce - cs) * Time;
         double h = fmod_floor(hs + (he - hs) * Time, 360.0) * DEG2RAD;

         auto result = lab_to_rgb(LAB { l, c * std::cos(h), c * std::sin(h) });
         return Colour(result.Red, result.Green, result.Blue);
      }

      case CSPACE::LAB:
      default: {
         auto start = rgb_to_lab(rgb);
         auto end   = rgb_to_lab(Other.rgb);
         auto result = lab_to_rgb(LAB {
            start.L + (end.L - start.L) * Time,
            start.A + (end.A - start.A) * Time,
            start.B + (end.B - start.B) * Time
         });
         return Colour(result.Red, result.Green, result.Blue);
      }
   }
}

} // namespace
