#pragma once

// 8-bit RGB colour with a 'none' sentinel and interpolation in RGB, HSV, LAB and LCH space.

#include <string>
#include <string_view>
#include <morphic/main.hpp>

namespace mx {

enum class CSPACE : int {
   RGB = 0,
   HSV,  // Shortest path around the hue circle
   LAB,  // Perceptually uniform (default)
   LCH   // LAB in cylindrical form, shortest hue path
};

struct RGB8 {
   uint8_t Red, Green, Blue;
};

class Colour {
   private:
      RGB8 rgb = { 0, 0, 0 };
      bool none = false;

   public:
      constexpr Colour() = default;
      constexpr Colour(uint8_t Red, uint8_t Green, uint8_t Blue) : rgb { Red, Green, Blue } { }

      static Colour None() { Colour c; c.none = true; return c; }

      // Accepts #RGB, #RRGGBB or one of the supported colour names.

      static ERR parse(std::string_view Value, Colour &Result);

      inline bool is_none() const { return none; }
      inline uint8_t red() const { return rgb.Red; }
      inline uint8_t green() const { return rgb.Green; }
      inline uint8_t blue() const { return rgb.Blue; }
      inline RGB8 to_rgb() const { return rgb; }

      bool operator==(const Colour &Other) const {
         if (none or Other.none) return none IS Other.none;
         return (rgb.Red IS Other.rgb.Red) and (rgb.Green IS Other.rgb.Green) and (rgb.Blue IS Other.rgb.Blue);
      }

      bool operator!=(const Colour &Other) const { return !(*this IS Other); }

      std::string to_hex() const;
      std::string to_rgb_string() const;

      Colour darken(int Amount) const;
      Colour lighten(int Amount) const;

      Colour interpolate(const Colour &Other, double Time, CSPACE Space = CSPACE::LAB) const;
};

} // namespace
