/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

*********************************************************************************************************************/

#include <morphic/state.h>

namespace mx {

/*********************************************************************************************************************

-METHOD-
resolve: Chooses the easing function for a field.

Easing is resolved in the following order, the first match winning: the segment overrides supplied for this call, the
overrides given to the resolver on construction, the default easing declared by the state, and finally linear.

*********************************************************************************************************************/

EASING EasingResolver::resolve(const State &Source, std::string_view Field, const EASING_MAP *SegmentOverrides) const
{
   if (SegmentOverrides) {
      if (auto it = SegmentOverrides->find(Field); it != SegmentOverrides->end()) return it->second;
   }
   return resolve_timeline(&Source, Field);
}

EASING EasingResolver::resolve_timeline(const State *Source, std::string_view Field) const
{
   if (auto it = property_easing.find(Field); it != property_easing.end()) return it->second;

   if (Source) {
      auto &defaults = Source->default_easing();
      if (auto it = defaults.find(Field); it != defaults.end()) return it->second;
   }

   return ease::linear;
}

} // namespace
