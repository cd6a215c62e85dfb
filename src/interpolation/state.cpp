/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

*********************************************************************************************************************/

#include <morphic/state.h>

namespace mx {

static const FIELDS glNoFields;
static const EASING_MAP glNoEasing;

const FIELDS & State::non_interpolatable() const { return glNoFields; }
const EASING_MAP & State::default_easing() const { return glNoEasing; }

//********************************************************************************************************************

std::vector<std::string> PropertyState::field_names() const
{
   std::vector<std::string> result;
   result.reserve(properties.size());
   for (auto &prop : properties) result.push_back(prop.first);
   return result;
}

const FieldValue * PropertyState::get(std::string_view Field) const
{
   for (auto &prop : properties) {
      if (prop.first IS Field) return &prop.second;
   }
   return nullptr;
}

//********************************************************************************************************************
// Existing fields keep their position; new fields are appended.

ERR PropertyState::set(std::string_view Field, FieldValue Value)
{
   if (Field.empty()) return Log(__FUNCTION__).warning(ERR::NullArgs);

   for (auto &prop : properties) {
      if (prop.first IS Field) {
         prop.second = std::move(Value);
         return ERR::Okay;
      }
   }

   properties.emplace_back(std::string(Field), std::move(Value));
   return ERR::Okay;
}

} // namespace
