/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CATEGORY-
Name: Alignment
-END-

Alignment strategies compute the cyclic offset (or reversal) of a second vertex list that best matches the first.  All
strategies are O(n^2) in the number of vertices; every offset is evaluated and the strictly smallest distance wins, so
ties resolve to the earliest offset.

*********************************************************************************************************************/

#include <string.h>
#include <strings.h>
#include <morphic/alignment.h>

namespace mx {

static const struct {
   CSTRING Name;
   NORM Value;
} glNorms[] = {
   { "l1", NORM::L1 }, { "l2", NORM::L2 }, { "linf", NORM::LINF }
};

/*********************************************************************************************************************

-FUNCTION-
parse_norm: Converts a norm name to its NORM value.

Accepted names are `l1`, `l2` and `linf` (case insensitive).

-ERRORS-
Okay
InvalidValue: The name is not recognised.

*********************************************************************************************************************/

ERR parse_norm(std::string_view Value, NORM &Result)
{
   Log log(__FUNCTION__);

   for (auto &entry : glNorms) {
      if ((Value.size() IS strlen(entry.Name)) and (!strncasecmp(entry.Name, Value.data(), Value.size()))) {
         Result = entry.Value;
         return ERR::Okay;
      }
   }

   log.warning("Invalid norm '%.*s'.  Valid options: 'l1', 'l2', 'linf'", int(Value.size()), Value.data());
   return ERR::InvalidValue;
}

CSTRING norm_name(NORM Norm)
{
   switch (Norm) {
      case NORM::L1:   return "l1";
      case NORM::L2:   return "l2";
      case NORM::LINF: return "linf";
      default:         return "custom";
   }
}

/*********************************************************************************************************************

-FUNCTION-
get_aligner: Selects a vertex aligner for a pair of shapes.

Open to open shapes use the SequentialAligner.  Closed to closed shapes use the AngularAligner, with the norm taken
from `morphing.angular_alignment_norm`, then `morphing.vertex_alignment_norm`, and finally `l1`.  Mixed pairs use the
EuclideanAligner with `morphing.euclidean_alignment_norm` resolved in the same way.  A non-empty `Norm` overrides the
configuration.

-INPUT-
bool Closed1: Closure of the first shape.
bool Closed2: Closure of the second shape.
cpp(strview) Norm: Optional norm name.
&cpp(unique_ptr) Result: Receives the aligner.

-ERRORS-
Okay
InvalidValue: The norm name is not recognised.

*********************************************************************************************************************/

ERR get_aligner(bool Closed1, bool Closed2, std::string_view Norm, std::unique_ptr<VertexAligner> &Result)
{
   if ((!Closed1) and (!Closed2)) {
      Result = std::make_unique<SequentialAligner>();
      return ERR::Okay;
   }

   std::string name(Norm);
   if (name.empty()) {
      auto settings = config();
      auto fallback = settings.get_string(cfg::VERTEX_ALIGNMENT_NORM, "l1");
      if (Closed1 and Closed2) name = settings.get_string(cfg::ANGULAR_ALIGNMENT_NORM, fallback);
      else name = settings.get_string(cfg::EUCLIDEAN_ALIGNMENT_NORM, fallback);
   }

   NORM norm;
   if (auto error = parse_norm(name, norm); error != ERR::Okay) return error;

   if (Closed1 and Closed2) Result = std::make_unique<AngularAligner>(norm);
   else Result = std::make_unique<EuclideanAligner>(norm);
   return ERR::Okay;
}

} // namespace
