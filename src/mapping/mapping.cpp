/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CATEGORY-
Name: Mapping
-END-

Loop mappers establish correspondence between two lists of vertex loops whose lengths may differ.  Every mapper
shares the same degenerate handling: with no loops on either side the result is empty; with loops on one side only,
each is paired with a zero-loop (a loop collapsed to its own centroid) so that it shrinks away or grows from a point.

Distances between loops are always measured between their centroids.

*********************************************************************************************************************/

#include <limits>
#include <string.h>
#include <strings.h>
#include "mapping.h"

namespace mx {

static const struct {
   CSTRING Name;
   std::unique_ptr<LoopMapper> (*Create)(const Config &);
} glMappers[] = {
   { "clustering", [](const Config &Settings) -> std::unique_ptr<LoopMapper> {
      return std::make_unique<ClusteringMapper>(
         Settings.get_int(cfg::CLUSTERING_MAX_ITERATIONS, 50),
         uint32_t(Settings.get_int(cfg::CLUSTERING_RANDOM_SEED, 42)),
         Settings.get_bool(cfg::CLUSTERING_BALANCE, true));
   } },
   { "greedy",    [](const Config &) -> std::unique_ptr<LoopMapper> { return std::make_unique<GreedyMapper>(); } },
   { "hungarian", [](const Config &) -> std::unique_ptr<LoopMapper> { return std::make_unique<HungarianMapper>(); } },
   { "discrete",  [](const Config &) -> std::unique_ptr<LoopMapper> { return std::make_unique<DiscreteMapper>(); } },
   { "simple",    [](const Config &) -> std::unique_ptr<LoopMapper> { return std::make_unique<SimpleMapper>(); } }
};

//********************************************************************************************************************

VertexLoop create_zero_loop(const VertexLoop &Reference)
{
   return VertexLoop(VERTICES(Reference.size(), Reference.centroid()), true);
}

VERTICES loop_centroids(const LOOPS &Loops)
{
   VERTICES result;
   result.reserve(Loops.size());
   for (auto &loop : Loops) result.push_back(loop.centroid());
   return result;
}

//********************************************************************************************************************
// Returns true if one side is empty, in which case the result has been written.

bool map_degenerate(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
   if ((!Loops1.empty()) and (!Loops2.empty())) return false;

   Matched1.clear();
   Matched2.clear();

   if (!Loops1.empty()) {
      Matched1 = Loops1;
      for (auto &loop : Loops1) Matched2.push_back(create_zero_loop(loop));
   }
   else if (!Loops2.empty()) {
      for (auto &loop : Loops2) Matched1.push_back(create_zero_loop(loop));
      Matched2 = Loops2;
   }
   return true;
}

//********************************************************************************************************************
// Equal counts.  Each destination in turn takes the nearest source that has not been used.  The output is ordered by
// destination.

void match_equal(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
   auto c1 = loop_centroids(Loops1);
   auto c2 = loop_centroids(Loops2);

   std::vector<bool> used(Loops1.size(), false);
   Matched1.clear();
   Matched2.clear();

   for (size_t i=0; i < c2.size(); i++) {
      int best = -1;
      double best_dist = std::numeric_limits<double>::infinity();
      for (size_t j=0; j < c1.size(); j++) {
         if (used[j]) continue;
         double dist = c1[j].distance(c2[i]);
         if (dist < best_dist) {
            best_dist = dist;
            best = int(j);
         }
      }

      if (best >= 0) {
         used[best] = true;
         Matched1.push_back(Loops1[best]);
         Matched2.push_back(Loops2[i]);
      }
   }
}

//********************************************************************************************************************
// Fewer sources (splitting).  Every destination takes its nearest source; sources are reused.

void match_each_destination(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
   auto c1 = loop_centroids(Loops1);
   auto c2 = loop_centroids(Loops2);

   Matched1.clear();
   Matched2.clear();

   for (size_t i=0; i < c2.size(); i++) {
      size_t best = 0;
      double best_dist = std::numeric_limits<double>::infinity();
      for (size_t j=0; j < c1.size(); j++) {
         double dist = c1[j].distance(c2[i]);
         if (dist < best_dist) {
            best_dist = dist;
            best = j;
         }
      }
      Matched1.push_back(Loops1[best]);
      Matched2.push_back(Loops2[i]);
   }
}

//********************************************************************************************************************
// More sources (merging).  Every source takes its nearest destination; destinations are reused.

void match_each_source(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
   auto c1 = loop_centroids(Loops1);
   auto c2 = loop_centroids(Loops2);

   Matched1.clear();
   Matched2.clear();

   for (size_t i=0; i < c1.size(); i++) {
      size_t best = 0;
      double best_dist = std::numeric_limits<double>::infinity();
      for (size_t j=0; j < c2.size(); j++) {
         double dist = c1[i].distance(c2[j]);
         if (dist < best_dist) {
            best_dist = dist;
            best = j;
         }
      }
      Matched1.push_back(Loops1[i]);
      Matched2.push_back(Loops2[best]);
   }
}

/*********************************************************************************************************************

-METHOD-
SimpleMapper::map: Shrinks every source loop to zero and grows every destination loop from zero.

The result is the concatenation of the sources (each paired with its own zero-loop) and the destinations (each paired
with its own zero-loop), so the output length is always N + M.

*********************************************************************************************************************/

ERR SimpleMapper::map(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
   Matched1 = Loops1;
   Matched2.clear();
   Matched2.reserve(Loops1.size() + Loops2.size());
   for (auto &loop : Loops1) Matched2.push_back(create_zero_loop(loop));
   for (auto &loop : Loops2) Matched1.push_back(create_zero_loop(loop));
   Matched2.insert(Matched2.end(), Loops2.begin(), Loops2.end());
   return ERR::Okay;
}

//********************************************************************************************************************

ERR GreedyMapper::map(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
   if (map_degenerate(Loops1, Loops2, Matched1, Matched2)) return ERR::Okay;

   if (Loops1.size() IS Loops2.size()) match_equal(Loops1, Loops2, Matched1, Matched2);
   else if (Loops1.size() < Loops2.size()) match_each_destination(Loops1, Loops2, Matched1, Matched2);
   else match_each_source(Loops1, Loops2, Matched1, Matched2);
   return ERR::Okay;
}

/*********************************************************************************************************************

-FUNCTION-
get_loop_mapper: Creates a loop mapper by name.

Recognised names are `clustering`, `greedy`, `hungarian`, `discrete` and `simple` (case insensitive).  If `Name` is
empty, the `morphing.vertex_loop_mapper` setting is used and defaults to `clustering`.  The clustering mapper takes its
parameters from the `morphing.clustering` group.

-INPUT-
cpp(strview) Name: Optional mapper name.
&cpp(unique_ptr) Result: Receives the mapper.

-ERRORS-
Okay
InvalidValue: The name is not recognised.

*********************************************************************************************************************/

ERR get_loop_mapper(std::string_view Name, std::unique_ptr<LoopMapper> &Result)
{
   Log log(__FUNCTION__);

   auto settings = config();
   std::string name(Name);
   if (name.empty()) name = settings.get_string(cfg::VERTEX_LOOP_MAPPER, "clustering");

   for (auto &entry : glMappers) {
      if ((name.size() IS strlen(entry.Name)) and (!strncasecmp(entry.Name, name.c_str(), name.size()))) {
         Result = entry.Create(settings);
         log.trace("Selected the %s mapper.", entry.Name);
         return ERR::Okay;
      }
   }

   log.warning("Unknown vertex loop mapper '%s'.  Valid options: 'clustering', 'greedy', 'hungarian', 'discrete', 'simple'",
      name.c_str());
   return ERR::InvalidValue;
}

} // namespace
