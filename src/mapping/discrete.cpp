/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
DiscreteMapper: Maps loops without merging or splitting.

Each loop either moves to exactly one partner or disappears (or appears) in place.  With N sources and M destinations
the smaller count of loops on the larger side is selected as movers: those whose centroid lies closest to any loop on
the other side.  The movers are matched one to one and the remaining loops are paired with their own zero-loops.

-END-

*********************************************************************************************************************/

#include <limits>
#include "mapping.h"

namespace mx {

//********************************************************************************************************************
// Selects Count indices from Candidates, closest first.  A candidate's score is its minimum centroid distance to any
// of the Targets.  Ties resolve to the lower index.

static std::vector<size_t> select_closest(const LOOPS &Candidates, const LOOPS &Targets, size_t Count)
{
   auto candidates = loop_centroids(Candidates);
   auto targets    = loop_centroids(Targets);

   std::vector<double> scores(candidates.size(), std::numeric_limits<double>::infinity());
   for (size_t i=0; i < candidates.size(); i++) {
      for (auto &t : targets) {
         double dist = candidates[i].distance(t);
         if (dist < scores[i]) scores[i] = dist;
      }
   }

   std::vector<size_t> selected;
   std::vector<bool> available(candidates.size(), true);
   while (selected.size() < Count) {
      int best = -1;
      double best_dist = std::numeric_limits<double>::infinity();
      for (size_t i=0; i < candidates.size(); i++) {
         if ((available[i]) and (scores[i] < best_dist)) {
            best_dist = scores[i];
            best = int(i);
         }
      }
      if (best < 0) break;
      available[best] = false;
      selected.push_back(size_t(best));
   }
   return selected;
}

//********************************************************************************************************************

ERR DiscreteMapper::map(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
   Log log("DiscreteMapper");

   if (selection != SELECT::DISTANCE) {
      log.warning("Unsupported selection method %d.", int(selection));
      return ERR::InvalidValue;
   }

   if (map_degenerate(Loops1, Loops2, Matched1, Matched2)) return ERR::Okay;

   if (Loops1.size() IS Loops2.size()) {
      match_equal(Loops1, Loops2, Matched1, Matched2);
      return ERR::Okay;
   }

   if (Loops1.size() > Loops2.size()) { // Surplus sources shrink to zero in place
      auto indices = select_closest(Loops1, Loops2, Loops2.size());
      std::vector<bool> selected(Loops1.size(), false);
      LOOPS movers;
      for (auto i : indices) {
         selected[i] = true;
         movers.push_back(Loops1[i]);
      }

      match_equal(movers, Loops2, Matched1, Matched2);

      for (size_t i=0; i < Loops1.size(); i++) {
         if (selected[i]) continue;
         Matched1.push_back(Loops1[i]);
         Matched2.push_back(create_zero_loop(Loops1[i]));
      }
      log.trace("%d sources move, %d disappear.", int(indices.size()), int(Loops1.size() - indices.size()));
   }
   else { // Surplus destinations grow from zero in place
      auto indices = select_closest(Loops2, Loops1, Loops1.size());
      std::vector<bool> selected(Loops2.size(), false);
      LOOPS targets;
      for (auto i : indices) {
         selected[i] = true;
         targets.push_back(Loops2[i]);
      }

      match_equal(Loops1, targets, Matched1, Matched2);

      for (size_t i=0; i < Loops2.size(); i++) {
         if (selected[i]) continue;
         Matched1.push_back(create_zero_loop(Loops2[i]));
         Matched2.push_back(Loops2[i]);
      }
      log.trace("%d sources move, %d appear.", int(indices.size()), int(Loops2.size() - indices.size()));
   }

   return ERR::Okay;
}

} // namespace
