/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
ClusteringMapper: Merges groups of nearby source loops into a shared destination.

When there are more sources than destinations (N > M) the source centroids are grouped into M clusters with k-means,
seeded by k-means++.  Each cluster is then assigned the nearest unused destination, measured from the mean of its
members' centroids, and every member of the cluster morphs into that destination.  Spatially adjacent sources therefore
merge together instead of being split apart by per-loop nearest matching.

Equal counts use nearest unused matching and fewer sources (N < M) use nearest source per destination, as for the
GreedyMapper.

The random generator is re-seeded with `random_seed` on every clustering run, so the result is a pure function of the
input and the mapper parameters.  Random choices are derived from the raw output of `std::mt19937`, which is fully
specified, so a seed produces the same clusters with every standard library.

-END-

*********************************************************************************************************************/

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include "mapping.h"

namespace mx {

static POINT<double> mean_point(const VERTICES &Points)
{
   if (Points.empty()) return POINT<double>(0, 0);
   POINT<double> sum;
   for (auto &p : Points) sum += p;
   return sum / double(Points.size());
}

//********************************************************************************************************************

static bool centres_converged(const VERTICES &Old, const VERTICES &New)
{
   const double EPSILON = 1e-6;
   if (Old.size() != New.size()) return false;
   for (size_t i=0; i < Old.size(); i++) {
      if ((std::abs(Old[i].x - New[i].x) > EPSILON) or (std::abs(Old[i].y - New[i].y) > EPSILON)) return false;
   }
   return true;
}

//********************************************************************************************************************

static std::vector<int> assign_points(const VERTICES &Points, const VERTICES &Centres)
{
   std::vector<int> clusters;
   clusters.reserve(Points.size());
   for (auto &point : Points) {
      int best = 0;
      double best_dist = std::numeric_limits<double>::infinity();
      for (size_t i=0; i < Centres.size(); i++) {
         double dist = point.distance(Centres[i]);
         if (dist < best_dist) {
            best_dist = dist;
            best = int(i);
         }
      }
      clusters.push_back(best);
   }
   return clusters;
}

//********************************************************************************************************************
// Uniform value in the range 0 - 1 (exclusive).

static double unit_random(std::mt19937 &Random)
{
   return double(Random()) / 4294967296.0;
}

//********************************************************************************************************************
// k-means++ seeding.  The first centre is a uniform choice; each further centre is chosen with probability
// proportional to its squared distance from the nearest existing centre.

static VERTICES seed_centres(const VERTICES &Points, int K, std::mt19937 &Random)
{
   VERTICES centres;
   centres.push_back(Points[Random() % Points.size()]);

   std::vector<double> weights(Points.size());
   while (int(centres.size()) < K) {
      double total = 0;
      for (size_t i=0; i < Points.size(); i++) {
         double min_dist = std::numeric_limits<double>::infinity();
         for (auto &c : centres) {
            double dist = Points[i].distance(c);
            if (dist < min_dist) min_dist = dist;
         }
         weights[i] = min_dist * min_dist;
         total += weights[i];
      }

      if (total IS 0) { // Every point already coincides with a centre
         centres.push_back(Points[Random() % Points.size()]);
         continue;
      }

      double r = total * unit_random(Random);
      double cumulative = 0;
      size_t chosen = Points.size() - 1;
      for (size_t i=0; i < Points.size(); i++) {
         cumulative += weights[i];
         if (cumulative >= r) { chosen = i; break; }
      }
      centres.push_back(Points[chosen]);
   }
   return centres;
}

/*********************************************************************************************************************

-METHOD-
kmeans: Assigns points to K clusters.

Lloyd iterations run until no centre moves by more than 1e-6 on either axis, or until `max_iterations` is reached.  A
cluster that loses all of its points keeps its previous centre.  If K is not less than the number of points then point
`i` is assigned to cluster `i`.

-INPUT-
cpp(array(point)) Points: The points to cluster.
int K: The number of clusters.

-RESULT-
cpp(array(int)): The cluster index of each point.

*********************************************************************************************************************/

std::vector<int> ClusteringMapper::kmeans(const VERTICES &Points, int K) const
{
   if ((K <= 0) or (Points.empty())) return std::vector<int>(Points.size(), 0);

   if (K >= int(Points.size())) {
      std::vector<int> clusters(Points.size());
      for (size_t i=0; i < Points.size(); i++) clusters[i] = int(i);
      return clusters;
   }

   std::mt19937 random(random_seed);
   auto centres = seed_centres(Points, K, random);
   auto clusters = assign_points(Points, centres);

   for (int iteration=0; iteration < max_iterations; iteration++) {
      if (iteration > 0) clusters = assign_points(Points, centres);

      VERTICES updated;
      updated.reserve(K);
      for (int c=0; c < K; c++) {
         VERTICES members;
         for (size_t i=0; i < Points.size(); i++) {
            if (clusters[i] IS c) members.push_back(Points[i]);
         }
         updated.push_back(members.empty() ? centres[c] : mean_point(members));
      }

      if (centres_converged(centres, updated)) break;
      centres = std::move(updated);
   }

   return clusters;
}

/*********************************************************************************************************************

-METHOD-
balance: Evens out cluster sizes.

The ideal cluster size is N/K and a deviation of `max(1, 0.4 * ideal)` is tolerated.  While the largest and smallest
clusters differ by more than one and either lies outside the tolerance, the member of the largest cluster that is
closest to the smallest cluster's centre is moved across.  Cluster centres are measured once, before any moves.

-INPUT-
cpp(array(point)) Points: The clustered points.
cpp(array(int)) Clusters: Cluster index of each point.
int K: The number of clusters.

-RESULT-
cpp(array(int)): The balanced cluster assignment.

*********************************************************************************************************************/

std::vector<int> ClusteringMapper::balance(const VERTICES &Points, const std::vector<int> &Clusters, int K) const
{
   const int n = int(Points.size());
   if ((K <= 0) or (n <= K)) return Clusters;

   auto result = Clusters;
   const double ideal = double(n) / double(K);
   const double max_deviation = std::max(1.0, ideal * 0.4);

   VERTICES centres;
   for (int c=0; c < K; c++) {
      VERTICES members;
      for (int i=0; i < n; i++) {
         if (result[i] IS c) members.push_back(Points[i]);
      }
      centres.push_back(mean_point(members));
   }

   for (int pass=0; pass < n; pass++) {
      std::vector<int> sizes(K, 0);
      for (auto c : result) {
         if ((c >= 0) and (c < K)) sizes[c]++;
      }

      int largest = 0, smallest = 0;
      for (int c=1; c < K; c++) {
         if (sizes[c] > sizes[largest]) largest = c;
         if (sizes[c] < sizes[smallest]) smallest = c;
      }

      if (sizes[largest] - sizes[smallest] <= 1) break;
      if ((std::abs(sizes[largest] - ideal) <= max_deviation) and (std::abs(sizes[smallest] - ideal) <= max_deviation)) break;

      int move = -1;
      double best_dist = std::numeric_limits<double>::infinity();
      for (int i=0; i < n; i++) {
         if (result[i] != largest) continue;
         double dist = Points[i].distance(centres[smallest]);
         if (dist < best_dist) {
            best_dist = dist;
            move = i;
         }
      }

      if (move < 0) break;
      result[move] = smallest;
   }

   return result;
}

//********************************************************************************************************************

ERR ClusteringMapper::map(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
   Log log("ClusteringMapper");

   if (map_degenerate(Loops1, Loops2, Matched1, Matched2)) return ERR::Okay;

   if (Loops1.size() IS Loops2.size()) {
      match_equal(Loops1, Loops2, Matched1, Matched2);
      return ERR::Okay;
   }

   if (Loops1.size() < Loops2.size()) {
      match_each_destination(Loops1, Loops2, Matched1, Matched2);
      return ERR::Okay;
   }

   const int k = int(Loops2.size());
   auto sources = loop_centroids(Loops1);
   auto targets = loop_centroids(Loops2);

   auto clusters = kmeans(sources, k);
   if (balance_clusters) clusters = balance(sources, clusters, k);

   Matched1.clear();
   Matched2.clear();

   std::vector<bool> used(targets.size(), false);
   for (int c=0; c < k; c++) {
      VERTICES members;
      for (size_t i=0; i < sources.size(); i++) {
         if (clusters[i] IS c) members.push_back(sources[i]);
      }
      if (members.empty()) continue;

      auto centre = mean_point(members);
      int best = -1;
      double best_dist = std::numeric_limits<double>::infinity();
      for (size_t j=0; j < targets.size(); j++) {
         if (used[j]) continue;
         double dist = centre.distance(targets[j]);
         if (dist < best_dist) {
            best_dist = dist;
            best = int(j);
         }
      }
      if (best < 0) continue;

      used[best] = true;
      log.trace("Cluster %d (%d loops) merges into destination %d.", c, int(members.size()), best);
      for (size_t i=0; i < sources.size(); i++) {
         if (clusters[i] IS c) {
            Matched1.push_back(Loops1[i]);
            Matched2.push_back(Loops2[best]);
         }
      }
   }

   return ERR::Okay;
}

} // namespace
