#include <algorithm>
#include <morphic/mapping.h>
#include "test_context.h"

using namespace mx;

static VertexLoop square_at(double X, double Y, double Size = 1.0) {
   return VertexLoop(VERTICES { { X - Size, Y - Size }, { X + Size, Y - Size }, { X + Size, Y + Size }, { X - Size, Y + Size } }, true);
}

static LOOPS loops_at(std::initializer_list<double> XPositions) {
   LOOPS loops;
   for (auto x : XPositions) loops.push_back(square_at(x, 0));
   return loops;
}

// Returns the x centroid of the destination paired with the source whose centroid is at SourceX.

static double partner_of(const LOOPS &Matched1, const LOOPS &Matched2, double SourceX) {
   for (size_t i=0; i < Matched1.size(); i++) {
      if (std::abs(Matched1[i].centroid().x - SourceX) < 1e-6) return Matched2[i].centroid().x;
   }
   return std::nan("");
}

static double total_distance(const LOOPS &Matched1, const LOOPS &Matched2) {
   double total = 0;
   for (size_t i=0; i < Matched1.size(); i++) total += Matched1[i].centroid().distance(Matched2[i].centroid());
   return total;
}

void test_zero_loop(TestContext &Context) {
   auto zero = create_zero_loop(square_at(5, 5, 2));
   Context.expect_equal(zero.size(), std::size_t(4), "Zero-loops keep the vertex count");
   Context.expect_true(zero.closed, "Zero-loops are closed");
   bool collapsed = true;
   for (auto &v : zero.vertices) {
      if ((std::abs(v.x - 5.0) > 1e-9) or (std::abs(v.y - 5.0) > 1e-9)) collapsed = false;
   }
   Context.expect_true(collapsed, "Every zero-loop vertex lies on the centroid");
}

void test_equal_lengths(TestContext &Context) {
   std::vector<std::unique_ptr<LoopMapper>> mappers;
   mappers.push_back(std::make_unique<SimpleMapper>());
   mappers.push_back(std::make_unique<GreedyMapper>());
   mappers.push_back(std::make_unique<DiscreteMapper>());
   mappers.push_back(std::make_unique<ClusteringMapper>());
   if (HungarianMapper::available()) mappers.push_back(std::make_unique<HungarianMapper>());

   const std::vector<std::pair<LOOPS, LOOPS>> cases = {
      { loops_at({ }), loops_at({ }) },
      { loops_at({ 0, 10 }), loops_at({ }) },
      { loops_at({ }), loops_at({ 0, 10, 20 }) },
      { loops_at({ 0, 10 }), loops_at({ 1, 11 }) },
      { loops_at({ 0, 10, 20, 30 }), loops_at({ 5 }) },
      { loops_at({ 0 }), loops_at({ -5, 5, 15 }) },
      { loops_at({ 0, 4, 50, 54, 100 }), loops_at({ 2, 52 }) }
   };

   for (auto &mapper : mappers) {
      for (auto &[loops1, loops2] : cases) {
         LOOPS matched1 { square_at(999, 999) }, matched2;
         if (mapper->map(loops1, loops2, matched1, matched2) != ERR::Okay) {
            Context.expect_true(false, mapper->name());
            continue;
         }

         Context.expect_equal(matched1.size(), matched2.size(), mapper->name());
         if (loops1.empty() and loops2.empty()) Context.expect_true(matched1.empty(), "No loops give an empty mapping");
         else if (loops2.empty()) Context.expect_equal(matched1.size(), loops1.size(), "Every source shrinks to zero");
         else if (loops1.empty()) Context.expect_equal(matched2.size(), loops2.size(), "Every destination grows from zero");
      }
   }
}

void test_simple(TestContext &Context) {
   SimpleMapper mapper;
   LOOPS matched1, matched2;
   Context.expect_ok(mapper.map(loops_at({ 0, 10 }), loops_at({ 20, 30, 40 }), matched1, matched2), "Simple mapping");
   Context.expect_equal(matched1.size(), std::size_t(5), "Simple mapping has N + M pairs");
   Context.expect_near(matched1[0].centroid().x, 0.0, 1e-9, "Sources come first");
   Context.expect_near(matched2[0].centroid().x, 0.0, 1e-9, "Sources shrink towards their own centroid");
   Context.expect_true(matched2[0].vertices[0] IS matched2[0].vertices[2], "Sources shrink to a zero-loop");
   Context.expect_near(matched2[2].centroid().x, 20.0, 1e-9, "Destinations follow the sources");
   Context.expect_true(matched1[4].vertices[0] IS matched1[4].vertices[1], "Destinations grow from a zero-loop");
}

void test_greedy(TestContext &Context) {
   GreedyMapper mapper;
   LOOPS matched1, matched2;

   Context.expect_ok(mapper.map(loops_at({ 0, 10 }), loops_at({ 11, 1 }), matched1, matched2), "Greedy equal counts");
   Context.expect_near(partner_of(matched1, matched2, 0), 1.0, 1e-9, "Equal counts pair the nearest loops");
   Context.expect_near(partner_of(matched1, matched2, 10), 11.0, 1e-9, "Equal counts do not reuse sources");

   Context.expect_ok(mapper.map(loops_at({ 0 }), loops_at({ -5, 5 }), matched1, matched2), "Greedy splitting");
   Context.expect_equal(matched1.size(), std::size_t(2), "Splitting pairs every destination");
   Context.expect_near(matched1[1].centroid().x, 0.0, 1e-9, "The single source is reused");

   Context.expect_ok(mapper.map(loops_at({ -1, 1, 100 }), loops_at({ -30, 30 }), matched1, matched2), "Greedy merging");
   Context.expect_near(partner_of(matched1, matched2, -1), -30.0, 1e-9, "Sources pick their nearest destination");
   Context.expect_near(partner_of(matched1, matched2, 1), 30.0, 1e-9, "Greedy splits adjacent sources");
   Context.expect_near(partner_of(matched1, matched2, 100), 30.0, 1e-9, "Destinations are reused when merging");
}

void test_discrete(TestContext &Context) {
   DiscreteMapper mapper;
   Context.expect_true(mapper.selection_method() IS SELECT::DISTANCE, "Distance selection is the default");

   LOOPS matched1, matched2;
   Context.expect_ok(mapper.map(loops_at({ 0, 10, 100 }), loops_at({ 1, 11 }), matched1, matched2), "Discrete shrinking");
   Context.expect_equal(matched1.size(), std::size_t(3), "Every source appears exactly once");
   Context.expect_near(partner_of(matched1, matched2, 0), 1.0, 1e-9, "Close sources move");
   Context.expect_near(partner_of(matched1, matched2, 10), 11.0, 1e-9, "Close sources are matched one to one");
   Context.expect_near(partner_of(matched1, matched2, 100), 100.0, 1e-9, "Far sources shrink in place");
   Context.expect_true(matched2[2].vertices[0] IS matched2[2].vertices[3], "Far sources shrink to a zero-loop");

   Context.expect_ok(mapper.map(loops_at({ 0 }), loops_at({ 50, 2, -70 }), matched1, matched2), "Discrete growing");
   Context.expect_equal(matched2.size(), std::size_t(3), "Every destination appears exactly once");
   Context.expect_near(matched2[0].centroid().x, 2.0, 1e-9, "The closest destination receives the source");
   Context.expect_near(matched1[1].centroid().x, 50.0, 1e-9, "Other destinations grow in place");
   Context.expect_near(matched1[2].centroid().x, -70.0, 1e-9, "Unselected destinations keep their order");
}

void test_clustering(TestContext &Context) {
   ClusteringMapper mapper;
   LOOPS matched1, matched2;

   // The same input as the greedy merge.  Clustering keeps the two adjacent sources together.

   Context.expect_ok(mapper.map(loops_at({ -1, 1, 100 }), loops_at({ -30, 30 }), matched1, matched2), "Clustering merge");
   Context.expect_equal(matched1.size(), std::size_t(3), "Every source is mapped once");
   Context.expect_near(partner_of(matched1, matched2, -1), -30.0, 1e-9, "Cluster members share a destination");
   Context.expect_near(partner_of(matched1, matched2, 1), -30.0, 1e-9, "Adjacent sources merge together");
   Context.expect_near(partner_of(matched1, matched2, 100), 30.0, 1e-9, "Distant sources form their own cluster");

   Context.expect_ok(mapper.map(loops_at({ 0 }), loops_at({ -5, 5 }), matched1, matched2), "Clustering split");
   Context.expect_equal(matched2.size(), std::size_t(2), "Splitting pairs every destination");

   const VERTICES points { { 0, 0 }, { 1, 0 }, { 0, 1 }, { 50, 50 }, { 51, 50 }, { 50, 51 }, { 100, 0 } };
   auto first = mapper.kmeans(points, 3);
   auto second = mapper.kmeans(points, 3);
   Context.expect_true(first IS second, "k-means is deterministic for a seed");
   Context.expect_true(first IS std::vector<int>({ 0, 0, 0, 2, 2, 2, 1 }), "k-means labels are fixed by the seed on every platform");
   Context.expect_equal(first.size(), points.size(), "Every point is assigned");
   Context.expect_true((first[0] IS first[1]) and (first[1] IS first[2]), "Nearby points share a cluster");
   Context.expect_true((first[3] IS first[4]) and (first[0] != first[3]) and (first[6] != first[3]), "Distinct groups are separated");

   auto identity = mapper.kmeans(points, 10);
   Context.expect_equal(identity[4], 4, "Each point is its own cluster when K exceeds the point count");
   auto single = mapper.kmeans(points, 0);
   Context.expect_equal(single[6], 0, "Non-positive K places everything in cluster 0");

   const VERTICES crowd { { 0, 0 }, { 1, 0 }, { 2, 0 }, { 3, 0 }, { 100, 0 } };
   auto balanced = mapper.balance(crowd, { 0, 0, 0, 0, 1 }, 2);
   int size0 = 0, size1 = 0;
   for (auto c : balanced) {
      if (c IS 0) size0++;
      else size1++;
   }
   Context.expect_true(std::abs(size0 - size1) <= 1, "Balanced cluster sizes differ by at most one");
   Context.expect_equal(balanced[4], 1, "Balancing never moves points out of the smallest cluster");
   Context.expect_equal(balanced[3], 1, "The member closest to the small cluster is moved");

   Context.expect_ok(mapper.map(loops_at({ 0, 1, 2, 3, 100 }), loops_at({ 1, 99 }), matched1, matched2), "Balanced merge");
   int near_count = 0, far_count = 0;
   for (auto &loop : matched2) {
      if (loop.centroid().x < 50) near_count++;
      else far_count++;
   }
   Context.expect_true(std::abs(near_count - far_count) <= 1, "Balanced merges share sources evenly");

   ClusteringMapper unbalanced(10, 7, false);
   Context.expect_false(unbalanced.balance_clusters, "Balancing can be disabled");
   Context.expect_ok(unbalanced.map(loops_at({ 0, 1, 2, 3, 100 }), loops_at({ 1, 99 }), matched1, matched2), "Unbalanced merge");
   Context.expect_near(partner_of(matched1, matched2, 3), 1.0, 1e-9, "Unbalanced clusters follow the geometry");
}

// Splitting always uses the nearest-source rule while merging clusters the sources.  Three sources in two groups are
// split over six destinations in two tight groups, then the mirrored merge collapses two tight groups of sources.

void test_clustering_asymmetry(TestContext &Context) {
   ClusteringMapper clustering;
   GreedyMapper greedy;
   LOOPS cluster1, cluster2, greedy1, greedy2;

   auto sources = loops_at({ -1, 1, 100 });
   auto targets = loops_at({ -32, -30, -28, 28, 30, 32 });
   Context.expect_ok(clustering.map(sources, targets, cluster1, cluster2), "Clustering split of 3 into 6");
   Context.expect_ok(greedy.map(sources, targets, greedy1, greedy2), "Greedy split of 3 into 6");
   Context.expect_equal(cluster1.size(), std::size_t(6), "Every destination is matched");
   Context.expect_true((cluster1 IS greedy1) and (cluster2 IS greedy2), "Clustering splits exactly as greedy does");
   Context.expect_near(partner_of(cluster2, cluster1, -30), -1.0, 1e-9, "The left group splits from the nearest source");
   Context.expect_near(partner_of(cluster2, cluster1, 30), 1.0, 1e-9, "The right group splits from the nearest source");

   auto crowd = loops_at({ -36, -32, -26, 98, 100, 102 });
   auto pair = loops_at({ -60, 0 });
   Context.expect_ok(clustering.map(crowd, pair, cluster1, cluster2), "Clustering merge of two groups");
   Context.expect_ok(greedy.map(crowd, pair, greedy1, greedy2), "Greedy merge of two groups");
   Context.expect_false((cluster1 IS greedy1) and (cluster2 IS greedy2), "Merging differs from greedy");

   Context.expect_near(partner_of(cluster1, cluster2, -36), -60.0, 1e-9, "The left group merges into one destination");
   Context.expect_near(partner_of(cluster1, cluster2, -26), -60.0, 1e-9, "Clustering keeps the left group together");
   Context.expect_near(partner_of(cluster1, cluster2, 100), 0.0, 1e-9, "The right group takes the other destination");
   Context.expect_near(partner_of(greedy1, greedy2, -26), 0.0, 1e-9, "Greedy breaks the left group apart");
}

void test_hungarian(TestContext &Context) {
   HungarianMapper mapper;
   LOOPS matched1, matched2;

   if (!HungarianMapper::available()) {
      Context.expect_error(mapper.map(loops_at({ 0 }), loops_at({ 1 }), matched1, matched2), ERR::MissingDependency,
         "Without the solver the mapper reports a missing dependency");
      return;
   }

   // Greedy takes the 10 -> 9 pair first and is left with 0 -> 20.

   auto sources = loops_at({ 0, 10 });
   auto targets = loops_at({ 9, 20 });
   Context.expect_ok(mapper.map(sources, targets, matched1, matched2), "Hungarian equal counts");
   Context.expect_near(total_distance(matched1, matched2), 19.0, 1e-6, "The assignment is globally optimal");
   Context.expect_near(matched2[0].centroid().x, 9.0, 1e-9, "Results are ordered by source");

   LOOPS greedy1, greedy2;
   GreedyMapper greedy;
   Context.expect_ok(greedy.map(sources, targets, greedy1, greedy2), "Greedy comparison");
   Context.expect_near(total_distance(greedy1, greedy2), 21.0, 1e-6, "Greedy matching is not optimal here");

   Context.expect_ok(mapper.map(loops_at({ 0 }), loops_at({ -5, 5, 15 }), matched1, matched2), "Hungarian splitting");
   Context.expect_equal(matched1.size(), std::size_t(3), "Every destination is matched");
   std::vector<double> xs;
   for (auto &loop : matched2) xs.push_back(loop.centroid().x);
   std::sort(xs.begin(), xs.end());
   Context.expect_near(xs[0], -5.0, 1e-9, "Destinations are matched exactly once");
   Context.expect_near(xs[2], 15.0, 1e-9, "Destinations are matched exactly once");

   Context.expect_ok(mapper.map(loops_at({ 0, 10, 20, 30 }), loops_at({ 5, 25 }), matched1, matched2), "Hungarian merging");
   Context.expect_equal(matched1.size(), std::size_t(4), "Every source is matched");
   Context.expect_near(total_distance(matched1, matched2), 20.0, 1e-6, "Merging balances the replicated destinations");

   // Distances of this size exceed a 32-bit integer once scaled to micro-units.

   Context.expect_ok(mapper.map(loops_at({ 0, 100000 }), loops_at({ 99000, 200000 }), matched1, matched2), "Hungarian large coordinates");
   Context.expect_near(total_distance(matched1, matched2), 199000.0, 1e-3, "Large coordinates are solved optimally");
   Context.expect_near(matched2[0].centroid().x, 99000.0, 1e-3, "Large coordinates are ordered by source");
}

void test_factory(TestContext &Context) {
   reset_config();
   std::unique_ptr<LoopMapper> mapper;

   Context.expect_ok(get_loop_mapper("", mapper), "Default mapper");
   Context.expect_equal(std::string(mapper->name()), std::string("clustering"), "Clustering is the default mapper");

   for (auto name : { "greedy", "hungarian", "discrete", "simple", "clustering" }) {
      Context.expect_ok(get_loop_mapper(name, mapper), name);
      Context.expect_equal(std::string(mapper->name()), std::string(name), "The named mapper is created");
   }

   Context.expect_ok(get_loop_mapper("Greedy", mapper), "Mapper names are case insensitive");
   Context.expect_error(get_loop_mapper("nearest", mapper), ERR::InvalidValue, "Unknown mappers are rejected");

   write_config(cfg::VERTEX_LOOP_MAPPER, "discrete");
   Context.expect_ok(get_loop_mapper("", mapper), "Configured mapper");
   Context.expect_equal(std::string(mapper->name()), std::string("discrete"), "The configured mapper is used");

   write_config(cfg::CLUSTERING_MAX_ITERATIONS, "5");
   write_config(cfg::CLUSTERING_RANDOM_SEED, "1234");
   write_config(cfg::CLUSTERING_BALANCE, "false");
   Context.expect_ok(get_loop_mapper("clustering", mapper), "Configured clustering");
   auto clustering = static_cast<ClusteringMapper *>(mapper.get());
   Context.expect_equal(clustering->max_iterations, 5, "Iterations are configurable");
   Context.expect_equal(clustering->random_seed, uint32_t(1234), "The seed is configurable");
   Context.expect_false(clustering->balance_clusters, "Balancing is configurable");

   reset_config();
}

int main() {
   TestContext test_context;
   test_zero_loop(test_context);
   test_equal_lengths(test_context);
   test_simple(test_context);
   test_greedy(test_context);
   test_discrete(test_context);
   test_clustering(test_context);
   test_clustering_asymmetry(test_context);
   test_hungarian(test_context);
   test_factory(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
