#pragma once

// Vertex-loop mapping strategies.  A mapper pairs the holes of two shapes when their counts differ (N -> M), returning
// two equal-length lists where entry i of the first list morphs into entry i of the second.  Loops may be duplicated
// (merging, splitting) or paired with a zero-loop (appearing, disappearing).

#include <memory>
#include <string_view>
#include <morphic/vertex.h>

namespace mx {

class LoopMapper {
public:
   virtual ~LoopMapper() = default;

   // On success Matched1 and Matched2 are replaced with equal-length lists.

   virtual ERR map(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2) = 0;
   virtual CSTRING name() const = 0;
};

// Returns a closed loop with the vertex count of Reference, every vertex placed at the Reference centroid.

extern VertexLoop create_zero_loop(const VertexLoop &Reference);

//********************************************************************************************************************
// All sources shrink to zero and all destinations grow from zero.  No correspondence is computed.

class SimpleMapper : public LoopMapper {
public:
   ERR map(const LOOPS &, const LOOPS &, LOOPS &, LOOPS &) override;
   CSTRING name() const override { return "simple"; }
};

//********************************************************************************************************************
// Nearest centroid matching.  Equal counts are paired without reuse; unequal counts reuse the smaller side.

class GreedyMapper : public LoopMapper {
public:
   ERR map(const LOOPS &, const LOOPS &, LOOPS &, LOOPS &) override;
   CSTRING name() const override { return "greedy"; }
};

//********************************************************************************************************************
// Loops never merge or split.  The closest loops move, the excess shrinks to (or grows from) zero in place.

enum class SELECT : int {
   DISTANCE = 0 // Select the loops with the smallest distance to the other side
};

class DiscreteMapper : public LoopMapper {
   private:
      SELECT selection;

   public:
      DiscreteMapper(SELECT Selection = SELECT::DISTANCE) : selection(Selection) { }

      inline SELECT selection_method() const { return selection; }

      ERR map(const LOOPS &, const LOOPS &, LOOPS &, LOOPS &) override;
      CSTRING name() const override { return "discrete"; }
};

//********************************************************************************************************************
// k-means grouping of the sources when merging (N > M).  Splitting (N < M) matches each destination to its nearest
// source.  Clustering is deterministic for a given seed.

class ClusteringMapper : public LoopMapper {
   public:
      int max_iterations;
      uint32_t random_seed;
      bool balance_clusters;

      ClusteringMapper(int MaxIterations = 50, uint32_t RandomSeed = 42, bool Balance = true) :
         max_iterations(MaxIterations), random_seed(RandomSeed), balance_clusters(Balance) { }

      // Assigns each point to one of K clusters.  If K >= the point count, each point is its own cluster.

      std::vector<int> kmeans(const VERTICES &Points, int K) const;

      // Moves points from the largest to the smallest cluster until sizes are within tolerance of N/K.

      std::vector<int> balance(const VERTICES &Points, const std::vector<int> &Clusters, int K) const;

      ERR map(const LOOPS &, const LOOPS &, LOOPS &, LOOPS &) override;
      CSTRING name() const override { return "clustering"; }
};

//********************************************************************************************************************
// Globally optimal assignment by total centroid distance.  Requires the assignment solver to be compiled in; if it is
// not, map() fails with ERR::MissingDependency.

class HungarianMapper : public LoopMapper {
   public:
      static bool available();

      ERR map(const LOOPS &, const LOOPS &, LOOPS &, LOOPS &) override;
      CSTRING name() const override { return "hungarian"; }
};

//********************************************************************************************************************
// Creates a mapper by name: clustering, greedy, hungarian, discrete or simple.  If Name is empty then the
// morphing.vertex_loop_mapper setting is used.  Clustering parameters are read from morphing.clustering.

extern ERR get_loop_mapper(std::string_view Name, std::unique_ptr<LoopMapper> &Result);

} // namespace
