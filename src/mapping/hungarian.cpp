/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
HungarianMapper: Minimises the total centroid distance between matched loops.

The assignment is solved as a minimum cost flow on a bipartite graph (source -> rows -> columns -> sink, unit
capacities) using the successive shortest path algorithm from the Boost Graph Library.  Costs are centroid distances
scaled to 64-bit integers with micro-unit precision, so the path sums of the solver remain exact for coordinates far
beyond the 32-bit range.

Unequal counts are handled by replication.  With fewer sources (N < M) the cost matrix has M rows and row `r` stands
for source `r % N`; with more sources (N > M) it has N columns and column `c` stands for destination `c % M`.  Every
loop on the larger side is therefore matched exactly once.  Results are ordered by row.

The solver is optional.  If Boost was not found when the library was configured, map() fails with
ERR::MissingDependency and the clustering, greedy, discrete or simple mappers should be used instead.

-END-

*********************************************************************************************************************/

#include <algorithm>
#include <cmath>
#include <cstdint>
#include "mapping.h"

#ifdef MORPHIC_ASSIGNMENT_SOLVER
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/successive_shortest_path_nonnegative_weights.hpp>
#endif

namespace mx {

#ifdef MORPHIC_ASSIGNMENT_SOLVER

typedef boost::adjacency_list_traits<boost::vecS, boost::vecS, boost::directedS> FlowTraits;
typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::directedS, boost::no_property,
   boost::property<boost::edge_capacity_t, int64_t,
   boost::property<boost::edge_residual_capacity_t, int64_t,
   boost::property<boost::edge_reverse_t, FlowTraits::edge_descriptor,
   boost::property<boost::edge_weight_t, int64_t>>>>> FlowGraph;

static const double COST_SCALE = 1e6;

//********************************************************************************************************************
// Adds an edge and its residual partner.  The partner has no capacity and the negated cost.

static void add_flow_edge(FlowGraph &Graph, int From, int To, int64_t Cost)
{
   auto capacity = get(boost::edge_capacity, Graph);
   auto reverse  = get(boost::edge_reverse, Graph);
   auto weight   = get(boost::edge_weight, Graph);

   auto e   = add_edge(From, To, Graph).first;
   auto rev = add_edge(To, From, Graph).first;
   capacity[e] = 1;
   capacity[rev] = 0;
   weight[e] = Cost;
   weight[rev] = -Cost;
   reverse[e] = rev;
   reverse[rev] = e;
}

//********************************************************************************************************************
// Solves a square assignment problem.  Columns[r] receives the column assigned to row r.

static ERR solve_assignment(const std::vector<std::vector<double>> &Costs, std::vector<int> &Columns)
{
   Log log(__FUNCTION__);

   const int size = int(Costs.size());
   const int source = 2 * size, sink = 2 * size + 1;

   FlowGraph graph(2 * size + 2);
   for (int r=0; r < size; r++) {
      add_flow_edge(graph, source, r, 0);
      add_flow_edge(graph, size + r, sink, 0);
      for (int c=0; c < size; c++) {
         add_flow_edge(graph, r, size + c, std::llround(Costs[r][c] * COST_SCALE));
      }
   }

   boost::successive_shortest_path_nonnegative_weights(graph, source, sink);

   auto capacity = get(boost::edge_capacity, graph);
   auto residual = get(boost::edge_residual_capacity, graph);

   Columns.assign(size, -1);
   for (int r=0; r < size; r++) {
      for (auto [ei, end] = out_edges(r, graph); ei != end; ++ei) {
         int target = int(boost::target(*ei, graph));
         if ((target >= size) and (target < 2 * size) and (capacity[*ei] - residual[*ei] > 0)) {
            Columns[r] = target - size;
            break;
         }
      }

      if (Columns[r] < 0) {
         log.warning("Row %d was not assigned.", r);
         return ERR::Failed;
      }
   }

   return ERR::Okay;
}

#endif

//********************************************************************************************************************

bool HungarianMapper::available()
{
#ifdef MORPHIC_ASSIGNMENT_SOLVER
   return true;
#else
   return false;
#endif
}

//********************************************************************************************************************

ERR HungarianMapper::map(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2)
{
#ifdef MORPHIC_ASSIGNMENT_SOLVER
   if (map_degenerate(Loops1, Loops2, Matched1, Matched2)) return ERR::Okay;

   const size_t n = Loops1.size(), m = Loops2.size();
   const size_t size = std::max(n, m);

   auto c1 = loop_centroids(Loops1);
   auto c2 = loop_centroids(Loops2);

   std::vector<std::vector<double>> costs(size, std::vector<double>(size));
   for (size_t r=0; r < size; r++) {
      for (size_t c=0; c < size; c++) costs[r][c] = c1[r % n].distance(c2[c % m]);
   }

   std::vector<int> columns;
   if (auto error = solve_assignment(costs, columns); error != ERR::Okay) return error;

   Matched1.clear();
   Matched2.clear();
   for (size_t r=0; r < size; r++) {
      Matched1.push_back(Loops1[r % n]);
      Matched2.push_back(Loops2[size_t(columns[r]) % m]);
   }
   return ERR::Okay;
#else
   Log log("HungarianMapper");
   log.warning("The assignment solver is not available in this build.  Use the 'clustering', 'greedy', 'discrete' or 'simple' mapper instead.");
   return ERR::MissingDependency;
#endif
}

} // namespace
