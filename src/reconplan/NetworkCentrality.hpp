#pragma once

#include "reconplan/NetworkGraph.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace reconplan {

// Structural importance of nodes in the distribution network.
//
// High scores flag single-point-of-failure candidates: a substation feeder
// junction that carries most shortest paths, a network point whose loss would
// split off a neighbourhood, and so on.
//
// Implementation notes:
//  - Closeness and betweenness run one Dijkstra per source over the weights
//    selected by CentralityConfig::weight (O(V*(V+E) log V) total).
//  - Betweenness is Brandes' accumulation. Ties between equal-cost paths are
//    counted exactly (sigma), and only settled nodes become predecessors, so
//    zero-length edges cannot create predecessor cycles.
//  - Eigenvector centrality is a power iteration on (A + I) with an iteration
//    cap. Non-convergence is reported, not fatal.
//  - Normalizations follow the usual graph-tooling conventions so results can
//    be compared with external analyses.

enum class CentralityMetric : std::uint8_t {
  Degree = 0,
  Closeness = 1,
  Betweenness = 2,
  Eigenvector = 3,
};

const char* ToString(CentralityMetric m);
bool ParseCentralityMetric(const std::string& s, CentralityMetric& out);

struct CentralityConfig {
  RoutingWeight weight = RoutingWeight::Length;

  // Betweenness: scale by 2/((n-1)(n-2)) into 0..1.
  bool normalize = true;

  // Closeness: scale by (reachable-1)/(n-1) so nodes stranded in small
  // components rank lower than nodes on the main network.
  bool closenessComponentScale = true;

  int eigenMaxIterations = 100;
  double eigenTolerance = 1.0e-6;
};

struct CentralityResult {
  CentralityMetric metric = CentralityMetric::Degree;

  // Score per node index.
  std::vector<double> score;

  // Per-edge betweenness (betweenness only, same normalization flag, 2/(n(n-1))).
  std::vector<double> edgeScore;

  // Eigenvector only.
  int iterations = 0;
  bool converged = true;
};

CentralityResult ComputeCentrality(const NetworkGraph& g, CentralityMetric metric, const CentralityConfig& cfg = {});

// Node id -> score.
std::unordered_map<std::string, double> CentralityScoresById(const NetworkGraph& g, const CentralityResult& r);

// Indices of the `topN` highest-scoring nodes (score descending, index ascending).
// topN <= 0 returns every node.
std::vector<int> TopCriticalNodes(const CentralityResult& r, int topN);

// Memoizes centrality results for one graph at a time.
//
// Entries are keyed by (metric, config). The graph is identified by its content
// fingerprint (HashNetworkGraph); a different fingerprint drops every entry.
class CentralityCache {
public:
  const CentralityResult& get(const NetworkGraph& g, CentralityMetric metric, const CentralityConfig& cfg = {});

  void clear();

  std::size_t size() const { return m_entries.size(); }
  int hits() const { return m_hits; }
  int misses() const { return m_misses; }

private:
  using Key = std::tuple<int, int, bool, bool, int, double>;

  static Key MakeKey(CentralityMetric metric, const CentralityConfig& cfg);

  bool m_hasFingerprint = false;
  std::uint64_t m_fingerprint = 0;
  std::map<Key, CentralityResult> m_entries;
  int m_hits = 0;
  int m_misses = 0;
};

} // namespace reconplan
