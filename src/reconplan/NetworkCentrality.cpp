#include "reconplan/NetworkCentrality.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

namespace reconplan {

namespace {

struct Adj {
  int to = -1;
  int edge = -1;
  double w = 0.0;
};

struct Pred {
  int v = -1;
  int edge = -1;
};

std::vector<std::vector<Adj>> BuildAdjacency(const NetworkGraph& g, RoutingWeight mode)
{
  const int n = g.nodeCount();
  std::vector<std::vector<Adj>> adj(static_cast<std::size_t>(n));
  for (int u = 0; u < n; ++u) {
    const NetworkNode& node = g.nodes[static_cast<std::size_t>(u)];
    std::vector<Adj>& a = adj[static_cast<std::size_t>(u)];
    a.reserve(node.edges.size());
    for (int ei : node.edges) {
      const NetworkEdge& e = g.edges[static_cast<std::size_t>(ei)];
      const int v = (e.a == u) ? e.b : e.a;
      a.push_back(Adj{v, ei, EdgeWeight(e, mode)});
    }
    std::sort(a.begin(), a.end(), [](const Adj& lhs, const Adj& rhs) {
      if (lhs.to != rhs.to) return lhs.to < rhs.to;
      return lhs.edge < rhs.edge;
    });
  }
  return adj;
}

// Path sums are accumulated in different orders along different routes.
// Treat distances within a relative 1e-12 as equal.
inline bool SameDistance(double a, double b)
{
  return std::fabs(a - b) <= 1.0e-12 * std::max(1.0, std::fabs(b));
}

// Shared single-source pass for closeness and betweenness.
struct SourceScratch {
  std::vector<double> dist;
  std::vector<double> sigma;
  std::vector<double> delta;
  std::vector<char> settled;
  std::vector<std::vector<Pred>> preds;
  std::vector<int> order; // settle order
};

void RunSource(const std::vector<std::vector<Adj>>& adj, int s, SourceScratch& sc)
{
  const std::size_t n = adj.size();
  const double inf = std::numeric_limits<double>::infinity();
  sc.dist.assign(n, inf);
  sc.sigma.assign(n, 0.0);
  sc.delta.assign(n, 0.0);
  sc.settled.assign(n, 0);
  sc.preds.resize(n);
  for (auto& p : sc.preds) p.clear();
  sc.order.clear();

  using QItem = std::pair<double, int>;
  std::priority_queue<QItem, std::vector<QItem>, std::greater<QItem>> pq;

  sc.dist[static_cast<std::size_t>(s)] = 0.0;
  sc.sigma[static_cast<std::size_t>(s)] = 1.0;
  pq.push({0.0, s});

  while (!pq.empty()) {
    const QItem it = pq.top();
    pq.pop();
    const int v = it.second;
    if (sc.settled[static_cast<std::size_t>(v)]) continue;
    if (it.first > sc.dist[static_cast<std::size_t>(v)]) continue;
    sc.settled[static_cast<std::size_t>(v)] = 1;
    sc.order.push_back(v);

    const double dv = sc.dist[static_cast<std::size_t>(v)];
    for (const Adj& e : adj[static_cast<std::size_t>(v)]) {
      const int w = e.to;
      if (sc.settled[static_cast<std::size_t>(w)]) continue;
      const double nd = dv + e.w;
      double& dw = sc.dist[static_cast<std::size_t>(w)];
      if (std::isfinite(dw) && SameDistance(nd, dw)) {
        sc.sigma[static_cast<std::size_t>(w)] += sc.sigma[static_cast<std::size_t>(v)];
        sc.preds[static_cast<std::size_t>(w)].push_back(Pred{v, e.edge});
      } else if (nd < dw) {
        dw = nd;
        pq.push({nd, w});
        sc.sigma[static_cast<std::size_t>(w)] = sc.sigma[static_cast<std::size_t>(v)];
        sc.preds[static_cast<std::size_t>(w)].clear();
        sc.preds[static_cast<std::size_t>(w)].push_back(Pred{v, e.edge});
      }
    }
  }
}

void ComputeDegree(const NetworkGraph& g, CentralityResult& out)
{
  const int n = g.nodeCount();
  out.score.assign(static_cast<std::size_t>(n), 0.0);
  if (n == 1) {
    out.score[0] = 1.0;
    return;
  }
  const double scale = (n > 1) ? 1.0 / static_cast<double>(n - 1) : 0.0;
  for (int i = 0; i < n; ++i) {
    out.score[static_cast<std::size_t>(i)] =
        static_cast<double>(g.nodes[static_cast<std::size_t>(i)].edges.size()) * scale;
  }
}

void ComputeCloseness(const NetworkGraph& g, const CentralityConfig& cfg, CentralityResult& out)
{
  const int n = g.nodeCount();
  out.score.assign(static_cast<std::size_t>(n), 0.0);
  const auto adj = BuildAdjacency(g, cfg.weight);

  SourceScratch sc;
  for (int s = 0; s < n; ++s) {
    RunSource(adj, s, sc);

    double sumDist = 0.0;
    const int reachable = static_cast<int>(sc.order.size());
    for (int v : sc.order) sumDist += sc.dist[static_cast<std::size_t>(v)];

    double closeness = 0.0;
    if (reachable > 1 && sumDist > 0.0) {
      closeness = static_cast<double>(reachable - 1) / sumDist;
      if (cfg.closenessComponentScale && n > 1) {
        closeness *= static_cast<double>(reachable - 1) / static_cast<double>(n - 1);
      }
    }
    out.score[static_cast<std::size_t>(s)] = closeness;
  }
}

void ComputeBetweenness(const NetworkGraph& g, const CentralityConfig& cfg, CentralityResult& out)
{
  const int n = g.nodeCount();
  const int m = g.edgeCount();
  out.score.assign(static_cast<std::size_t>(n), 0.0);
  out.edgeScore.assign(static_cast<std::size_t>(m), 0.0);
  const auto adj = BuildAdjacency(g, cfg.weight);

  SourceScratch sc;
  for (int s = 0; s < n; ++s) {
    RunSource(adj, s, sc);

    // Accumulate dependencies in reverse settle order.
    for (auto it = sc.order.rbegin(); it != sc.order.rend(); ++it) {
      const int w = *it;
      const double sigmaW = sc.sigma[static_cast<std::size_t>(w)];
      if (sigmaW <= 0.0) continue;

      for (const Pred& p : sc.preds[static_cast<std::size_t>(w)]) {
        const double c =
            (sc.sigma[static_cast<std::size_t>(p.v)] / sigmaW) * (1.0 + sc.delta[static_cast<std::size_t>(w)]);
        sc.delta[static_cast<std::size_t>(p.v)] += c;
        out.edgeScore[static_cast<std::size_t>(p.edge)] += c;
      }
      if (w != s) out.score[static_cast<std::size_t>(w)] += sc.delta[static_cast<std::size_t>(w)];
    }
  }

  // Each unordered pair was counted from both ends.
  for (double& v : out.score) v *= 0.5;
  for (double& v : out.edgeScore) v *= 0.5;

  if (cfg.normalize) {
    const double nodeScale =
        (n > 2) ? 2.0 / (static_cast<double>(n - 1) * static_cast<double>(n - 2)) : 0.0;
    const double edgeScale = (n > 1) ? 2.0 / (static_cast<double>(n) * static_cast<double>(n - 1)) : 0.0;
    for (double& v : out.score) v *= nodeScale;
    for (double& v : out.edgeScore) v *= edgeScale;
  }
}

void ComputeEigenvector(const NetworkGraph& g, const CentralityConfig& cfg, CentralityResult& out)
{
  const int n = g.nodeCount();
  out.score.assign(static_cast<std::size_t>(n), 0.0);
  out.iterations = 0;
  out.converged = true;
  if (n == 0) return;

  std::vector<double> x(static_cast<std::size_t>(n), 1.0 / static_cast<double>(n));
  std::vector<double> next(static_cast<std::size_t>(n), 0.0);

  out.converged = false;
  const int maxIter = std::max(1, cfg.eigenMaxIterations);
  for (int iter = 0; iter < maxIter; ++iter) {
    // next = (A + I) x
    for (int u = 0; u < n; ++u) {
      double acc = x[static_cast<std::size_t>(u)];
      for (int ei : g.nodes[static_cast<std::size_t>(u)].edges) {
        const NetworkEdge& e = g.edges[static_cast<std::size_t>(ei)];
        const int v = (e.a == u) ? e.b : e.a;
        acc += x[static_cast<std::size_t>(v)];
      }
      next[static_cast<std::size_t>(u)] = acc;
    }

    double norm = 0.0;
    for (double v : next) norm += v * v;
    norm = std::sqrt(norm);
    if (norm <= 0.0) break;
    for (double& v : next) v /= norm;

    double diff = 0.0;
    for (int i = 0; i < n; ++i) {
      diff += std::fabs(next[static_cast<std::size_t>(i)] - x[static_cast<std::size_t>(i)]);
    }
    x.swap(next);
    out.iterations = iter + 1;

    if (diff < static_cast<double>(n) * cfg.eigenTolerance) {
      out.converged = true;
      break;
    }
  }

  out.score = std::move(x);
}

} // namespace

const char* ToString(CentralityMetric m)
{
  switch (m) {
  case CentralityMetric::Degree: return "degree";
  case CentralityMetric::Closeness: return "closeness";
  case CentralityMetric::Betweenness: return "betweenness";
  case CentralityMetric::Eigenvector: return "eigenvector";
  default: return "degree";
  }
}

bool ParseCentralityMetric(const std::string& s, CentralityMetric& out)
{
  std::string t;
  t.reserve(s.size());
  for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (t == "degree") {
    out = CentralityMetric::Degree;
    return true;
  }
  if (t == "closeness") {
    out = CentralityMetric::Closeness;
    return true;
  }
  if (t == "betweenness" || t == "between") {
    out = CentralityMetric::Betweenness;
    return true;
  }
  if (t == "eigenvector" || t == "eigen") {
    out = CentralityMetric::Eigenvector;
    return true;
  }
  return false;
}

CentralityResult ComputeCentrality(const NetworkGraph& g, CentralityMetric metric, const CentralityConfig& cfg)
{
  CentralityResult out;
  out.metric = metric;

  switch (metric) {
  case CentralityMetric::Degree: ComputeDegree(g, out); break;
  case CentralityMetric::Closeness: ComputeCloseness(g, cfg, out); break;
  case CentralityMetric::Betweenness: ComputeBetweenness(g, cfg, out); break;
  case CentralityMetric::Eigenvector: ComputeEigenvector(g, cfg, out); break;
  }
  return out;
}

std::unordered_map<std::string, double> CentralityScoresById(const NetworkGraph& g, const CentralityResult& r)
{
  std::unordered_map<std::string, double> out;
  out.reserve(r.score.size());
  const std::size_t n = std::min(r.score.size(), g.nodes.size());
  for (std::size_t i = 0; i < n; ++i) out.emplace(g.nodes[i].id, r.score[i]);
  return out;
}

std::vector<int> TopCriticalNodes(const CentralityResult& r, int topN)
{
  std::vector<int> idx(r.score.size());
  for (std::size_t i = 0; i < idx.size(); ++i) idx[i] = static_cast<int>(i);

  std::sort(idx.begin(), idx.end(), [&](int a, int b) {
    const double sa = r.score[static_cast<std::size_t>(a)];
    const double sb = r.score[static_cast<std::size_t>(b)];
    if (sa != sb) return sa > sb;
    return a < b;
  });

  if (topN > 0 && static_cast<std::size_t>(topN) < idx.size()) idx.resize(static_cast<std::size_t>(topN));
  return idx;
}

CentralityCache::Key CentralityCache::MakeKey(CentralityMetric metric, const CentralityConfig& cfg)
{
  // Fields a metric does not read are zeroed so equivalent requests share an entry.
  const bool pathBased = (metric == CentralityMetric::Closeness || metric == CentralityMetric::Betweenness);
  return Key{static_cast<int>(metric),
             pathBased ? static_cast<int>(cfg.weight) : 0,
             metric == CentralityMetric::Betweenness && cfg.normalize,
             metric == CentralityMetric::Closeness && cfg.closenessComponentScale,
             metric == CentralityMetric::Eigenvector ? cfg.eigenMaxIterations : 0,
             metric == CentralityMetric::Eigenvector ? cfg.eigenTolerance : 0.0};
}

const CentralityResult& CentralityCache::get(const NetworkGraph& g, CentralityMetric metric,
                                             const CentralityConfig& cfg)
{
  const std::uint64_t fp = HashNetworkGraph(g);
  if (!m_hasFingerprint || fp != m_fingerprint) {
    m_entries.clear();
    m_fingerprint = fp;
    m_hasFingerprint = true;
  }

  const Key key = MakeKey(metric, cfg);
  auto it = m_entries.find(key);
  if (it != m_entries.end()) {
    ++m_hits;
    return it->second;
  }

  ++m_misses;
  auto ins = m_entries.emplace(key, ComputeCentrality(g, metric, cfg));
  return ins.first->second;
}

void CentralityCache::clear()
{
  m_entries.clear();
  m_hasFingerprint = false;
  m_fingerprint = 0;
}

} // namespace reconplan
