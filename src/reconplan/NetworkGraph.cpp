#include "reconplan/NetworkGraph.hpp"

#include "reconplan/SpatialIndex.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

namespace reconplan {

namespace {

constexpr std::uint64_t kFNVOffset = 1469598103934665603ull;
constexpr std::uint64_t kFNVPrime = 1099511628211ull;

inline void HashByte(std::uint64_t& h, std::uint8_t b)
{
  h ^= static_cast<std::uint64_t>(b);
  h *= kFNVPrime;
}

inline void HashU64(std::uint64_t& h, std::uint64_t v)
{
  for (int s = 0; s < 64; s += 8) HashByte(h, static_cast<std::uint8_t>((v >> s) & 0xFFull));
}

inline void HashI32(std::uint64_t& h, int v)
{
  std::uint32_t uv = 0;
  std::memcpy(&uv, &v, sizeof(uv));
  for (int s = 0; s < 32; s += 8) HashByte(h, static_cast<std::uint8_t>((uv >> s) & 0xFFu));
}

inline void HashF64(std::uint64_t& h, double v)
{
  static_assert(sizeof(double) == 8, "double must be 64-bit");
  // Collapse -0.0 so it hashes like 0.0.
  if (v == 0.0) v = 0.0;
  std::uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  HashU64(h, bits);
}

inline void HashString(std::uint64_t& h, const std::string& s)
{
  HashU64(h, static_cast<std::uint64_t>(s.size()));
  for (char c : s) HashByte(h, static_cast<std::uint8_t>(c));
}

} // namespace

int NetworkGraph::findNode(const std::string& id) const
{
  const auto it = nodeIndex.find(id);
  return (it == nodeIndex.end()) ? -1 : it->second;
}

int NetworkGraph::findEdge(int a, int b) const
{
  if (a < 0 || b < 0 || a >= nodeCount() || b >= nodeCount()) return -1;
  // Scan the smaller adjacency list.
  const NetworkNode& na = nodes[static_cast<std::size_t>(a)];
  const NetworkNode& nb = nodes[static_cast<std::size_t>(b)];
  const bool useA = na.edges.size() <= nb.edges.size();
  const std::vector<int>& adj = useA ? na.edges : nb.edges;
  const int other = useA ? b : a;
  for (int ei : adj) {
    const NetworkEdge& e = edges[static_cast<std::size_t>(ei)];
    if (e.a == other || e.b == other) return ei;
  }
  return -1;
}

const char* ToString(RoutingWeight w)
{
  switch (w) {
  case RoutingWeight::Length: return "length";
  case RoutingWeight::DamagePenalized: return "damage_penalized";
  default: return "length";
  }
}

bool ParseRoutingWeight(const std::string& s, RoutingWeight& out)
{
  std::string t;
  t.reserve(s.size());
  for (char c : s) {
    const unsigned char uc = static_cast<unsigned char>(c);
    t.push_back((c == '-' || c == ' ') ? '_' : static_cast<char>(std::tolower(uc)));
  }
  if (t == "length" || t == "distance") {
    out = RoutingWeight::Length;
    return true;
  }
  if (t == "damage_penalized" || t == "damaged" || t == "penalized") {
    out = RoutingWeight::DamagePenalized;
    return true;
  }
  return false;
}

double EdgeWeight(const NetworkEdge& e, RoutingWeight mode)
{
  if (mode == RoutingWeight::DamagePenalized && e.status == SegmentStatus::Damaged) {
    return e.length * kDamagedSegmentPenalty;
  }
  return e.length;
}

bool BuildNetworkGraph(const std::vector<NetworkNode>& nodes, const std::vector<NetworkEdgeSpec>& edges,
                       NetworkGraph& out, std::string& outError)
{
  outError.clear();
  out = NetworkGraph{};

  NetworkGraph g;
  g.nodes.reserve(nodes.size());
  g.nodeIndex.reserve(nodes.size());

  for (const NetworkNode& src : nodes) {
    if (src.id.empty()) {
      outError = "node with empty identifier";
      return false;
    }
    const int idx = static_cast<int>(g.nodes.size());
    if (!g.nodeIndex.emplace(src.id, idx).second) {
      outError = "duplicate node identifier '" + src.id + "'";
      return false;
    }
    g.nodes.push_back(src);
    g.nodes.back().edges.clear();
    g.nodes.back().attached = false;
  }

  g.edges.reserve(edges.size());
  for (const NetworkEdgeSpec& spec : edges) {
    const int a = g.findNode(spec.from);
    const int b = g.findNode(spec.to);
    if (a < 0 || b < 0) {
      outError = "edge '" + spec.id + "' references unknown node '" + (a < 0 ? spec.from : spec.to) + "'";
      return false;
    }
    if (!std::isfinite(spec.length) || spec.length < 0.0) {
      outError = "edge '" + spec.id + "' has invalid length";
      return false;
    }
    if (a == b) {
      outError = "edge '" + spec.id + "' is a self loop on '" + spec.from + "'";
      return false;
    }
    if (g.findEdge(a, b) >= 0) {
      outError = "edge '" + spec.id + "' duplicates an existing edge between '" + spec.from + "' and '" + spec.to + "'";
      return false;
    }

    NetworkEdge e;
    e.id = spec.id;
    e.a = a;
    e.b = b;
    e.length = spec.length;
    e.kind = spec.kind;
    e.status = spec.status;
    e.hasCapacity = spec.hasCapacity;
    e.capacity = spec.capacity;

    const int ei = static_cast<int>(g.edges.size());
    g.edges.push_back(std::move(e));
    g.nodes[static_cast<std::size_t>(a)].edges.push_back(ei);
    g.nodes[static_cast<std::size_t>(b)].edges.push_back(ei);

    if (spec.kind == EdgeKind::Connection) {
      NetworkNode& na = g.nodes[static_cast<std::size_t>(a)];
      NetworkNode& nb = g.nodes[static_cast<std::size_t>(b)];
      if (na.kind != NodeKind::NetworkPoint) na.attached = true;
      if (nb.kind != NodeKind::NetworkPoint) nb.attached = true;
    }
  }

  out = std::move(g);
  return true;
}

NearestConnectionResult ConnectNodesToNearest(NetworkGraph& g, NodeKind kind, double maxDistance)
{
  NearestConnectionResult r;
  if (kind == NodeKind::NetworkPoint) return r;

  std::vector<int> ids;
  std::vector<Vec2> pts;
  for (int i = 0; i < g.nodeCount(); ++i) {
    const NetworkNode& n = g.nodes[static_cast<std::size_t>(i)];
    if (n.kind != NodeKind::NetworkPoint) continue;
    ids.push_back(i);
    pts.push_back(n.pos);
  }
  const PointVPTree tree(ids, pts);

  for (int i = 0; i < g.nodeCount(); ++i) {
    if (g.nodes[static_cast<std::size_t>(i)].kind != kind) continue;
    if (g.nodes[static_cast<std::size_t>(i)].attached) continue;

    const auto best = tree.nearest(g.nodes[static_cast<std::size_t>(i)].pos);
    if (best.second < 0 || !(best.first < maxDistance)) {
      r.unattached.push_back(i);
      continue;
    }
    if (g.findEdge(i, best.second) >= 0) {
      // Already wired to its nearest point by an input segment.
      g.nodes[static_cast<std::size_t>(i)].attached = true;
      continue;
    }

    NetworkEdge e;
    e.id = "conn_" + g.nodes[static_cast<std::size_t>(i)].id;
    e.a = i;
    e.b = best.second;
    e.length = best.first;
    e.kind = EdgeKind::Connection;

    const int ei = g.edgeCount();
    g.edges.push_back(std::move(e));
    g.nodes[static_cast<std::size_t>(i)].edges.push_back(ei);
    g.nodes[static_cast<std::size_t>(best.second)].edges.push_back(ei);
    g.nodes[static_cast<std::size_t>(i)].attached = true;

    r.attached.push_back(i);
    r.newEdges.push_back(ei);
  }

  return r;
}

ComponentPartition ComputeConnectedComponents(const NetworkGraph& g)
{
  ComponentPartition p;
  const int n = g.nodeCount();
  p.nodeComponent.assign(static_cast<std::size_t>(n), -1);

  std::vector<int> queue;
  queue.reserve(static_cast<std::size_t>(n));

  for (int start = 0; start < n; ++start) {
    if (p.nodeComponent[static_cast<std::size_t>(start)] >= 0) continue;

    const int cid = p.count();
    p.members.emplace_back();
    std::vector<int>& members = p.members.back();

    queue.clear();
    queue.push_back(start);
    p.nodeComponent[static_cast<std::size_t>(start)] = cid;

    for (std::size_t head = 0; head < queue.size(); ++head) {
      const int u = queue[head];
      members.push_back(u);
      for (int ei : g.nodes[static_cast<std::size_t>(u)].edges) {
        const NetworkEdge& e = g.edges[static_cast<std::size_t>(ei)];
        const int v = (e.a == u) ? e.b : e.a;
        if (p.nodeComponent[static_cast<std::size_t>(v)] >= 0) continue;
        p.nodeComponent[static_cast<std::size_t>(v)] = cid;
        queue.push_back(v);
      }
    }

    std::sort(members.begin(), members.end());
  }

  return p;
}

bool FindShortestPath(const NetworkGraph& g, int source, int target, ShortestPath& out, RoutingWeight mode)
{
  out = ShortestPath{};
  const int n = g.nodeCount();
  if (source < 0 || target < 0 || source >= n || target >= n) return false;

  if (source == target) {
    out.found = true;
    out.nodes.push_back(source);
    return true;
  }

  const double inf = std::numeric_limits<double>::infinity();
  std::vector<double> dist(static_cast<std::size_t>(n), inf);
  std::vector<int> parent(static_cast<std::size_t>(n), -1);

  using QItem = std::pair<double, int>;
  // Min-heap on (distance, node index): equal distances pop the lower index first.
  std::priority_queue<QItem, std::vector<QItem>, std::greater<QItem>> pq;

  dist[static_cast<std::size_t>(source)] = 0.0;
  pq.push({0.0, source});

  while (!pq.empty()) {
    const QItem cur = pq.top();
    pq.pop();
    const int u = cur.second;
    if (cur.first > dist[static_cast<std::size_t>(u)]) continue;
    if (u == target) break;

    for (int ei : g.nodes[static_cast<std::size_t>(u)].edges) {
      const NetworkEdge& e = g.edges[static_cast<std::size_t>(ei)];
      const int v = (e.a == u) ? e.b : e.a;
      const double nd = cur.first + EdgeWeight(e, mode);
      if (nd < dist[static_cast<std::size_t>(v)]) {
        dist[static_cast<std::size_t>(v)] = nd;
        parent[static_cast<std::size_t>(v)] = u;
        pq.push({nd, v});
      }
    }
  }

  if (!std::isfinite(dist[static_cast<std::size_t>(target)])) return false;

  for (int v = target; v >= 0; v = parent[static_cast<std::size_t>(v)]) {
    out.nodes.push_back(v);
    if (v == source) break;
  }
  std::reverse(out.nodes.begin(), out.nodes.end());
  out.cost = dist[static_cast<std::size_t>(target)];
  out.found = true;
  return true;
}

bool ComputePathCost(const NetworkGraph& g, const std::vector<int>& path, double& outCost, std::string& outError,
                     RoutingWeight mode)
{
  outCost = 0.0;
  outError.clear();

  for (int v : path) {
    if (v < 0 || v >= g.nodeCount()) {
      outError = "path contains invalid node index " + std::to_string(v);
      return false;
    }
  }

  double sum = 0.0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    const int ei = g.findEdge(path[i - 1], path[i]);
    if (ei < 0) {
      outError = "nodes '" + g.nodes[static_cast<std::size_t>(path[i - 1])].id + "' and '" +
                 g.nodes[static_cast<std::size_t>(path[i])].id + "' are not adjacent";
      return false;
    }
    sum += EdgeWeight(g.edges[static_cast<std::size_t>(ei)], mode);
  }

  outCost = sum;
  return true;
}

std::vector<SubstationRoute> FindPathsToSubstations(const NetworkGraph& g, int from, RoutingWeight mode)
{
  std::vector<SubstationRoute> routes;
  if (from < 0 || from >= g.nodeCount()) return routes;

  for (int i = 0; i < g.nodeCount(); ++i) {
    if (g.nodes[static_cast<std::size_t>(i)].kind != NodeKind::Substation) continue;
    SubstationRoute r;
    r.substation = i;
    if (FindShortestPath(g, from, i, r.path, mode)) routes.push_back(std::move(r));
  }

  std::stable_sort(routes.begin(), routes.end(), [](const SubstationRoute& a, const SubstationRoute& b) {
    if (a.path.cost != b.path.cost) return a.path.cost < b.path.cost;
    return a.substation < b.substation;
  });
  return routes;
}

NetworkStats ComputeNetworkStats(const NetworkGraph& g)
{
  NetworkStats s;
  s.nodes = g.nodeCount();
  s.edges = g.edgeCount();

  for (const NetworkNode& n : g.nodes) {
    switch (n.kind) {
    case NodeKind::Substation: ++s.substations; break;
    case NodeKind::NetworkPoint: ++s.networkPoints; break;
    case NodeKind::Building:
      ++s.buildings;
      if (n.attached) ++s.buildingsAttached;
      break;
    }
  }

  for (const NetworkEdge& e : g.edges) {
    s.totalLength += e.length;
    if (e.kind == EdgeKind::Segment) {
      ++s.segments;
      if (e.status == SegmentStatus::Damaged) {
        ++s.damagedSegments;
        s.damagedLength += e.length;
      }
    } else {
      ++s.connections;
    }
  }

  if (s.nodes > 0) {
    s.minDegree = std::numeric_limits<int>::max();
    for (const NetworkNode& n : g.nodes) {
      const int d = static_cast<int>(n.edges.size());
      s.minDegree = std::min(s.minDegree, d);
      s.maxDegree = std::max(s.maxDegree, d);
    }
    s.avgDegree = 2.0 * static_cast<double>(s.edges) / static_cast<double>(s.nodes);
  }

  s.components = ComputeConnectedComponents(g).count();
  s.connected = (s.components == 1);
  return s;
}

std::uint64_t HashNetworkGraph(const NetworkGraph& g)
{
  std::uint64_t h = kFNVOffset;

  HashI32(h, g.nodeCount());
  for (const NetworkNode& n : g.nodes) {
    HashString(h, n.id);
    HashByte(h, static_cast<std::uint8_t>(n.kind));
    HashF64(h, n.pos.x);
    HashF64(h, n.pos.y);
  }

  HashI32(h, g.edgeCount());
  for (const NetworkEdge& e : g.edges) {
    HashI32(h, e.a);
    HashI32(h, e.b);
    HashF64(h, e.length);
    HashByte(h, static_cast<std::uint8_t>(e.kind));
    HashByte(h, static_cast<std::uint8_t>(e.status));
  }

  return h;
}

} // namespace reconplan
