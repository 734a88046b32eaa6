#pragma once

#include "reconplan/Enums.hpp"
#include "reconplan/Types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace reconplan {

// Undirected topology graph of the distribution network.
//
// Nodes are substations, network points (cable junctions/ends) and buildings.
// Edges are cable segments between network points/substations and "connection"
// service drops that attach a building or substation to its nearest network point.
//
// Node identifiers from the input are interned: every node gets a dense integer
// index (its position in `nodes`) and all adjacency uses those indices. The string
// id is kept for reporting and for lookups through `nodeIndex`.
//
// The graph is built once (BuildNetworkGraph + ConnectNodesToNearest) and then
// treated as read-only by every analysis in NetworkCentrality.hpp.

struct NetworkNode {
  std::string id;
  NodeKind kind = NodeKind::NetworkPoint;
  Vec2 pos{};

  // Substation payload.
  double capacity = 0.0;
  std::string name;

  // Building payload. `powered` mirrors the survey's connected flag;
  // `attached` is set when a connection edge links the building into the graph.
  int inhabitants = 0;
  bool powered = false;
  bool attached = false;

  std::vector<int> edges; // indices into NetworkGraph::edges
};

struct NetworkEdge {
  std::string id;
  int a = -1;
  int b = -1;
  double length = 0.0;
  EdgeKind kind = EdgeKind::Segment;
  SegmentStatus status = SegmentStatus::Active;
  bool hasCapacity = false;
  double capacity = 0.0;
};

struct NetworkGraph {
  std::vector<NetworkNode> nodes;
  std::vector<NetworkEdge> edges;
  std::unordered_map<std::string, int> nodeIndex;

  // -1 if the id is unknown.
  int findNode(const std::string& id) const;

  // Index of the edge joining a and b, or -1.
  int findEdge(int a, int b) const;

  int nodeCount() const { return static_cast<int>(nodes.size()); }
  int edgeCount() const { return static_cast<int>(edges.size()); }
};

// Edge description with endpoints given by node identifier (as in the input files).
struct NetworkEdgeSpec {
  std::string id;
  std::string from;
  std::string to;
  double length = 0.0;
  EdgeKind kind = EdgeKind::Segment;
  SegmentStatus status = SegmentStatus::Active;
  bool hasCapacity = false;
  double capacity = 0.0;
};

// How edge costs are derived for routing and centrality.
enum class RoutingWeight : std::uint8_t {
  Length = 0,          // weight = edge length
  DamagePenalized = 1, // damaged segments cost kDamagedSegmentPenalty x their length
};

inline constexpr double kDamagedSegmentPenalty = 10.0;

const char* ToString(RoutingWeight w);
bool ParseRoutingWeight(const std::string& s, RoutingWeight& out);

double EdgeWeight(const NetworkEdge& e, RoutingWeight mode);

// Build the graph. `nodes[i].edges` is ignored and rebuilt.
//
// Fails (returns false, graph left empty) on:
//  - empty or duplicate node identifiers
//  - an edge endpoint that names no node
//  - a negative or non-finite edge length
//  - a self loop, or a second edge between the same pair of nodes
bool BuildNetworkGraph(const std::vector<NetworkNode>& nodes, const std::vector<NetworkEdgeSpec>& edges,
                       NetworkGraph& out, std::string& outError);

struct NearestConnectionResult {
  // Nodes of the requested kind that received a new connection edge.
  std::vector<int> attached;

  // Nodes left without a connection because no network point lies within reach.
  std::vector<int> unattached;

  // Indices of the inserted edges.
  std::vector<int> newEdges;
};

// For every node of `kind` that has no connection edge yet, find the nearest
// network point (Euclidean distance on Vec2) and, if it lies strictly closer than
// `maxDistance`, insert a Connection edge whose length is that distance. A node
// already joined to that point by a segment is marked attached without a new edge.
//
// Nearest-neighbour queries go through a vantage-point tree over the network
// points, so the cost is O(m log m) to index plus ~O(log m) per query instead of
// a full scan per node.
NearestConnectionResult ConnectNodesToNearest(NetworkGraph& g, NodeKind kind, double maxDistance);

struct ComponentPartition {
  // Component id for every node. Ids are assigned in order of each component's
  // lowest node index, so they are stable for a given graph.
  std::vector<int> nodeComponent;

  // Node indices of each component, ascending.
  std::vector<std::vector<int>> members;

  int count() const { return static_cast<int>(members.size()); }
};

// Breadth-first labelling, O(V+E).
ComponentPartition ComputeConnectedComponents(const NetworkGraph& g);

struct ShortestPath {
  bool found = false;
  std::vector<int> nodes; // inclusive of source and target
  double cost = 0.0;      // summed EdgeWeight along the path
};

// Dijkstra from source to target.
//
// Returns false (out.found == false) when the two nodes lie in different
// components or an index is out of range. That is an expected outcome for a
// damaged network, not an error.
bool FindShortestPath(const NetworkGraph& g, int source, int target, ShortestPath& out,
                      RoutingWeight mode = RoutingWeight::Length);

// Sum the weights of the edges along a node sequence.
// Fails if two consecutive nodes are not adjacent or an index is invalid.
bool ComputePathCost(const NetworkGraph& g, const std::vector<int>& path, double& outCost, std::string& outError,
                     RoutingWeight mode = RoutingWeight::Length);

struct SubstationRoute {
  int substation = -1;
  ShortestPath path;
};

// Shortest route from `from` to every substation it can reach, ordered by
// ascending cost then substation index.
std::vector<SubstationRoute> FindPathsToSubstations(const NetworkGraph& g, int from,
                                                    RoutingWeight mode = RoutingWeight::Length);

struct NetworkStats {
  int nodes = 0;
  int edges = 0;
  int substations = 0;
  int networkPoints = 0;
  int buildings = 0;
  int buildingsAttached = 0;
  int segments = 0;
  int connections = 0;
  int damagedSegments = 0;

  int components = 0;
  bool connected = false;

  int minDegree = 0;
  int maxDegree = 0;
  double avgDegree = 0.0;

  double totalLength = 0.0;
  double damagedLength = 0.0;
};

NetworkStats ComputeNetworkStats(const NetworkGraph& g);

// Content fingerprint of the graph (64-bit FNV-1a over ids, kinds, positions and
// edges). Two graphs with the same fingerprint are treated as identical by the
// metric cache.
std::uint64_t HashNetworkGraph(const NetworkGraph& g);

} // namespace reconplan
