#pragma once

#include "reconplan/Types.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace reconplan {

// -----------------------------------------------------------------------------
// Vantage-point tree over planar points.
//
// Used to attach buildings/substations to their nearest network point. The
// query point is arbitrary (it is not one of the indexed items), which is the
// only difference from an id-to-id metric tree.
//
// Construction and queries are deterministic: the vantage point is always the
// last remaining item, median splits tie-break on item id, and equal distances
// resolve to the smaller id.
// -----------------------------------------------------------------------------

class PointVPTree {
public:
  // `ids` are caller-defined tags (typically node indices); `points[i]` is the
  // position of `ids[i]`. Both vectors must have the same size.
  PointVPTree(const std::vector<int>& ids, const std::vector<Vec2>& points)
  {
    std::vector<Item> items;
    items.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size() && i < points.size(); ++i) {
      items.push_back(Item{ids[i], points[i]});
    }
    // Build order must not depend on the caller's ordering.
    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b) { return a.id > b.id; });

    m_nodes.reserve(items.size());
    m_root = build(items);
  }

  bool empty() const { return m_root < 0; }
  std::size_t size() const { return m_nodes.size(); }

  // Nearest indexed item to `q` as (distance, id). Returns (inf, -1) if empty.
  std::pair<double, int> nearest(const Vec2& q) const
  {
    std::pair<double, int> best{std::numeric_limits<double>::infinity(), -1};
    search(m_root, q, best);
    return best;
  }

private:
  struct Item {
    int id = -1;
    Vec2 pos{};
  };

  struct Node {
    Item vp{};
    double threshold = 0.0;
    int left = -1;
    int right = -1;
  };

  std::vector<Node> m_nodes;
  int m_root = -1;

  int build(std::vector<Item>& items)
  {
    if (items.empty()) return -1;

    const int nodeId = static_cast<int>(m_nodes.size());
    m_nodes.push_back(Node{});
    m_nodes.back().vp = items.back();
    items.pop_back();

    const Vec2 vpPos = m_nodes.back().vp.pos;
    if (items.empty()) return nodeId;

    std::vector<std::pair<double, std::size_t>> dists;
    dists.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
      dists.emplace_back(Distance(vpPos, items[i].pos), i);
    }
    std::sort(dists.begin(), dists.end(), [&](const auto& a, const auto& b) {
      if (a.first < b.first) return true;
      if (a.first > b.first) return false;
      return items[a.second].id < items[b.second].id;
    });

    const std::size_t median = dists.size() / 2;
    const double threshold = dists[median].first;

    std::vector<Item> inner;
    std::vector<Item> outer;
    inner.reserve(median);
    outer.reserve(dists.size() - median);
    for (std::size_t i = 0; i < dists.size(); ++i) {
      const Item& it = items[dists[i].second];
      if (i < median) {
        inner.push_back(it);
      } else {
        outer.push_back(it);
      }
    }

    // m_nodes may reallocate during recursion; write through the index.
    const int left = build(inner);
    const int right = build(outer);
    Node& n = m_nodes[static_cast<std::size_t>(nodeId)];
    n.threshold = threshold;
    n.left = left;
    n.right = right;
    return nodeId;
  }

  void search(int nodeId, const Vec2& q, std::pair<double, int>& best) const
  {
    if (nodeId < 0) return;
    const Node& n = m_nodes[static_cast<std::size_t>(nodeId)];

    const double dist = Distance(q, n.vp.pos);
    if (dist < best.first || (dist == best.first && n.vp.id < best.second)) {
      best = {dist, n.vp.id};
    }

    if (n.left < 0 && n.right < 0) return;

    // `>=` / `<=` keep equal-distance candidates on both sides reachable so the
    // smaller-id tie-break is exact.
    if (dist < n.threshold) {
      search(n.left, q, best);
      if (dist + best.first >= n.threshold) search(n.right, q, best);
    } else {
      search(n.right, q, best);
      if (dist - best.first <= n.threshold) search(n.left, q, best);
    }
  }
};

} // namespace reconplan
