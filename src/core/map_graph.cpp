#include "cataphract/core/map_graph.h"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <queue>

namespace cataphract {
namespace {

constexpr int kDirs[6][2] = {{1, 0}, {1, -1}, {0, -1}, {-1, 0}, {-1, 1}, {0, 1}};

std::uint64_t coord_key(int q, int r) {
  return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(q)) << 32) |
         static_cast<std::uint64_t>(static_cast<std::uint32_t>(r));
}

} // namespace

int hex_distance(int q1, int r1, int q2, int r2) {
  const int dq = q1 - q2;
  const int dr = r1 - r2;
  const int ds = -dq - dr;
  return std::max({std::abs(dq), std::abs(dr), std::abs(ds)});
}

std::uint64_t MapGraph::edge_key(Id a, Id b) {
  if (a > b) std::swap(a, b);
  // Ids are allocated sequentially and comfortably fit in 32 bits.
  return (a << 32) ^ (b & 0xffffffffULL);
}

MapGraph::MapGraph(const CampaignMap& map, double hex_miles) : hex_miles_(hex_miles) {
  for (const auto& [id, h] : map.hexes) {
    Node n;
    n.id = id;
    n.q = h.q;
    n.r = h.r;
    n.terrain = h.terrain;
    n.is_sea = h.is_sea();
    nodes_[id] = n;
    by_coord_[coord_key(h.q, h.r)] = id;
  }
  for (const auto& road : map.roads) roads_[edge_key(road.a, road.b)] = road;
  for (const auto& rc : map.river_crossings) fords_[edge_key(rc.a, rc.b)] = true;
  for (const auto& lane : map.sea_lanes) lanes_[edge_key(lane.a, lane.b)] = lane;
}

const MapGraph::Node* MapGraph::node(Id id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

std::optional<Id> MapGraph::hex_at(int q, int r) const {
  auto it = by_coord_.find(coord_key(q, r));
  if (it == by_coord_.end()) return std::nullopt;
  return it->second;
}

int MapGraph::distance(Id a, Id b) const {
  const Node* na = node(a);
  const Node* nb = node(b);
  if (!na || !nb) return -1;
  return hex_distance(na->q, na->r, nb->q, nb->r);
}

std::vector<Id> MapGraph::neighbors(Id id) const {
  std::vector<Id> out;
  const Node* n = node(id);
  if (!n) return out;
  for (const auto& d : kDirs) {
    if (auto nb = hex_at(n->q + d[0], n->r + d[1])) out.push_back(*nb);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Id> MapGraph::hexes_within(Id center, int radius) const {
  std::vector<Id> out;
  const Node* c = node(center);
  if (!c || radius < 0) return out;
  for (int dq = -radius; dq <= radius; ++dq) {
    for (int dr = std::max(-radius, -dq - radius); dr <= std::min(radius, -dq + radius); ++dr) {
      if (auto h = hex_at(c->q + dq, c->r + dr)) out.push_back(*h);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

const Road* MapGraph::road_between(Id a, Id b) const {
  auto it = roads_.find(edge_key(a, b));
  return it == roads_.end() ? nullptr : &it->second;
}

bool MapGraph::has_ford(Id a, Id b) const { return fords_.count(edge_key(a, b)) != 0; }

const SeaLane* MapGraph::sea_lane(Id a, Id b) const {
  auto it = lanes_.find(edge_key(a, b));
  return it == lanes_.end() ? nullptr : &it->second;
}

std::optional<double> MapGraph::shortest_path_miles(Id from, Id to) const {
  if (!has_hex(from) || !has_hex(to)) return std::nullopt;
  if (from == to) return 0.0;

  using Item = std::pair<double, Id>;
  std::priority_queue<Item, std::vector<Item>, std::greater<Item>> open;
  std::unordered_map<Id, double> best;
  best[from] = 0.0;
  open.push({0.0, from});

  while (!open.empty()) {
    const auto [d, cur] = open.top();
    open.pop();
    if (cur == to) return d;
    if (d > best[cur]) continue;
    for (Id nb : neighbors(cur)) {
      double step = hex_miles_;
      const Road* road = road_between(cur, nb);
      if (road && road->cost_modifier > 0.0) step /= road->cost_modifier;
      const double nd = d + step;
      auto it = best.find(nb);
      if (it == best.end() || nd < it->second) {
        best[nb] = nd;
        open.push({nd, nb});
      }
    }
  }
  return std::nullopt;
}

} // namespace cataphract
