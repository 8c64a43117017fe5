#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cataphract/core/campaign.h"
#include "cataphract/core/ids.h"

namespace cataphract {

// Axial hex helpers.
int hex_distance(int q1, int r1, int q2, int r2);

// Read-only view of a campaign's topology, rebuilt once per day-part.
//
// Holds copies (not pointers) of the topology so resolvers can freely mutate
// Campaign::map.hexes yield state while the graph stays valid.
class MapGraph {
 public:
  struct Node {
    Id id{kInvalidId};
    int q{0};
    int r{0};
    Terrain terrain{Terrain::Flat};
    bool is_sea{false};
  };

  MapGraph() = default;
  explicit MapGraph(const CampaignMap& map, double hex_miles = 6.0);

  bool has_hex(Id id) const { return nodes_.count(id) != 0; }
  const Node* node(Id id) const;

  std::optional<Id> hex_at(int q, int r) const;

  // Cube distance in hexes, or -1 if either hex is unknown.
  int distance(Id a, Id b) const;

  // Existing neighbours in ascending id order.
  std::vector<Id> neighbors(Id id) const;

  // Hexes with distance(center, h) <= radius, ascending id order.
  std::vector<Id> hexes_within(Id center, int radius) const;

  const Road* road_between(Id a, Id b) const;
  bool has_ford(Id a, Id b) const;
  const SeaLane* sea_lane(Id a, Id b) const;

  // Overland courier distance in miles: Dijkstra over hex adjacency, each step
  // costing hex_miles (divided by the road's speed modifier where a road exists).
  std::optional<double> shortest_path_miles(Id from, Id to) const;

  double hex_miles() const { return hex_miles_; }

 private:
  static std::uint64_t edge_key(Id a, Id b);

  double hex_miles_{6.0};
  std::unordered_map<Id, Node> nodes_;
  std::unordered_map<std::uint64_t, Id> by_coord_;
  std::unordered_map<std::uint64_t, Road> roads_;
  std::unordered_map<std::uint64_t, bool> fords_;
  std::unordered_map<std::uint64_t, SeaLane> lanes_;
};

} // namespace cataphract
