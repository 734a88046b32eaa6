#pragma once

#include "reconplan/Enums.hpp"
#include "reconplan/Types.hpp"

#include <string>

namespace reconplan {

// Input records consumed by the planning core.
//
// These are produced by the ingestion layer (see Scenario.hpp) after validation,
// so every field here already satisfies its documented range. The core never
// mutates identity fields; derived values live in separate output rows
// (RankedBuilding, BuildingRepairSummary, Phase).

struct BuildingRecord {
  std::string id;
  int inhabitants = 0;
  BuildingType type = BuildingType::Residential;
  BuildingPriority priority = BuildingPriority::Medium;
  bool connected = true;

  // Estimated reconnection cost and distance to the existing network, as surveyed.
  // Used by the multi-criteria ranking. The phased planner uses the cost model instead.
  double cost = 0.0;
  double distance = 0.0;

  // Optional planar position, used when the building is added to the network graph.
  bool hasPosition = false;
  Vec2 pos{};
};

struct InfraRecord {
  std::string id;
  std::string buildingId;
  InfraType type = InfraType::Aerial;
  InfraState state = InfraState::Intact;
  double length = 0.0;
  int housesServed = 0;
};

struct SegmentRecord {
  std::string id;
  std::string endpointA;
  std::string endpointB;
  double length = 0.0;
  SegmentStatus status = SegmentStatus::Active;
  bool hasCapacity = false;
  double capacity = 0.0;
};

struct NetworkPointRecord {
  std::string id;
  Vec2 pos{};
};

struct SubstationRecord {
  std::string id;
  Vec2 pos{};
  double capacity = 0.0;
  std::string name;
};

} // namespace reconplan
