#pragma once

#include "reconplan/Json.hpp"
#include "reconplan/NetworkGraph.hpp"
#include "reconplan/ReconConfig.hpp"
#include "reconplan/Records.hpp"

#include <string>
#include <vector>

namespace reconplan {

// A complete planning input: survey records plus an optional config override.
//
// JSON layout (all arrays optional, unknown keys ignored):
//   {
//     "buildings":       [{"id", "inhabitants", "type", "priority", "connected",
//                          "cost", "distance", "x", "y"}],
//     "infrastructures": [{"id", "building_id", "type", "state", "length", "houses_served"}],
//     "network_points":  [{"id", "x", "y"}],
//     "segments":        [{"id", "endpoint_a", "endpoint_b", "length", "status", "capacity"}],
//     "substations":     [{"id", "x", "y", "capacity", "name"}],
//     "config":          { ...ReconConfig overrides, see ConfigIO.hpp... }
//   }
//
// Identifiers may be strings or integers. Enum fields accept the aliases of the
// Parse* functions in Enums.hpp. A position may also be given as
// "position": [x, y] or {"x": .., "y": ..}.
struct Scenario {
  std::vector<BuildingRecord> buildings;
  std::vector<InfraRecord> infrastructures;
  std::vector<NetworkPointRecord> networkPoints;
  std::vector<SegmentRecord> segments;
  std::vector<SubstationRecord> substations;

  bool hasConfig = false;
  JsonValue config;
};

// Parse and validate. Errors name the array, record index and field, e.g.
// "buildings[3].inhabitants: expected a non-negative integer".
//
// Checks: required fields present, enum values known, numbers finite and
// non-negative, ids unique within each array, every infrastructure's
// building_id names a building. An infrastructure shared by several buildings
// repeats its id once per building, with the same type, state and length.
bool LoadScenarioJson(const std::string& text, Scenario& out, std::string& outError);
bool LoadScenarioJsonFile(const std::string& path, Scenario& out, std::string& outError);

// Apply the scenario's embedded config (if any) on top of ioCfg.
bool ApplyScenarioConfig(const Scenario& s, ReconConfig& ioCfg, std::string& outError);

struct ScenarioGraphReport {
  NearestConnectionResult substations;
  NearestConnectionResult buildings;
};

// Build the network graph of a scenario:
//  - nodes: substations, network points, and buildings that have a position
//  - edges: segments, then nearest-point connections for substations
//    (cfg.substationReach) and buildings (cfg.buildingReach)
bool BuildScenarioGraph(const Scenario& s, const NetworkAnalysisConfig& cfg, NetworkGraph& out,
                        ScenarioGraphReport& outReport, std::string& outError);

} // namespace reconplan
