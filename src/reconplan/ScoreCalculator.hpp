#pragma once

#include "reconplan/Enums.hpp"

#include <string>
#include <vector>

namespace reconplan {

// Per-criterion normalizers for the multi-criteria ranking.
//
// Each function maps the raw values of one criterion (one entry per building, in
// caller order) to scores in [0,1]. Degenerate inputs resolve to fixed values:
//  - population: max == 0 => every score is 0
//  - cost/distance: max == min => every score is 1 (no discriminating signal)
// Empty input yields empty output.

// v / max(v)
std::vector<double> PopulationScores(const std::vector<int>& inhabitants);

// 1 - (v - min) / (max - min). Cheaper is better.
std::vector<double> CostScores(const std::vector<double>& costs);

// Same shape as CostScores. Closer is better.
std::vector<double> DistanceScores(const std::vector<double>& distances);

// Urgency lookup keyed by (building type, priority).
//
// Cells holding a negative value are untabulated and resolve to `fallback`.
// Defaults:
//   hospital/high 1.0, school/high 1.0,
//   residential/high 0.75, residential/medium 0.55, residential/low 0.35,
//   commercial/medium 0.55, everything else 0.5
struct UrgencyTable {
  static constexpr double kUntabulated = -1.0;

  double fallback = 0.5;

  // cells[type][priority]
  double cells[kBuildingTypeCount][kBuildingPriorityCount] = {
      {0.75, 0.55, 0.35},                           // residential
      {1.0, kUntabulated, kUntabulated},            // school
      {1.0, kUntabulated, kUntabulated},            // hospital
      {kUntabulated, 0.55, kUntabulated},           // commercial
  };

  bool isTabulated(BuildingType t, BuildingPriority p) const;
  void set(BuildingType t, BuildingPriority p, double score);
  void unset(BuildingType t, BuildingPriority p);
};

double UrgencyScore(BuildingType type, BuildingPriority priority, const UrgencyTable& table = {});

// All cells (and the fallback) must lie in [0,1] or be untabulated.
bool ValidateUrgencyTable(const UrgencyTable& table, std::string& outError);

} // namespace reconplan
