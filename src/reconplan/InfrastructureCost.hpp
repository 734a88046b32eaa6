#pragma once

#include "reconplan/Records.hpp"

#include <string>
#include <vector>

namespace reconplan {

// Repair cost and duration model for infrastructure segments.
//
// Per segment:
//   price         = length * pricePerMeter[type]
//   durationHours = length * hoursPerMeter[type]     (worker-hours)
//   workerCost    = durationHours / 8 * dailyWage    (independent of crew size)
//   elapsed(w)    = durationHours / clamp(w, 1, maxWorkersPerInfra)
//
// A building's infrastructures are repaired in parallel by independent crews,
// so its reconnection time is the slowest segment, not the sum.

inline constexpr double kHoursPerWorkDay = 8.0;

struct CostModelConfig {
  // Indexed by InfraType. A negative entry means "no rate defined" for that type.
  double pricePerMeter[kInfraTypeCount] = {500.0, 750.0, 900.0};
  double hoursPerMeter[kInfraTypeCount] = {2.0, 4.0, 5.0};

  double dailyWage = 300.0; // per 8 h of work
  int maxWorkersPerInfra = 4;
};

// Checks wage/crew limits and that every infrastructure type used by `infras`
// has a defined (finite, non-negative) price and duration rate.
bool ValidateCostModelConfig(const CostModelConfig& cfg, const std::vector<InfraRecord>& infras,
                             std::string& outError);

struct InfraCost {
  double price = 0.0;
  double durationHours = 0.0;
  double workerCost = 0.0;
};

InfraCost ComputeInfraCost(const InfraRecord& infra, const CostModelConfig& cfg);

// Wall-clock hours for `durationHours` of work with `workers` crew members.
// The crew is clamped to [1, cfg.maxWorkersPerInfra].
double ElapsedHours(double durationHours, int workers, const CostModelConfig& cfg);

// Smallest crew that finishes within `targetHours`, clamped to [1, maxWorkersPerInfra].
// A non-positive target returns maxWorkersPerInfra.
int RequiredWorkersForTargetElapsed(double durationHours, double targetHours, const CostModelConfig& cfg);

struct BuildingRepairSummary {
  std::string buildingId;
  int buildingIndex = -1;

  // Infrastructures in state ToReplace, in input order.
  std::vector<std::string> infraIds;

  double totalCost = 0.0;
  double totalDurationHours = 0.0;
  double totalWorkerCost = 0.0;

  // Max over the repaired infrastructures of ElapsedHours(duration, maxWorkersPerInfra).
  double minElapsedHours = 0.0;

  double totalLength = 0.0;
  long long housesServed = 0;

  // totalLength / housesServed, or totalLength when no house is served.
  double difficulty = 0.0;
};

BuildingRepairSummary SummarizeBuildingRepairs(const BuildingRecord& building, int buildingIndex,
                                               const std::vector<InfraRecord>& infras, const CostModelConfig& cfg);

// One summary per building, in input order. Infrastructures are matched by
// buildingId with a single pass over `infras`.
std::vector<BuildingRepairSummary> SummarizeAllBuildings(const std::vector<BuildingRecord>& buildings,
                                                         const std::vector<InfraRecord>& infras,
                                                         const CostModelConfig& cfg);

// A building needs work when it is disconnected or when any of its
// infrastructures must be replaced.
bool BuildingRequiresRepair(const BuildingRecord& b, const std::vector<InfraRecord>& infras);
bool BuildingRequiresRepair(const BuildingRecord& b, const BuildingRepairSummary& s);

} // namespace reconplan
