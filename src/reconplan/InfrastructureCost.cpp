#include "reconplan/InfrastructureCost.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace reconplan {

namespace {

inline bool RateDefined(double v) { return std::isfinite(v) && v >= 0.0; }

inline int ClampWorkers(int workers, const CostModelConfig& cfg)
{
  const int cap = std::max(1, cfg.maxWorkersPerInfra);
  return std::clamp(workers, 1, cap);
}

void Accumulate(BuildingRepairSummary& s, const InfraRecord& infra, const CostModelConfig& cfg)
{
  const InfraCost c = ComputeInfraCost(infra, cfg);
  s.infraIds.push_back(infra.id);
  s.totalCost += c.price;
  s.totalDurationHours += c.durationHours;
  s.totalWorkerCost += c.workerCost;
  s.minElapsedHours = std::max(s.minElapsedHours, ElapsedHours(c.durationHours, cfg.maxWorkersPerInfra, cfg));
  s.totalLength += infra.length;
  s.housesServed += infra.housesServed;
}

void FinishSummary(BuildingRepairSummary& s)
{
  s.difficulty = (s.housesServed > 0) ? s.totalLength / static_cast<double>(s.housesServed) : s.totalLength;
}

} // namespace

bool BuildingRequiresRepair(const BuildingRecord& b, const std::vector<InfraRecord>& infras)
{
  if (!b.connected) return true;
  for (const InfraRecord& i : infras) {
    if (i.buildingId == b.id && i.state == InfraState::ToReplace) return true;
  }
  return false;
}

bool BuildingRequiresRepair(const BuildingRecord& b, const BuildingRepairSummary& s)
{
  return !b.connected || !s.infraIds.empty();
}

bool ValidateCostModelConfig(const CostModelConfig& cfg, const std::vector<InfraRecord>& infras,
                             std::string& outError)
{
  outError.clear();

  if (!std::isfinite(cfg.dailyWage) || cfg.dailyWage < 0.0) {
    outError = "daily wage must be a non-negative number";
    return false;
  }
  if (cfg.maxWorkersPerInfra < 1) {
    outError = "max workers per infrastructure must be >= 1";
    return false;
  }

  bool used[kInfraTypeCount] = {false, false, false};
  for (const InfraRecord& i : infras) used[static_cast<int>(i.type)] = true;

  for (int t = 0; t < kInfraTypeCount; ++t) {
    if (!used[t]) continue;
    const char* name = ToString(static_cast<InfraType>(t));
    if (!RateDefined(cfg.pricePerMeter[t])) {
      outError = std::string("missing price per metre for infrastructure type '") + name + "'";
      return false;
    }
    if (!RateDefined(cfg.hoursPerMeter[t])) {
      outError = std::string("missing duration per metre for infrastructure type '") + name + "'";
      return false;
    }
  }
  return true;
}

InfraCost ComputeInfraCost(const InfraRecord& infra, const CostModelConfig& cfg)
{
  const int t = static_cast<int>(infra.type);
  InfraCost c;
  c.price = infra.length * cfg.pricePerMeter[t];
  c.durationHours = infra.length * cfg.hoursPerMeter[t];
  c.workerCost = c.durationHours / kHoursPerWorkDay * cfg.dailyWage;
  return c;
}

double ElapsedHours(double durationHours, int workers, const CostModelConfig& cfg)
{
  return durationHours / static_cast<double>(ClampWorkers(workers, cfg));
}

int RequiredWorkersForTargetElapsed(double durationHours, double targetHours, const CostModelConfig& cfg)
{
  const int cap = std::max(1, cfg.maxWorkersPerInfra);
  if (!(targetHours > 0.0)) return cap;
  if (durationHours <= 0.0) return 1;

  const double needed = std::ceil(durationHours / targetHours);
  if (needed >= static_cast<double>(cap)) return cap;
  return ClampWorkers(static_cast<int>(needed), cfg);
}

BuildingRepairSummary SummarizeBuildingRepairs(const BuildingRecord& building, int buildingIndex,
                                               const std::vector<InfraRecord>& infras, const CostModelConfig& cfg)
{
  BuildingRepairSummary s;
  s.buildingId = building.id;
  s.buildingIndex = buildingIndex;
  for (const InfraRecord& i : infras) {
    if (i.buildingId != building.id || i.state != InfraState::ToReplace) continue;
    Accumulate(s, i, cfg);
  }
  FinishSummary(s);
  return s;
}

std::vector<BuildingRepairSummary> SummarizeAllBuildings(const std::vector<BuildingRecord>& buildings,
                                                         const std::vector<InfraRecord>& infras,
                                                         const CostModelConfig& cfg)
{
  std::vector<BuildingRepairSummary> out(buildings.size());
  std::unordered_map<std::string, std::size_t> byId;
  byId.reserve(buildings.size());
  for (std::size_t i = 0; i < buildings.size(); ++i) {
    out[i].buildingId = buildings[i].id;
    out[i].buildingIndex = static_cast<int>(i);
    byId.emplace(buildings[i].id, i);
  }

  for (const InfraRecord& infra : infras) {
    if (infra.state != InfraState::ToReplace) continue;
    const auto it = byId.find(infra.buildingId);
    if (it == byId.end()) continue;
    Accumulate(out[it->second], infra, cfg);
  }

  for (BuildingRepairSummary& s : out) FinishSummary(s);
  return out;
}

} // namespace reconplan
