#include "reconplan/ReconConfig.hpp"

#include <cmath>

namespace reconplan {

bool ValidateReconConfig(const ReconConfig& cfg, const std::vector<InfraRecord>& infras, std::string& outError)
{
  if (!ValidatePrioritizationWeights(cfg.weights, outError)) return false;
  if (!ValidateUrgencyTable(cfg.urgency, outError)) return false;
  if (!ValidateCostModelConfig(cfg.cost, infras, outError)) return false;
  if (!ValidatePlannerConfig(cfg.planner, outError)) return false;
  return true;
}

bool ValidateNetworkAnalysisConfig(const NetworkAnalysisConfig& cfg, std::string& outError)
{
  outError.clear();
  if (!std::isfinite(cfg.buildingReach) || cfg.buildingReach < 0.0) {
    outError = "building reach must be a non-negative distance";
    return false;
  }
  if (!std::isfinite(cfg.substationReach) || cfg.substationReach < 0.0) {
    outError = "substation reach must be a non-negative distance";
    return false;
  }
  if (cfg.centrality.eigenMaxIterations < 1) {
    outError = "eigenvector iteration cap must be >= 1";
    return false;
  }
  if (!std::isfinite(cfg.centrality.eigenTolerance) || cfg.centrality.eigenTolerance <= 0.0) {
    outError = "eigenvector tolerance must be > 0";
    return false;
  }
  return true;
}

} // namespace reconplan
