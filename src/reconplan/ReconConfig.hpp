#pragma once

#include "reconplan/InfrastructureCost.hpp"
#include "reconplan/NetworkCentrality.hpp"
#include "reconplan/PhasedPlanner.hpp"
#include "reconplan/Prioritization.hpp"
#include "reconplan/ScoreCalculator.hpp"

#include <string>
#include <vector>

namespace reconplan {

// Settings for graph construction and analysis.
struct NetworkAnalysisConfig {
  // Maximum attach distance (metres) from a building / substation to its nearest
  // network point. Nodes farther away stay unattached.
  double buildingReach = 100.0;
  double substationReach = 50.0;

  CentralityConfig centrality{};
};

// Every tunable of a planning run, built once and passed by const reference.
//
// Defaults reproduce the reference field constants (price and labour rates,
// phase split, generator autonomy, scoring weights).
struct ReconConfig {
  CostModelConfig cost{};
  PrioritizationWeights weights{};
  UrgencyTable urgency{};
  PlannerConfig planner{};
  NetworkAnalysisConfig network{};
};

// Validate the sections used by ranking and planning. `infras` is used to check
// that every infrastructure type in the data has a price and duration rate.
bool ValidateReconConfig(const ReconConfig& cfg, const std::vector<InfraRecord>& infras, std::string& outError);

bool ValidateNetworkAnalysisConfig(const NetworkAnalysisConfig& cfg, std::string& outError);

} // namespace reconplan
