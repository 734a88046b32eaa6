#pragma once

#include "reconplan/InfrastructureCost.hpp"
#include "reconplan/Records.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace reconplan {

// Budget-constrained, phased reconnection plan.
//
// State machine:
//   Init -> CriticalPhase -> BudgetPhase(1) -> ... -> BudgetPhase(k) -> Done
//
// Phase 0 (CriticalPhase) takes every hospital that requires repair, whatever its
// score, and warns when the slowest hospital repair outlasts the backup
// generators (autonomy * safety margin).
//
// Budget phase i receives phaseBudgetFractions[i-1] of the budget still
// remaining when it starts. Remaining buildings are ordered by
//   alpha*priorityWeight + beta/difficulty + gamma/cost + delta/duration
// (descending, then ascending id) and taken greedily until the phase's
// accumulated cost reaches its allotment. The building that crosses the
// allotment is kept in the phase.
//
// Buildings still pending after the last phase are reported as unplanned.
//
// An infrastructure shared by several buildings is repaired, paid for and
// listed once, by the first phase that takes one of its buildings. Later
// phases only account for the building. Ordering scores still use each
// building's full repair summary.

struct CombinedScoreCoefficients {
  double alpha = 0.4; // priority weight
  double beta = 0.3;  // 1 / difficulty
  double gamma = 0.2; // 1 / cost
  double delta = 0.1; // 1 / duration
};

struct PlannerConfig {
  // Must be > 0.
  double totalBudget = 0.0;

  // One entry per budget phase; each >= 0, sum <= 1.
  std::vector<double> phaseBudgetFractions = {0.4, 0.2, 0.2, 0.2};

  double generatorAutonomyHours = 20.0;
  double safetyMargin = 0.8; // (0,1]

  // Indexed by BuildingType.
  double priorityWeight[kBuildingTypeCount] = {0.5, 0.75, 1.0, 0.5};

  CombinedScoreCoefficients coefficients{};

  // Value used for 1/x when x <= 0, and upper bound of every reciprocal.
  double reciprocalCap = 1.0e6;
};

bool ValidatePlannerConfig(const PlannerConfig& cfg, std::string& outError);

// 1/x with x <= 0 mapped to `cap`; the result never exceeds `cap`.
double GuardedReciprocal(double x, double cap);

double CombinedScore(const BuildingRepairSummary& s, BuildingType type, const PlannerConfig& cfg);

enum class PlannerState : std::uint8_t {
  Init = 0,
  CriticalPhase = 1,
  BudgetPhase = 2,
  Done = 3,
};

const char* ToString(PlannerState s);

struct Phase {
  int index = 0; // 0 = critical facilities

  std::vector<std::string> buildingIds;
  std::vector<std::string> infraIds;

  double cost = 0.0;
  double durationHours = 0.0;   // summed worker-hours
  double minElapsedHours = 0.0; // slowest repair in the phase
  double workerCost = 0.0;

  // Budget phases only (phase 0 is not budget-bounded).
  double budgetAllotment = 0.0;

  double remainingBudgetBefore = 0.0;
  double remainingBudgetAfter = 0.0;

  std::vector<std::string> warnings;
};

struct PhasePlan {
  std::vector<Phase> phases;

  // Buildings requiring repair that no phase could take.
  std::vector<std::string> unplannedBuildings;

  // Plan-level warnings (phase-level ones stay on their Phase).
  std::vector<std::string> warnings;

  double totalBudget = 0.0;
  double plannedCost = 0.0;
  double remainingBudget = 0.0;
  int buildingsRequiringRepair = 0;
  int buildingsPlanned = 0;
};

class PhasedBudgetPlanner {
public:
  PhasedBudgetPlanner(std::vector<BuildingRecord> buildings, std::vector<InfraRecord> infras, PlannerConfig cfg,
                      CostModelConfig costCfg = {});

  // Validate the configuration and collect the buildings requiring repair.
  // Moves Init -> CriticalPhase. Returns false (state stays Init) on a
  // configuration error.
  bool begin(std::string& outError);

  // Execute the current state and advance to the next one.
  // Returns false once the planner is Done (or was never started).
  bool step();

  // begin() followed by step() until Done.
  bool run(std::string& outError);

  PlannerState state() const { return m_state; }

  // 1-based index of the next budget phase (meaningful in BudgetPhase).
  int budgetPhase() const { return m_budgetPhase; }

  double remainingBudget() const { return m_remaining; }

  const PlannerConfig& config() const { return m_cfg; }
  const PhasePlan& plan() const { return m_plan; }

  // Repair summaries of every input building, in input order (valid after begin()).
  const std::vector<BuildingRepairSummary>& summaries() const { return m_summaries; }

private:
  void runCriticalPhase();
  void runBudgetPhase();
  void finish();

  void addToPhase(Phase& phase, std::size_t buildingIndex);

  std::vector<BuildingRecord> m_buildings;
  std::vector<InfraRecord> m_infras;
  PlannerConfig m_cfg;
  CostModelConfig m_costCfg;

  PlannerState m_state = PlannerState::Init;
  int m_budgetPhase = 0;
  double m_remaining = 0.0;

  std::vector<BuildingRepairSummary> m_summaries;
  std::vector<std::size_t> m_pending; // building indices not yet placed

  std::unordered_map<std::string, InfraCost> m_infraCosts; // to-replace infrastructures by id
  std::unordered_set<std::string> m_repaired;
  PhasePlan m_plan;
};

// Convenience wrapper around PhasedBudgetPlanner::run().
bool PlanReconnection(const std::vector<BuildingRecord>& buildings, const std::vector<InfraRecord>& infras,
                      const PlannerConfig& cfg, const CostModelConfig& costCfg, PhasePlan& out,
                      std::string& outError);

} // namespace reconplan
