#include "reconplan/PhasedPlanner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace reconplan {

namespace {

std::string Fmt(double v)
{
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return std::string(buf);
}

bool NonNegative(double v) { return std::isfinite(v) && v >= 0.0; }

} // namespace

bool ValidatePlannerConfig(const PlannerConfig& cfg, std::string& outError)
{
  outError.clear();

  if (!std::isfinite(cfg.totalBudget) || cfg.totalBudget <= 0.0) {
    outError = "total budget must be > 0";
    return false;
  }

  double fracSum = 0.0;
  for (std::size_t i = 0; i < cfg.phaseBudgetFractions.size(); ++i) {
    const double f = cfg.phaseBudgetFractions[i];
    if (!NonNegative(f)) {
      outError = "phase budget fraction #" + std::to_string(i + 1) + " must be >= 0";
      return false;
    }
    fracSum += f;
  }
  if (fracSum > 1.0 + 1.0e-9) {
    outError = "phase budget fractions must sum to <= 1 (got " + std::to_string(fracSum) + ")";
    return false;
  }

  if (!std::isfinite(cfg.generatorAutonomyHours) || cfg.generatorAutonomyHours <= 0.0) {
    outError = "generator autonomy must be > 0 hours";
    return false;
  }
  if (!std::isfinite(cfg.safetyMargin) || cfg.safetyMargin <= 0.0 || cfg.safetyMargin > 1.0) {
    outError = "safety margin must lie in (0,1]";
    return false;
  }

  for (int t = 0; t < kBuildingTypeCount; ++t) {
    if (!NonNegative(cfg.priorityWeight[t])) {
      outError = std::string("priority weight for '") + ToString(static_cast<BuildingType>(t)) + "' must be >= 0";
      return false;
    }
  }

  const CombinedScoreCoefficients& c = cfg.coefficients;
  if (!NonNegative(c.alpha) || !NonNegative(c.beta) || !NonNegative(c.gamma) || !NonNegative(c.delta)) {
    outError = "combined score coefficients must be >= 0";
    return false;
  }

  if (!std::isfinite(cfg.reciprocalCap) || cfg.reciprocalCap <= 0.0) {
    outError = "reciprocal cap must be > 0";
    return false;
  }
  return true;
}

double GuardedReciprocal(double x, double cap)
{
  if (!(x > 0.0)) return cap;
  return std::min(cap, 1.0 / x);
}

double CombinedScore(const BuildingRepairSummary& s, BuildingType type, const PlannerConfig& cfg)
{
  const CombinedScoreCoefficients& c = cfg.coefficients;
  const double cap = cfg.reciprocalCap;
  return c.alpha * cfg.priorityWeight[static_cast<int>(type)] + c.beta * GuardedReciprocal(s.difficulty, cap) +
         c.gamma * GuardedReciprocal(s.totalCost, cap) + c.delta * GuardedReciprocal(s.totalDurationHours, cap);
}

const char* ToString(PlannerState s)
{
  switch (s) {
  case PlannerState::Init: return "init";
  case PlannerState::CriticalPhase: return "critical_phase";
  case PlannerState::BudgetPhase: return "budget_phase";
  case PlannerState::Done: return "done";
  default: return "init";
  }
}

PhasedBudgetPlanner::PhasedBudgetPlanner(std::vector<BuildingRecord> buildings, std::vector<InfraRecord> infras,
                                         PlannerConfig cfg, CostModelConfig costCfg)
    : m_buildings(std::move(buildings))
    , m_infras(std::move(infras))
    , m_cfg(std::move(cfg))
    , m_costCfg(costCfg)
{
}

bool PhasedBudgetPlanner::begin(std::string& outError)
{
  if (m_state != PlannerState::Init) {
    outError = "planner already started";
    return false;
  }
  if (!ValidatePlannerConfig(m_cfg, outError)) return false;
  if (!ValidateCostModelConfig(m_costCfg, m_infras, outError)) return false;

  m_summaries = SummarizeAllBuildings(m_buildings, m_infras, m_costCfg);

  m_infraCosts.clear();
  m_repaired.clear();
  for (const InfraRecord& infra : m_infras) {
    if (infra.state == InfraState::ToReplace) m_infraCosts.emplace(infra.id, ComputeInfraCost(infra, m_costCfg));
  }

  m_pending.clear();
  for (std::size_t i = 0; i < m_buildings.size(); ++i) {
    if (BuildingRequiresRepair(m_buildings[i], m_summaries[i])) m_pending.push_back(i);
  }

  m_plan = PhasePlan{};
  m_plan.totalBudget = m_cfg.totalBudget;
  m_plan.buildingsRequiringRepair = static_cast<int>(m_pending.size());
  m_remaining = m_cfg.totalBudget;
  m_budgetPhase = 0;
  m_state = PlannerState::CriticalPhase;
  return true;
}

bool PhasedBudgetPlanner::step()
{
  switch (m_state) {
  case PlannerState::Init: return false;
  case PlannerState::CriticalPhase:
    runCriticalPhase();
    m_budgetPhase = 1;
    m_state = PlannerState::BudgetPhase;
    break;
  case PlannerState::BudgetPhase:
    if (m_pending.empty() || m_budgetPhase > static_cast<int>(m_cfg.phaseBudgetFractions.size())) {
      finish();
    } else {
      runBudgetPhase();
      ++m_budgetPhase;
    }
    break;
  case PlannerState::Done: return false;
  }
  return m_state != PlannerState::Done;
}

bool PhasedBudgetPlanner::run(std::string& outError)
{
  if (!begin(outError)) return false;
  while (step()) {
  }
  return true;
}

void PhasedBudgetPlanner::addToPhase(Phase& phase, std::size_t buildingIndex)
{
  const BuildingRepairSummary& s = m_summaries[buildingIndex];
  phase.buildingIds.push_back(s.buildingId);

  for (const std::string& id : s.infraIds) {
    if (!m_repaired.insert(id).second) continue; // shared, already repaired
    const auto it = m_infraCosts.find(id);
    if (it == m_infraCosts.end()) continue;
    const InfraCost& c = it->second;
    phase.infraIds.push_back(id);
    phase.cost += c.price;
    phase.durationHours += c.durationHours;
    phase.workerCost += c.workerCost;
    phase.minElapsedHours =
        std::max(phase.minElapsedHours, ElapsedHours(c.durationHours, m_costCfg.maxWorkersPerInfra, m_costCfg));
  }
}

void PhasedBudgetPlanner::runCriticalPhase()
{
  Phase phase;
  phase.index = 0;
  phase.remainingBudgetBefore = m_remaining;

  std::vector<std::size_t> rest;
  rest.reserve(m_pending.size());
  for (std::size_t bi : m_pending) {
    if (m_buildings[bi].type == BuildingType::Hospital) {
      addToPhase(phase, bi);
    } else {
      rest.push_back(bi);
    }
  }
  m_pending.swap(rest);

  const double limit = m_cfg.generatorAutonomyHours * m_cfg.safetyMargin;
  if (phase.minElapsedHours > limit) {
    phase.warnings.push_back("hospital repairs need " + Fmt(phase.minElapsedHours) +
                             " h with a full crew, beyond the " + Fmt(limit) + " h generator autonomy (" +
                             Fmt(m_cfg.generatorAutonomyHours) + " h x " + Fmt(m_cfg.safetyMargin) + ")");
  }
  if (phase.cost > m_cfg.totalBudget) {
    phase.warnings.push_back("critical phase cost " + Fmt(phase.cost) + " exceeds the total budget " +
                             Fmt(m_cfg.totalBudget));
  }

  m_remaining = std::max(0.0, m_remaining - phase.cost);
  phase.remainingBudgetAfter = m_remaining;
  m_plan.phases.push_back(std::move(phase));
}

void PhasedBudgetPlanner::runBudgetPhase()
{
  Phase phase;
  phase.index = m_budgetPhase;
  phase.remainingBudgetBefore = m_remaining;
  phase.budgetAllotment = m_cfg.phaseBudgetFractions[static_cast<std::size_t>(m_budgetPhase - 1)] * m_remaining;

  if (phase.budgetAllotment <= 0.0) {
    phase.warnings.push_back("no budget available for phase " + std::to_string(m_budgetPhase));
    phase.remainingBudgetAfter = m_remaining;
    m_plan.phases.push_back(std::move(phase));
    return;
  }

  struct Candidate {
    std::size_t index = 0;
    double score = 0.0;
  };
  std::vector<Candidate> cands;
  cands.reserve(m_pending.size());
  for (std::size_t bi : m_pending) {
    cands.push_back(Candidate{bi, CombinedScore(m_summaries[bi], m_buildings[bi].type, m_cfg)});
  }
  std::sort(cands.begin(), cands.end(), [&](const Candidate& a, const Candidate& b) {
    if (a.score != b.score) return a.score > b.score;
    const std::string& ia = m_buildings[a.index].id;
    const std::string& ib = m_buildings[b.index].id;
    if (ia != ib) return ia < ib;
    return a.index < b.index;
  });

  std::vector<char> taken(m_buildings.size(), 0);
  for (const Candidate& c : cands) {
    if (phase.cost >= phase.budgetAllotment) break;
    addToPhase(phase, c.index);
    taken[c.index] = 1;
  }

  std::vector<std::size_t> rest;
  rest.reserve(m_pending.size());
  for (std::size_t bi : m_pending) {
    if (!taken[bi]) rest.push_back(bi);
  }
  m_pending.swap(rest);

  if (phase.cost > m_remaining) {
    phase.warnings.push_back("phase " + std::to_string(m_budgetPhase) + " cost " + Fmt(phase.cost) +
                             " exceeds the remaining budget " + Fmt(m_remaining));
  }

  m_remaining = std::max(0.0, m_remaining - phase.cost);
  phase.remainingBudgetAfter = m_remaining;
  m_plan.phases.push_back(std::move(phase));
}

void PhasedBudgetPlanner::finish()
{
  // Report leftovers in input order.
  std::sort(m_pending.begin(), m_pending.end());
  for (std::size_t bi : m_pending) m_plan.unplannedBuildings.push_back(m_buildings[bi].id);

  if (!m_plan.unplannedBuildings.empty()) {
    m_plan.warnings.push_back(std::to_string(m_plan.unplannedBuildings.size()) +
                              " building(s) requiring repair could not be planned within " +
                              std::to_string(m_cfg.phaseBudgetFractions.size()) + " budget phase(s)");
  }

  m_plan.plannedCost = 0.0;
  m_plan.buildingsPlanned = 0;
  for (const Phase& p : m_plan.phases) {
    m_plan.plannedCost += p.cost;
    m_plan.buildingsPlanned += static_cast<int>(p.buildingIds.size());
  }
  m_plan.remainingBudget = m_remaining;

  m_pending.clear();
  m_state = PlannerState::Done;
}

bool PlanReconnection(const std::vector<BuildingRecord>& buildings, const std::vector<InfraRecord>& infras,
                      const PlannerConfig& cfg, const CostModelConfig& costCfg, PhasePlan& out,
                      std::string& outError)
{
  out = PhasePlan{};
  PhasedBudgetPlanner planner(buildings, infras, cfg, costCfg);
  if (!planner.run(outError)) return false;
  out = planner.plan();
  return true;
}

} // namespace reconplan
