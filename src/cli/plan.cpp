#include "cli/CliParse.hpp"

#include "reconplan/ConfigIO.hpp"
#include "reconplan/LogTee.hpp"
#include "reconplan/PhasedPlanner.hpp"
#include "reconplan/PlanExport.hpp"
#include "reconplan/Prioritization.hpp"
#include "reconplan/ReconConfig.hpp"
#include "reconplan/Scenario.hpp"
#include "reconplan/Version.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintHelp()
{
  std::cout
      << "reconplan_plan (building prioritization + phased reconnection plan)\n\n"
      << "Ranks buildings by a weighted multi-criteria score and allocates repairs to\n"
      << "budget-bounded phases. Hospitals go first (phase 0) with a generator autonomy check.\n\n"
      << "Usage:\n"
      << "  reconplan_plan --scenario <scenario.json> [--config <config.json>]\n"
      << "                 [--budget <amount>] [--fractions <f1,f2,...>] [--top <N>]\n"
      << "                 [--rank-json <out.json>] [--rank-csv <out.csv>]\n"
      << "                 [--plan-json <out.json>] [--plan-csv <out.csv>]\n"
      << "                 [--write-config <out.json>] [--log <run.log>] [--quiet]\n\n"
      << "Notes:\n"
      << "  - Config precedence: defaults < scenario \"config\" < --config < --budget/--fractions.\n"
      << "  - --top limits the ranking output; the phase plan always covers every building.\n"
      << "  - --write-config without --scenario only writes the effective config.\n";
}

void PrintPhase(const reconplan::Phase& p)
{
  std::cout << "  phase " << p.index << (p.index == 0 ? " (critical)" : "") << ": " << p.buildingIds.size()
            << " building(s), " << p.infraIds.size() << " infrastructure(s), cost " << p.cost << ", "
            << p.durationHours << " worker-h, min elapsed " << p.minElapsedHours << " h\n";
  for (const std::string& w : p.warnings) std::cerr << "warning: phase " << p.index << ": " << w << "\n";
}

} // namespace

int main(int argc, char** argv)
{
  using namespace reconplan;

  std::string scenarioPath;
  std::string configPath;
  std::string rankJsonPath;
  std::string rankCsvPath;
  std::string planJsonPath;
  std::string planCsvPath;
  std::string writeConfigPath;
  std::string logPath;

  bool haveBudget = false;
  double budget = 0.0;
  bool haveFractions = false;
  std::vector<double> fractions;
  int topN = 0;
  bool quiet = false;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string val;

    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--version") {
      std::cout << ReconPlanBanner() << "\n";
      return 0;
    } else if (arg == "--scenario") {
      if (!requireValue(i, scenarioPath)) {
        std::cerr << "--scenario requires a path\n";
        return 2;
      }
    } else if (arg == "--config") {
      if (!requireValue(i, configPath)) {
        std::cerr << "--config requires a path\n";
        return 2;
      }
    } else if (arg == "--budget") {
      if (!requireValue(i, val) || !cli::ParseF64(val, &budget) || budget <= 0.0) {
        std::cerr << "--budget requires a positive number\n";
        return 2;
      }
      haveBudget = true;
    } else if (arg == "--fractions") {
      if (!requireValue(i, val) || !cli::ParseF64List(val, &fractions)) {
        std::cerr << "--fractions requires a comma separated list of numbers\n";
        return 2;
      }
      haveFractions = true;
    } else if (arg == "--top") {
      if (!requireValue(i, val) || !cli::ParseI32(val, &topN) || topN < 0) {
        std::cerr << "--top requires a non-negative integer\n";
        return 2;
      }
    } else if (arg == "--rank-json") {
      if (!requireValue(i, rankJsonPath)) {
        std::cerr << "--rank-json requires a path\n";
        return 2;
      }
    } else if (arg == "--rank-csv") {
      if (!requireValue(i, rankCsvPath)) {
        std::cerr << "--rank-csv requires a path\n";
        return 2;
      }
    } else if (arg == "--plan-json") {
      if (!requireValue(i, planJsonPath)) {
        std::cerr << "--plan-json requires a path\n";
        return 2;
      }
    } else if (arg == "--plan-csv") {
      if (!requireValue(i, planCsvPath)) {
        std::cerr << "--plan-csv requires a path\n";
        return 2;
      }
    } else if (arg == "--write-config") {
      if (!requireValue(i, writeConfigPath)) {
        std::cerr << "--write-config requires a path\n";
        return 2;
      }
    } else if (arg == "--log") {
      if (!requireValue(i, logPath)) {
        std::cerr << "--log requires a path\n";
        return 2;
      }
    } else if (arg == "--quiet") {
      quiet = true;
    } else {
      std::cerr << "Unknown arg: " << arg << "\n";
      PrintHelp();
      return 2;
    }
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions lopt;
    lopt.path = logPath;
    std::string err;
    if (!logTee.start(lopt, err)) {
      std::cerr << "Failed to start log: " << err << "\n";
      return 1;
    }
  }

  if (scenarioPath.empty() && writeConfigPath.empty()) {
    std::cerr << "--scenario is required\n";
    PrintHelp();
    return 2;
  }

  std::string err;
  Scenario scenario;
  ReconConfig cfg;

  if (!scenarioPath.empty()) {
    if (!LoadScenarioJsonFile(scenarioPath, scenario, err)) {
      std::cerr << "Failed to load scenario: " << err << "\n";
      return 1;
    }
    if (!ApplyScenarioConfig(scenario, cfg, err)) {
      std::cerr << "Invalid scenario config: " << err << "\n";
      return 1;
    }
  }
  if (!configPath.empty() && !LoadReconConfigJsonFile(configPath, cfg, err)) {
    std::cerr << "Failed to load config: " << err << "\n";
    return 1;
  }
  if (haveBudget) cfg.planner.totalBudget = budget;
  if (haveFractions) cfg.planner.phaseBudgetFractions = fractions;

  if (!writeConfigPath.empty()) {
    if (!cli::EnsureParentDir(writeConfigPath) || !WriteReconConfigJsonFile(writeConfigPath, cfg, err)) {
      std::cerr << "Failed to write config: " << (err.empty() ? writeConfigPath : err) << "\n";
      return 1;
    }
    if (!quiet) std::cout << "Wrote config: " << writeConfigPath << "\n";
    if (scenarioPath.empty()) return 0;
  }

  if (!ValidateReconConfig(cfg, scenario.infrastructures, err)) {
    std::cerr << "Configuration error: " << err << "\n";
    if (cfg.planner.totalBudget <= 0.0) std::cerr << "(set the budget with --budget or planner.total_budget)\n";
    return 1;
  }

  if (!quiet) {
    std::cout << ReconPlanBanner() << "\n";
    std::cout << "Scenario: " << scenarioPath << " (" << scenario.buildings.size() << " buildings, "
              << scenario.infrastructures.size() << " infrastructures)\n";
  }

  std::vector<RankedBuilding> ranked;
  if (!RankBuildings(scenario.buildings, cfg.weights, cfg.urgency, ranked, err, topN)) {
    std::cerr << "Ranking failed: " << err << "\n";
    return 1;
  }
  const PriorityReport report = BuildPriorityReport(ranked);

  PhasePlan plan;
  if (!PlanReconnection(scenario.buildings, scenario.infrastructures, cfg.planner, cfg.cost, plan, err)) {
    std::cerr << "Planning failed: " << err << "\n";
    return 1;
  }

  if (!quiet) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Ranking (top " << std::min<std::size_t>(ranked.size(), 10) << " of " << ranked.size() << "):\n";
    for (std::size_t i = 0; i < ranked.size() && i < 10; ++i) {
      const RankedBuilding& r = ranked[i];
      std::cout << "  #" << r.rank << " " << r.id << " composite " << std::setprecision(4) << r.compositeScore
                << std::setprecision(2) << " cumulative inhabitants " << r.cumulativeInhabitants << " ("
                << r.cumulativeInhabitantsPct << "%)\n";
    }

    std::cout << "Plan: budget " << plan.totalBudget << ", planned " << plan.plannedCost << ", remaining "
              << plan.remainingBudget << ", " << plan.buildingsPlanned << "/" << plan.buildingsRequiringRepair
              << " building(s) requiring repair planned\n";
  }
  for (const Phase& p : plan.phases) {
    if (!quiet) {
      PrintPhase(p);
    } else {
      for (const std::string& w : p.warnings) std::cerr << "warning: phase " << p.index << ": " << w << "\n";
    }
  }
  for (const std::string& w : plan.warnings) std::cerr << "warning: " << w << "\n";

  if (!rankJsonPath.empty()) {
    if (!ExportRankingJson(rankJsonPath, ranked, &report, &err)) {
      std::cerr << "Failed to write " << rankJsonPath << ": " << err << "\n";
      return 1;
    }
    if (!quiet) std::cout << "Wrote ranking JSON: " << rankJsonPath << "\n";
  }
  if (!rankCsvPath.empty()) {
    if (!ExportRankingCsv(rankCsvPath, ranked, &err)) {
      std::cerr << "Failed to write " << rankCsvPath << ": " << err << "\n";
      return 1;
    }
    if (!quiet) std::cout << "Wrote ranking CSV: " << rankCsvPath << "\n";
  }
  if (!planJsonPath.empty()) {
    if (!ExportPhasePlanJson(planJsonPath, plan, &err)) {
      std::cerr << "Failed to write " << planJsonPath << ": " << err << "\n";
      return 1;
    }
    if (!quiet) std::cout << "Wrote plan JSON: " << planJsonPath << "\n";
  }
  if (!planCsvPath.empty()) {
    if (!ExportPhasePlanCsv(planCsvPath, plan, &err)) {
      std::cerr << "Failed to write " << planCsvPath << ": " << err << "\n";
      return 1;
    }
    if (!quiet) std::cout << "Wrote plan CSV: " << planCsvPath << "\n";
  }

  return 0;
}
