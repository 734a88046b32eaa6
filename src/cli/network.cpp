#include "cli/CliParse.hpp"

#include "reconplan/ConfigIO.hpp"
#include "reconplan/LogTee.hpp"
#include "reconplan/NetworkCentrality.hpp"
#include "reconplan/NetworkGraph.hpp"
#include "reconplan/PlanExport.hpp"
#include "reconplan/Scenario.hpp"
#include "reconplan/Version.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintHelp()
{
  std::cout
      << "reconplan_network (distribution network topology analysis)\n\n"
      << "Builds the network graph of a scenario (segments + nearest-point service drops),\n"
      << "reports connectivity and ranks structurally critical nodes by centrality.\n\n"
      << "Usage:\n"
      << "  reconplan_network --scenario <scenario.json> [--config <config.json>]\n"
      << "                    [--building-reach <m>] [--substation-reach <m>]\n"
      << "                    [--weight <length|damage_penalized>]\n"
      << "                    [--metric <degree,closeness,betweenness,eigenvector|all>]\n"
      << "                    [--from <node id> [--to <node id>]] [--top <N>]\n"
      << "                    [--json <out.json>] [--nodes-csv <out.csv>] [--log <run.log>]\n\n"
      << "Notes:\n"
      << "  - --from without --to lists the shortest route to every reachable substation.\n"
      << "  - damage_penalized routing costs damaged segments 10x their length.\n";
}

void PrintPath(const reconplan::NetworkGraph& g, const reconplan::ShortestPath& p)
{
  for (std::size_t i = 0; i < p.nodes.size(); ++i) {
    if (i) std::cout << " -> ";
    std::cout << g.nodes[static_cast<std::size_t>(p.nodes[i])].id;
  }
  std::cout << "\n";
}

} // namespace

int main(int argc, char** argv)
{
  using namespace reconplan;

  std::string scenarioPath;
  std::string configPath;
  std::string jsonPath;
  std::string nodesCsvPath;
  std::string logPath;
  std::string fromId;
  std::string toId;

  bool haveBuildingReach = false;
  bool haveSubstationReach = false;
  bool haveWeight = false;
  double buildingReach = 0.0;
  double substationReach = 0.0;
  RoutingWeight weight = RoutingWeight::Length;
  std::vector<CentralityMetric> metrics = {CentralityMetric::Betweenness};
  int topN = 10;

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
    } else if (arg == "--building-reach") {
      if (!requireValue(i, val) || !cli::ParseF64(val, &buildingReach) || buildingReach < 0.0) {
        std::cerr << "--building-reach requires a non-negative distance\n";
        return 2;
      }
      haveBuildingReach = true;
    } else if (arg == "--substation-reach") {
      if (!requireValue(i, val) || !cli::ParseF64(val, &substationReach) || substationReach < 0.0) {
        std::cerr << "--substation-reach requires a non-negative distance\n";
        return 2;
      }
      haveSubstationReach = true;
    } else if (arg == "--weight") {
      if (!requireValue(i, val) || !ParseRoutingWeight(val, weight)) {
        std::cerr << "--weight requires: length|damage_penalized\n";
        return 2;
      }
      haveWeight = true;
    } else if (arg == "--metric") {
      if (!requireValue(i, val)) {
        std::cerr << "--metric requires a value\n";
        return 2;
      }
      metrics.clear();
      if (val == "all") {
        metrics = {CentralityMetric::Degree, CentralityMetric::Closeness, CentralityMetric::Betweenness,
                   CentralityMetric::Eigenvector};
      } else {
        for (const std::string& name : cli::SplitCommaList(val)) {
          CentralityMetric m = CentralityMetric::Degree;
          if (!ParseCentralityMetric(name, m)) {
            std::cerr << "--metric: unknown metric '" << name << "'\n";
            return 2;
          }
          metrics.push_back(m);
        }
      }
      if (metrics.empty()) {
        std::cerr << "--metric requires at least one metric\n";
        return 2;
      }
    } else if (arg == "--from") {
      if (!requireValue(i, fromId)) {
        std::cerr << "--from requires a node id\n";
        return 2;
      }
    } else if (arg == "--to") {
      if (!requireValue(i, toId)) {
        std::cerr << "--to requires a node id\n";
        return 2;
      }
    } else if (arg == "--top") {
      if (!requireValue(i, val) || !cli::ParseI32(val, &topN) || topN < 0) {
        std::cerr << "--top requires a non-negative integer\n";
        return 2;
      }
    } else if (arg == "--json") {
      if (!requireValue(i, jsonPath)) {
        std::cerr << "--json requires a path\n";
        return 2;
      }
    } else if (arg == "--nodes-csv") {
      if (!requireValue(i, nodesCsvPath)) {
        std::cerr << "--nodes-csv requires a path\n";
        return 2;
      }
    } else if (arg == "--log") {
      if (!requireValue(i, logPath)) {
        std::cerr << "--log requires a path\n";
        return 2;
      }
    } else {
      std::cerr << "Unknown arg: " << arg << "\n";
      PrintHelp();
      return 2;
    }
  }

  if (scenarioPath.empty()) {
    std::cerr << "--scenario is required\n";
    PrintHelp();
    return 2;
  }
  if (!toId.empty() && fromId.empty()) {
    std::cerr << "--to requires --from\n";
    return 2;
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

  std::string err;
  Scenario scenario;
  ReconConfig cfg;
  if (!LoadScenarioJsonFile(scenarioPath, scenario, err)) {
    std::cerr << "Failed to load scenario: " << err << "\n";
    return 1;
  }
  if (!ApplyScenarioConfig(scenario, cfg, err)) {
    std::cerr << "Invalid scenario config: " << err << "\n";
    return 1;
  }
  if (!configPath.empty() && !LoadReconConfigJsonFile(configPath, cfg, err)) {
    std::cerr << "Failed to load config: " << err << "\n";
    return 1;
  }
  if (haveBuildingReach) cfg.network.buildingReach = buildingReach;
  if (haveSubstationReach) cfg.network.substationReach = substationReach;
  if (haveWeight) cfg.network.centrality.weight = weight;

  if (!ValidateNetworkAnalysisConfig(cfg.network, err)) {
    std::cerr << "Configuration error: " << err << "\n";
    return 1;
  }

  NetworkGraph g;
  ScenarioGraphReport attach;
  if (!BuildScenarioGraph(scenario, cfg.network, g, attach, err)) {
    std::cerr << "Graph construction failed: " << err << "\n";
    return 1;
  }

  NetworkMetricsReport report;
  report.stats = ComputeNetworkStats(g);
  report.components = ComputeConnectedComponents(g);
  report.topNodes = topN;

  const NetworkStats& s = report.stats;
  std::cout << ReconPlanBanner() << "\n";
  std::cout << "Graph: " << s.nodes << " nodes (" << s.substations << " substations, " << s.networkPoints
            << " network points, " << s.buildings << " buildings), " << s.edges << " edges (" << s.segments
            << " segments, " << s.damagedSegments << " damaged, " << s.connections << " connections)\n";
  std::cout << "Components: " << s.components << (s.connected ? " (connected)" : "") << "\n";
  std::cout << std::fixed << std::setprecision(2);
  std::cout << "Degree: min " << s.minDegree << ", avg " << s.avgDegree << ", max " << s.maxDegree
            << "; total length " << s.totalLength << "\n";

  for (int v : attach.substations.unattached) {
    std::cerr << "warning: substation '" << g.nodes[static_cast<std::size_t>(v)].id << "' has no network point within "
              << cfg.network.substationReach << " m\n";
  }
  for (int v : attach.buildings.unattached) {
    std::cerr << "warning: building '" << g.nodes[static_cast<std::size_t>(v)].id << "' has no network point within "
              << cfg.network.buildingReach << " m\n";
  }

  CentralityCache cache;
  for (CentralityMetric m : metrics) {
    const CentralityResult& c = cache.get(g, m, cfg.network.centrality);
    report.centrality.push_back(c);

    std::cout << "Top " << ToString(m) << ":";
    if (m == CentralityMetric::Eigenvector && !c.converged) {
      std::cout << " (not converged after " << c.iterations << " iterations)";
    }
    std::cout << "\n" << std::setprecision(6);
    for (int v : TopCriticalNodes(c, topN)) {
      const NetworkNode& n = g.nodes[static_cast<std::size_t>(v)];
      std::cout << "  " << n.id << " [" << ToString(n.kind) << "] " << c.score[static_cast<std::size_t>(v)] << "\n";
    }
    std::cout << std::setprecision(2);
  }

  if (!fromId.empty()) {
    const int from = g.findNode(fromId);
    if (from < 0) {
      std::cerr << "Unknown node: " << fromId << "\n";
      return 1;
    }

    if (!toId.empty()) {
      const int to = g.findNode(toId);
      if (to < 0) {
        std::cerr << "Unknown node: " << toId << "\n";
        return 1;
      }
      report.hasPath = true;
      report.pathFrom = from;
      report.pathTo = to;
      if (FindShortestPath(g, from, to, report.path, cfg.network.centrality.weight)) {
        std::cout << "Path " << fromId << " -> " << toId << " (cost " << report.path.cost << "): ";
        PrintPath(g, report.path);
      } else {
        std::cout << "No path between " << fromId << " and " << toId << "\n";
      }
    } else {
      const std::vector<SubstationRoute> routes = FindPathsToSubstations(g, from, cfg.network.centrality.weight);
      if (routes.empty()) std::cout << "No substation reachable from " << fromId << "\n";
      for (const SubstationRoute& r : routes) {
        std::cout << "Route to " << g.nodes[static_cast<std::size_t>(r.substation)].id << " (cost " << r.path.cost
                  << "): ";
        PrintPath(g, r.path);
      }
    }
  }

  if (!jsonPath.empty()) {
    if (!ExportNetworkMetricsJson(jsonPath, g, report, &err)) {
      std::cerr << "Failed to write " << jsonPath << ": " << err << "\n";
      return 1;
    }
    std::cout << "Wrote metrics JSON: " << jsonPath << "\n";
  }
  if (!nodesCsvPath.empty()) {
    if (!ExportCentralityNodesCsv(nodesCsvPath, g, report.components, report.centrality, &err)) {
      std::cerr << "Failed to write " << nodesCsvPath << ": " << err << "\n";
      return 1;
    }
    std::cout << "Wrote nodes CSV: " << nodesCsvPath << "\n";
  }

  return 0;
}
