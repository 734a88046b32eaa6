#pragma once

#include "reconplan/NetworkCentrality.hpp"
#include "reconplan/NetworkGraph.hpp"
#include "reconplan/PhasedPlanner.hpp"
#include "reconplan/Prioritization.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace reconplan {

// Serializers for ranking, phase plan and network metric outputs.
//
// Write* functions stream into an std::ostream and return false on stream
// failure. Export* wrappers open the file (creating parent directories).
// Key order and row order are fixed, so identical inputs give identical files.

// {"buildings": N, "report": {...}, "ranking": [{...}, ...]}
bool WriteRankingJson(std::ostream& os, const std::vector<RankedBuilding>& ranked, const PriorityReport* report,
                      std::string* outError = nullptr);

// One row per ranked building.
bool WriteRankingCsv(std::ostream& os, const std::vector<RankedBuilding>& ranked, std::string* outError = nullptr);

bool WritePhasePlanJson(std::ostream& os, const PhasePlan& plan, std::string* outError = nullptr);

// One row per phase; building/infrastructure ids joined with ';'.
bool WritePhasePlanCsv(std::ostream& os, const PhasePlan& plan, std::string* outError = nullptr);

struct NetworkMetricsReport {
  NetworkStats stats;
  ComponentPartition components;

  // Any subset of metrics, written in vector order.
  std::vector<CentralityResult> centrality;

  // Number of top-ranked nodes listed per metric (<= 0 lists all).
  int topNodes = 10;

  bool hasPath = false;
  int pathFrom = -1;
  int pathTo = -1;
  ShortestPath path;
};

bool WriteNetworkMetricsJson(std::ostream& os, const NetworkGraph& g, const NetworkMetricsReport& r,
                             std::string* outError = nullptr);

// id,kind,x,y,degree,component,<metric>... for every node.
bool WriteCentralityNodesCsv(std::ostream& os, const NetworkGraph& g, const ComponentPartition& comps,
                             const std::vector<CentralityResult>& metrics, std::string* outError = nullptr);

bool ExportRankingJson(const std::string& path, const std::vector<RankedBuilding>& ranked,
                       const PriorityReport* report, std::string* outError);
bool ExportRankingCsv(const std::string& path, const std::vector<RankedBuilding>& ranked, std::string* outError);
bool ExportPhasePlanJson(const std::string& path, const PhasePlan& plan, std::string* outError);
bool ExportPhasePlanCsv(const std::string& path, const PhasePlan& plan, std::string* outError);
bool ExportNetworkMetricsJson(const std::string& path, const NetworkGraph& g, const NetworkMetricsReport& r,
                              std::string* outError);
bool ExportCentralityNodesCsv(const std::string& path, const NetworkGraph& g, const ComponentPartition& comps,
                              const std::vector<CentralityResult>& metrics, std::string* outError);

} // namespace reconplan
