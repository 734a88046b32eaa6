#include "reconplan/PlanExport.hpp"

#include "reconplan/Json.hpp"
#include "reconplan/Version.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <string>

namespace reconplan {

namespace fs = std::filesystem;

namespace {

bool EnsureParentDir(const std::string& path)
{
  fs::path p(path);
  fs::path parent = p.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  fs::create_directories(parent, ec);
  return !ec;
}

template <typename WriteFn>
bool ExportToFile(const std::string& path, std::string* outError, WriteFn write)
{
  if (!EnsureParentDir(path)) {
    if (outError) *outError = "failed creating parent directory for " + path;
    return false;
  }
  std::ofstream f(path, std::ios::binary);
  if (!f.is_open()) {
    if (outError) *outError = "failed opening " + path;
    return false;
  }
  return write(f);
}

// RFC 4180 quoting, only when needed.
std::string CsvField(const std::string& s)
{
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string JoinIds(const std::vector<std::string>& ids)
{
  std::string out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i) out.push_back(';');
    out += ids[i];
  }
  return out;
}

bool Finish(std::ostream& os, const char* what, std::string* outError)
{
  if (!os.good()) {
    if (outError) *outError = std::string("failed writing ") + what;
    return false;
  }
  return true;
}

bool Finish(std::ostream& os, const JsonWriter& w, const char* what, std::string* outError)
{
  if (!w.ok()) {
    if (outError) *outError = std::string(what) + ": " + w.error();
    return false;
  }
  os << '\n';
  return Finish(os, what, outError);
}

void WriteStringArray(JsonWriter& w, const char* key, const std::vector<std::string>& items)
{
  w.key(key);
  w.beginArray();
  for (const std::string& s : items) w.stringValue(s);
  w.endArray();
}

void WriteSummary(JsonWriter& w, const char* key, const ScoreSummary& s)
{
  w.key(key);
  w.beginObject();
  w.member("mean", s.mean);
  w.member("median", s.median);
  w.member("std", s.stddev);
  w.member("min", s.min);
  w.member("max", s.max);
  w.endObject();
}

void WritePhase(JsonWriter& w, const Phase& p)
{
  w.beginObject();
  w.member("index", p.index);
  w.member("critical", p.index == 0);
  w.member("building_count", static_cast<int>(p.buildingIds.size()));
  WriteStringArray(w, "buildings", p.buildingIds);
  WriteStringArray(w, "infrastructures", p.infraIds);
  w.member("cost", p.cost);
  w.member("duration_hours", p.durationHours);
  w.member("min_elapsed_hours", p.minElapsedHours);
  w.member("worker_cost", p.workerCost);
  w.member("budget_allotment", p.budgetAllotment);
  w.member("remaining_budget_before", p.remainingBudgetBefore);
  w.member("remaining_budget_after", p.remainingBudgetAfter);
  WriteStringArray(w, "warnings", p.warnings);
  w.endObject();
}

} // namespace

bool WriteRankingJson(std::ostream& os, const std::vector<RankedBuilding>& ranked, const PriorityReport* report,
                      std::string* outError)
{
  if (outError) outError->clear();
  JsonWriter w(os);

  w.beginObject();
  w.member("generator", ReconPlanBanner());
  w.member("buildings", static_cast<int>(ranked.size()));

  if (report) {
    w.key("report");
    w.beginObject();
    w.member("buildings", report->buildings);
    w.key("total_inhabitants");
    w.intValue(static_cast<std::int64_t>(report->totalInhabitants));
    w.member("total_cost", report->totalCost);
    WriteSummary(w, "population_score", report->population);
    WriteSummary(w, "cost_score", report->cost);
    WriteSummary(w, "urgency_score", report->urgency);
    WriteSummary(w, "distance_score", report->distance);
    WriteSummary(w, "composite_score", report->composite);
    w.key("top_20_percent");
    w.beginObject();
    w.member("buildings", report->topCount);
    w.key("inhabitants");
    w.intValue(static_cast<std::int64_t>(report->topInhabitants));
    w.member("inhabitants_pct", report->topInhabitantsPct);
    w.member("cost", report->topCost);
    w.member("cost_pct", report->topCostPct);
    w.endObject();
    w.endObject();
  }

  w.key("ranking");
  w.beginArray();
  for (const RankedBuilding& r : ranked) {
    w.beginObject();
    w.member("rank", r.rank);
    w.member("id", r.id);
    w.member("inhabitants", r.inhabitants);
    w.member("cost", r.cost);
    w.member("population_score", r.populationScore);
    w.member("cost_score", r.costScore);
    w.member("urgency_score", r.urgencyScore);
    w.member("distance_score", r.distanceScore);
    w.member("composite_score", r.compositeScore);
    w.key("cumulative_inhabitants");
    w.intValue(static_cast<std::int64_t>(r.cumulativeInhabitants));
    w.member("cumulative_cost", r.cumulativeCost);
    w.member("cumulative_inhabitants_pct", r.cumulativeInhabitantsPct);
    w.member("cumulative_cost_pct", r.cumulativeCostPct);
    w.member("buildings_reconnected", r.buildingsReconnected);
    w.member("buildings_reconnected_pct", r.buildingsReconnectedPct);
    w.endObject();
  }
  w.endArray();
  w.endObject();

  return Finish(os, w, "ranking JSON", outError);
}

bool WriteRankingCsv(std::ostream& os, const std::vector<RankedBuilding>& ranked, std::string* outError)
{
  if (outError) outError->clear();

  os << "rank,id,inhabitants,cost,population_score,cost_score,urgency_score,distance_score,composite_score,"
        "cumulative_inhabitants,cumulative_cost,cumulative_inhabitants_pct,cumulative_cost_pct,"
        "buildings_reconnected\n";
  os << std::fixed;
  for (const RankedBuilding& r : ranked) {
    os << r.rank << ',' << CsvField(r.id) << ',' << r.inhabitants << ',' << std::setprecision(2) << r.cost << ',';
    os << std::setprecision(6) << r.populationScore << ',' << r.costScore << ',' << r.urgencyScore << ','
       << r.distanceScore << ',' << r.compositeScore << ',';
    os << r.cumulativeInhabitants << ',' << std::setprecision(2) << r.cumulativeCost << ','
       << r.cumulativeInhabitantsPct << ',' << r.cumulativeCostPct << ',' << r.buildingsReconnected << '\n';
  }

  return Finish(os, "ranking CSV", outError);
}

bool WritePhasePlanJson(std::ostream& os, const PhasePlan& plan, std::string* outError)
{
  if (outError) outError->clear();
  JsonWriter w(os);

  w.beginObject();
  w.member("generator", ReconPlanBanner());

  w.key("summary");
  w.beginObject();
  w.member("total_budget", plan.totalBudget);
  w.member("planned_cost", plan.plannedCost);
  w.member("remaining_budget", plan.remainingBudget);
  w.member("buildings_requiring_repair", plan.buildingsRequiringRepair);
  w.member("buildings_planned", plan.buildingsPlanned);
  w.member("buildings_unplanned", static_cast<int>(plan.unplannedBuildings.size()));
  w.member("phases", static_cast<int>(plan.phases.size()));
  w.endObject();

  w.key("phases");
  w.beginArray();
  for (const Phase& p : plan.phases) WritePhase(w, p);
  w.endArray();

  WriteStringArray(w, "unplanned_buildings", plan.unplannedBuildings);
  WriteStringArray(w, "warnings", plan.warnings);
  w.endObject();

  return Finish(os, w, "phase plan JSON", outError);
}

bool WritePhasePlanCsv(std::ostream& os, const PhasePlan& plan, std::string* outError)
{
  if (outError) outError->clear();

  os << "phase,building_count,cost,duration_hours,min_elapsed_hours,worker_cost,budget_allotment,"
        "remaining_budget_after,buildings,infrastructures,warnings\n";
  os << std::fixed << std::setprecision(2);
  for (const Phase& p : plan.phases) {
    os << p.index << ',' << p.buildingIds.size() << ',' << p.cost << ',' << p.durationHours << ','
       << p.minElapsedHours << ',' << p.workerCost << ',' << p.budgetAllotment << ',' << p.remainingBudgetAfter
       << ',' << CsvField(JoinIds(p.buildingIds)) << ',' << CsvField(JoinIds(p.infraIds)) << ','
       << CsvField(JoinIds(p.warnings)) << '\n';
  }

  return Finish(os, "phase plan CSV", outError);
}

bool WriteNetworkMetricsJson(std::ostream& os, const NetworkGraph& g, const NetworkMetricsReport& r,
                             std::string* outError)
{
  if (outError) outError->clear();
  JsonWriter w(os);

  const NetworkStats& s = r.stats;
  w.beginObject();
  w.member("generator", ReconPlanBanner());

  w.key("stats");
  w.beginObject();
  w.member("nodes", s.nodes);
  w.member("edges", s.edges);
  w.member("substations", s.substations);
  w.member("network_points", s.networkPoints);
  w.member("buildings", s.buildings);
  w.member("buildings_attached", s.buildingsAttached);
  w.member("segments", s.segments);
  w.member("connections", s.connections);
  w.member("damaged_segments", s.damagedSegments);
  w.member("components", s.components);
  w.member("connected", s.connected);
  w.member("min_degree", s.minDegree);
  w.member("max_degree", s.maxDegree);
  w.member("avg_degree", s.avgDegree);
  w.member("total_length", s.totalLength);
  w.member("damaged_length", s.damagedLength);
  w.endObject();

  w.key("components");
  w.beginArray();
  for (int c = 0; c < r.components.count(); ++c) {
    const std::vector<int>& members = r.components.members[static_cast<std::size_t>(c)];
    w.beginObject();
    w.member("id", c);
    w.member("size", static_cast<int>(members.size()));
    w.key("nodes");
    w.beginArray();
    for (int v : members) w.stringValue(g.nodes[static_cast<std::size_t>(v)].id);
    w.endArray();
    w.endObject();
  }
  w.endArray();

  w.key("centrality");
  w.beginObject();
  for (const CentralityResult& c : r.centrality) {
    w.key(ToString(c.metric));
    w.beginObject();
    if (c.metric == CentralityMetric::Eigenvector) {
      w.member("iterations", c.iterations);
      w.member("converged", c.converged);
    }
    w.key("top");
    w.beginArray();
    for (int v : TopCriticalNodes(c, r.topNodes)) {
      const NetworkNode& n = g.nodes[static_cast<std::size_t>(v)];
      w.beginObject();
      w.member("id", n.id);
      w.member("kind", ToString(n.kind));
      w.member("score", c.score[static_cast<std::size_t>(v)]);
      w.endObject();
    }
    w.endArray();
    w.endObject();
  }
  w.endObject();

  if (r.hasPath) {
    w.key("path");
    w.beginObject();
    if (r.pathFrom >= 0 && r.pathFrom < g.nodeCount()) w.member("from", g.nodes[static_cast<std::size_t>(r.pathFrom)].id);
    if (r.pathTo >= 0 && r.pathTo < g.nodeCount()) w.member("to", g.nodes[static_cast<std::size_t>(r.pathTo)].id);
    w.member("found", r.path.found);
    if (r.path.found) {
      w.member("cost", r.path.cost);
      w.key("nodes");
      w.beginArray();
      for (int v : r.path.nodes) w.stringValue(g.nodes[static_cast<std::size_t>(v)].id);
      w.endArray();
    }
    w.endObject();
  }

  w.endObject();
  return Finish(os, w, "network metrics JSON", outError);
}

bool WriteCentralityNodesCsv(std::ostream& os, const NetworkGraph& g, const ComponentPartition& comps,
                             const std::vector<CentralityResult>& metrics, std::string* outError)
{
  if (outError) outError->clear();

  os << "id,kind,x,y,degree,component";
  for (const CentralityResult& c : metrics) os << ',' << ToString(c.metric);
  os << '\n';

  for (int i = 0; i < g.nodeCount(); ++i) {
    const NetworkNode& n = g.nodes[static_cast<std::size_t>(i)];
    const int comp = (i < static_cast<int>(comps.nodeComponent.size()))
                         ? comps.nodeComponent[static_cast<std::size_t>(i)]
                         : -1;
    os << CsvField(n.id) << ',' << ToString(n.kind) << ',' << std::fixed << std::setprecision(3) << n.pos.x << ','
       << n.pos.y << ',' << n.edges.size() << ',' << comp;
    os << std::setprecision(9);
    for (const CentralityResult& c : metrics) {
      os << ',';
      if (i < static_cast<int>(c.score.size())) os << c.score[static_cast<std::size_t>(i)];
    }
    os << '\n';
  }

  return Finish(os, "centrality nodes CSV", outError);
}

bool ExportRankingJson(const std::string& path, const std::vector<RankedBuilding>& ranked,
                       const PriorityReport* report, std::string* outError)
{
  return ExportToFile(path, outError, [&](std::ostream& os) { return WriteRankingJson(os, ranked, report, outError); });
}

bool ExportRankingCsv(const std::string& path, const std::vector<RankedBuilding>& ranked, std::string* outError)
{
  return ExportToFile(path, outError, [&](std::ostream& os) { return WriteRankingCsv(os, ranked, outError); });
}

bool ExportPhasePlanJson(const std::string& path, const PhasePlan& plan, std::string* outError)
{
  return ExportToFile(path, outError, [&](std::ostream& os) { return WritePhasePlanJson(os, plan, outError); });
}

bool ExportPhasePlanCsv(const std::string& path, const PhasePlan& plan, std::string* outError)
{
  return ExportToFile(path, outError, [&](std::ostream& os) { return WritePhasePlanCsv(os, plan, outError); });
}

bool ExportNetworkMetricsJson(const std::string& path, const NetworkGraph& g, const NetworkMetricsReport& r,
                              std::string* outError)
{
  return ExportToFile(path, outError, [&](std::ostream& os) { return WriteNetworkMetricsJson(os, g, r, outError); });
}

bool ExportCentralityNodesCsv(const std::string& path, const NetworkGraph& g, const ComponentPartition& comps,
                              const std::vector<CentralityResult>& metrics, std::string* outError)
{
  return ExportToFile(path, outError,
                      [&](std::ostream& os) { return WriteCentralityNodesCsv(os, g, comps, metrics, outError); });
}

} // namespace reconplan
