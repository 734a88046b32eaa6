#include "reconplan/ConfigIO.hpp"
#include "reconplan/InfrastructureCost.hpp"
#include "reconplan/Json.hpp"
#include "reconplan/LogTee.hpp"
#include "reconplan/NetworkCentrality.hpp"
#include "reconplan/NetworkGraph.hpp"
#include "reconplan/PhasedPlanner.hpp"
#include "reconplan/PlanExport.hpp"
#include "reconplan/Prioritization.hpp"
#include "reconplan/Scenario.hpp"
#include "reconplan/ScoreCalculator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace reconplan;

bool Contains(const std::string& haystack, const std::string& needle)
{
  return haystack.find(needle) != std::string::npos;
}

fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

BuildingRecord MakeBuilding(const std::string& id, int inhabitants, BuildingType type,
                            BuildingPriority prio = BuildingPriority::Medium, double cost = 0.0, double distance = 0.0,
                            bool connected = true)
{
  BuildingRecord b;
  b.id = id;
  b.inhabitants = inhabitants;
  b.type = type;
  b.priority = prio;
  b.cost = cost;
  b.distance = distance;
  b.connected = connected;
  return b;
}

InfraRecord MakeInfra(const std::string& id, const std::string& building, InfraType type, InfraState state,
                      double length, int houses)
{
  InfraRecord in;
  in.id = id;
  in.buildingId = building;
  in.type = type;
  in.state = state;
  in.length = length;
  in.housesServed = houses;
  return in;
}

NetworkNode MakeNode(const std::string& id, NodeKind kind = NodeKind::NetworkPoint, Vec2 pos = {})
{
  NetworkNode n;
  n.id = id;
  n.kind = kind;
  n.pos = pos;
  return n;
}

NetworkEdgeSpec MakeEdge(const std::string& from, const std::string& to, double length,
                         SegmentStatus status = SegmentStatus::Active)
{
  NetworkEdgeSpec e;
  e.id = from + "-" + to;
  e.from = from;
  e.to = to;
  e.length = length;
  e.status = status;
  return e;
}

// a - b - c with a long a-c shortcut.
NetworkGraph MakeTriangle(SegmentStatus bc = SegmentStatus::Active)
{
  NetworkGraph g;
  std::string err;
  const bool ok = BuildNetworkGraph({MakeNode("a"), MakeNode("b"), MakeNode("c")},
                                    {MakeEdge("a", "b", 1.0), MakeEdge("b", "c", 1.0, bc), MakeEdge("a", "c", 5.0)},
                                    g, err);
  EXPECT_TRUE(ok);
  return g;
}

void TestScoreNormalization()
{
  const std::vector<double> cost = CostScores({100.0, 200.0, 300.0});
  ASSERT_TRUE(cost.size() == 3u);
  EXPECT_NEAR(cost[0], 1.0, 1e-12);
  EXPECT_NEAR(cost[1], 0.5, 1e-12);
  EXPECT_NEAR(cost[2], 0.0, 1e-12);

  // Equal values: nothing to discriminate, every building gets the best score.
  for (double v : CostScores({250.0, 250.0, 250.0})) EXPECT_NEAR(v, 1.0, 1e-12);
  for (double v : DistanceScores({12.0, 12.0})) EXPECT_NEAR(v, 1.0, 1e-12);

  const std::vector<double> dist = DistanceScores({0.0, 50.0, 100.0});
  EXPECT_NEAR(dist[0], 1.0, 1e-12);
  EXPECT_NEAR(dist[2], 0.0, 1e-12);

  const std::vector<double> pop = PopulationScores({10, 40, 20});
  EXPECT_NEAR(pop[0], 0.25, 1e-12);
  EXPECT_NEAR(pop[1], 1.0, 1e-12);
  EXPECT_NEAR(pop[2], 0.5, 1e-12);

  for (double v : PopulationScores({0, 0})) EXPECT_NEAR(v, 0.0, 1e-12);
  EXPECT_TRUE(CostScores({}).empty());
}

void TestUrgencyTable()
{
  const UrgencyTable t;
  EXPECT_NEAR(UrgencyScore(BuildingType::Hospital, BuildingPriority::High, t), 1.0, 1e-12);
  EXPECT_NEAR(UrgencyScore(BuildingType::School, BuildingPriority::High, t), 1.0, 1e-12);
  EXPECT_NEAR(UrgencyScore(BuildingType::Residential, BuildingPriority::High, t), 0.75, 1e-12);
  EXPECT_NEAR(UrgencyScore(BuildingType::Residential, BuildingPriority::Low, t), 0.35, 1e-12);
  EXPECT_NEAR(UrgencyScore(BuildingType::Commercial, BuildingPriority::Medium, t), 0.55, 1e-12);

  // Untabulated combinations fall back.
  EXPECT_NEAR(UrgencyScore(BuildingType::Hospital, BuildingPriority::Low, t), 0.5, 1e-12);
  EXPECT_NEAR(UrgencyScore(BuildingType::Commercial, BuildingPriority::High, t), 0.5, 1e-12);

  UrgencyTable custom;
  custom.set(BuildingType::Commercial, BuildingPriority::High, 0.9);
  custom.unset(BuildingType::Residential, BuildingPriority::Low);
  custom.fallback = 0.1;
  EXPECT_NEAR(UrgencyScore(BuildingType::Commercial, BuildingPriority::High, custom), 0.9, 1e-12);
  EXPECT_NEAR(UrgencyScore(BuildingType::Residential, BuildingPriority::Low, custom), 0.1, 1e-12);
  EXPECT_FALSE(custom.isTabulated(BuildingType::Residential, BuildingPriority::Low));

  std::string err;
  EXPECT_TRUE(ValidateUrgencyTable(custom, err));
  custom.set(BuildingType::School, BuildingPriority::Low, 1.5);
  EXPECT_FALSE(ValidateUrgencyTable(custom, err));
  EXPECT_FALSE(err.empty());
}

void TestWeightValidation()
{
  std::string err;
  PrioritizationWeights w;
  EXPECT_TRUE(ValidatePrioritizationWeights(w, err));

  w.distance = 0.0; // sums to 0.9
  EXPECT_FALSE(ValidatePrioritizationWeights(w, err));
  EXPECT_FALSE(err.empty());

  w = PrioritizationWeights{};
  w.population = -0.1;
  w.cost = 0.8;
  EXPECT_FALSE(ValidatePrioritizationWeights(w, err));

  std::vector<RankedBuilding> out;
  w.distance = 0.3;
  w.population = 0.0;
  w.cost = 0.0;
  w.urgency = 0.0;
  EXPECT_FALSE(RankBuildings({MakeBuilding("a", 1, BuildingType::Residential)}, w, UrgencyTable{}, out, err));
  EXPECT_TRUE(out.empty());
}

std::vector<BuildingRecord> MakeRankingInput()
{
  return {
      MakeBuilding("r1", 40, BuildingType::Residential, BuildingPriority::Medium, 1200.0, 30.0),
      MakeBuilding("h1", 10, BuildingType::Hospital, BuildingPriority::High, 5000.0, 80.0),
      MakeBuilding("s1", 200, BuildingType::School, BuildingPriority::High, 3000.0, 10.0),
      MakeBuilding("c1", 5, BuildingType::Commercial, BuildingPriority::Low, 800.0, 120.0),
      MakeBuilding("r2", 60, BuildingType::Residential, BuildingPriority::High, 2500.0, 60.0),
  };
}

void TestRankingInvariants()
{
  const std::vector<BuildingRecord> input = MakeRankingInput();
  std::vector<RankedBuilding> ranked;
  std::string err;
  ASSERT_TRUE(RankBuildings(input, PrioritizationWeights{}, UrgencyTable{}, ranked, err));
  ASSERT_TRUE(ranked.size() == input.size());

  long long totalInhabitants = 0;
  double totalCost = 0.0;
  for (const BuildingRecord& b : input) {
    totalInhabitants += b.inhabitants;
    totalCost += b.cost;
  }

  for (std::size_t i = 0; i < ranked.size(); ++i) {
    const RankedBuilding& r = ranked[i];
    EXPECT_TRUE(r.compositeScore >= 0.0 && r.compositeScore <= 1.0);
    EXPECT_EQ(r.rank, static_cast<int>(i) + 1);
    EXPECT_EQ(r.buildingsReconnected, static_cast<int>(i) + 1);
    if (i > 0) {
      EXPECT_TRUE(ranked[i - 1].compositeScore >= r.compositeScore);
      EXPECT_TRUE(ranked[i - 1].cumulativeInhabitants <= r.cumulativeInhabitants);
      EXPECT_TRUE(ranked[i - 1].cumulativeCost <= r.cumulativeCost);
    }
  }
  EXPECT_EQ(ranked.back().cumulativeInhabitants, totalInhabitants);
  EXPECT_NEAR(ranked.back().cumulativeCost, totalCost, 1e-9);
  EXPECT_NEAR(ranked.back().cumulativeInhabitantsPct, 100.0, 1e-9);
  EXPECT_NEAR(ranked.back().buildingsReconnectedPct, 100.0, 1e-9);

  // The school has the most inhabitants, the best distance and a high urgency.
  EXPECT_EQ(ranked.front().id, std::string("s1"));

  // Same input, same order.
  std::vector<RankedBuilding> again;
  ASSERT_TRUE(RankBuildings(input, PrioritizationWeights{}, UrgencyTable{}, again, err));
  for (std::size_t i = 0; i < ranked.size(); ++i) EXPECT_EQ(ranked[i].id, again[i].id);

  // topN truncates before the cumulative columns are computed.
  std::vector<RankedBuilding> top;
  ASSERT_TRUE(RankBuildings(input, PrioritizationWeights{}, UrgencyTable{}, top, err, 2));
  ASSERT_TRUE(top.size() == 2u);
  EXPECT_EQ(top[0].id, ranked[0].id);
  EXPECT_NEAR(top.back().cumulativeInhabitantsPct, 100.0, 1e-9);
}

void TestRankingTieBreakById()
{
  std::vector<BuildingRecord> input = {
      MakeBuilding("b3", 10, BuildingType::Residential, BuildingPriority::Medium, 100.0, 5.0),
      MakeBuilding("b1", 10, BuildingType::Residential, BuildingPriority::Medium, 100.0, 5.0),
      MakeBuilding("b2", 10, BuildingType::Residential, BuildingPriority::Medium, 100.0, 5.0),
  };
  std::vector<RankedBuilding> ranked;
  std::string err;
  ASSERT_TRUE(RankBuildings(input, PrioritizationWeights{}, UrgencyTable{}, ranked, err));
  ASSERT_TRUE(ranked.size() == 3u);
  EXPECT_EQ(ranked[0].id, std::string("b1"));
  EXPECT_EQ(ranked[1].id, std::string("b2"));
  EXPECT_EQ(ranked[2].id, std::string("b3"));
  EXPECT_EQ(ranked[0].index, 1);
  EXPECT_NEAR(ranked[0].compositeScore, ranked[2].compositeScore, 0.0);
}

void TestPriorityReport()
{
  std::vector<BuildingRecord> input;
  for (int i = 0; i < 10; ++i) {
    input.push_back(MakeBuilding("b" + std::to_string(i), 10 * (i + 1), BuildingType::Residential,
                                 BuildingPriority::Medium, 100.0, 10.0));
  }
  std::vector<RankedBuilding> ranked;
  std::string err;
  ASSERT_TRUE(RankBuildings(input, PrioritizationWeights{}, UrgencyTable{}, ranked, err));

  const PriorityReport rep = BuildPriorityReport(ranked);
  EXPECT_EQ(rep.buildings, 10);
  EXPECT_EQ(rep.totalInhabitants, 550LL);
  EXPECT_EQ(rep.topCount, 2);
  // The two most populated buildings come first (cost and distance tie).
  EXPECT_EQ(rep.topInhabitants, 190LL);
  EXPECT_NEAR(rep.topInhabitantsPct, 100.0 * 190.0 / 550.0, 1e-9);
  EXPECT_NEAR(rep.topCost, 200.0, 1e-9);
  EXPECT_TRUE(rep.composite.max >= rep.composite.median && rep.composite.median >= rep.composite.min);

  const ScoreSummary s = SummarizeScores({1.0, 2.0, 3.0, 4.0});
  EXPECT_NEAR(s.mean, 2.5, 1e-12);
  EXPECT_NEAR(s.median, 2.5, 1e-12);
  EXPECT_NEAR(s.stddev, std::sqrt(5.0 / 3.0), 1e-12);
  EXPECT_NEAR(s.min, 1.0, 1e-12);
  EXPECT_NEAR(s.max, 4.0, 1e-12);

  const PriorityReport empty = BuildPriorityReport({});
  EXPECT_EQ(empty.topCount, 0);
  EXPECT_NEAR(empty.topInhabitantsPct, 0.0, 1e-12);
}

void TestInfrastructureCost()
{
  const CostModelConfig cfg;
  const InfraRecord aerial = MakeInfra("i1", "b1", InfraType::Aerial, InfraState::ToReplace, 10.0, 2);
  const InfraCost c = ComputeInfraCost(aerial, cfg);
  EXPECT_NEAR(c.price, 5000.0, 1e-9);
  EXPECT_NEAR(c.durationHours, 20.0, 1e-9);
  EXPECT_NEAR(c.workerCost, 20.0 / 8.0 * 300.0, 1e-9);

  // More workers never slow a repair down; the crew is capped.
  double prev = ElapsedHours(20.0, 1, cfg);
  EXPECT_NEAR(prev, 20.0, 1e-12);
  for (int w = 2; w <= 8; ++w) {
    const double e = ElapsedHours(20.0, w, cfg);
    EXPECT_TRUE(e <= prev);
    prev = e;
  }
  EXPECT_NEAR(ElapsedHours(20.0, 10, cfg), 5.0, 1e-12);
  EXPECT_NEAR(ElapsedHours(20.0, 0, cfg), 20.0, 1e-12);

  EXPECT_EQ(RequiredWorkersForTargetElapsed(20.0, 5.0, cfg), 4);
  EXPECT_EQ(RequiredWorkersForTargetElapsed(20.0, 10.0, cfg), 2);
  EXPECT_EQ(RequiredWorkersForTargetElapsed(20.0, 7.0, cfg), 3);
  EXPECT_EQ(RequiredWorkersForTargetElapsed(20.0, 1.0, cfg), 4);
  EXPECT_EQ(RequiredWorkersForTargetElapsed(20.0, 0.0, cfg), 4);
  EXPECT_EQ(RequiredWorkersForTargetElapsed(0.0, 5.0, cfg), 1);

  const BuildingRecord b = MakeBuilding("b1", 30, BuildingType::Residential);
  const std::vector<InfraRecord> infras = {
      aerial,
      MakeInfra("i2", "b1", InfraType::Duct, InfraState::ToReplace, 4.0, 3),
      MakeInfra("i3", "b1", InfraType::SemiAerial, InfraState::Intact, 50.0, 9),
      MakeInfra("i4", "b2", InfraType::Aerial, InfraState::ToReplace, 7.0, 1),
  };
  const BuildingRepairSummary s = SummarizeBuildingRepairs(b, 0, infras, cfg);
  ASSERT_TRUE(s.infraIds.size() == 2u);
  EXPECT_EQ(s.infraIds[0], std::string("i1"));
  EXPECT_EQ(s.infraIds[1], std::string("i2"));
  EXPECT_NEAR(s.totalCost, 5000.0 + 3600.0, 1e-9);
  EXPECT_NEAR(s.totalDurationHours, 20.0 + 20.0, 1e-9);
  EXPECT_NEAR(s.minElapsedHours, 5.0, 1e-9);
  EXPECT_NEAR(s.totalLength, 14.0, 1e-9);
  EXPECT_EQ(s.housesServed, 5);
  EXPECT_NEAR(s.difficulty, 14.0 / 5.0, 1e-12);

  // No house served: difficulty is the raw length.
  const BuildingRepairSummary s2 =
      SummarizeBuildingRepairs(MakeBuilding("b9", 1, BuildingType::Residential), 0,
                               {MakeInfra("x", "b9", InfraType::Aerial, InfraState::ToReplace, 6.0, 0)}, cfg);
  EXPECT_NEAR(s2.difficulty, 6.0, 1e-12);

  const std::vector<BuildingRepairSummary> all =
      SummarizeAllBuildings({b, MakeBuilding("b2", 4, BuildingType::Commercial)}, infras, cfg);
  ASSERT_TRUE(all.size() == 2u);
  EXPECT_EQ(all[1].infraIds.size(), 1u);
  EXPECT_NEAR(all[1].totalCost, 3500.0, 1e-9);

  EXPECT_TRUE(BuildingRequiresRepair(b, infras));
  EXPECT_TRUE(BuildingRequiresRepair(b, s));
  EXPECT_FALSE(BuildingRequiresRepair(MakeBuilding("b3", 1, BuildingType::Residential), infras));
  EXPECT_TRUE(BuildingRequiresRepair(
      MakeBuilding("b3", 1, BuildingType::Residential, BuildingPriority::Medium, 0.0, 0.0, false), infras));

  // Household counts near the int limit add up without wrapping.
  const int big = std::numeric_limits<int>::max();
  const BuildingRepairSummary crowded =
      SummarizeBuildingRepairs(MakeBuilding("b8", 1, BuildingType::Residential), 0,
                               {MakeInfra("y1", "b8", InfraType::Aerial, InfraState::ToReplace, 1.0, big),
                                MakeInfra("y2", "b8", InfraType::Aerial, InfraState::ToReplace, 1.0, big)},
                               cfg);
  EXPECT_EQ(crowded.housesServed, 2LL * big);
  EXPECT_TRUE(crowded.difficulty > 0.0);
  EXPECT_NEAR(crowded.difficulty, 2.0 / (2.0 * static_cast<double>(big)), 1e-18);
}

void TestCostModelValidation()
{
  std::string err;
  CostModelConfig cfg;
  const std::vector<InfraRecord> aerialOnly = {MakeInfra("i", "b", InfraType::Aerial, InfraState::ToReplace, 1, 1)};
  EXPECT_TRUE(ValidateCostModelConfig(cfg, aerialOnly, err));

  // A missing rate only matters for a type that is actually used.
  cfg.pricePerMeter[static_cast<int>(InfraType::Duct)] = -1.0;
  EXPECT_TRUE(ValidateCostModelConfig(cfg, aerialOnly, err));
  const std::vector<InfraRecord> withDuct = {MakeInfra("d", "b", InfraType::Duct, InfraState::Intact, 1, 1)};
  EXPECT_FALSE(ValidateCostModelConfig(cfg, withDuct, err));
  EXPECT_TRUE(Contains(err, "duct"));

  cfg = CostModelConfig{};
  cfg.maxWorkersPerInfra = 0;
  EXPECT_FALSE(ValidateCostModelConfig(cfg, aerialOnly, err));
}

void TestPlannerConfigValidation()
{
  std::string err;
  PlannerConfig cfg;
  EXPECT_FALSE(ValidatePlannerConfig(cfg, err)); // budget 0
  cfg.totalBudget = 1000.0;
  EXPECT_TRUE(ValidatePlannerConfig(cfg, err));

  PlannerConfig bad = cfg;
  bad.phaseBudgetFractions = {0.6, 0.6};
  EXPECT_FALSE(ValidatePlannerConfig(bad, err));

  bad = cfg;
  bad.phaseBudgetFractions = {0.5, -0.1};
  EXPECT_FALSE(ValidatePlannerConfig(bad, err));

  bad = cfg;
  bad.safetyMargin = 1.5;
  EXPECT_FALSE(ValidatePlannerConfig(bad, err));

  bad = cfg;
  bad.generatorAutonomyHours = 0.0;
  EXPECT_FALSE(ValidatePlannerConfig(bad, err));

  bad = cfg;
  bad.coefficients.gamma = -1.0;
  EXPECT_FALSE(ValidatePlannerConfig(bad, err));

  EXPECT_NEAR(GuardedReciprocal(4.0, 1e6), 0.25, 1e-12);
  EXPECT_NEAR(GuardedReciprocal(0.0, 1e6), 1e6, 1e-6);
  EXPECT_NEAR(GuardedReciprocal(1e-9, 1e3), 1e3, 1e-9);
}

void TestPlannerHospitalsFirst()
{
  const std::vector<BuildingRecord> buildings = {
      MakeBuilding("r1", 20, BuildingType::Residential),
      MakeBuilding("h1", 100, BuildingType::Hospital, BuildingPriority::High),
      MakeBuilding("r2", 5, BuildingType::Residential, BuildingPriority::Low, 0.0, 0.0, false),
      MakeBuilding("c1", 3, BuildingType::Commercial),
  };
  const std::vector<InfraRecord> infras = {
      MakeInfra("i-h1", "h1", InfraType::Aerial, InfraState::ToReplace, 10.0, 1),
      MakeInfra("i-r1", "r1", InfraType::Aerial, InfraState::ToReplace, 2.0, 4),
      MakeInfra("i-c1", "c1", InfraType::Duct, InfraState::Intact, 30.0, 2),
  };
  PlannerConfig cfg;
  cfg.totalBudget = 100000.0;

  PhasePlan plan;
  std::string err;
  ASSERT_TRUE(PlanReconnection(buildings, infras, cfg, CostModelConfig{}, plan, err));
  ASSERT_TRUE(plan.phases.size() >= 2u);

  const Phase& p0 = plan.phases[0];
  EXPECT_EQ(p0.index, 0);
  ASSERT_TRUE(p0.buildingIds.size() == 1u);
  EXPECT_EQ(p0.buildingIds[0], std::string("h1"));
  EXPECT_NEAR(p0.cost, 5000.0, 1e-9);
  // 20 worker-hours over 4 workers = 5 h, within 20 h * 0.8.
  EXPECT_NEAR(p0.minElapsedHours, 5.0, 1e-9);
  EXPECT_TRUE(p0.warnings.empty());

  // Partition: every building requiring repair is placed exactly once or unplanned.
  std::multiset<std::string> seen;
  for (const Phase& p : plan.phases) seen.insert(p.buildingIds.begin(), p.buildingIds.end());
  seen.insert(plan.unplannedBuildings.begin(), plan.unplannedBuildings.end());
  EXPECT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen.count("h1"), 1u);
  EXPECT_EQ(seen.count("r1"), 1u);
  EXPECT_EQ(seen.count("r2"), 1u);
  EXPECT_EQ(seen.count("c1"), 0u);
  EXPECT_EQ(plan.buildingsRequiringRepair, 3);
  EXPECT_EQ(plan.buildingsPlanned, 3);
  EXPECT_TRUE(plan.unplannedBuildings.empty());

  // Cost conservation.
  double sum = 0.0;
  for (const Phase& p : plan.phases) sum += p.cost;
  EXPECT_NEAR(plan.plannedCost, sum, 1e-9);
  EXPECT_NEAR(plan.plannedCost, 6000.0, 1e-9);
  EXPECT_NEAR(plan.remainingBudget, 94000.0, 1e-9);
}

void TestPlannerAutonomyWarning()
{
  const std::vector<BuildingRecord> buildings = {MakeBuilding("h1", 100, BuildingType::Hospital)};
  // 20 m of duct = 100 worker-hours = 25 h with 4 workers, beyond 16 h.
  const std::vector<InfraRecord> infras = {MakeInfra("i1", "h1", InfraType::Duct, InfraState::ToReplace, 20.0, 1)};
  PlannerConfig cfg;
  cfg.totalBudget = 1.0e6;

  PhasePlan plan;
  std::string err;
  ASSERT_TRUE(PlanReconnection(buildings, infras, cfg, CostModelConfig{}, plan, err));
  ASSERT_TRUE(!plan.phases.empty());
  EXPECT_NEAR(plan.phases[0].minElapsedHours, 25.0, 1e-9);
  EXPECT_FALSE(plan.phases[0].warnings.empty());

  // Longer autonomy: no warning.
  cfg.generatorAutonomyHours = 40.0;
  ASSERT_TRUE(PlanReconnection(buildings, infras, cfg, CostModelConfig{}, plan, err));
  EXPECT_TRUE(plan.phases[0].warnings.empty());
}

void TestPlannerBudgetExhaustion()
{
  const std::vector<BuildingRecord> buildings = {
      MakeBuilding("r3", 10, BuildingType::Residential),
      MakeBuilding("r1", 10, BuildingType::Residential),
      MakeBuilding("r2", 10, BuildingType::Residential),
  };
  const std::vector<InfraRecord> infras = {
      MakeInfra("i1", "r1", InfraType::Aerial, InfraState::ToReplace, 1.0, 1),
      MakeInfra("i2", "r2", InfraType::Aerial, InfraState::ToReplace, 1.0, 1),
      MakeInfra("i3", "r3", InfraType::Aerial, InfraState::ToReplace, 1.0, 1),
  };
  PlannerConfig cfg;
  cfg.totalBudget = 1000.0;

  PhasePlan plan;
  std::string err;
  ASSERT_TRUE(PlanReconnection(buildings, infras, cfg, CostModelConfig{}, plan, err));
  ASSERT_TRUE(plan.phases.size() == 5u);

  EXPECT_TRUE(plan.phases[0].buildingIds.empty());

  // Phase 1: 400 allotted, the first 500 building crosses it and is kept.
  EXPECT_NEAR(plan.phases[1].budgetAllotment, 400.0, 1e-9);
  ASSERT_TRUE(plan.phases[1].buildingIds.size() == 1u);
  EXPECT_EQ(plan.phases[1].buildingIds[0], std::string("r1"));

  // Phase 2: 0.2 * 500 = 100 allotted.
  EXPECT_NEAR(plan.phases[2].budgetAllotment, 100.0, 1e-9);
  ASSERT_TRUE(plan.phases[2].buildingIds.size() == 1u);
  EXPECT_EQ(plan.phases[2].buildingIds[0], std::string("r2"));
  EXPECT_NEAR(plan.phases[2].remainingBudgetAfter, 0.0, 1e-9);

  // Nothing left for phases 3 and 4.
  EXPECT_TRUE(plan.phases[3].buildingIds.empty());
  EXPECT_FALSE(plan.phases[3].warnings.empty());
  EXPECT_TRUE(plan.phases[4].buildingIds.empty());

  ASSERT_TRUE(plan.unplannedBuildings.size() == 1u);
  EXPECT_EQ(plan.unplannedBuildings[0], std::string("r3"));
  EXPECT_FALSE(plan.warnings.empty());
  EXPECT_NEAR(plan.remainingBudget, 0.0, 1e-9);
  EXPECT_TRUE(plan.remainingBudget >= 0.0);
}

void TestCombinedScoreOrdering()
{
  PlannerConfig cfg;
  cfg.totalBudget = 40000.0;

  // School: 0.4*0.75 + 0.3/2 + 0.2/1000 + 0.1/8
  BuildingRepairSummary s;
  s.difficulty = 2.0;
  s.totalCost = 1000.0;
  s.totalDurationHours = 8.0;
  EXPECT_NEAR(CombinedScore(s, BuildingType::School, cfg), 0.3 + 0.15 + 0.0002 + 0.0125, 1e-12);

  // Zero denominators resolve to the cap.
  PlannerConfig capped = cfg;
  capped.reciprocalCap = 100.0;
  const BuildingRepairSummary empty;
  EXPECT_NEAR(CombinedScore(empty, BuildingType::Residential, capped), 0.2 + 30.0 + 20.0 + 10.0, 1e-9);

  const std::vector<BuildingRecord> buildings = {
      MakeBuilding("a-res", 40, BuildingType::Residential),
      MakeBuilding("b-com", 10, BuildingType::Commercial),
      MakeBuilding("m-zero", 5, BuildingType::Residential, BuildingPriority::Low, 0.0, 0.0, false),
      MakeBuilding("z-sch", 300, BuildingType::School),
  };
  const std::vector<InfraRecord> infras = {
      MakeInfra("i-a", "a-res", InfraType::Aerial, InfraState::ToReplace, 40.0, 1),   // 20000, 80 h
      MakeInfra("i-b", "b-com", InfraType::Duct, InfraState::ToReplace, 20.0, 2),     // 18000, 100 h
      MakeInfra("i-z", "z-sch", InfraType::SemiAerial, InfraState::ToReplace, 2.0, 4), // 1500, 8 h
  };

  PhasedBudgetPlanner planner(buildings, infras, cfg);
  std::string err;
  ASSERT_TRUE(planner.begin(err));
  const std::vector<BuildingRepairSummary>& sums = planner.summaries();
  ASSERT_TRUE(sums.size() == 4u);
  const double scoreA = CombinedScore(sums[0], BuildingType::Residential, cfg);
  const double scoreB = CombinedScore(sums[1], BuildingType::Commercial, cfg);
  const double scoreM = CombinedScore(sums[2], BuildingType::Residential, cfg);
  const double scoreZ = CombinedScore(sums[3], BuildingType::School, cfg);
  EXPECT_NEAR(scoreZ, 0.3 + 0.3 / 0.5 + 0.2 / 1500.0 + 0.1 / 8.0, 1e-12);
  EXPECT_NEAR(scoreB, 0.2 + 0.3 / 10.0 + 0.2 / 18000.0 + 0.1 / 100.0, 1e-12);
  EXPECT_NEAR(scoreA, 0.2 + 0.3 / 40.0 + 0.2 / 20000.0 + 0.1 / 80.0, 1e-12);
  EXPECT_TRUE(scoreM > scoreZ);
  EXPECT_TRUE(scoreZ > scoreB);
  EXPECT_TRUE(scoreB > scoreA);

  while (planner.step()) {
  }
  const PhasePlan& plan = planner.plan();
  ASSERT_TRUE(plan.phases.size() >= 3u);
  EXPECT_TRUE(plan.phases[0].buildingIds.empty());

  // Phase 1 gets 16000: the free building, then the school, then the
  // commercial building that crosses the allotment.
  const Phase& p1 = plan.phases[1];
  EXPECT_NEAR(p1.budgetAllotment, 16000.0, 1e-9);
  ASSERT_TRUE(p1.buildingIds.size() == 3u);
  EXPECT_EQ(p1.buildingIds[0], std::string("m-zero"));
  EXPECT_EQ(p1.buildingIds[1], std::string("z-sch"));
  EXPECT_EQ(p1.buildingIds[2], std::string("b-com"));
  EXPECT_NEAR(p1.cost, 19500.0, 1e-9);

  const Phase& p2 = plan.phases[2];
  EXPECT_NEAR(p2.budgetAllotment, 0.2 * 20500.0, 1e-9);
  ASSERT_TRUE(p2.buildingIds.size() == 1u);
  EXPECT_EQ(p2.buildingIds[0], std::string("a-res"));
  EXPECT_TRUE(p2.warnings.empty());
  EXPECT_TRUE(plan.unplannedBuildings.empty());
  EXPECT_NEAR(plan.remainingBudget, 500.0, 1e-9);
}

void TestPlannerSharedInfrastructure()
{
  std::string err;

  // Two homes fed by the same 10 m aerial line: one repair, paid once.
  {
    const std::vector<BuildingRecord> buildings = {
        MakeBuilding("r1", 10, BuildingType::Residential),
        MakeBuilding("r2", 12, BuildingType::Residential),
    };
    const std::vector<InfraRecord> infras = {
        MakeInfra("INF-1", "r1", InfraType::Aerial, InfraState::ToReplace, 10.0, 1),
        MakeInfra("INF-1", "r2", InfraType::Aerial, InfraState::ToReplace, 10.0, 1),
    };
    PlannerConfig cfg;
    cfg.totalBudget = 100000.0;

    PhasePlan plan;
    ASSERT_TRUE(PlanReconnection(buildings, infras, cfg, CostModelConfig{}, plan, err));
    EXPECT_NEAR(plan.plannedCost, 5000.0, 1e-9);
    EXPECT_NEAR(plan.remainingBudget, 95000.0, 1e-9);
    EXPECT_EQ(plan.buildingsPlanned, 2);

    int listed = 0;
    for (const Phase& p : plan.phases) {
      listed += static_cast<int>(std::count(p.infraIds.begin(), p.infraIds.end(), std::string("INF-1")));
    }
    EXPECT_EQ(listed, 1);
    ASSERT_TRUE(plan.phases.size() >= 2u);
    EXPECT_NEAR(plan.phases[1].durationHours, 20.0, 1e-9);
  }

  // The hospital phase repairs the shared line; the home later only pays for its own.
  {
    const std::vector<BuildingRecord> buildings = {
        MakeBuilding("h1", 80, BuildingType::Hospital),
        MakeBuilding("r1", 10, BuildingType::Residential),
    };
    const std::vector<InfraRecord> infras = {
        MakeInfra("INF-1", "h1", InfraType::Aerial, InfraState::ToReplace, 10.0, 1),
        MakeInfra("INF-1", "r1", InfraType::Aerial, InfraState::ToReplace, 10.0, 1),
        MakeInfra("INF-2", "r1", InfraType::Aerial, InfraState::ToReplace, 2.0, 1),
    };
    PlannerConfig cfg;
    cfg.totalBudget = 100000.0;

    PhasePlan plan;
    ASSERT_TRUE(PlanReconnection(buildings, infras, cfg, CostModelConfig{}, plan, err));
    ASSERT_TRUE(plan.phases.size() >= 2u);
    ASSERT_TRUE(plan.phases[0].infraIds.size() == 1u);
    EXPECT_EQ(plan.phases[0].infraIds[0], std::string("INF-1"));
    EXPECT_NEAR(plan.phases[0].cost, 5000.0, 1e-9);

    ASSERT_TRUE(plan.phases[1].buildingIds.size() == 1u);
    EXPECT_EQ(plan.phases[1].buildingIds[0], std::string("r1"));
    ASSERT_TRUE(plan.phases[1].infraIds.size() == 1u);
    EXPECT_EQ(plan.phases[1].infraIds[0], std::string("INF-2"));
    EXPECT_NEAR(plan.phases[1].cost, 1000.0, 1e-9);
    EXPECT_NEAR(plan.phases[1].minElapsedHours, 1.0, 1e-9);
    EXPECT_NEAR(plan.plannedCost, 6000.0, 1e-9);
  }

  // Ingestion links a repeated id to each building and rejects inconsistent rows.
  {
    Scenario sc;
    ASSERT_TRUE(LoadScenarioJson(R"({
      "buildings": [{"id": "r1", "inhabitants": 10, "type": "residential"},
                    {"id": "r2", "inhabitants": 12, "type": "residential"}],
      "infrastructures": [
        {"id": "INF-1", "building_id": "r1", "type": "aerial", "state": "to_replace", "length": 10},
        {"id": "INF-1", "building_id": "r2", "type": "aerial", "state": "to_replace", "length": 10}
      ]})",
                                 sc, err));
    ASSERT_TRUE(sc.infrastructures.size() == 2u);
    EXPECT_EQ(sc.infrastructures[1].buildingId, std::string("r2"));

    PlannerConfig cfg;
    cfg.totalBudget = 100000.0;
    PhasePlan plan;
    ASSERT_TRUE(PlanReconnection(sc.buildings, sc.infrastructures, cfg, CostModelConfig{}, plan, err));
    EXPECT_NEAR(plan.plannedCost, 5000.0, 1e-9);

    EXPECT_FALSE(LoadScenarioJson(R"({
      "buildings": [{"id": "r1", "inhabitants": 1, "type": "residential"},
                    {"id": "r2", "inhabitants": 1, "type": "residential"}],
      "infrastructures": [
        {"id": "INF-1", "building_id": "r1", "type": "aerial", "state": "to_replace", "length": 10},
        {"id": "INF-1", "building_id": "r2", "type": "aerial", "state": "to_replace", "length": 12}
      ]})",
                                  sc, err));
    EXPECT_TRUE(Contains(err, "infrastructures[1].length"));

    EXPECT_FALSE(LoadScenarioJson(R"({
      "buildings": [{"id": "r1", "inhabitants": 1, "type": "residential"}],
      "infrastructures": [
        {"id": "INF-1", "building_id": "r1", "type": "aerial", "state": "intact", "length": 10},
        {"id": "INF-1", "building_id": "r1", "type": "aerial", "state": "intact", "length": 10}
      ]})",
                                  sc, err));
    EXPECT_TRUE(Contains(err, "infrastructures[1].id"));
  }
}

void TestPlannerStateMachine()
{
  const std::vector<BuildingRecord> buildings = {
      MakeBuilding("h1", 50, BuildingType::Hospital),
      MakeBuilding("r1", 10, BuildingType::Residential),
  };
  const std::vector<InfraRecord> infras = {
      MakeInfra("i1", "h1", InfraType::Aerial, InfraState::ToReplace, 1.0, 1),
      MakeInfra("i2", "r1", InfraType::Aerial, InfraState::ToReplace, 1.0, 1),
  };
  PlannerConfig cfg;
  cfg.totalBudget = 10000.0;

  PhasedBudgetPlanner planner(buildings, infras, cfg);
  EXPECT_EQ(planner.state(), PlannerState::Init);
  EXPECT_FALSE(planner.step());

  std::string err;
  ASSERT_TRUE(planner.begin(err));
  EXPECT_EQ(planner.state(), PlannerState::CriticalPhase);
  EXPECT_EQ(planner.summaries().size(), 2u);
  EXPECT_FALSE(planner.begin(err));

  EXPECT_TRUE(planner.step());
  EXPECT_EQ(planner.state(), PlannerState::BudgetPhase);
  EXPECT_EQ(planner.budgetPhase(), 1);
  EXPECT_NEAR(planner.remainingBudget(), 9500.0, 1e-9);

  EXPECT_TRUE(planner.step());
  EXPECT_EQ(planner.budgetPhase(), 2);
  EXPECT_EQ(planner.plan().phases.size(), 2u);

  // Nothing pending: the next step finishes early.
  EXPECT_FALSE(planner.step());
  EXPECT_EQ(planner.state(), PlannerState::Done);
  EXPECT_FALSE(planner.step());
  EXPECT_EQ(planner.plan().buildingsPlanned, 2);
  EXPECT_EQ(std::string(ToString(PlannerState::Done)), std::string("done"));

  PlannerConfig broken;
  PhasedBudgetPlanner invalid(buildings, infras, broken);
  EXPECT_FALSE(invalid.begin(err));
  EXPECT_FALSE(err.empty());
  EXPECT_EQ(invalid.state(), PlannerState::Init);
}

void TestGraphConstructionErrors()
{
  NetworkGraph g;
  std::string err;

  EXPECT_FALSE(BuildNetworkGraph({MakeNode("a"), MakeNode("a")}, {}, g, err));
  EXPECT_TRUE(Contains(err, "a"));
  EXPECT_EQ(g.nodeCount(), 0);

  EXPECT_FALSE(BuildNetworkGraph({MakeNode("")}, {}, g, err));
  EXPECT_FALSE(BuildNetworkGraph({MakeNode("a"), MakeNode("b")}, {MakeEdge("a", "zz", 1.0)}, g, err));
  EXPECT_TRUE(Contains(err, "zz"));
  EXPECT_FALSE(BuildNetworkGraph({MakeNode("a"), MakeNode("b")}, {MakeEdge("a", "b", -1.0)}, g, err));
  EXPECT_FALSE(BuildNetworkGraph({MakeNode("a")}, {MakeEdge("a", "a", 1.0)}, g, err));
  EXPECT_FALSE(
      BuildNetworkGraph({MakeNode("a"), MakeNode("b")}, {MakeEdge("a", "b", 1.0), MakeEdge("b", "a", 2.0)}, g, err));

  EXPECT_TRUE(BuildNetworkGraph({MakeNode("a"), MakeNode("b")}, {MakeEdge("a", "b", 0.0)}, g, err));
  EXPECT_EQ(g.edgeCount(), 1);
  EXPECT_EQ(g.findEdge(1, 0), 0);
  EXPECT_EQ(g.findNode("b"), 1);
  EXPECT_EQ(g.findNode("nope"), -1);
}

void TestComponents()
{
  NetworkGraph g;
  std::string err;
  ASSERT_TRUE(BuildNetworkGraph({MakeNode("a"), MakeNode("b"), MakeNode("c"), MakeNode("d"), MakeNode("e")},
                                {MakeEdge("a", "b", 1.0), MakeEdge("c", "d", 1.0)}, g, err));
  const ComponentPartition comps = ComputeConnectedComponents(g);
  EXPECT_EQ(comps.count(), 3);
  EXPECT_EQ(comps.nodeComponent[0], comps.nodeComponent[1]);
  EXPECT_EQ(comps.nodeComponent[2], comps.nodeComponent[3]);
  EXPECT_NE(comps.nodeComponent[0], comps.nodeComponent[2]);
  EXPECT_EQ(comps.members[2].size(), 1u);
  EXPECT_EQ(comps.members[2][0], 4);

  const NetworkStats s = ComputeNetworkStats(g);
  EXPECT_EQ(s.components, 3);
  EXPECT_FALSE(s.connected);
  EXPECT_EQ(s.minDegree, 0);
  EXPECT_EQ(s.maxDegree, 1);
  EXPECT_NEAR(s.avgDegree, 4.0 / 5.0, 1e-12);

  ShortestPath p;
  EXPECT_FALSE(FindShortestPath(g, 0, 2, p));
  EXPECT_FALSE(p.found);
  EXPECT_TRUE(p.nodes.empty());

  NetworkGraph empty;
  EXPECT_EQ(ComputeConnectedComponents(empty).count(), 0);
}

void TestShortestPath()
{
  NetworkGraph g = MakeTriangle(SegmentStatus::Damaged);
  const int a = g.findNode("a");
  const int c = g.findNode("c");

  ShortestPath p;
  ASSERT_TRUE(FindShortestPath(g, a, c, p, RoutingWeight::Length));
  EXPECT_TRUE(p.found);
  ASSERT_TRUE(p.nodes.size() == 3u);
  EXPECT_EQ(p.nodes[0], a);
  EXPECT_EQ(p.nodes[1], g.findNode("b"));
  EXPECT_EQ(p.nodes[2], c);
  EXPECT_NEAR(p.cost, 2.0, 1e-12);

  // A damaged b-c costs 10 x 1 = 10, so the direct 5 m link wins.
  ASSERT_TRUE(FindShortestPath(g, a, c, p, RoutingWeight::DamagePenalized));
  ASSERT_TRUE(p.nodes.size() == 2u);
  EXPECT_NEAR(p.cost, 5.0, 1e-12);

  double cost = 0.0;
  std::string err;
  EXPECT_TRUE(ComputePathCost(g, {a, g.findNode("b"), c}, cost, err));
  EXPECT_NEAR(cost, 2.0, 1e-12);
  EXPECT_TRUE(ComputePathCost(g, {a, g.findNode("b"), c}, cost, err, RoutingWeight::DamagePenalized));
  EXPECT_NEAR(cost, 11.0, 1e-12);
  EXPECT_FALSE(ComputePathCost(g, {a, 42}, cost, err));

  ASSERT_TRUE(FindShortestPath(g, a, a, p));
  EXPECT_EQ(p.nodes.size(), 1u);
  EXPECT_NEAR(p.cost, 0.0, 1e-12);

  EXPECT_FALSE(FindShortestPath(g, a, 99, p));
}

void TestPathsToSubstations()
{
  NetworkGraph g;
  std::string err;
  ASSERT_TRUE(BuildNetworkGraph({MakeNode("s1", NodeKind::Substation), MakeNode("p1"), MakeNode("p2"),
                                 MakeNode("s2", NodeKind::Substation), MakeNode("s3", NodeKind::Substation)},
                                {MakeEdge("s1", "p1", 4.0), MakeEdge("p1", "p2", 1.0), MakeEdge("p2", "s2", 1.0)}, g,
                                err));
  const std::vector<SubstationRoute> routes = FindPathsToSubstations(g, g.findNode("p1"));
  ASSERT_TRUE(routes.size() == 2u);
  EXPECT_EQ(routes[0].substation, g.findNode("s2"));
  EXPECT_NEAR(routes[0].path.cost, 2.0, 1e-12);
  EXPECT_EQ(routes[1].substation, g.findNode("s1"));
  EXPECT_NEAR(routes[1].path.cost, 4.0, 1e-12);
}

void TestConnectNodesToNearest()
{
  NetworkGraph g;
  std::string err;
  ASSERT_TRUE(BuildNetworkGraph({MakeNode("p1", NodeKind::NetworkPoint, {0.0, 0.0}),
                                 MakeNode("p2", NodeKind::NetworkPoint, {10.0, 0.0}),
                                 MakeNode("b1", NodeKind::Building, {1.0, 0.0}),
                                 MakeNode("b2", NodeKind::Building, {100.0, 0.0}),
                                 MakeNode("b3", NodeKind::Building, {7.0, 4.0})},
                                {MakeEdge("p1", "p2", 10.0)}, g, err));

  const NearestConnectionResult r = ConnectNodesToNearest(g, NodeKind::Building, 50.0);
  EXPECT_EQ(r.attached.size(), 2u);
  ASSERT_TRUE(r.unattached.size() == 1u);
  EXPECT_EQ(r.unattached[0], g.findNode("b2"));
  EXPECT_EQ(r.newEdges.size(), 2u);

  const int e1 = g.findEdge(g.findNode("b1"), g.findNode("p1"));
  ASSERT_TRUE(e1 >= 0);
  EXPECT_EQ(g.edges[static_cast<std::size_t>(e1)].kind, EdgeKind::Connection);
  EXPECT_NEAR(g.edges[static_cast<std::size_t>(e1)].length, 1.0, 1e-12);
  EXPECT_EQ(g.edges[static_cast<std::size_t>(e1)].id, std::string("conn_b1"));
  EXPECT_TRUE(g.edges[static_cast<std::size_t>(e1)].length < 50.0);
  EXPECT_TRUE(g.nodes[static_cast<std::size_t>(g.findNode("b1"))].attached);
  EXPECT_FALSE(g.nodes[static_cast<std::size_t>(g.findNode("b2"))].attached);

  // b3 at (7,4): 5 from p2, ~8.06 from p1.
  EXPECT_TRUE(g.findEdge(g.findNode("b3"), g.findNode("p2")) >= 0);

  // Already attached buildings are skipped.
  const NearestConnectionResult again = ConnectNodesToNearest(g, NodeKind::Building, 500.0);
  EXPECT_EQ(again.attached.size(), 1u);
  EXPECT_EQ(again.attached[0], g.findNode("b2"));

  // The reach is exclusive.
  NetworkGraph h;
  ASSERT_TRUE(BuildNetworkGraph({MakeNode("p", NodeKind::NetworkPoint, {0.0, 0.0}),
                                 MakeNode("b", NodeKind::Building, {5.0, 0.0})},
                                {}, h, err));
  EXPECT_TRUE(ConnectNodesToNearest(h, NodeKind::Building, 5.0).attached.empty());

  const NetworkStats s = ComputeNetworkStats(g);
  EXPECT_EQ(s.buildings, 3);
  EXPECT_EQ(s.buildingsAttached, 3);
  EXPECT_EQ(s.connections, 3);
  EXPECT_TRUE(s.connected);
}

void TestCentralityPathGraph()
{
  NetworkGraph g;
  std::string err;
  ASSERT_TRUE(BuildNetworkGraph({MakeNode("a"), MakeNode("b"), MakeNode("c")},
                                {MakeEdge("a", "b", 1.0), MakeEdge("b", "c", 1.0)}, g, err));

  const CentralityResult deg = ComputeCentrality(g, CentralityMetric::Degree);
  EXPECT_NEAR(deg.score[0], 0.5, 1e-12);
  EXPECT_NEAR(deg.score[1], 1.0, 1e-12);

  const CentralityResult clo = ComputeCentrality(g, CentralityMetric::Closeness);
  EXPECT_NEAR(clo.score[0], 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(clo.score[1], 1.0, 1e-12);
  EXPECT_NEAR(clo.score[2], 2.0 / 3.0, 1e-12);

  const CentralityResult bet = ComputeCentrality(g, CentralityMetric::Betweenness);
  EXPECT_NEAR(bet.score[0], 0.0, 1e-12);
  EXPECT_NEAR(bet.score[1], 1.0, 1e-12);
  EXPECT_NEAR(bet.score[2], 0.0, 1e-12);
  ASSERT_TRUE(bet.edgeScore.size() == 2u);
  // Each edge carries 2 of the 3 shortest paths, scaled by 2/(3*2).
  EXPECT_NEAR(bet.edgeScore[0], 2.0 / 3.0, 1e-12);

  CentralityConfig raw;
  raw.normalize = false;
  EXPECT_NEAR(ComputeCentrality(g, CentralityMetric::Betweenness, raw).score[1], 1.0, 1e-12);

  const std::vector<int> top = TopCriticalNodes(bet, 1);
  ASSERT_TRUE(top.size() == 1u);
  EXPECT_EQ(top[0], 1);
  EXPECT_EQ(TopCriticalNodes(bet, 0).size(), 3u);

  const auto byId = CentralityScoresById(g, bet);
  EXPECT_NEAR(byId.at("b"), 1.0, 1e-12);
}

void TestCentralityStar()
{
  std::vector<NetworkNode> nodes = {MakeNode("hub")};
  std::vector<NetworkEdgeSpec> edges;
  for (int i = 0; i < 4; ++i) {
    const std::string id = "leaf" + std::to_string(i);
    nodes.push_back(MakeNode(id));
    edges.push_back(MakeEdge("hub", id, 1.0 + i));
  }
  NetworkGraph g;
  std::string err;
  ASSERT_TRUE(BuildNetworkGraph(nodes, edges, g, err));

  const CentralityResult bet = ComputeCentrality(g, CentralityMetric::Betweenness);
  EXPECT_NEAR(bet.score[0], 1.0, 1e-12);
  for (int i = 1; i < 5; ++i) EXPECT_NEAR(bet.score[static_cast<std::size_t>(i)], 0.0, 1e-12);

  const CentralityResult eig = ComputeCentrality(g, CentralityMetric::Eigenvector);
  EXPECT_TRUE(eig.converged);
  EXPECT_TRUE(eig.iterations > 0);
  double norm = 0.0;
  for (double v : eig.score) norm += v * v;
  EXPECT_NEAR(norm, 1.0, 1e-9);
  for (int i = 1; i < 5; ++i) {
    EXPECT_TRUE(eig.score[0] > eig.score[static_cast<std::size_t>(i)]);
    EXPECT_NEAR(eig.score[1], eig.score[static_cast<std::size_t>(i)], 1e-9);
  }

  CentralityConfig tight;
  tight.eigenMaxIterations = 1;
  tight.eigenTolerance = 1e-15;
  const CentralityResult capped = ComputeCentrality(g, CentralityMetric::Eigenvector, tight);
  EXPECT_FALSE(capped.converged);
  EXPECT_EQ(capped.iterations, 1);

  // Closeness scales down nodes stranded in small components.
  NetworkGraph split;
  ASSERT_TRUE(BuildNetworkGraph({MakeNode("a"), MakeNode("b"), MakeNode("c"), MakeNode("x"), MakeNode("y")},
                                {MakeEdge("a", "b", 1.0), MakeEdge("b", "c", 1.0), MakeEdge("x", "y", 1.0)}, split,
                                err));
  const CentralityResult clo = ComputeCentrality(split, CentralityMetric::Closeness);
  EXPECT_NEAR(clo.score[3], 1.0 * (1.0 / 4.0), 1e-12);
  EXPECT_TRUE(clo.score[1] > clo.score[3]);
}

void TestCentralityCache()
{
  NetworkGraph g = MakeTriangle();
  CentralityCache cache;

  const CentralityResult& first = cache.get(g, CentralityMetric::Betweenness);
  EXPECT_EQ(cache.misses(), 1);
  const double b0 = first.score[0];
  const CentralityResult& second = cache.get(g, CentralityMetric::Betweenness);
  EXPECT_EQ(cache.hits(), 1);
  EXPECT_NEAR(second.score[0], b0, 0.0);

  // Eigenvector ignores the routing weight; both configs share one entry.
  CentralityConfig damaged;
  damaged.weight = RoutingWeight::DamagePenalized;
  cache.get(g, CentralityMetric::Eigenvector);
  cache.get(g, CentralityMetric::Eigenvector, damaged);
  EXPECT_EQ(cache.size(), 2u);
  EXPECT_EQ(cache.hits(), 2);

  // A changed graph drops every entry.
  NetworkGraph h = MakeTriangle(SegmentStatus::Damaged);
  EXPECT_NE(HashNetworkGraph(g), HashNetworkGraph(h));
  EXPECT_EQ(HashNetworkGraph(g), HashNetworkGraph(MakeTriangle()));
  cache.get(h, CentralityMetric::Degree);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(cache.misses(), 3);

  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
}

const char* kScenarioJson = R"({
  "buildings": [
    {"id": "H1", "inhabitants": 120, "type": "hospital", "priority": "high", "x": 0, "y": 5},
    {"id": 7, "inhabitants": 30, "type": "habitation", "connected": 0, "cost": 1500, "distance": 40,
     "position": [20, 5]},
    {"id": "C1", "inhabitants": 4, "type": "commerce", "priority": "moyenne", "cost": 900}
  ],
  "infrastructures": [
    {"id": "i1", "building_id": "H1", "type": "aerien", "state": "a_remplacer", "length": 12, "houses_served": 1},
    {"id": "i2", "building_id": 7, "type": "duct", "state": "intact", "length": 30, "houses_served": 3}
  ],
  "network_points": [{"id": "p1", "x": 0, "y": 0}, {"id": "p2", "x": 20, "y": 0}],
  "segments": [{"id": "s1", "endpoint_a": "p1", "endpoint_b": "p2", "length": 20, "status": "damaged"},
               {"id": "s2", "endpoint_a": "sub", "endpoint_b": "p1", "length": 3}],
  "substations": [{"id": "sub", "x": -3, "y": 0, "capacity": 400, "name": "North"}],
  "config": {"planner": {"total_budget": 50000}}
})";

void TestScenarioIngestion()
{
  Scenario s;
  std::string err;
  ASSERT_TRUE(LoadScenarioJson(kScenarioJson, s, err));
  ASSERT_TRUE(s.buildings.size() == 3u);
  EXPECT_EQ(s.buildings[1].id, std::string("7"));
  EXPECT_EQ(s.buildings[1].type, BuildingType::Residential);
  EXPECT_EQ(s.buildings[1].priority, BuildingPriority::Medium);
  EXPECT_FALSE(s.buildings[1].connected);
  EXPECT_TRUE(s.buildings[1].hasPosition);
  EXPECT_NEAR(s.buildings[1].pos.x, 20.0, 1e-12);
  EXPECT_FALSE(s.buildings[2].hasPosition);
  EXPECT_EQ(s.infrastructures[0].state, InfraState::ToReplace);
  EXPECT_EQ(s.infrastructures[1].buildingId, std::string("7"));
  EXPECT_EQ(s.segments[0].status, SegmentStatus::Damaged);
  EXPECT_EQ(s.substations[0].name, std::string("North"));
  EXPECT_TRUE(s.hasConfig);

  ReconConfig cfg;
  ASSERT_TRUE(ApplyScenarioConfig(s, cfg, err));
  EXPECT_NEAR(cfg.planner.totalBudget, 50000.0, 1e-9);

  NetworkGraph g;
  ScenarioGraphReport rep;
  ASSERT_TRUE(BuildScenarioGraph(s, cfg.network, g, rep, err));
  // sub, p1, p2, H1, 7 (C1 has no position).
  EXPECT_EQ(g.nodeCount(), 5);
  EXPECT_EQ(rep.substations.attached.size(), 0u); // already joined by segment s2
  EXPECT_EQ(rep.buildings.attached.size(), 2u);
  EXPECT_TRUE(ComputeNetworkStats(g).connected);

  PhasePlan plan;
  ASSERT_TRUE(PlanReconnection(s.buildings, s.infrastructures, cfg.planner, cfg.cost, plan, err));
  EXPECT_EQ(plan.buildingsRequiringRepair, 2);
  EXPECT_EQ(plan.phases[0].buildingIds.size(), 1u);
}

void TestScenarioErrors()
{
  Scenario s;
  std::string err;

  EXPECT_FALSE(LoadScenarioJson(R"({"buildings": [{"id": "a", "type": "hospital"}]})", s, err));
  EXPECT_TRUE(Contains(err, "buildings[0].inhabitants"));

  EXPECT_FALSE(LoadScenarioJson(R"({"buildings": [{"id": "a", "inhabitants": -3, "type": "school"}]})", s, err));
  EXPECT_TRUE(Contains(err, "buildings[0].inhabitants"));

  EXPECT_FALSE(LoadScenarioJson(R"({"buildings": [{"id": "a", "inhabitants": 3, "type": "castle"}]})", s, err));
  EXPECT_TRUE(Contains(err, "buildings[0].type"));

  EXPECT_FALSE(LoadScenarioJson(R"({"buildings": [{"id": "a", "inhabitants": 1, "type": "school"},
                                                  {"id": "a", "inhabitants": 2, "type": "school"}]})",
                                s, err));
  EXPECT_TRUE(Contains(err, "buildings[1].id"));

  EXPECT_FALSE(LoadScenarioJson(R"({"buildings": [],
    "infrastructures": [{"id": "i", "building_id": "ghost", "type": "aerial", "state": "intact", "length": 1}]})",
                                s, err));
  EXPECT_TRUE(Contains(err, "ghost"));

  EXPECT_FALSE(LoadScenarioJson(R"({"buildings": [})", s, err));
  EXPECT_FALSE(err.empty());

  EXPECT_FALSE(LoadScenarioJson("[1, 2]", s, err));

  // A segment naming an unknown node fails at graph construction.
  ASSERT_TRUE(LoadScenarioJson(
      R"({"network_points": [{"id": "p", "x": 0, "y": 0}],
          "segments": [{"id": "s", "endpoint_a": "p", "endpoint_b": "q", "length": 1}]})",
      s, err));
  NetworkGraph g;
  ScenarioGraphReport rep;
  EXPECT_FALSE(BuildScenarioGraph(s, NetworkAnalysisConfig{}, g, rep, err));
  EXPECT_TRUE(Contains(err, "q"));
}

void TestConfigJsonRoundTrip()
{
  ReconConfig cfg;
  cfg.cost.pricePerMeter[static_cast<int>(InfraType::Duct)] = 1234.5;
  cfg.cost.maxWorkersPerInfra = 6;
  cfg.weights.population = 0.25;
  cfg.weights.cost = 0.25;
  cfg.weights.urgency = 0.25;
  cfg.weights.distance = 0.25;
  cfg.urgency.set(BuildingType::Commercial, BuildingPriority::High, 0.8);
  cfg.urgency.unset(BuildingType::Residential, BuildingPriority::Low);
  cfg.planner.totalBudget = 75000.0;
  cfg.planner.phaseBudgetFractions = {0.5, 0.5};
  cfg.planner.coefficients.delta = 0.3;
  cfg.network.buildingReach = 42.0;
  cfg.network.centrality.weight = RoutingWeight::DamagePenalized;

  const std::string text = ReconConfigToJson(cfg);
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(text, root, err));

  ReconConfig loaded;
  ASSERT_TRUE(ApplyReconConfigJson(root, loaded, err));
  EXPECT_NEAR(loaded.cost.pricePerMeter[static_cast<int>(InfraType::Duct)], 1234.5, 1e-12);
  EXPECT_EQ(loaded.cost.maxWorkersPerInfra, 6);
  EXPECT_NEAR(loaded.weights.distance, 0.25, 1e-12);
  EXPECT_NEAR(UrgencyScore(BuildingType::Commercial, BuildingPriority::High, loaded.urgency), 0.8, 1e-12);
  EXPECT_FALSE(loaded.urgency.isTabulated(BuildingType::Residential, BuildingPriority::Low));
  EXPECT_NEAR(loaded.planner.totalBudget, 75000.0, 1e-9);
  ASSERT_TRUE(loaded.planner.phaseBudgetFractions.size() == 2u);
  EXPECT_NEAR(loaded.planner.coefficients.delta, 0.3, 1e-12);
  EXPECT_NEAR(loaded.network.buildingReach, 42.0, 1e-12);
  EXPECT_EQ(loaded.network.centrality.weight, RoutingWeight::DamagePenalized);
  EXPECT_EQ(ReconConfigToJson(loaded), text);
}

void TestConfigJsonMerge()
{
  ReconConfig cfg;
  cfg.planner.totalBudget = 1000.0;
  cfg.network.substationReach = 12.0;

  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(R"({"planner": {"safety_margin": 0.5}, "urgency": {"table": {"hospital": {"low": 0.9}}}})",
                        root, err));
  ASSERT_TRUE(ApplyReconConfigJson(root, cfg, err));
  EXPECT_NEAR(cfg.planner.safetyMargin, 0.5, 1e-12);
  EXPECT_NEAR(cfg.planner.totalBudget, 1000.0, 1e-12);
  EXPECT_NEAR(cfg.network.substationReach, 12.0, 1e-12);
  EXPECT_NEAR(UrgencyScore(BuildingType::Hospital, BuildingPriority::Low, cfg.urgency), 0.9, 1e-12);

  // A bad value leaves the config untouched and names its section.
  ASSERT_TRUE(ParseJson(R"({"planner": {"total_budget": 5}, "scoring_weights": {"population": "lots"}})", root, err));
  EXPECT_FALSE(ApplyReconConfigJson(root, cfg, err));
  EXPECT_TRUE(Contains(err, "scoring_weights"));
  EXPECT_NEAR(cfg.planner.totalBudget, 1000.0, 1e-12);

  ASSERT_TRUE(ParseJson(R"({"network": {"routing_weight": "teleport"}})", root, err));
  EXPECT_FALSE(ApplyReconConfigJson(root, cfg, err));

  // Full validation catches cross-field problems.
  ReconConfig invalid;
  invalid.planner.totalBudget = 100.0;
  invalid.weights.urgency = 0.9;
  EXPECT_FALSE(ValidateReconConfig(invalid, {}, err));
  invalid.weights = PrioritizationWeights{};
  EXPECT_TRUE(ValidateReconConfig(invalid, {}, err));

  NetworkAnalysisConfig net;
  EXPECT_TRUE(ValidateNetworkAnalysisConfig(net, err));
  net.buildingReach = -1.0;
  EXPECT_FALSE(ValidateNetworkAnalysisConfig(net, err));
}

void TestConfigFileIO()
{
  const fs::path dir = MakeTempPath("reconplan_config");
  const fs::path file = dir / "cfg.json";
  std::error_code ec;
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);

  ReconConfig cfg;
  cfg.planner.totalBudget = 321.0;
  std::string err;
  ASSERT_TRUE(WriteReconConfigJsonFile(file.string(), cfg, err));

  ReconConfig loaded;
  ASSERT_TRUE(LoadReconConfigJsonFile(file.string(), loaded, err));
  EXPECT_NEAR(loaded.planner.totalBudget, 321.0, 1e-12);

  EXPECT_FALSE(LoadReconConfigJsonFile((dir / "missing.json").string(), loaded, err));
  EXPECT_FALSE(err.empty());

  fs::remove_all(dir, ec);
}

void TestPlanExports()
{
  const std::vector<BuildingRecord> buildings = MakeRankingInput();
  const std::vector<InfraRecord> infras = {
      MakeInfra("i1", "h1", InfraType::Aerial, InfraState::ToReplace, 3.0, 1),
      MakeInfra("i2", "r2", InfraType::SemiAerial, InfraState::ToReplace, 4.0, 2),
  };
  PlannerConfig pcfg;
  pcfg.totalBudget = 20000.0;

  PhasePlan plan;
  std::string err;
  ASSERT_TRUE(PlanReconnection(buildings, infras, pcfg, CostModelConfig{}, plan, err));

  std::ostringstream json;
  ASSERT_TRUE(WritePhasePlanJson(json, plan, &err));
  JsonValue root;
  ASSERT_TRUE(ParseJson(json.str(), root, err));
  const JsonValue* phases = FindJsonMember(root, "phases");
  ASSERT_TRUE(phases != nullptr && phases->isArray());
  EXPECT_EQ(phases->arrayValue.size(), plan.phases.size());
  const JsonValue* summary = FindJsonMember(root, "summary");
  ASSERT_TRUE(summary != nullptr);
  const JsonValue* planned = FindJsonMember(*summary, "planned_cost");
  ASSERT_TRUE(planned != nullptr && planned->isNumber());
  EXPECT_NEAR(planned->numberValue, plan.plannedCost, 1e-9);

  std::vector<RankedBuilding> ranked;
  ASSERT_TRUE(RankBuildings(buildings, PrioritizationWeights{}, UrgencyTable{}, ranked, err));
  std::ostringstream csv;
  ASSERT_TRUE(WriteRankingCsv(csv, ranked, &err));
  std::istringstream lines(csv.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    if (count == 0) EXPECT_TRUE(line.rfind("rank,id,", 0) == 0);
    ++count;
  }
  EXPECT_EQ(count, static_cast<int>(ranked.size()) + 1);

  const PriorityReport rep = BuildPriorityReport(ranked);
  std::ostringstream rj;
  ASSERT_TRUE(WriteRankingJson(rj, ranked, &rep, &err));
  ASSERT_TRUE(ParseJson(rj.str(), root, err));
  const JsonValue* rows = FindJsonMember(root, "ranking");
  ASSERT_TRUE(rows != nullptr && rows->isArray());
  EXPECT_EQ(rows->arrayValue.size(), ranked.size());
}

void TestNetworkMetricsExport()
{
  NetworkGraph g = MakeTriangle(SegmentStatus::Damaged);
  NetworkMetricsReport rep;
  rep.stats = ComputeNetworkStats(g);
  rep.components = ComputeConnectedComponents(g);
  rep.centrality.push_back(ComputeCentrality(g, CentralityMetric::Degree));
  rep.centrality.push_back(ComputeCentrality(g, CentralityMetric::Betweenness));
  rep.hasPath = true;
  rep.pathFrom = 0;
  rep.pathTo = 2;
  EXPECT_TRUE(FindShortestPath(g, 0, 2, rep.path));

  std::ostringstream json;
  std::string err;
  ASSERT_TRUE(WriteNetworkMetricsJson(json, g, rep, &err));
  JsonValue root;
  ASSERT_TRUE(ParseJson(json.str(), root, err));
  const JsonValue* stats = FindJsonMember(root, "stats");
  ASSERT_TRUE(stats != nullptr);
  const JsonValue* damaged = FindJsonMember(*stats, "damaged_segments");
  ASSERT_TRUE(damaged != nullptr && damaged->isNumber());
  EXPECT_NEAR(damaged->numberValue, 1.0, 0.0);

  std::ostringstream csv;
  ASSERT_TRUE(WriteCentralityNodesCsv(csv, g, rep.components, rep.centrality, &err));
  std::string header;
  std::istringstream in(csv.str());
  ASSERT_TRUE(static_cast<bool>(std::getline(in, header)));
  EXPECT_TRUE(Contains(header, "degree"));
  EXPECT_TRUE(Contains(header, "betweenness"));
}

void TestJsonParser()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson(R"({"a": [1, 2.5, -3e2], "b": {"c": null, "d": true}, "s": "x\"é"})", v, err));
  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a != nullptr && a->isArray() && a->arrayValue.size() == 3u);
  EXPECT_NEAR(a->arrayValue[2].numberValue, -300.0, 1e-12);
  const JsonValue* s = FindJsonMember(v, "s");
  ASSERT_TRUE(s != nullptr && s->isString());
  EXPECT_EQ(s->stringValue, std::string("x\"\xC3\xA9"));

  EXPECT_FALSE(ParseJson("{\"a\": 1,}", v, err));
  EXPECT_FALSE(ParseJson("[1 2]", v, err));
  EXPECT_FALSE(ParseJson("{} extra", v, err));

  std::ostringstream os;
  JsonWriter w(os, JsonWriteOptions{false, 0});
  EXPECT_TRUE(w.beginObject());
  EXPECT_TRUE(w.member("x", 0.1));
  EXPECT_FALSE(w.numberValue(1.0)); // value where a key is expected
  EXPECT_FALSE(w.ok());
}

void TestLogTee()
{
  const fs::path dir = MakeTempPath("reconplan_log");
  const fs::path file = dir / "run.log";

  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = file;
    std::string err;
    ASSERT_TRUE(tee.start(opt, err));
    EXPECT_TRUE(tee.active());
    std::cout << "logtee-probe\n";
    std::cout.flush();
  }

  std::ifstream f(file, std::ios::binary);
  ASSERT_TRUE(static_cast<bool>(f));
  std::stringstream ss;
  ss << f.rdbuf();
  EXPECT_TRUE(Contains(ss.str(), "[OUT] logtee-probe"));
  f.close();

  // Starting again rotates the previous log to run.log.1.
  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = file;
    std::string err;
    ASSERT_TRUE(tee.start(opt, err));
  }
  std::error_code ec;
  EXPECT_TRUE(fs::exists(dir / "run.log.1", ec));

  fs::remove_all(dir, ec);
}

} // namespace

int main()
{
  TestScoreNormalization();
  TestUrgencyTable();
  TestWeightValidation();
  TestRankingInvariants();
  TestRankingTieBreakById();
  TestPriorityReport();

  TestInfrastructureCost();
  TestCostModelValidation();
  TestPlannerConfigValidation();
  TestPlannerHospitalsFirst();
  TestPlannerAutonomyWarning();
  TestPlannerBudgetExhaustion();
  TestCombinedScoreOrdering();
  TestPlannerSharedInfrastructure();
  TestPlannerStateMachine();

  TestGraphConstructionErrors();
  TestComponents();
  TestShortestPath();
  TestPathsToSubstations();
  TestConnectNodesToNearest();
  TestCentralityPathGraph();
  TestCentralityStar();
  TestCentralityCache();

  TestScenarioIngestion();
  TestScenarioErrors();
  TestConfigJsonRoundTrip();
  TestConfigJsonMerge();
  TestConfigFileIO();
  TestPlanExports();
  TestNetworkMetricsExport();
  TestJsonParser();
  TestLogTee();

  if (g_failures == 0) {
    std::cout << "reconplan_tests: OK\n";
    return 0;
  }

  std::cerr << "reconplan_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
