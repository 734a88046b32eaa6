#include "reconplan/Prioritization.hpp"

#include <algorithm>
#include <cmath>

namespace reconplan {

namespace {

inline double Pct(double part, double total)
{
  return (total > 0.0) ? (100.0 * part / total) : 0.0;
}

} // namespace

bool ValidatePrioritizationWeights(const PrioritizationWeights& w, std::string& outError)
{
  outError.clear();

  const struct {
    const char* name;
    double value;
  } items[] = {{"population", w.population}, {"cost", w.cost}, {"urgency", w.urgency}, {"distance", w.distance}};

  for (const auto& it : items) {
    if (!std::isfinite(it.value) || it.value < 0.0) {
      outError = std::string("scoring weight '") + it.name + "' must be a non-negative number";
      return false;
    }
  }

  const double sum = w.sum();
  if (std::fabs(sum - 1.0) > kWeightSumTolerance) {
    outError = "scoring weights must sum to 1 (got " + std::to_string(sum) + ")";
    return false;
  }
  return true;
}

bool RankBuildings(const std::vector<BuildingRecord>& buildings, const PrioritizationWeights& weights,
                   const UrgencyTable& urgency, std::vector<RankedBuilding>& out, std::string& outError, int topN)
{
  out.clear();
  if (!ValidatePrioritizationWeights(weights, outError)) return false;
  if (!ValidateUrgencyTable(urgency, outError)) return false;

  const std::size_t n = buildings.size();
  std::vector<int> inhabitants(n, 0);
  std::vector<double> costs(n, 0.0);
  std::vector<double> distances(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    inhabitants[i] = buildings[i].inhabitants;
    costs[i] = buildings[i].cost;
    distances[i] = buildings[i].distance;
  }

  const std::vector<double> pop = PopulationScores(inhabitants);
  const std::vector<double> cost = CostScores(costs);
  const std::vector<double> dist = DistanceScores(distances);

  out.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    const BuildingRecord& b = buildings[i];
    RankedBuilding& r = out[i];
    r.id = b.id;
    r.index = static_cast<int>(i);
    r.inhabitants = b.inhabitants;
    r.cost = b.cost;
    r.populationScore = pop[i];
    r.costScore = cost[i];
    r.urgencyScore = UrgencyScore(b.type, b.priority, urgency);
    r.distanceScore = dist[i];

    const double c = weights.population * r.populationScore + weights.cost * r.costScore +
                     weights.urgency * r.urgencyScore + weights.distance * r.distanceScore;
    // Weights may sum to 1 +/- tolerance.
    r.compositeScore = std::clamp(c, 0.0, 1.0);
  }

  std::sort(out.begin(), out.end(), [](const RankedBuilding& a, const RankedBuilding& b) {
    if (a.compositeScore != b.compositeScore) return a.compositeScore > b.compositeScore;
    if (a.id != b.id) return a.id < b.id;
    return a.index < b.index;
  });

  if (topN > 0 && static_cast<std::size_t>(topN) < out.size()) out.resize(static_cast<std::size_t>(topN));

  for (std::size_t i = 0; i < out.size(); ++i) out[i].rank = static_cast<int>(i) + 1;
  ComputeCumulativeImpact(out);
  return true;
}

void ComputeCumulativeImpact(std::vector<RankedBuilding>& rows)
{
  long long totalInhabitants = 0;
  double totalCost = 0.0;
  for (const RankedBuilding& r : rows) {
    totalInhabitants += r.inhabitants;
    totalCost += r.cost;
  }

  long long accInhabitants = 0;
  double accCost = 0.0;
  int count = 0;
  const double n = static_cast<double>(rows.size());
  for (RankedBuilding& r : rows) {
    accInhabitants += r.inhabitants;
    accCost += r.cost;
    ++count;

    r.cumulativeInhabitants = accInhabitants;
    r.cumulativeCost = accCost;
    r.buildingsReconnected = count;
    r.cumulativeInhabitantsPct = Pct(static_cast<double>(accInhabitants), static_cast<double>(totalInhabitants));
    r.cumulativeCostPct = Pct(accCost, totalCost);
    r.buildingsReconnectedPct = Pct(static_cast<double>(count), n);
  }
}

ScoreSummary SummarizeScores(const std::vector<double>& values)
{
  ScoreSummary s;
  if (values.empty()) return s;

  std::vector<double> v = values;
  std::sort(v.begin(), v.end());
  const std::size_t n = v.size();

  double sum = 0.0;
  for (double x : v) sum += x;
  s.mean = sum / static_cast<double>(n);
  s.min = v.front();
  s.max = v.back();
  s.median = (n % 2 == 1) ? v[n / 2] : 0.5 * (v[n / 2 - 1] + v[n / 2]);

  if (n >= 2) {
    double ss = 0.0;
    for (double x : v) ss += (x - s.mean) * (x - s.mean);
    s.stddev = std::sqrt(ss / static_cast<double>(n - 1));
  }
  return s;
}

PriorityReport BuildPriorityReport(const std::vector<RankedBuilding>& ranked)
{
  PriorityReport rep;
  rep.buildings = static_cast<int>(ranked.size());

  std::vector<double> pop, cost, urg, dist, comp;
  pop.reserve(ranked.size());
  cost.reserve(ranked.size());
  urg.reserve(ranked.size());
  dist.reserve(ranked.size());
  comp.reserve(ranked.size());

  for (const RankedBuilding& r : ranked) {
    rep.totalInhabitants += r.inhabitants;
    rep.totalCost += r.cost;
    pop.push_back(r.populationScore);
    cost.push_back(r.costScore);
    urg.push_back(r.urgencyScore);
    dist.push_back(r.distanceScore);
    comp.push_back(r.compositeScore);
  }

  rep.population = SummarizeScores(pop);
  rep.cost = SummarizeScores(cost);
  rep.urgency = SummarizeScores(urg);
  rep.distance = SummarizeScores(dist);
  rep.composite = SummarizeScores(comp);

  rep.topCount = static_cast<int>(ranked.size() / 5);
  for (int i = 0; i < rep.topCount; ++i) {
    rep.topInhabitants += ranked[static_cast<std::size_t>(i)].inhabitants;
    rep.topCost += ranked[static_cast<std::size_t>(i)].cost;
  }
  rep.topInhabitantsPct = Pct(static_cast<double>(rep.topInhabitants), static_cast<double>(rep.totalInhabitants));
  rep.topCostPct = Pct(rep.topCost, rep.totalCost);
  return rep;
}

} // namespace reconplan
