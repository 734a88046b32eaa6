#pragma once

#include "reconplan/Records.hpp"
#include "reconplan/ScoreCalculator.hpp"

#include <string>
#include <vector>

namespace reconplan {

// Multi-criteria ranking of buildings (general priority list).
//
// composite = wPopulation*population + wCost*cost + wUrgency*urgency + wDistance*distance
//
// Buildings are sorted by composite descending; equal composites are ordered by
// ascending building id so two runs over the same input always agree.

inline constexpr double kWeightSumTolerance = 1.0e-6;

struct PrioritizationWeights {
  double population = 0.4;
  double cost = 0.3;
  double urgency = 0.2;
  double distance = 0.1;

  double sum() const { return population + cost + urgency + distance; }
};

// Each weight must be finite and >= 0 and the four must sum to 1 (+/- kWeightSumTolerance).
bool ValidatePrioritizationWeights(const PrioritizationWeights& w, std::string& outError);

struct RankedBuilding {
  std::string id;
  int index = -1; // position in the input vector

  int inhabitants = 0;
  double cost = 0.0;

  double populationScore = 0.0;
  double costScore = 0.0;
  double urgencyScore = 0.0;
  double distanceScore = 0.0;
  double compositeScore = 0.0;

  int rank = 0; // 1-based

  // Running totals along the ranked order (inclusive of this row).
  long long cumulativeInhabitants = 0;
  double cumulativeCost = 0.0;
  int buildingsReconnected = 0;

  // Running totals as a percentage of the ranked list's totals (0 when the total is 0).
  double cumulativeInhabitantsPct = 0.0;
  double cumulativeCostPct = 0.0;
  double buildingsReconnectedPct = 0.0;
};

// Score and rank `buildings`.
//
// topN > 0 keeps only the first topN rows; cumulative values are then computed
// over the kept rows. Returns false (out empty) if the weights are invalid.
bool RankBuildings(const std::vector<BuildingRecord>& buildings, const PrioritizationWeights& weights,
                   const UrgencyTable& urgency, std::vector<RankedBuilding>& out, std::string& outError,
                   int topN = 0);

// (Re)compute the cumulative/percentage columns along the current order of `rows`.
void ComputeCumulativeImpact(std::vector<RankedBuilding>& rows);

struct ScoreSummary {
  double mean = 0.0;
  double median = 0.0;
  double stddev = 0.0; // sample standard deviation; 0 for fewer than 2 values
  double min = 0.0;
  double max = 0.0;
};

ScoreSummary SummarizeScores(const std::vector<double>& values);

struct PriorityReport {
  int buildings = 0;
  long long totalInhabitants = 0;
  double totalCost = 0.0;

  ScoreSummary population;
  ScoreSummary cost;
  ScoreSummary urgency;
  ScoreSummary distance;
  ScoreSummary composite;

  // The first floor(20%) of the ranked list.
  int topCount = 0;
  long long topInhabitants = 0;
  double topCost = 0.0;
  double topInhabitantsPct = 0.0;
  double topCostPct = 0.0;
};

PriorityReport BuildPriorityReport(const std::vector<RankedBuilding>& ranked);

} // namespace reconplan
