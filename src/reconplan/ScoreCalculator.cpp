#include "reconplan/ScoreCalculator.hpp"

#include <algorithm>
#include <cmath>

namespace reconplan {

namespace {

std::vector<double> InverseRangeScores(const std::vector<double>& values)
{
  std::vector<double> out(values.size(), 1.0);
  if (values.empty()) return out;

  const auto mm = std::minmax_element(values.begin(), values.end());
  const double lo = *mm.first;
  const double hi = *mm.second;
  const double range = hi - lo;
  if (!(range > 0.0)) return out;

  for (std::size_t i = 0; i < values.size(); ++i) {
    const double s = 1.0 - (values[i] - lo) / range;
    out[i] = std::clamp(s, 0.0, 1.0);
  }
  return out;
}

inline std::size_t TypeIndex(BuildingType t) { return static_cast<std::size_t>(t); }
inline std::size_t PriorityIndex(BuildingPriority p) { return static_cast<std::size_t>(p); }

} // namespace

std::vector<double> PopulationScores(const std::vector<int>& inhabitants)
{
  std::vector<double> out(inhabitants.size(), 0.0);
  if (inhabitants.empty()) return out;

  const int maxPop = *std::max_element(inhabitants.begin(), inhabitants.end());
  if (maxPop <= 0) return out;

  for (std::size_t i = 0; i < inhabitants.size(); ++i) {
    out[i] = static_cast<double>(std::max(0, inhabitants[i])) / static_cast<double>(maxPop);
  }
  return out;
}

std::vector<double> CostScores(const std::vector<double>& costs)
{
  return InverseRangeScores(costs);
}

std::vector<double> DistanceScores(const std::vector<double>& distances)
{
  return InverseRangeScores(distances);
}

bool UrgencyTable::isTabulated(BuildingType t, BuildingPriority p) const
{
  return cells[TypeIndex(t)][PriorityIndex(p)] >= 0.0;
}

void UrgencyTable::set(BuildingType t, BuildingPriority p, double score)
{
  cells[TypeIndex(t)][PriorityIndex(p)] = score;
}

void UrgencyTable::unset(BuildingType t, BuildingPriority p)
{
  cells[TypeIndex(t)][PriorityIndex(p)] = kUntabulated;
}

double UrgencyScore(BuildingType type, BuildingPriority priority, const UrgencyTable& table)
{
  const double v = table.cells[TypeIndex(type)][PriorityIndex(priority)];
  return (v >= 0.0) ? v : table.fallback;
}

bool ValidateUrgencyTable(const UrgencyTable& table, std::string& outError)
{
  outError.clear();
  if (!std::isfinite(table.fallback) || table.fallback < 0.0 || table.fallback > 1.0) {
    outError = "urgency fallback must lie in [0,1]";
    return false;
  }
  for (int t = 0; t < kBuildingTypeCount; ++t) {
    for (int p = 0; p < kBuildingPriorityCount; ++p) {
      const double v = table.cells[t][p];
      if (v < 0.0) continue;
      if (!std::isfinite(v) || v > 1.0) {
        outError = std::string("urgency score for ") + ToString(static_cast<BuildingType>(t)) + "/" +
                   ToString(static_cast<BuildingPriority>(p)) + " must lie in [0,1]";
        return false;
      }
    }
  }
  return true;
}

} // namespace reconplan
