#include "reconplan/ConfigIO.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

namespace reconplan {

namespace {

bool IsFiniteDouble(double v)
{
  return std::isfinite(v) != 0;
}

bool GetObj(const JsonValue& obj, const char* key, const JsonValue** out, std::string& err)
{
  *out = FindJsonMember(obj, key);
  if (!*out) return true; // missing => keep
  if (!(*out)->isObject()) {
    err = std::string("expected object for key '") + key + "'";
    return false;
  }
  return true;
}

bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(v->numberValue));
  return true;
}

bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

// {"aerial": 500, "duct": 900} -> table[InfraType]
bool ApplyInfraTable(const JsonValue& root, const char* key, double (&table)[kInfraTypeCount], std::string& err)
{
  const JsonValue* obj = nullptr;
  if (!GetObj(root, key, &obj, err)) return false;
  if (!obj) return true;

  for (const auto& kv : obj->objectValue) {
    InfraType t = InfraType::Aerial;
    if (!ParseInfraType(kv.first, t)) {
      err = std::string(key) + ": unknown infrastructure type '" + kv.first + "'";
      return false;
    }
    if (!kv.second.isNumber() || !IsFiniteDouble(kv.second.numberValue)) {
      err = std::string(key) + "." + kv.first + ": expected number";
      return false;
    }
    table[static_cast<int>(t)] = kv.second.numberValue;
  }
  return true;
}

// {"hospital": 1.0, "school": 0.75} -> table[BuildingType]
bool ApplyTypeTable(const JsonValue& root, const char* key, double (&table)[kBuildingTypeCount], std::string& err)
{
  const JsonValue* obj = nullptr;
  if (!GetObj(root, key, &obj, err)) return false;
  if (!obj) return true;

  for (const auto& kv : obj->objectValue) {
    BuildingType t = BuildingType::Residential;
    if (!ParseBuildingType(kv.first, t)) {
      err = std::string(key) + ": unknown building type '" + kv.first + "'";
      return false;
    }
    if (!kv.second.isNumber() || !IsFiniteDouble(kv.second.numberValue)) {
      err = std::string(key) + "." + kv.first + ": expected number";
      return false;
    }
    table[static_cast<int>(t)] = kv.second.numberValue;
  }
  return true;
}

bool ApplyCostModel(const JsonValue& root, CostModelConfig& c, std::string& err)
{
  if (!ApplyInfraTable(root, "price_per_meter", c.pricePerMeter, err)) return false;
  if (!ApplyInfraTable(root, "hours_per_meter", c.hoursPerMeter, err)) return false;
  if (!ApplyF64(root, "daily_wage", c.dailyWage, err)) return false;
  if (!ApplyI32(root, "max_workers_per_infra", c.maxWorkersPerInfra, err)) return false;
  return true;
}

bool ApplyWeights(const JsonValue& root, PrioritizationWeights& w, std::string& err)
{
  if (!ApplyF64(root, "population", w.population, err)) return false;
  if (!ApplyF64(root, "cost", w.cost, err)) return false;
  if (!ApplyF64(root, "urgency", w.urgency, err)) return false;
  if (!ApplyF64(root, "distance", w.distance, err)) return false;
  return true;
}

bool ApplyUrgency(const JsonValue& root, UrgencyTable& u, std::string& err)
{
  if (!ApplyF64(root, "fallback", u.fallback, err)) return false;

  const JsonValue* table = nullptr;
  if (!GetObj(root, "table", &table, err)) return false;
  if (!table) return true;

  for (const auto& row : table->objectValue) {
    BuildingType t = BuildingType::Residential;
    if (!ParseBuildingType(row.first, t)) {
      err = "urgency.table: unknown building type '" + row.first + "'";
      return false;
    }
    if (!row.second.isObject()) {
      err = "urgency.table." + row.first + ": expected object";
      return false;
    }
    for (const auto& cell : row.second.objectValue) {
      BuildingPriority p = BuildingPriority::Medium;
      if (!ParseBuildingPriority(cell.first, p)) {
        err = "urgency.table." + row.first + ": unknown priority '" + cell.first + "'";
        return false;
      }
      if (cell.second.isNull()) {
        u.unset(t, p);
        continue;
      }
      if (!cell.second.isNumber() || !IsFiniteDouble(cell.second.numberValue)) {
        err = "urgency.table." + row.first + "." + cell.first + ": expected number or null";
        return false;
      }
      u.set(t, p, cell.second.numberValue);
    }
  }
  return true;
}

bool ApplyPlanner(const JsonValue& root, PlannerConfig& p, std::string& err)
{
  if (!ApplyF64(root, "total_budget", p.totalBudget, err)) return false;

  if (const JsonValue* arr = FindJsonMember(root, "phase_budget_fractions")) {
    if (!arr->isArray()) {
      err = "expected array for key 'phase_budget_fractions'";
      return false;
    }
    std::vector<double> fractions;
    fractions.reserve(arr->arrayValue.size());
    for (const JsonValue& v : arr->arrayValue) {
      if (!v.isNumber() || !IsFiniteDouble(v.numberValue)) {
        err = "phase_budget_fractions: expected numbers";
        return false;
      }
      fractions.push_back(v.numberValue);
    }
    p.phaseBudgetFractions = std::move(fractions);
  }

  if (!ApplyF64(root, "generator_autonomy_hours", p.generatorAutonomyHours, err)) return false;
  if (!ApplyF64(root, "safety_margin", p.safetyMargin, err)) return false;
  if (!ApplyTypeTable(root, "priority_weights", p.priorityWeight, err)) return false;

  const JsonValue* coeff = nullptr;
  if (!GetObj(root, "coefficients", &coeff, err)) return false;
  if (coeff) {
    if (!ApplyF64(*coeff, "alpha", p.coefficients.alpha, err)) return false;
    if (!ApplyF64(*coeff, "beta", p.coefficients.beta, err)) return false;
    if (!ApplyF64(*coeff, "gamma", p.coefficients.gamma, err)) return false;
    if (!ApplyF64(*coeff, "delta", p.coefficients.delta, err)) return false;
  }

  if (!ApplyF64(root, "reciprocal_cap", p.reciprocalCap, err)) return false;
  return true;
}

bool ApplyNetwork(const JsonValue& root, NetworkAnalysisConfig& n, std::string& err)
{
  if (!ApplyF64(root, "building_reach", n.buildingReach, err)) return false;
  if (!ApplyF64(root, "substation_reach", n.substationReach, err)) return false;

  if (const JsonValue* w = FindJsonMember(root, "routing_weight")) {
    if (!w->isString() || !ParseRoutingWeight(w->stringValue, n.centrality.weight)) {
      err = "routing_weight: expected \"length\" or \"damage_penalized\"";
      return false;
    }
  }

  if (!ApplyBool(root, "normalize_betweenness", n.centrality.normalize, err)) return false;
  if (!ApplyBool(root, "closeness_component_scale", n.centrality.closenessComponentScale, err)) return false;
  if (!ApplyI32(root, "eigen_max_iterations", n.centrality.eigenMaxIterations, err)) return false;
  if (!ApplyF64(root, "eigen_tolerance", n.centrality.eigenTolerance, err)) return false;
  return true;
}

// Apply one section, prefixing errors with the section name.
template <typename T, typename Fn>
bool ApplySection(const JsonValue& root, const char* key, T& io, Fn fn, std::string& err)
{
  const JsonValue* obj = nullptr;
  if (!GetObj(root, key, &obj, err)) return false;
  if (!obj) return true;
  if (!fn(*obj, io, err)) {
    err = std::string(key) + ": " + err;
    return false;
  }
  return true;
}

void WriteInfraTable(JsonWriter& w, const char* key, const double (&table)[kInfraTypeCount])
{
  w.key(key);
  w.beginObject();
  for (int t = 0; t < kInfraTypeCount; ++t) w.member(ToString(static_cast<InfraType>(t)), table[t]);
  w.endObject();
}

} // namespace

std::string ReconConfigToJson(const ReconConfig& cfg, int indentSpaces)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;
  JsonWriter w(oss, opt);

  w.beginObject();

  w.key("cost_model");
  w.beginObject();
  WriteInfraTable(w, "price_per_meter", cfg.cost.pricePerMeter);
  WriteInfraTable(w, "hours_per_meter", cfg.cost.hoursPerMeter);
  w.member("daily_wage", cfg.cost.dailyWage);
  w.member("max_workers_per_infra", cfg.cost.maxWorkersPerInfra);
  w.endObject();

  w.key("scoring_weights");
  w.beginObject();
  w.member("population", cfg.weights.population);
  w.member("cost", cfg.weights.cost);
  w.member("urgency", cfg.weights.urgency);
  w.member("distance", cfg.weights.distance);
  w.endObject();

  w.key("urgency");
  w.beginObject();
  w.member("fallback", cfg.urgency.fallback);
  w.key("table");
  w.beginObject();
  for (int t = 0; t < kBuildingTypeCount; ++t) {
    const BuildingType bt = static_cast<BuildingType>(t);
    w.key(ToString(bt));
    w.beginObject();
    for (int p = 0; p < kBuildingPriorityCount; ++p) {
      const BuildingPriority bp = static_cast<BuildingPriority>(p);
      w.key(ToString(bp));
      if (cfg.urgency.isTabulated(bt, bp)) {
        w.numberValue(UrgencyScore(bt, bp, cfg.urgency));
      } else {
        w.nullValue();
      }
    }
    w.endObject();
  }
  w.endObject();
  w.endObject();

  w.key("planner");
  w.beginObject();
  w.member("total_budget", cfg.planner.totalBudget);
  w.key("phase_budget_fractions");
  w.beginArray();
  for (double f : cfg.planner.phaseBudgetFractions) w.numberValue(f);
  w.endArray();
  w.member("generator_autonomy_hours", cfg.planner.generatorAutonomyHours);
  w.member("safety_margin", cfg.planner.safetyMargin);
  w.key("priority_weights");
  w.beginObject();
  for (int t = 0; t < kBuildingTypeCount; ++t) {
    w.member(ToString(static_cast<BuildingType>(t)), cfg.planner.priorityWeight[t]);
  }
  w.endObject();
  w.key("coefficients");
  w.beginObject();
  w.member("alpha", cfg.planner.coefficients.alpha);
  w.member("beta", cfg.planner.coefficients.beta);
  w.member("gamma", cfg.planner.coefficients.gamma);
  w.member("delta", cfg.planner.coefficients.delta);
  w.endObject();
  w.member("reciprocal_cap", cfg.planner.reciprocalCap);
  w.endObject();

  w.key("network");
  w.beginObject();
  w.member("building_reach", cfg.network.buildingReach);
  w.member("substation_reach", cfg.network.substationReach);
  w.member("routing_weight", ToString(cfg.network.centrality.weight));
  w.member("normalize_betweenness", cfg.network.centrality.normalize);
  w.member("closeness_component_scale", cfg.network.centrality.closenessComponentScale);
  w.member("eigen_max_iterations", cfg.network.centrality.eigenMaxIterations);
  w.member("eigen_tolerance", cfg.network.centrality.eigenTolerance);
  w.endObject();

  w.endObject();
  if (opt.pretty) oss << '\n';
  return oss.str();
}

bool ApplyReconConfigJson(const JsonValue& root, ReconConfig& ioCfg, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "config root must be an object";
    return false;
  }

  // Work on a copy so a failed override leaves ioCfg untouched.
  ReconConfig cfg = ioCfg;
  if (!ApplySection(root, "cost_model", cfg.cost, ApplyCostModel, outError)) return false;
  if (!ApplySection(root, "scoring_weights", cfg.weights, ApplyWeights, outError)) return false;
  if (!ApplySection(root, "urgency", cfg.urgency, ApplyUrgency, outError)) return false;
  if (!ApplySection(root, "planner", cfg.planner, ApplyPlanner, outError)) return false;
  if (!ApplySection(root, "network", cfg.network, ApplyNetwork, outError)) return false;

  ioCfg = std::move(cfg);
  return true;
}

bool LoadReconConfigJsonFile(const std::string& path, ReconConfig& ioCfg, std::string& outError)
{
  std::string text;
  if (!ReadTextFile(path, text, outError)) return false;

  JsonValue root;
  if (!ParseJson(text, root, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  if (!ApplyReconConfigJson(root, ioCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool WriteReconConfigJsonFile(const std::string& path, const ReconConfig& cfg, std::string& outError,
                              int indentSpaces)
{
  outError.clear();
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open for writing: " + path;
    return false;
  }
  f << ReconConfigToJson(cfg, indentSpaces);
  if (!f) {
    outError = "failed to write: " + path;
    return false;
  }
  return true;
}

} // namespace reconplan
