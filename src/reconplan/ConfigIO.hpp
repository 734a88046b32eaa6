#pragma once

#include "reconplan/Json.hpp"
#include "reconplan/ReconConfig.hpp"

#include <string>

namespace reconplan {

// JSON helpers for ReconConfig.
//
// Overrides use merge semantics: missing keys leave the existing value unchanged,
// so a config file only needs the settings it changes. Field names are snake_case;
// type-keyed tables accept the same aliases as the record parsers ("aerien",
// "hopital", ...). In the urgency table a null cell removes that entry so the
// fallback applies.
//
// Layout:
//   {
//     "cost_model":      {"price_per_meter": {...}, "hours_per_meter": {...},
//                         "daily_wage": 300, "max_workers_per_infra": 4},
//     "scoring_weights": {"population": 0.4, "cost": 0.3, "urgency": 0.2, "distance": 0.1},
//     "urgency":         {"fallback": 0.5, "table": {"hospital": {"high": 1.0}, ...}},
//     "planner":         {"total_budget": ..., "phase_budget_fractions": [...], ...},
//     "network":         {"building_reach": 100, "substation_reach": 50, ...}
//   }

std::string ReconConfigToJson(const ReconConfig& cfg, int indentSpaces = 2);

bool ApplyReconConfigJson(const JsonValue& root, ReconConfig& ioCfg, std::string& outError);

bool LoadReconConfigJsonFile(const std::string& path, ReconConfig& ioCfg, std::string& outError);
bool WriteReconConfigJsonFile(const std::string& path, const ReconConfig& cfg, std::string& outError,
                              int indentSpaces = 2);

} // namespace reconplan
