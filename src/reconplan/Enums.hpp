#pragma once

#include <cstdint>
#include <string>

namespace reconplan {

// Closed vocabularies used by the input records.
//
// Every enum has a canonical snake_case name (ToString) and a tolerant parser that
// accepts case-insensitive aliases, including the French labels found in the
// field survey spreadsheets. Unknown values are rejected at ingestion.

enum class NodeKind : std::uint8_t {
  Substation = 0,
  NetworkPoint = 1,
  Building = 2,
};

enum class EdgeKind : std::uint8_t {
  Segment = 0,    // a cable segment of the distribution network
  Connection = 1, // a service drop from a building/substation to its nearest network point
};

enum class SegmentStatus : std::uint8_t {
  Active = 0,
  Damaged = 1,
};

enum class BuildingType : std::uint8_t {
  Residential = 0,
  School = 1,
  Hospital = 2,
  Commercial = 3,
};

enum class BuildingPriority : std::uint8_t {
  High = 0,
  Medium = 1,
  Low = 2,
};

enum class InfraType : std::uint8_t {
  Aerial = 0,
  SemiAerial = 1,
  Duct = 2,
};

enum class InfraState : std::uint8_t {
  Intact = 0,
  ToReplace = 1,
};

inline constexpr int kBuildingTypeCount = 4;
inline constexpr int kBuildingPriorityCount = 3;
inline constexpr int kInfraTypeCount = 3;

const char* ToString(NodeKind k);
const char* ToString(EdgeKind k);
const char* ToString(SegmentStatus s);
const char* ToString(BuildingType t);
const char* ToString(BuildingPriority p);
const char* ToString(InfraType t);
const char* ToString(InfraState s);

bool ParseNodeKind(const std::string& s, NodeKind& out);
bool ParseSegmentStatus(const std::string& s, SegmentStatus& out);
bool ParseBuildingType(const std::string& s, BuildingType& out);
bool ParseBuildingPriority(const std::string& s, BuildingPriority& out);
bool ParseInfraType(const std::string& s, InfraType& out);
bool ParseInfraState(const std::string& s, InfraState& out);

} // namespace reconplan
