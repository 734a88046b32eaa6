#include "reconplan/Enums.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace reconplan {

namespace {

// Lowercase ASCII and fold ' ' / '-' into '_' so "Semi-Aerial", "semi aerial" and
// "semi_aerial" compare equal. Non-ASCII bytes (accents) are kept as-is.
std::string NormalizeKey(const std::string& s)
{
  std::string t;
  t.reserve(s.size());
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
  for (std::size_t i = b; i < e; ++i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c == ' ' || c == '-') {
      t.push_back('_');
    } else {
      t.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return t;
}

} // namespace

const char* ToString(NodeKind k)
{
  switch (k) {
  case NodeKind::Substation: return "substation";
  case NodeKind::NetworkPoint: return "network_point";
  case NodeKind::Building: return "building";
  default: return "network_point";
  }
}

const char* ToString(EdgeKind k)
{
  switch (k) {
  case EdgeKind::Segment: return "segment";
  case EdgeKind::Connection: return "connection";
  default: return "segment";
  }
}

const char* ToString(SegmentStatus s)
{
  switch (s) {
  case SegmentStatus::Active: return "active";
  case SegmentStatus::Damaged: return "damaged";
  default: return "active";
  }
}

const char* ToString(BuildingType t)
{
  switch (t) {
  case BuildingType::Residential: return "residential";
  case BuildingType::School: return "school";
  case BuildingType::Hospital: return "hospital";
  case BuildingType::Commercial: return "commercial";
  default: return "residential";
  }
}

const char* ToString(BuildingPriority p)
{
  switch (p) {
  case BuildingPriority::High: return "high";
  case BuildingPriority::Medium: return "medium";
  case BuildingPriority::Low: return "low";
  default: return "medium";
  }
}

const char* ToString(InfraType t)
{
  switch (t) {
  case InfraType::Aerial: return "aerial";
  case InfraType::SemiAerial: return "semi_aerial";
  case InfraType::Duct: return "duct";
  default: return "aerial";
  }
}

const char* ToString(InfraState s)
{
  switch (s) {
  case InfraState::Intact: return "intact";
  case InfraState::ToReplace: return "to_replace";
  default: return "intact";
  }
}

bool ParseNodeKind(const std::string& s, NodeKind& out)
{
  const std::string t = NormalizeKey(s);
  if (t == "substation" || t == "poste") {
    out = NodeKind::Substation;
    return true;
  }
  if (t == "network_point" || t == "network" || t == "point") {
    out = NodeKind::NetworkPoint;
    return true;
  }
  if (t == "building" || t == "batiment" || t == "bâtiment") {
    out = NodeKind::Building;
    return true;
  }
  return false;
}

bool ParseSegmentStatus(const std::string& s, SegmentStatus& out)
{
  const std::string t = NormalizeKey(s);
  if (t == "active" || t == "ok" || t == "intact") {
    out = SegmentStatus::Active;
    return true;
  }
  if (t == "damaged" || t == "broken" || t == "endommage" || t == "endommagé") {
    out = SegmentStatus::Damaged;
    return true;
  }
  return false;
}

bool ParseBuildingType(const std::string& s, BuildingType& out)
{
  const std::string t = NormalizeKey(s);
  if (t == "residential" || t == "habitation" || t == "house" || t == "housing") {
    out = BuildingType::Residential;
    return true;
  }
  if (t == "school" || t == "ecole" || t == "école") {
    out = BuildingType::School;
    return true;
  }
  if (t == "hospital" || t == "hopital" || t == "hôpital") {
    out = BuildingType::Hospital;
    return true;
  }
  if (t == "commercial" || t == "commerce" || t == "shop") {
    out = BuildingType::Commercial;
    return true;
  }
  return false;
}

bool ParseBuildingPriority(const std::string& s, BuildingPriority& out)
{
  const std::string t = NormalizeKey(s);
  if (t == "high" || t == "critical" || t == "elevee" || t == "élevée" || t == "critique") {
    out = BuildingPriority::High;
    return true;
  }
  if (t == "medium" || t == "moyenne") {
    out = BuildingPriority::Medium;
    return true;
  }
  if (t == "low" || t == "faible") {
    out = BuildingPriority::Low;
    return true;
  }
  return false;
}

bool ParseInfraType(const std::string& s, InfraType& out)
{
  const std::string t = NormalizeKey(s);
  if (t == "aerial" || t == "aerien" || t == "aérien") {
    out = InfraType::Aerial;
    return true;
  }
  if (t == "semi_aerial" || t == "semiaerial" || t == "semi_aerien" || t == "semi_aérien") {
    out = InfraType::SemiAerial;
    return true;
  }
  if (t == "duct" || t == "fourreau" || t == "underground") {
    out = InfraType::Duct;
    return true;
  }
  return false;
}

bool ParseInfraState(const std::string& s, InfraState& out)
{
  const std::string t = NormalizeKey(s);
  if (t == "intact" || t == "intacte" || t == "infra_intacte") {
    out = InfraState::Intact;
    return true;
  }
  if (t == "to_replace" || t == "replace" || t == "a_remplacer" || t == "à_remplacer" || t == "remplacer" ||
      t == "infra_a_remplacer") {
    out = InfraState::ToReplace;
    return true;
  }
  return false;
}

} // namespace reconplan
