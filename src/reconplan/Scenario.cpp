#include "reconplan/Scenario.hpp"

#include "reconplan/ConfigIO.hpp"

#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace reconplan {

namespace {

const JsonValue* FindAny(const JsonValue& obj, std::initializer_list<const char*> keys)
{
  for (const char* k : keys) {
    if (const JsonValue* v = FindJsonMember(obj, k)) {
      if (!v->isNull()) return v;
    }
  }
  return nullptr;
}

// Reports errors as "<array>[<index>].<field>: <message>".
class RecordReader {
public:
  RecordReader(const char* array, std::size_t index, const JsonValue& obj, std::string& err)
      : m_array(array), m_index(index), m_obj(obj), m_err(err)
  {
  }

  bool fail(const char* field, const std::string& msg)
  {
    m_err = std::string(m_array) + "[" + std::to_string(m_index) + "]";
    if (field && *field) m_err += std::string(".") + field;
    m_err += ": " + msg;
    return false;
  }

  bool id(std::initializer_list<const char*> keys, std::string& out)
  {
    const JsonValue* v = FindAny(m_obj, keys);
    const char* field = *keys.begin();
    if (!v) return fail(field, "missing identifier");
    if (v->isString()) {
      if (v->stringValue.empty()) return fail(field, "empty identifier");
      out = v->stringValue;
      return true;
    }
    if (v->isNumber() && std::isfinite(v->numberValue) && std::floor(v->numberValue) == v->numberValue) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.0f", v->numberValue);
      out = buf;
      return true;
    }
    return fail(field, "expected a string or integer identifier");
  }

  // Non-negative finite number. When `required` is false a missing key keeps `out`.
  bool number(std::initializer_list<const char*> keys, double& out, bool required)
  {
    const JsonValue* v = FindAny(m_obj, keys);
    const char* field = *keys.begin();
    if (!v) return required ? fail(field, "missing value") : true;
    if (!v->isNumber() || !std::isfinite(v->numberValue)) return fail(field, "expected a number");
    if (v->numberValue < 0.0) return fail(field, "must be >= 0");
    out = v->numberValue;
    return true;
  }

  bool count(std::initializer_list<const char*> keys, int& out, bool required)
  {
    const JsonValue* v = FindAny(m_obj, keys);
    const char* field = *keys.begin();
    if (!v) return required ? fail(field, "missing value") : true;
    if (!v->isNumber() || !std::isfinite(v->numberValue) || v->numberValue < 0.0 ||
        std::floor(v->numberValue) != v->numberValue || v->numberValue > 2147483647.0) {
      return fail(field, "expected a non-negative integer");
    }
    out = static_cast<int>(v->numberValue);
    return true;
  }

  bool flag(std::initializer_list<const char*> keys, bool& out)
  {
    const JsonValue* v = FindAny(m_obj, keys);
    if (!v) return true;
    if (v->isBool()) {
      out = v->boolValue;
      return true;
    }
    // Spreadsheet exports often carry 0/1.
    if (v->isNumber() && (v->numberValue == 0.0 || v->numberValue == 1.0)) {
      out = (v->numberValue == 1.0);
      return true;
    }
    return fail(*keys.begin(), "expected a boolean");
  }

  bool text(std::initializer_list<const char*> keys, std::string& out)
  {
    const JsonValue* v = FindAny(m_obj, keys);
    if (!v) return true;
    if (!v->isString()) return fail(*keys.begin(), "expected a string");
    out = v->stringValue;
    return true;
  }

  template <typename E>
  bool enumValue(std::initializer_list<const char*> keys, E& out, bool (*parse)(const std::string&, E&),
                 bool required)
  {
    const JsonValue* v = FindAny(m_obj, keys);
    const char* field = *keys.begin();
    if (!v) return required ? fail(field, "missing value") : true;
    if (!v->isString()) return fail(field, "expected a string");
    if (!parse(v->stringValue, out)) return fail(field, "unknown value '" + v->stringValue + "'");
    return true;
  }

  // "x"/"y" members or "position": [x, y] / {"x", "y"}. Returns true with
  // outHas=false when no position is given.
  bool position(Vec2& out, bool& outHas, bool required)
  {
    outHas = false;
    const JsonValue* x = FindJsonMember(m_obj, "x");
    const JsonValue* y = FindJsonMember(m_obj, "y");
    const JsonValue* pos = FindJsonMember(m_obj, "position");

    if (pos && pos->isArray()) {
      if (pos->arrayValue.size() != 2) return fail("position", "expected [x, y]");
      x = &pos->arrayValue[0];
      y = &pos->arrayValue[1];
    } else if (pos && pos->isObject()) {
      x = FindJsonMember(*pos, "x");
      y = FindJsonMember(*pos, "y");
    } else if (pos && !pos->isNull()) {
      return fail("position", "expected [x, y] or {\"x\", \"y\"}");
    }

    if (!x && !y) return required ? fail("position", "missing coordinates") : true;
    if (!x || !y || !x->isNumber() || !y->isNumber() || !std::isfinite(x->numberValue) ||
        !std::isfinite(y->numberValue)) {
      return fail("position", "expected finite x and y");
    }
    out.x = x->numberValue;
    out.y = y->numberValue;
    outHas = true;
    return true;
  }

private:
  const char* m_array;
  std::size_t m_index;
  const JsonValue& m_obj;
  std::string& m_err;
};

bool GetArray(const JsonValue& root, const char* key, const JsonValue** out, std::string& err)
{
  *out = FindJsonMember(root, key);
  if (!*out || (*out)->isNull()) {
    *out = nullptr;
    return true;
  }
  if (!(*out)->isArray()) {
    err = std::string("expected array for key '") + key + "'";
    return false;
  }
  return true;
}

bool CheckObject(const char* array, std::size_t i, const JsonValue& v, std::string& err)
{
  if (v.isObject()) return true;
  err = std::string(array) + "[" + std::to_string(i) + "]: expected an object";
  return false;
}

bool CheckUnique(std::unordered_set<std::string>& seen, const char* array, std::size_t i, const std::string& id,
                 std::string& err)
{
  if (seen.insert(id).second) return true;
  err = std::string(array) + "[" + std::to_string(i) + "].id: duplicate identifier '" + id + "'";
  return false;
}

bool ReadBuildings(const JsonValue& arr, std::vector<BuildingRecord>& out, std::string& err)
{
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& v = arr.arrayValue[i];
    if (!CheckObject("buildings", i, v, err)) return false;
    RecordReader r("buildings", i, v, err);

    BuildingRecord b;
    if (!r.id({"id", "building_id", "id_batiment"}, b.id)) return false;
    if (!r.count({"inhabitants", "population", "nb_habitants"}, b.inhabitants, true)) return false;
    if (!r.enumValue({"type", "building_type", "type_batiment"}, b.type, &ParseBuildingType, true)) return false;
    if (!r.enumValue({"priority", "priorite"}, b.priority, &ParseBuildingPriority, false)) return false;
    if (!r.flag({"connected", "raccorde"}, b.connected)) return false;
    if (!r.number({"cost", "cout"}, b.cost, false)) return false;
    if (!r.number({"distance"}, b.distance, false)) return false;
    if (!r.position(b.pos, b.hasPosition, false)) return false;
    if (!CheckUnique(seen, "buildings", i, b.id, err)) return false;

    out.push_back(std::move(b));
  }
  return true;
}

bool ReadInfrastructures(const JsonValue& arr, const std::unordered_set<std::string>& buildingIds,
                         std::vector<InfraRecord>& out, std::string& err)
{
  // One infrastructure may serve several buildings: it then appears once per
  // building, and every row must agree on type, state and length.
  std::unordered_map<std::string, std::size_t> firstRow;
  std::unordered_set<std::string> links;
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& v = arr.arrayValue[i];
    if (!CheckObject("infrastructures", i, v, err)) return false;
    RecordReader r("infrastructures", i, v, err);

    InfraRecord in;
    if (!r.id({"id", "infra_id"}, in.id)) return false;
    if (!r.id({"building_id", "id_batiment"}, in.buildingId)) return false;
    if (!r.enumValue({"type", "infra_type", "type_infra"}, in.type, &ParseInfraType, true)) return false;
    if (!r.enumValue({"state", "etat"}, in.state, &ParseInfraState, true)) return false;
    if (!r.number({"length", "longueur"}, in.length, true)) return false;
    if (!r.count({"houses_served", "nb_maisons"}, in.housesServed, false)) return false;
    if (buildingIds.find(in.buildingId) == buildingIds.end()) {
      return r.fail("building_id", "unknown building '" + in.buildingId + "'");
    }
    if (!links.insert(in.id + '\n' + in.buildingId).second) {
      return r.fail("id", "duplicate identifier '" + in.id + "' for building '" + in.buildingId + "'");
    }

    const auto it = firstRow.emplace(in.id, out.size());
    if (!it.second) {
      const InfraRecord& first = out[it.first->second];
      if (first.type != in.type) return r.fail("type", "conflicts with an earlier row of '" + in.id + "'");
      if (first.state != in.state) return r.fail("state", "conflicts with an earlier row of '" + in.id + "'");
      if (first.length != in.length) return r.fail("length", "conflicts with an earlier row of '" + in.id + "'");
    }

    out.push_back(std::move(in));
  }
  return true;
}

bool ReadNetworkPoints(const JsonValue& arr, std::vector<NetworkPointRecord>& out, std::string& err)
{
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& v = arr.arrayValue[i];
    if (!CheckObject("network_points", i, v, err)) return false;
    RecordReader r("network_points", i, v, err);

    NetworkPointRecord p;
    bool has = false;
    if (!r.id({"id"}, p.id)) return false;
    if (!r.position(p.pos, has, true)) return false;
    if (!CheckUnique(seen, "network_points", i, p.id, err)) return false;

    out.push_back(std::move(p));
  }
  return true;
}

bool ReadSegments(const JsonValue& arr, std::vector<SegmentRecord>& out, std::string& err)
{
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& v = arr.arrayValue[i];
    if (!CheckObject("segments", i, v, err)) return false;
    RecordReader r("segments", i, v, err);

    SegmentRecord s;
    if (!r.id({"id"}, s.id)) return false;
    if (!r.id({"endpoint_a", "from", "source"}, s.endpointA)) return false;
    if (!r.id({"endpoint_b", "to", "target"}, s.endpointB)) return false;
    if (!r.number({"length", "longueur"}, s.length, true)) return false;
    if (!r.enumValue({"status", "etat"}, s.status, &ParseSegmentStatus, false)) return false;
    if (FindAny(v, {"capacity"})) {
      if (!r.number({"capacity"}, s.capacity, true)) return false;
      s.hasCapacity = true;
    }
    if (!CheckUnique(seen, "segments", i, s.id, err)) return false;

    out.push_back(std::move(s));
  }
  return true;
}

bool ReadSubstations(const JsonValue& arr, std::vector<SubstationRecord>& out, std::string& err)
{
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& v = arr.arrayValue[i];
    if (!CheckObject("substations", i, v, err)) return false;
    RecordReader r("substations", i, v, err);

    SubstationRecord s;
    bool has = false;
    if (!r.id({"id"}, s.id)) return false;
    if (!r.position(s.pos, has, true)) return false;
    if (!r.number({"capacity"}, s.capacity, false)) return false;
    if (!r.text({"name", "nom"}, s.name)) return false;
    if (!CheckUnique(seen, "substations", i, s.id, err)) return false;

    out.push_back(std::move(s));
  }
  return true;
}

} // namespace

bool LoadScenarioJson(const std::string& text, Scenario& out, std::string& outError)
{
  outError.clear();
  out = Scenario{};

  JsonValue root;
  if (!ParseJson(text, root, outError)) return false;
  if (!root.isObject()) {
    outError = "scenario root must be an object";
    return false;
  }

  Scenario s;
  const JsonValue* arr = nullptr;

  if (!GetArray(root, "buildings", &arr, outError)) return false;
  if (arr && !ReadBuildings(*arr, s.buildings, outError)) return false;

  std::unordered_set<std::string> buildingIds;
  for (const BuildingRecord& b : s.buildings) buildingIds.insert(b.id);

  if (!GetArray(root, "infrastructures", &arr, outError)) return false;
  if (arr && !ReadInfrastructures(*arr, buildingIds, s.infrastructures, outError)) return false;

  if (!GetArray(root, "network_points", &arr, outError)) return false;
  if (arr && !ReadNetworkPoints(*arr, s.networkPoints, outError)) return false;

  if (!GetArray(root, "segments", &arr, outError)) return false;
  if (arr && !ReadSegments(*arr, s.segments, outError)) return false;

  if (!GetArray(root, "substations", &arr, outError)) return false;
  if (arr && !ReadSubstations(*arr, s.substations, outError)) return false;

  if (const JsonValue* cfg = FindJsonMember(root, "config")) {
    if (!cfg->isNull()) {
      if (!cfg->isObject()) {
        outError = "expected object for key 'config'";
        return false;
      }
      s.hasConfig = true;
      s.config = *cfg;
    }
  }

  out = std::move(s);
  return true;
}

bool LoadScenarioJsonFile(const std::string& path, Scenario& out, std::string& outError)
{
  std::string text;
  if (!ReadTextFile(path, text, outError)) return false;
  if (!LoadScenarioJson(text, out, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool ApplyScenarioConfig(const Scenario& s, ReconConfig& ioCfg, std::string& outError)
{
  outError.clear();
  if (!s.hasConfig) return true;
  if (!ApplyReconConfigJson(s.config, ioCfg, outError)) {
    outError = "config: " + outError;
    return false;
  }
  return true;
}

bool BuildScenarioGraph(const Scenario& s, const NetworkAnalysisConfig& cfg, NetworkGraph& out,
                        ScenarioGraphReport& outReport, std::string& outError)
{
  outReport = ScenarioGraphReport{};

  std::vector<NetworkNode> nodes;
  nodes.reserve(s.substations.size() + s.networkPoints.size() + s.buildings.size());

  for (const SubstationRecord& r : s.substations) {
    NetworkNode n;
    n.id = r.id;
    n.kind = NodeKind::Substation;
    n.pos = r.pos;
    n.capacity = r.capacity;
    n.name = r.name;
    nodes.push_back(std::move(n));
  }
  for (const NetworkPointRecord& r : s.networkPoints) {
    NetworkNode n;
    n.id = r.id;
    n.kind = NodeKind::NetworkPoint;
    n.pos = r.pos;
    nodes.push_back(std::move(n));
  }
  for (const BuildingRecord& r : s.buildings) {
    if (!r.hasPosition) continue;
    NetworkNode n;
    n.id = r.id;
    n.kind = NodeKind::Building;
    n.pos = r.pos;
    n.inhabitants = r.inhabitants;
    n.powered = r.connected;
    nodes.push_back(std::move(n));
  }

  std::vector<NetworkEdgeSpec> edges;
  edges.reserve(s.segments.size());
  for (const SegmentRecord& r : s.segments) {
    NetworkEdgeSpec e;
    e.id = r.id;
    e.from = r.endpointA;
    e.to = r.endpointB;
    e.length = r.length;
    e.kind = EdgeKind::Segment;
    e.status = r.status;
    e.hasCapacity = r.hasCapacity;
    e.capacity = r.capacity;
    edges.push_back(std::move(e));
  }

  if (!BuildNetworkGraph(nodes, edges, out, outError)) return false;

  outReport.substations = ConnectNodesToNearest(out, NodeKind::Substation, cfg.substationReach);
  outReport.buildings = ConnectNodesToNearest(out, NodeKind::Building, cfg.buildingReach);
  return true;
}

} // namespace reconplan
