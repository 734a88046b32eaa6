#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace reconplan {

// Minimal JSON document model, parser and streaming writer.
//
// Used for scenario ingestion, config overrides and plan/metric exports so the
// headless core and tools stay free of third-party JSON libraries.
//
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are stored as double.
//  - Objects keep their members in document order.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }
};

// Returns nullptr when obj is not an object or has no such key.
const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Read a whole file into memory. Returns false (with a message) if it cannot be opened.
bool ReadTextFile(const std::string& path, std::string& outText, std::string& outError);

// Escape a string for use inside a JSON string literal (without surrounding quotes).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
};

// Streaming JSON writer.
//
// Callers control member order, which keeps exports deterministic. Misuse (a value
// where a key is expected, unbalanced containers, non-finite numbers) records an
// error and every later call returns false.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool stringValue(const std::string& s);

  // Serialize a JsonValue subtree in the current context.
  bool value(const JsonValue& v);

  // Convenience for the common "key": value pattern.
  bool member(const std::string& k, double n) { return key(k) && numberValue(n); }
  bool member(const std::string& k, int n) { return key(k) && intValue(n); }
  bool member(const std::string& k, bool b) { return key(k) && boolValue(b); }
  bool member(const std::string& k, const std::string& s) { return key(k) && stringValue(s); }
  bool member(const std::string& k, const char* s) { return key(k) && stringValue(s ? s : ""); }

  // True once the top-level value has been completely written.
  bool finished() const { return m_finished; }

private:
  struct Frame {
    bool isObject = true;
    bool empty = true;
    bool expectingKey = true;
  };

  bool fail(std::string msg);
  bool beforeValue();
  void afterValue();
  void newline(std::size_t depth);
  bool open(bool isObject, char c);
  bool close(bool isObject, char c);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

} // namespace reconplan
