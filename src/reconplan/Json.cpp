#include "reconplan/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace reconplan {

JsonValue JsonValue::MakeNull()
{
  return JsonValue{};
}

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

bool ReadTextFile(const std::string& path, std::string& outText, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "unable to open '" + path + "'";
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) {
    outError = "read error on '" + path + "'";
    return false;
  }
  outText = oss.str();
  outError.clear();
  return true;
}

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char ch : s) {
    switch (ch) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

constexpr int kMaxDepth = 256;

void AppendUtf8(std::string& out, unsigned int cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

class JsonReader {
public:
  explicit JsonReader(const std::string& text) : m_s(text) {}

  bool document(JsonValue& out)
  {
    if (!value(out, 0)) return false;
    ws();
    if (m_pos != m_s.size()) return fail("trailing characters after document");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  bool fail(const std::string& msg)
  {
    // Report a 1-based line:column, which is what people editing scenario files want.
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < m_pos && k < m_s.size(); ++k) {
      if (m_s[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream oss;
    oss << "JSON parse error at " << line << ":" << col << ": " << msg;
    m_err = oss.str();
    return false;
  }

  void ws()
  {
    while (m_pos < m_s.size() && std::isspace(static_cast<unsigned char>(m_s[m_pos])) != 0) ++m_pos;
  }

  char peek() const { return m_pos < m_s.size() ? m_s[m_pos] : '\0'; }

  bool literal(const char* word)
  {
    const std::string w(word);
    if (m_s.compare(m_pos, w.size(), w) != 0) return fail("invalid literal");
    m_pos += w.size();
    return true;
  }

  bool value(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    ws();
    switch (peek()) {
    case '\0': return fail("unexpected end of input");
    case 'n':
      out = JsonValue::MakeNull();
      return literal("null");
    case 't':
      out = JsonValue::MakeBool(true);
      return literal("true");
    case 'f':
      out = JsonValue::MakeBool(false);
      return literal("false");
    case '"': {
      std::string s;
      if (!string(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case '[': return array(out, depth);
    case '{': return object(out, depth);
    default: break;
    }
    const char c = peek();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return number(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++m_pos;
    return true;
  }

  bool number(JsonValue& out)
  {
    const std::size_t start = m_pos;
    if (peek() == '-') ++m_pos;
    if (peek() == '0') {
      ++m_pos;
    } else if (!digits()) {
      return fail("expected digit");
    }
    if (peek() == '.') {
      ++m_pos;
      if (!digits()) return fail("expected digit after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_pos;
      if (peek() == '+' || peek() == '-') ++m_pos;
      if (!digits()) return fail("expected exponent digits");
    }

    const std::string text = m_s.substr(start, m_pos - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || !end || *end != '\0') return fail("number out of range");
    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool hex4(unsigned int& out)
  {
    if (m_pos + 4 > m_s.size()) return fail("truncated \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_pos++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<unsigned int>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<unsigned int>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<unsigned int>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool string(std::string& out)
  {
    if (peek() != '"') return fail("expected string");
    ++m_pos;
    out.clear();
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (m_pos >= m_s.size()) break;
      const char e = m_s[m_pos++];
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        unsigned int cp = 0;
        if (!hex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // Surrogate pair.
          if (m_s.compare(m_pos, 2, "\\u") != 0) return fail("unpaired surrogate");
          m_pos += 2;
          unsigned int lo = 0;
          if (!hex4(lo)) return false;
          if (lo < 0xDC00 || lo > 0xDFFF) return fail("invalid low surrogate");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        }
        AppendUtf8(out, cp);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }
    return fail("unterminated string");
  }

  bool array(JsonValue& out, int depth)
  {
    ++m_pos; // '['
    out = JsonValue::MakeArray();
    ws();
    if (peek() == ']') {
      ++m_pos;
      return true;
    }
    for (;;) {
      JsonValue item;
      if (!value(item, depth + 1)) return false;
      out.arrayValue.push_back(std::move(item));
      ws();
      if (peek() == ',') {
        ++m_pos;
        continue;
      }
      if (peek() == ']') {
        ++m_pos;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  bool object(JsonValue& out, int depth)
  {
    ++m_pos; // '{'
    out = JsonValue::MakeObject();
    ws();
    if (peek() == '}') {
      ++m_pos;
      return true;
    }
    for (;;) {
      ws();
      std::string k;
      if (!string(k)) return false;
      ws();
      if (peek() != ':') return fail("expected ':'");
      ++m_pos;
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.objectValue.emplace_back(std::move(k), std::move(v));
      ws();
      if (peek() == ',') {
        ++m_pos;
        continue;
      }
      if (peek() == '}') {
        ++m_pos;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  const std::string& m_s;
  std::size_t m_pos = 0;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  JsonReader r(text);
  JsonValue v;
  if (!r.document(v)) {
    outError = r.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

// -----------------------------------------------------------------------------------------------
// JsonWriter
// -----------------------------------------------------------------------------------------------

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt) : m_os(&os), m_opt(opt) {}

bool JsonWriter::fail(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

void JsonWriter::newline(std::size_t depth)
{
  if (!m_opt.pretty) return;
  *m_os << '\n';
  const std::size_t n = depth * static_cast<std::size_t>(m_opt.indent > 0 ? m_opt.indent : 0);
  for (std::size_t i = 0; i < n; ++i) *m_os << ' ';
}

bool JsonWriter::beforeValue()
{
  if (!ok()) return false;
  if (m_finished) return fail("JsonWriter: value after completed document");
  if (m_stack.empty()) return true;

  Frame& f = m_stack.back();
  if (f.isObject) {
    // The key() call already handled separators and indentation.
    if (f.expectingKey) return fail("JsonWriter: value written where a key was expected");
    return true;
  }
  if (!f.empty) *m_os << ',';
  newline(m_stack.size());
  return true;
}

void JsonWriter::afterValue()
{
  if (m_stack.empty()) {
    m_finished = true;
    if (m_opt.pretty) *m_os << '\n';
    return;
  }
  Frame& f = m_stack.back();
  f.empty = false;
  if (f.isObject) f.expectingKey = true;
}

bool JsonWriter::open(bool isObject, char c)
{
  if (!beforeValue()) return false;
  *m_os << c;
  m_stack.push_back(Frame{isObject, true, true});
  return static_cast<bool>(*m_os) || fail("JsonWriter: stream failure");
}

bool JsonWriter::close(bool isObject, char c)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().isObject != isObject) {
    return fail("JsonWriter: unbalanced container close");
  }
  if (isObject && !m_stack.back().expectingKey) return fail("JsonWriter: key without value");
  const bool wasEmpty = m_stack.back().empty;
  m_stack.pop_back();
  if (!wasEmpty) newline(m_stack.size());
  *m_os << c;
  afterValue();
  return static_cast<bool>(*m_os) || fail("JsonWriter: stream failure");
}

bool JsonWriter::beginObject() { return open(true, '{'); }
bool JsonWriter::endObject() { return close(true, '}'); }
bool JsonWriter::beginArray() { return open(false, '['); }
bool JsonWriter::endArray() { return close(false, ']'); }

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || !m_stack.back().isObject) return fail("JsonWriter: key outside object");
  Frame& f = m_stack.back();
  if (!f.expectingKey) return fail("JsonWriter: two keys in a row");
  if (!f.empty) *m_os << ',';
  newline(m_stack.size());
  *m_os << '"' << JsonEscape(k) << '"' << (m_opt.pretty ? ": " : ":");
  f.expectingKey = false;
  return true;
}

bool JsonWriter::nullValue()
{
  if (!beforeValue()) return false;
  *m_os << "null";
  afterValue();
  return true;
}

bool JsonWriter::boolValue(bool b)
{
  if (!beforeValue()) return false;
  *m_os << (b ? "true" : "false");
  afterValue();
  return true;
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return fail("JsonWriter: non-finite number");
  if (!beforeValue()) return false;
  // Shortest of 15/17 significant digits that reads back to the same double.
  std::ostringstream oss;
  oss << std::setprecision(15) << n;
  if (std::strtod(oss.str().c_str(), nullptr) != n) {
    oss.str(std::string());
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << n;
  }
  *m_os << oss.str();
  afterValue();
  return true;
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!beforeValue()) return false;
  *m_os << n;
  afterValue();
  return true;
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!beforeValue()) return false;
  *m_os << '"' << JsonEscape(s) << '"';
  afterValue();
  return true;
}

bool JsonWriter::value(const JsonValue& v)
{
  switch (v.type) {
  case JsonValue::Type::Null: return nullValue();
  case JsonValue::Type::Bool: return boolValue(v.boolValue);
  case JsonValue::Type::Number: return numberValue(v.numberValue);
  case JsonValue::Type::String: return stringValue(v.stringValue);
  case JsonValue::Type::Array:
    if (!beginArray()) return false;
    for (const JsonValue& item : v.arrayValue) {
      if (!value(item)) return false;
    }
    return endArray();
  case JsonValue::Type::Object:
    if (!beginObject()) return false;
    for (const auto& kv : v.objectValue) {
      if (!key(kv.first) || !value(kv.second)) return false;
    }
    return endObject();
  default: return fail("JsonWriter: unknown value type");
  }
}

} // namespace reconplan
