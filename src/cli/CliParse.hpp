#pragma once

// Strict argument parsing shared by the reconplan tools.
//
// Every helper rejects partial parses ("12abc"), and the float helpers reject
// inf/nan, so a typo on the command line fails loudly instead of silently
// planning with a wrong budget.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace reconplan::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  // std::from_chars does not accept a leading '+'.
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0) return false;
  if (!end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  std::string t(s);
  for (char& c : t) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (t == "0" || t == "false" || t == "off" || t == "no") {
    *out = false;
    return true;
  }
  if (t == "1" || t == "true" || t == "on" || t == "yes") {
    *out = true;
    return true;
  }
  return false;
}

// "a, b,,c" -> {"a", "b", "c"}
inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    if (c == ' ' || c == '\t') continue;
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

// "0.4,0.2,0.2" -> {0.4, 0.2, 0.2}. Fails on an empty list or any bad item.
inline bool ParseF64List(std::string_view s, std::vector<double>* out)
{
  if (!out) return false;
  const std::vector<std::string> items = SplitCommaList(s);
  if (items.empty()) return false;

  std::vector<double> v;
  v.reserve(items.size());
  for (const std::string& it : items) {
    double d = 0.0;
    if (!ParseF64(it, &d)) return false;
    v.push_back(d);
  }
  *out = std::move(v);
  return true;
}

} // namespace reconplan::cli
