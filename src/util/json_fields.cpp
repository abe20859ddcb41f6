#include "model_cache/json_fields.hpp"

#include <regex>

namespace model_cache {

std::optional<std::string> json_string(const std::string &json,
                                       const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  const std::string raw = m[1].str();
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\\' && i + 1 < raw.size()) {
      const char c = raw[++i];
      out.push_back(c == 'n' ? '\n' : c == 't' ? '\t' : c);
      continue;
    }
    out.push_back(raw[i]);
  }
  return out;
}

std::optional<std::uint64_t> json_u64(const std::string &json,
                                      const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  try {
    return static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<std::int64_t> json_i64(const std::string &json,
                                     const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  try {
    return static_cast<std::int64_t>(std::stoll(m[1].str()));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<bool> json_bool(const std::string &json, const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  return m[1].str() == "true";
}

bool looks_like_json_object(const std::string &text) {
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  return open != std::string::npos && close != std::string::npos &&
         open < close;
}

std::string json_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(c);
    }
  }
  return out;
}

} // namespace model_cache
