#include "llm_patch.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace llm_patch {

// ---------------- Json helpers ----------------

bool Json::is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
bool Json::is_bool() const { return std::holds_alternative<bool>(value); }
bool Json::is_number() const { return std::holds_alternative<double>(value); }
bool Json::is_string() const { return std::holds_alternative<std::string>(value); }
bool Json::is_array() const { return std::holds_alternative<JsonArray>(value); }
bool Json::is_object() const { return std::holds_alternative<JsonObject>(value); }

const bool& Json::as_bool() const { return std::get<bool>(value); }
const double& Json::as_number() const { return std::get<double>(value); }
const std::string& Json::as_string() const { return std::get<std::string>(value); }
const JsonArray& Json::as_array() const { return std::get<JsonArray>(value); }
const JsonObject& Json::as_object() const { return std::get<JsonObject>(value); }

JsonArray& Json::as_array() { return std::get<JsonArray>(value); }
JsonObject& Json::as_object() { return std::get<JsonObject>(value); }

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

static std::string ltrim_copy(const std::string& s) {
  size_t i = 0;
  while (i < s.size() && is_space(s[i])) i++;
  return s.substr(i);
}

static std::string rtrim_copy(const std::string& s) {
  size_t n = s.size();
  while (n > 0 && is_space(s[n - 1])) n--;
  return s.substr(0, n);
}

static std::string trim_copy(const std::string& s) { return rtrim_copy(ltrim_copy(s)); }

static std::string leading_whitespace(const std::string& s) {
  size_t i = 0;
  while (i < s.size() && is_space(s[i])) i++;
  return s.substr(0, i);
}

// Splits on \n, dropping a \r that directly precedes it. A lone \r stays part of the line.
static std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::string cur;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') continue;
    if (c == '\n') {
      lines.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  lines.push_back(cur);
  return lines;
}

static std::string join_lines(std::vector<std::string>::const_iterator first,
                              std::vector<std::string>::const_iterator last,
                              const std::string& sep) {
  std::string out;
  for (auto it = first; it != last; ++it) {
    if (it != first) out += sep;
    out += *it;
  }
  return out;
}

static std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          std::ostringstream oss;
          oss << "\\u";
          oss.setf(std::ios::hex, std::ios::basefield);
          oss.width(4);
          oss.fill('0');
          oss << (static_cast<int>(static_cast<unsigned char>(c)));
          out += oss.str();
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

static std::string json_pointer_escape(const std::string& seg) {
  std::string out;
  out.reserve(seg.size());
  for (char c : seg) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string json_pointer_from_path(const std::string& json_path) {
  if (json_path.empty() || json_path[0] != '$') return "";

  std::vector<std::string> segs;
  size_t i = 1;
  while (i < json_path.size()) {
    char c = json_path[i];
    if (c == '.') {
      ++i;
      size_t start = i;
      while (i < json_path.size()) {
        char cc = json_path[i];
        if (cc == '.' || cc == '[') break;
        ++i;
      }
      if (i > start) segs.push_back(json_path.substr(start, i - start));
      continue;
    }
    if (c == '[') {
      ++i;
      size_t start = i;
      while (i < json_path.size() && json_path[i] != ']') ++i;
      if (i > start) segs.push_back(json_path.substr(start, i - start));
      if (i < json_path.size() && json_path[i] == ']') ++i;
      continue;
    }
    ++i;
  }

  std::string out;
  for (const auto& seg : segs) {
    out.push_back('/');
    out += json_pointer_escape(seg);
  }
  return out;
}

static std::string format_number(double n) {
  if (!std::isfinite(n)) return "null";
  double intpart;
  if (std::modf(n, &intpart) == 0.0) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(0);
    oss << n;
    return oss.str();
  }
  // Shortest of 15..17 significant digits that reads back as the same double.
  std::string out;
  for (int precision = 15; precision <= 17; ++precision) {
    std::ostringstream oss;
    oss.precision(precision);
    oss << n;
    out = oss.str();
    if (std::strtod(out.c_str(), nullptr) == n) break;
  }
  return out;
}

std::string dumps_json(const Json& value) {
  if (value.is_null()) return "null";
  if (value.is_bool()) return value.as_bool() ? "true" : "false";
  if (value.is_number()) return format_number(value.as_number());
  if (value.is_string()) return "\"" + json_escape(value.as_string()) + "\"";
  if (value.is_array()) {
    std::string out = "[";
    const auto& arr = value.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i) out += ",";
      out += dumps_json(arr[i]);
    }
    out += "]";
    return out;
  }
  const auto& obj = value.as_object();
  std::string out = "{";
  bool first = true;
  for (const auto& kv : obj) {
    if (!first) out += ",";
    first = false;
    out += "\"" + json_escape(kv.first) + "\":" + dumps_json(kv.second);
  }
  out += "}";
  return out;
}

static void dumps_pretty_impl(const Json& value, int indent, int depth, std::string& out) {
  const std::string pad(static_cast<size_t>(indent) * static_cast<size_t>(depth + 1), ' ');
  const std::string close_pad(static_cast<size_t>(indent) * static_cast<size_t>(depth), ' ');

  if (value.is_array()) {
    const auto& arr = value.as_array();
    if (arr.empty()) {
      out += "[]";
      return;
    }
    out += "[\n";
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i) out += ",\n";
      out += pad;
      dumps_pretty_impl(arr[i], indent, depth + 1, out);
    }
    out += "\n" + close_pad + "]";
    return;
  }
  if (value.is_object()) {
    const auto& obj = value.as_object();
    if (obj.empty()) {
      out += "{}";
      return;
    }
    out += "{\n";
    bool first = true;
    for (const auto& kv : obj) {
      if (!first) out += ",\n";
      first = false;
      out += pad + "\"" + json_escape(kv.first) + "\": ";
      dumps_pretty_impl(kv.second, indent, depth + 1, out);
    }
    out += "\n" + close_pad + "}";
    return;
  }
  out += dumps_json(value);
}

std::string dumps_json_pretty(const Json& value, int indent) {
  if (indent <= 0) return dumps_json(value);
  std::string out;
  dumps_pretty_impl(value, indent, 0, out);
  return out;
}

// ---------------- JSON parser ----------------

static void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
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

struct Parser {
  const std::string& s;
  size_t i{0};
  bool allow_single_quotes{false};
  JsonParseConfig::DuplicateKeyPolicy duplicate_key_policy{JsonParseConfig::DuplicateKeyPolicy::LastWins};
  size_t max_depth{512};
  size_t depth{0};

  Parser(const std::string& in, const JsonParseConfig& config)
      : s(in),
        allow_single_quotes(config.allow_single_quotes),
        duplicate_key_policy(config.duplicate_key_policy),
        max_depth(config.max_depth) {}

  void skip_ws() {
    while (i < s.size() && is_space(s[i])) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    throw std::runtime_error("JSON parse error: " + msg + " at offset " + std::to_string(i));
  }

  bool consume(char c) {
    skip_ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  Json parse_value() {
    skip_ws();
    if (i >= s.size()) fail("unexpected end");
    char c = s[i];
    if (c == '{' || c == '[') {
      if (++depth > max_depth) fail("nesting too deep (max_depth=" + std::to_string(max_depth) + ")");
      Json v = c == '{' ? parse_object() : parse_array();
      --depth;
      return v;
    }
    if (c == '"') return Json(parse_string());
    if (c == '\'') {
      if (!allow_single_quotes) fail("single-quoted strings are forbidden");
      return Json(parse_string());
    }
    if (c == 't') return parse_literal("true", Json(true));
    if (c == 'f') return parse_literal("false", Json(false));
    if (c == 'n') return parse_literal("null", Json(nullptr));
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return Json(parse_number());
    fail(std::string("unexpected char '") + c + "'");
  }

  Json parse_object() {
    if (!consume('{')) fail("expected {");
    JsonObject obj;
    skip_ws();
    if (consume('}')) return Json(obj);
    while (true) {
      skip_ws();
      if (i >= s.size()) fail("unterminated object");
      if (!(s[i] == '"' || s[i] == '\'')) fail("expected string key");
      std::string key = parse_string();
      if (!consume(':')) fail("expected :");
      Json val = parse_value();

      auto it = obj.find(key);
      if (it != obj.end()) {
        if (duplicate_key_policy == JsonParseConfig::DuplicateKeyPolicy::Error) fail("duplicate key '" + key + "'");
        if (duplicate_key_policy == JsonParseConfig::DuplicateKeyPolicy::LastWins) it->second = std::move(val);
      } else {
        obj.emplace(std::move(key), std::move(val));
      }
      if (consume('}')) break;
      if (!consume(',')) fail("expected , or }");
    }
    return Json(obj);
  }

  Json parse_array() {
    if (!consume('[')) fail("expected [");
    JsonArray arr;
    if (consume(']')) return Json(arr);
    while (true) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      if (!consume(',')) fail("expected , or ]");
    }
    return Json(arr);
  }

  uint32_t parse_hex4() {
    if (i + 4 > s.size()) fail("bad unicode escape");
    uint32_t cp = 0;
    for (int k = 0; k < 4; ++k) {
      char h = s[i++];
      cp <<= 4;
      if (h >= '0' && h <= '9') {
        cp |= static_cast<uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        cp |= static_cast<uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        cp |= static_cast<uint32_t>(h - 'A' + 10);
      } else {
        fail("bad unicode escape");
      }
    }
    return cp;
  }

  std::string parse_string() {
    skip_ws();
    if (i >= s.size()) fail("expected string");
    char q = s[i];
    if (q != '"' && q != '\'') fail("expected quote");
    if (q == '\'' && !allow_single_quotes) fail("single-quoted strings are forbidden");
    ++i;
    std::string out;
    while (i < s.size()) {
      char c = s[i++];
      if (c == q) return out;
      if (c == '\\') {
        if (i >= s.size()) fail("bad escape");
        char e = s[i++];
        switch (e) {
          case '"': out.push_back('"'); break;
          case '\'': out.push_back('\''); break;
          case '\\': out.push_back('\\'); break;
          case '/': out.push_back('/'); break;
          case 'b': out.push_back('\b'); break;
          case 'f': out.push_back('\f'); break;
          case 'n': out.push_back('\n'); break;
          case 'r': out.push_back('\r'); break;
          case 't': out.push_back('\t'); break;
          case 'u': {
            uint32_t cp = parse_hex4();
            if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
              i += 2;
              uint32_t lo = parse_hex4();
              if (lo >= 0xDC00 && lo <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
              } else {
                append_utf8(out, cp);
                cp = lo;
              }
            }
            append_utf8(out, cp);
            break;
          }
          default:
            fail(std::string("bad escape '\\") + e + "'");
        }
      } else {
        if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
        out.push_back(c);
      }
    }
    fail("unterminated string");
  }

  double parse_number() {
    size_t start = i;
    if (s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("bad number");
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i < s.size() && s[i] == '.') {
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("bad number");
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("bad number");
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    std::string num = s.substr(start, i - start);
    return std::strtod(num.c_str(), nullptr);
  }

  Json parse_literal(const char* word, Json value) {
    const std::string w(word);
    if (s.compare(i, w.size(), w) == 0) {
      i += w.size();
      return value;
    }
    fail("expected " + w);
  }
};

Json loads_json(const std::string& text, const JsonParseConfig& config) {
  Parser p(text, config);
  Json v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("trailing data");
  return v;
}

// ---------------- Similarity ----------------

size_t levenshtein_distance(const std::string& a, const std::string& b) {
  const std::string& shorter = a.size() < b.size() ? a : b;
  const std::string& longer = a.size() < b.size() ? b : a;
  if (shorter.empty()) return longer.size();

  std::vector<size_t> prev(shorter.size() + 1);
  std::vector<size_t> cur(shorter.size() + 1);
  for (size_t j = 0; j <= shorter.size(); ++j) prev[j] = j;

  for (size_t i = 1; i <= longer.size(); ++i) {
    cur[0] = i;
    for (size_t j = 1; j <= shorter.size(); ++j) {
      const size_t cost = longer[i - 1] == shorter[j - 1] ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[shorter.size()];
}

double similarity(const std::string& original, const std::string& search) {
  if (search.empty()) return 0.0;

  const std::string a = trim_copy(to_lower(original));
  const std::string b = trim_copy(to_lower(search));
  if (a == b) return 1.0;

  // a != b, so at least one side is non-empty.
  const size_t longest = std::max(a.size(), b.size());
  return 1.0 - static_cast<double>(levenshtein_distance(a, b)) / static_cast<double>(longest);
}

// ---------------- Locator ----------------

MatchCandidate locate(const std::vector<std::string>& lines,
                      const std::string& search_chunk,
                      int range_start,
                      int range_end) {
  MatchCandidate best;
  const int height = static_cast<int>(split_lines(search_chunk).size());
  best.height_lines = height;

  range_start = std::max(range_start, 0);
  range_end = std::min(range_end, static_cast<int>(lines.size()));
  if (range_end - range_start < height) return best;

  const int last = range_end - height;
  auto consider = [&](int start) {
    const auto first = lines.begin() + start;
    const double score = similarity(join_lines(first, first + height, "\n"), search_chunk);
    if (score > best.score) {
      best.score = score;
      best.start_line = start;
    }
  };

  const int mid = (range_start + range_end) / 2;
  int left = mid;
  int right = mid + 1;
  while (left >= range_start || right <= last) {
    if (left >= range_start) {
      if (left <= last) consider(left);
      --left;
    }
    if (right <= last) {
      consider(right);
      ++right;
    }
  }
  return best;
}

// ---------------- Hunks ----------------

static const char* const kSearchMarker = "<<<<<<< SEARCH";
static const char* const kSeparatorMarker = "=======";
static const char* const kReplaceMarker = ">>>>>>> REPLACE";

static bool is_marker(const std::string& line, const char* marker) { return rtrim_copy(line) == marker; }

std::vector<Hunk> parse_hunks(const std::string& diff_text) {
  enum class Section { None, Search, Replace };

  std::vector<Hunk> hunks;
  const auto lines = split_lines(diff_text);
  Section section = Section::None;
  std::vector<std::string> search;
  std::vector<std::string> replace;
  int marker_line = 0;

  for (size_t idx = 0; idx < lines.size(); ++idx) {
    const std::string& line = lines[idx];
    switch (section) {
      case Section::None:
        if (is_marker(line, kSearchMarker)) {
          section = Section::Search;
          marker_line = static_cast<int>(idx) + 1;
          search.clear();
          replace.clear();
        }
        break;
      case Section::Search:
        if (is_marker(line, kSeparatorMarker)) {
          section = Section::Replace;
        } else {
          search.push_back(line);
        }
        break;
      case Section::Replace:
        if (is_marker(line, kReplaceMarker)) {
          Hunk h;
          h.search = join_lines(search.begin(), search.end(), "\n");
          h.replace = join_lines(replace.begin(), replace.end(), "\n");
          h.line = marker_line;
          hunks.push_back(std::move(h));
          section = Section::None;
        } else {
          replace.push_back(line);
        }
        break;
    }
  }
  return hunks;
}

std::string create_diff_template(const std::string& search_content, const std::string& replace_content) {
  return std::string(kSearchMarker) + "\n" + search_content + "\n" + kSeparatorMarker + "\n" + replace_content + "\n" +
         kReplaceMarker;
}

std::vector<DiffIssue> lint_diff(const std::string& diff_text) {
  enum class Section { None, Search, Replace };

  std::vector<DiffIssue> issues;
  const auto lines = split_lines(diff_text);
  Section section = Section::None;
  int open_line = 0;
  int blocks = 0;

  for (size_t idx = 0; idx < lines.size(); ++idx) {
    const int line_no = static_cast<int>(idx) + 1;
    const std::string line = trim_copy(lines[idx]);
    const bool marker = line == kSearchMarker || line == kSeparatorMarker || line == kReplaceMarker;

    if (marker && is_space(lines[idx][0])) {
      issues.push_back({line_no, "marker is indented and will not be recognized"});
      continue;
    }

    if (line == kSearchMarker) {
      if (section != Section::None) {
        issues.push_back({line_no, "SEARCH marker inside an open block (opened at line " + std::to_string(open_line) + ")"});
      }
      section = Section::Search;
      open_line = line_no;
      ++blocks;
    } else if (line == kSeparatorMarker) {
      if (section != Section::Search) {
        issues.push_back({line_no, "separator without a preceding SEARCH marker"});
      }
      section = Section::Replace;
    } else if (line == kReplaceMarker) {
      if (section != Section::Replace) {
        issues.push_back({line_no, "REPLACE marker without a separator"});
      }
      section = Section::None;
    } else if (line.find("<<<<<<<") != std::string::npos || line.find(">>>>>>>") != std::string::npos) {
      issues.push_back({line_no, "stray conflict marker"});
    }
  }

  if (section != Section::None) {
    issues.push_back({open_line, "block is not closed; expected >>>>>>> REPLACE"});
  }
  if (blocks == 0) {
    issues.push_back({0, "no SEARCH/REPLACE blocks found"});
  }
  return issues;
}

// ---------------- Line buffer ----------------

LineBuffer split_document(const std::string& text) {
  LineBuffer buffer;
  buffer.lines = split_lines(text);
  buffer.line_ending = text.find("\r\n") != std::string::npos ? "\r\n" : "\n";
  return buffer;
}

std::string join_document(const LineBuffer& buffer) {
  return join_lines(buffer.lines.begin(), buffer.lines.end(), buffer.line_ending);
}

// ---------------- Configuration ----------------

PatchConfig patch_config_from_json(const Json& value) {
  if (!value.is_object()) throw ValidationError("patch config must be an object", "$", "config");

  PatchConfig config;
  const auto& obj = value.as_object();

  auto it = obj.find("fuzzyThreshold");
  if (it != obj.end()) {
    if (!it->second.is_number()) throw ValidationError("expected number", "$.fuzzyThreshold", "config");
    const double t = it->second.as_number();
    if (!(t >= 0.0 && t <= 1.0)) {
      throw ValidationError("fuzzyThreshold must be within [0, 1]", "$.fuzzyThreshold", "config");
    }
    config.fuzzy_threshold = t;
  }

  it = obj.find("preserveIndentation");
  if (it != obj.end()) {
    if (!it->second.is_bool()) throw ValidationError("expected boolean", "$.preserveIndentation", "config");
    config.preserve_indentation = it->second.as_bool();
  }
  return config;
}

// ---------------- Patch application ----------------

const char* patch_error_kind_name(PatchErrorKind kind) {
  switch (kind) {
    case PatchErrorKind::None: return "NONE";
    case PatchErrorKind::InvalidFormat: return "INVALID_FORMAT";
    case PatchErrorKind::NoConfidentMatch: return "NO_CONFIDENT_MATCH";
    case PatchErrorKind::ParsingError: return "PARSING_ERROR";
    case PatchErrorKind::StructureError: return "STRUCTURE_ERROR";
  }
  return "NONE";
}

static int whole_percent(double x) { return static_cast<int>(std::floor(x * 100.0)); }

PatchApplier::PatchApplier(const std::string& original, std::vector<Hunk> hunks, PatchConfig config)
    : buffer_(split_document(original)), hunks_(std::move(hunks)), config_(config) {}

bool PatchApplier::step() {
  if (state_ == State::Succeeded || state_ == State::Failed) return false;
  state_ = State::Applying;

  if (next_ < hunks_.size()) {
    const Hunk& hunk = hunks_[next_];
    const std::string search = trim_copy(hunk.search);

    AppliedHunk record;
    record.index = next_;

    if (search == trim_copy(hunk.replace)) {
      record.noop = true;
    } else {
      const MatchCandidate match = locate(buffer_.lines, search, 0, static_cast<int>(buffer_.lines.size()));
      if (match.start_line == -1 || match.score < config_.fuzzy_threshold) {
        fail(match.score);
        return false;
      }

      std::vector<std::string> incoming = replacement_lines(hunk, match.start_line);
      auto at = buffer_.lines.begin() + match.start_line;
      at = buffer_.lines.erase(at, at + match.height_lines);
      buffer_.lines.insert(at, incoming.begin(), incoming.end());

      record.start_line = match.start_line;
      record.removed_lines = match.height_lines;
      record.inserted_lines = static_cast<int>(incoming.size());
      record.score = match.score;
    }

    applied_.push_back(record);
    ++next_;
  }

  if (next_ < hunks_.size()) return true;

  state_ = State::Succeeded;
  result_ = PatchResult{};
  result_.success = true;
  result_.content = join_document(buffer_);
  result_.applied = applied_;
  return false;
}

PatchResult PatchApplier::run() {
  while (step()) {
  }
  return result_;
}

std::vector<std::string> PatchApplier::replacement_lines(const Hunk& hunk, int start_line) const {
  if (trim_copy(hunk.replace).empty()) return {};

  std::vector<std::string> out = split_lines(hunk.replace);
  if (!config_.preserve_indentation) return out;

  const std::string target = leading_whitespace(buffer_.lines[static_cast<size_t>(start_line)]);
  std::string base;
  for (const auto& line : out) {
    if (!trim_copy(line).empty()) {
      base = leading_whitespace(line);
      break;
    }
  }
  if (base == target) return out;

  for (auto& line : out) {
    if (trim_copy(line).empty()) continue;
    if (line.compare(0, base.size(), base) == 0) {
      line = target + line.substr(base.size());
    } else {
      line = target + ltrim_copy(line);
    }
  }
  return out;
}

void PatchApplier::fail(double score) {
  state_ = State::Failed;
  result_ = PatchResult{};
  result_.success = false;
  result_.kind = PatchErrorKind::NoConfidentMatch;
  result_.failed_hunk = next_;
  result_.best_score = score;
  result_.error = "No sufficiently similar match found (" + std::to_string(whole_percent(score)) + "% similar, needs " +
                  std::to_string(whole_percent(config_.fuzzy_threshold)) + "%)";
  applied_.clear();
  buffer_.lines.clear();
}

PatchResult apply_diff(const std::string& original_content, const std::string& diff_content, double fuzzy_threshold) {
  PatchConfig config;
  config.fuzzy_threshold = fuzzy_threshold;
  return apply_diff(original_content, diff_content, config);
}

PatchResult apply_diff(const std::string& original_content, const std::string& diff_content, const PatchConfig& config) {
  std::vector<Hunk> hunks = parse_hunks(diff_content);
  if (hunks.empty()) {
    PatchResult r;
    r.kind = PatchErrorKind::InvalidFormat;
    r.error = "Invalid diff format - missing required SEARCH/REPLACE sections";
    return r;
  }
  PatchApplier applier(original_content, std::move(hunks), config);
  return applier.run();
}

// ---------------- Structure validation ----------------

static std::optional<std::string> get_string_field(const JsonObject& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (!it->second.is_string()) return std::nullopt;
  return it->second.as_string();
}

static const JsonObject& require_object_schema(const Json& schema, const std::string& path) {
  if (!schema.is_object()) throw ValidationError("schema must be object", path);
  return schema.as_object();
}

struct ValidateOptions {
  bool collect_all{false};
  std::vector<ValidationError>* errors{nullptr};
};

static bool report_or_throw(
    const ValidateOptions& opt, const std::string& message, const std::string& path, const std::string& kind = "schema") {
  if (opt.collect_all && opt.errors) {
    opt.errors->emplace_back(message, path, kind);
    return false;
  }
  throw ValidationError(message, path, kind);
}

static bool matches_type(const Json& value, const std::string& ty) {
  if (ty == "null") return value.is_null();
  if (ty == "boolean") return value.is_bool();
  if (ty == "number") return value.is_number();
  if (ty == "integer") {
    if (!value.is_number() || !std::isfinite(value.as_number())) return false;
    double ip;
    return std::fabs(std::modf(value.as_number(), &ip)) <= 1e-12;
  }
  if (ty == "string") return value.is_string();
  if (ty == "array") return value.is_array();
  if (ty == "object") return value.is_object();
  return true;
}

static void validate_impl(const Json& value, const Json& schema, const std::string& path, const ValidateOptions& opt) {
  const auto& sch = require_object_schema(schema, path);

  // enum
  {
    auto it = sch.find("enum");
    if (it != sch.end() && it->second.is_array()) {
      const std::string dumped = dumps_json(value);
      bool ok = false;
      for (const auto& v : it->second.as_array()) {
        if (dumps_json(v) == dumped) {
          ok = true;
          break;
        }
      }
      if (!ok) {
        if (!report_or_throw(opt, "value not in enum", path)) return;
      }
    }
  }

  // type
  if (auto t = get_string_field(sch, "type")) {
    const std::string ty = to_lower(*t);
    if (!matches_type(value, ty)) {
      report_or_throw(opt, "expected " + ty, path, "type");
      return;
    }
  }

  if (value.is_array()) {
    const auto& arr = value.as_array();
    auto it_items = sch.find("items");
    if (it_items != sch.end() && it_items->second.is_object()) {
      for (size_t idx = 0; idx < arr.size(); ++idx) {
        validate_impl(arr[idx], it_items->second, path + "[" + std::to_string(idx) + "]", opt);
      }
    }
  }

  if (value.is_object()) {
    const auto& obj = value.as_object();

    auto it_req = sch.find("required");
    if (it_req != sch.end() && it_req->second.is_array()) {
      for (const auto& k : it_req->second.as_array()) {
        if (!k.is_string()) continue;
        if (obj.find(k.as_string()) == obj.end()) {
          report_or_throw(opt, "missing required property: " + k.as_string(), path + "." + k.as_string());
        }
      }
    }

    auto it_props = sch.find("properties");
    if (it_props != sch.end() && it_props->second.is_object()) {
      const auto& props = it_props->second.as_object();
      for (const auto& kv : obj) {
        auto p = props.find(kv.first);
        if (p != props.end()) validate_impl(kv.second, p->second, path + "." + kv.first, opt);
      }
    }
  }
}

void validate(const Json& value, const Json& schema, const std::string& path) {
  ValidateOptions opt;
  validate_impl(value, schema, path, opt);
}

std::vector<ValidationError> validate_all(const Json& value, const Json& schema, const std::string& path) {
  std::vector<ValidationError> errors;
  ValidateOptions opt;
  opt.collect_all = true;
  opt.errors = &errors;
  validate_impl(value, schema, path, opt);
  return errors;
}

static Json typed(const char* type) { return Json(JsonObject{{"type", Json(type)}}); }

Json node_definition_schema() {
  JsonObject props;
  props["type"] = typed("string");
  props["name"] = typed("string");
  props["description"] = typed("string");
  props["inputs"] = typed("array");
  props["outputs"] = typed("array");
  props["parameters"] = typed("array");
  props["executeCode"] = typed("string");

  return Json(JsonObject{
      {"type", Json("object")},
      {"required",
       JsonArray{Json("type"), Json("name"), Json("description"), Json("inputs"), Json("outputs"),
                 Json("parameters"), Json("executeCode")}},
      {"properties", Json(props)},
  });
}

Json scene_schema() {
  JsonObject props;
  props["nodes"] = typed("array");
  props["edges"] = typed("array");

  return Json(JsonObject{
      {"type", Json("object")},
      {"required", JsonArray{Json("nodes"), Json("edges")}},
      {"properties", Json(props)},
  });
}

std::vector<ValidationError> validate_node_structure(const Json& node) { return validate_all(node, node_definition_schema()); }

std::vector<ValidationError> validate_scene_structure(const Json& scene) { return validate_all(scene, scene_schema()); }

// JavaScript truthiness of a member; absent counts as false.
static bool has_truthy(const JsonObject& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return false;
  const Json& v = it->second;
  if (v.is_null()) return false;
  if (v.is_bool()) return v.as_bool();
  if (v.is_number()) return v.as_number() != 0.0 && !std::isnan(v.as_number());
  if (v.is_string()) return !v.as_string().empty();
  return true;
}

SceneReport check_scene(const Json& scene) {
  SceneReport report;
  if (!scene.is_object()) {
    report.errors.push_back("Scene must be a valid JSON object");
    return report;
  }
  const auto& obj = scene.as_object();

  auto nodes = obj.find("nodes");
  const bool nodes_ok = nodes != obj.end() && nodes->second.is_array();
  if (!nodes_ok) report.errors.push_back("Scene must have a nodes array");

  auto edges = obj.find("edges");
  const bool edges_ok = edges != obj.end() && edges->second.is_array();
  if (!edges_ok) report.errors.push_back("Scene must have an edges array");

  if (nodes_ok) {
    const auto& arr = nodes->second.as_array();
    for (size_t idx = 0; idx < arr.size(); ++idx) {
      const std::string label = "Node " + std::to_string(idx);
      if (!arr[idx].is_object()) {
        report.errors.push_back(label + " must be an object");
        continue;
      }
      const auto& node = arr[idx].as_object();
      if (!has_truthy(node, "id")) report.errors.push_back(label + " missing id");
      if (!has_truthy(node, "type")) report.errors.push_back(label + " missing type");
      if (!has_truthy(node, "position")) report.errors.push_back(label + " missing position");
      if (!has_truthy(node, "data")) report.errors.push_back(label + " missing data");

      auto pos = node.find("position");
      if (has_truthy(node, "position")) {
        const Json& p = pos->second;
        bool numeric = false;
        if (p.is_object()) {
          const auto& po = p.as_object();
          auto x = po.find("x");
          auto y = po.find("y");
          numeric = x != po.end() && x->second.is_number() && y != po.end() && y->second.is_number();
        }
        if (!numeric) report.errors.push_back(label + " position must have numeric x and y values");
      }
    }
  }

  if (edges_ok) {
    const auto& arr = edges->second.as_array();
    for (size_t idx = 0; idx < arr.size(); ++idx) {
      const std::string label = "Edge " + std::to_string(idx);
      if (!arr[idx].is_object()) {
        report.errors.push_back(label + " must be an object");
        continue;
      }
      const auto& edge = arr[idx].as_object();
      if (!has_truthy(edge, "id")) report.errors.push_back(label + " missing id");
      if (!has_truthy(edge, "source")) report.errors.push_back(label + " missing source");
      if (!has_truthy(edge, "target")) report.errors.push_back(label + " missing target");
      if (!has_truthy(edge, "sourceHandle")) report.warnings.push_back(label + " missing sourceHandle");
      if (!has_truthy(edge, "targetHandle")) report.warnings.push_back(label + " missing targetHandle");
    }
  }

  report.success = report.errors.empty();
  return report;
}

// ---------------- Node / scene diffs ----------------

using StructureCheck = std::vector<ValidationError> (*)(const Json&);

static JsonDiffResult apply_document_diff(const Json& original,
                                          const std::string& diff_content,
                                          const PatchConfig& config,
                                          const std::string& noun,
                                          StructureCheck check) {
  JsonDiffResult out;
  out.patch = apply_diff(dumps_json_pretty(original, 2), diff_content, config);
  if (!out.patch.success) {
    out.kind = out.patch.kind;
    out.error = out.patch.error;
    return out;
  }

  Json modified;
  try {
    modified = loads_json(*out.patch.content);
  } catch (const std::exception& e) {
    out.kind = PatchErrorKind::ParsingError;
    out.error = "Failed to apply " + noun + " diff: " + e.what();
    return out;
  }

  out.issues = check(modified);
  if (!out.issues.empty()) {
    out.kind = PatchErrorKind::StructureError;
    out.error = "Modified JSON does not match required " + noun + " structure";
    return out;
  }

  out.success = true;
  out.value = std::move(modified);
  return out;
}

JsonDiffResult apply_node_diff(const Json& original_node, const std::string& diff_content, const PatchConfig& config) {
  return apply_document_diff(original_node, diff_content, config, "node", &validate_node_structure);
}

JsonDiffResult apply_scene_diff(const Json& original_scene, const std::string& diff_content, const PatchConfig& config) {
  return apply_document_diff(original_scene, diff_content, config, "scene", &validate_scene_structure);
}

}  // namespace llm_patch
