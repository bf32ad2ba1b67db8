#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace llm_patch {

struct ValidationError : public std::runtime_error {
  std::string path;
  std::string message;
  std::string kind;  // schema | type | parse | config
  explicit ValidationError(std::string message, std::string path_ = "$", std::string kind_ = "schema")
      : std::runtime_error(message), path(std::move(path_)), message(std::move(message)), kind(std::move(kind_)) {}

  const char* what() const noexcept override { return message.c_str(); }
};

// Best-effort conversion from a JSONPath-ish string like "$.nodes[0].id" to a JSON Pointer like "/nodes/0/id".
std::string json_pointer_from_path(const std::string& json_path);

// ---------------- Json ----------------

struct Json;
using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

struct Json {
  using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;
  Value value;

  Json() : value(nullptr) {}
  Json(std::nullptr_t) : value(nullptr) {}
  Json(bool b) : value(b) {}
  Json(double n) : value(n) {}
  Json(int64_t n) : value(static_cast<double>(n)) {}
  Json(std::string s) : value(std::move(s)) {}
  Json(const char* s) : value(std::string(s)) {}
  Json(JsonArray a) : value(std::move(a)) {}
  Json(JsonObject o) : value(std::move(o)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool& as_bool() const;
  const double& as_number() const;
  const std::string& as_string() const;
  const JsonArray& as_array() const;
  const JsonObject& as_object() const;

  JsonArray& as_array();
  JsonObject& as_object();
};

struct JsonParseConfig {
  // Strict by default: patched documents must be plain JSON.
  bool allow_single_quotes{false};

  enum class DuplicateKeyPolicy {
    Error,
    FirstWins,
    LastWins,
  };

  DuplicateKeyPolicy duplicate_key_policy{DuplicateKeyPolicy::LastWins};

  // Objects and arrays nested deeper than this are rejected as a parse error.
  size_t max_depth{512};
};

// Parses a complete JSON document. Throws std::runtime_error("JSON parse error: ...") on malformed input.
Json loads_json(const std::string& text, const JsonParseConfig& config = JsonParseConfig{});

// Compact serialization.
std::string dumps_json(const Json& value);

// Multi-line serialization with `indent` spaces per level; empty containers print as {} and [].
std::string dumps_json_pretty(const Json& value, int indent = 2);

// ---------------- Similarity ----------------

// Unit-cost Levenshtein distance over bytes.
size_t levenshtein_distance(const std::string& a, const std::string& b);

// Normalized similarity in [0,1] between a document fragment and a search fragment.
// An empty search scores 0; case-insensitive, outer-whitespace-trimmed equality scores 1.
double similarity(const std::string& original, const std::string& search);

// ---------------- Locator ----------------

struct MatchCandidate {
  double score{0.0};
  int start_line{-1};  // -1 when no window was found
  int height_lines{0};
};

// Finds the best window of the search chunk's height inside lines[range_start, range_end),
// scanning outward from the middle of the range.
MatchCandidate locate(const std::vector<std::string>& lines,
                      const std::string& search_chunk,
                      int range_start,
                      int range_end);

// ---------------- Hunks ----------------

struct Hunk {
  std::string search;
  std::string replace;
  int line{0};  // 1-based line of the SEARCH marker in the patch document
};

// Extracts every <<<<<<< SEARCH / ======= / >>>>>>> REPLACE block in document order.
std::vector<Hunk> parse_hunks(const std::string& diff_text);

// Formats a single well-formed hunk block.
std::string create_diff_template(const std::string& search_content, const std::string& replace_content);

struct DiffIssue {
  int line{0};  // 1-based, 0 when the issue concerns the whole document
  std::string message;
};

// Checks marker sequencing. Advisory only: apply_diff does not consult it.
std::vector<DiffIssue> lint_diff(const std::string& diff_text);

// ---------------- Line buffer ----------------

struct LineBuffer {
  std::vector<std::string> lines;
  std::string line_ending{"\n"};
};

// Splits on \r\n or \n; the line ending is \r\n when the text contains one anywhere.
LineBuffer split_document(const std::string& text);
std::string join_document(const LineBuffer& buffer);

// ---------------- Configuration ----------------

struct PatchConfig {
  // Minimum similarity (0..1) a located window needs to be accepted.
  double fuzzy_threshold{0.8};
  // Re-indent replacement lines to the indentation of the matched block.
  bool preserve_indentation{true};
};

// Reads {"fuzzyThreshold": number, "preserveIndentation": bool}. Unknown keys are ignored.
// Throws ValidationError (kind "config") on a field of the wrong type or out of range.
PatchConfig patch_config_from_json(const Json& value);

// ---------------- Patch application ----------------

enum class PatchErrorKind {
  None,
  InvalidFormat,
  NoConfidentMatch,
  ParsingError,
  StructureError,
};

// INVALID_FORMAT | NO_CONFIDENT_MATCH | PARSING_ERROR | STRUCTURE_ERROR | NONE
const char* patch_error_kind_name(PatchErrorKind kind);

struct AppliedHunk {
  size_t index{0};
  bool noop{false};
  int start_line{-1};
  int removed_lines{0};
  int inserted_lines{0};
  double score{0.0};
};

struct PatchResult {
  bool success{false};
  std::optional<std::string> content;
  std::optional<std::string> error;
  PatchErrorKind kind{PatchErrorKind::None};
  std::optional<size_t> failed_hunk;
  std::vector<AppliedHunk> applied;  // filled on success only
  double best_score{0.0};            // score of the failing hunk's best window
};

// Applies hunks one at a time against a single line buffer.
// Ready -> Applying(i) -> Succeeded | Failed. A failure discards every earlier edit.
class PatchApplier {
 public:
  enum class State { Ready, Applying, Succeeded, Failed };

  PatchApplier(const std::string& original, std::vector<Hunk> hunks, PatchConfig config = PatchConfig{});

  // Processes the next hunk. Returns false once a terminal state is reached.
  bool step();
  PatchResult run();

  State state() const { return state_; }
  size_t hunk_index() const { return next_; }
  const std::vector<std::string>& lines() const { return buffer_.lines; }

 private:
  std::vector<std::string> replacement_lines(const Hunk& hunk, int start_line) const;
  void fail(double score);

  LineBuffer buffer_;
  std::vector<Hunk> hunks_;
  PatchConfig config_;
  State state_{State::Ready};
  size_t next_{0};
  std::vector<AppliedHunk> applied_;
  PatchResult result_;
};

PatchResult apply_diff(const std::string& original_content, const std::string& diff_content, double fuzzy_threshold = 0.8);
PatchResult apply_diff(const std::string& original_content, const std::string& diff_content, const PatchConfig& config);

// ---------------- Structure validation ----------------

// Validate a Json value against the supported JSON-schema subset: type, required, properties, items, enum.
void validate(const Json& value, const Json& schema, const std::string& path = "$");

// Collect-all variant: returns a list of validation failures (empty means valid).
std::vector<ValidationError> validate_all(const Json& value, const Json& schema, const std::string& path = "$");

Json node_definition_schema();
Json scene_schema();

std::vector<ValidationError> validate_node_structure(const Json& node);
std::vector<ValidationError> validate_scene_structure(const Json& scene);

struct SceneReport {
  bool success{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Per-node and per-edge checks of a scene graph (ids, endpoints, positions, handles).
SceneReport check_scene(const Json& scene);

// ---------------- Node / scene diffs ----------------

struct JsonDiffResult {
  bool success{false};
  std::optional<Json> value;
  std::optional<std::string> error;
  PatchErrorKind kind{PatchErrorKind::None};
  std::vector<ValidationError> issues;  // structural findings when kind == StructureError
  PatchResult patch;
};

JsonDiffResult apply_node_diff(const Json& original_node, const std::string& diff_content, const PatchConfig& config = PatchConfig{});
JsonDiffResult apply_scene_diff(const Json& original_scene, const std::string& diff_content, const PatchConfig& config = PatchConfig{});

}  // namespace llm_patch
