#include "llm_patch.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace llm_patch;

static std::string hunk(const std::string& search, const std::string& replace) {
  return create_diff_template(search, replace);
}

static bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// ---------------- Similarity / locator ----------------

static void test_levenshtein_distance() {
  assert(levenshtein_distance("kitten", "sitting") == 3);
  assert(levenshtein_distance("", "abc") == 3);
  assert(levenshtein_distance("abc", "abc") == 0);
}

static void test_similarity_normalization() {
  assert(similarity(" ABC ", "abc") == 1.0);
  assert(similarity("abc", "") == 0.0);
  assert(similarity("", "") == 0.0);
  assert(std::fabs(similarity("abcd", "abcX") - 0.75) < 1e-12);
  assert(similarity("xyz", "abc") == 0.0);
}

static void test_locate_prefers_center() {
  std::vector<std::string> lines = {"x", "dup", "y", "dup", "z"};
  MatchCandidate m = locate(lines, "dup", 0, 5);
  assert(m.start_line == 3);
  assert(m.score == 1.0);
  assert(m.height_lines == 1);
}

static void test_locate_multi_line_window() {
  std::vector<std::string> lines = {"one", "two", "three", "four"};
  MatchCandidate m = locate(lines, "two\nthree", 0, 4);
  assert(m.start_line == 1);
  assert(m.height_lines == 2);
  assert(m.score == 1.0);
}

static void test_locate_range_too_small() {
  std::vector<std::string> lines = {"a"};
  MatchCandidate m = locate(lines, "a\nb", 0, 1);
  assert(m.start_line == -1);
  assert(m.score == 0.0);

  // Every window scoring 0 is reported as not found.
  std::vector<std::string> other = {"abc", "abc"};
  assert(locate(other, "xyz", 0, 2).start_line == -1);
}

static void test_locate_skips_truncated_tail() {
  // A window starting at "target" would hold one line of a two-line search.
  std::vector<std::string> lines = {"a", "b", "target"};
  MatchCandidate m = locate(lines, "target\nx", 0, 3);
  assert(m.start_line == 1);
  assert(m.height_lines == 2);
  assert(std::fabs(m.score - 0.5) < 1e-12);
}

// ---------------- Hunks ----------------

static void test_parse_hunks_order_and_lines() {
  std::string diff =
      "intro text\n"
      "<<<<<<< SEARCH  \n"
      "foo\n"
      "=======\n"
      "bar\n"
      ">>>>>>> REPLACE\n"
      "between\n"
      "<<<<<<< SEARCH\n"
      "one\n"
      "two\n"
      "=======\n"
      "three\n"
      ">>>>>>> REPLACE\n"
      "<<<<<<< SEARCH\n"
      "never closed\n"
      "=======\n";

  auto hunks = parse_hunks(diff);
  assert(hunks.size() == 2);
  assert(hunks[0].search == "foo");
  assert(hunks[0].replace == "bar");
  assert(hunks[0].line == 2);
  assert(hunks[1].search == "one\ntwo");
  assert(hunks[1].replace == "three");
  assert(hunks[1].line == 8);
}

static void test_parse_hunks_crlf() {
  auto hunks = parse_hunks("<<<<<<< SEARCH\r\nb\r\n=======\r\nB\r\n>>>>>>> REPLACE\r\n");
  assert(hunks.size() == 1);
  assert(hunks[0].search == "b");
  assert(hunks[0].replace == "B");
}

static void test_create_diff_template() {
  assert(hunk("a", "b") == "<<<<<<< SEARCH\na\n=======\nb\n>>>>>>> REPLACE");
  auto hunks = parse_hunks(hunk("a", "b"));
  assert(hunks.size() == 1);
  assert(hunks[0].search == "a");
  assert(hunks[0].replace == "b");
}

static void test_lint_diff() {
  assert(lint_diff(hunk("a", "b")).empty());

  auto missing_separator = lint_diff("<<<<<<< SEARCH\na\n>>>>>>> REPLACE");
  assert(missing_separator.size() == 1);
  assert(missing_separator[0].line == 3);
  assert(contains(missing_separator[0].message, "without a separator"));

  auto unclosed = lint_diff("<<<<<<< SEARCH\na\n=======\nb");
  assert(unclosed.size() == 1);
  assert(unclosed[0].line == 1);
  assert(contains(unclosed[0].message, "not closed"));

  auto empty = lint_diff("just prose");
  assert(empty.size() == 1);
  assert(empty[0].line == 0);

  auto nested = lint_diff("<<<<<<< SEARCH\na\n<<<<<<< SEARCH\nb\n=======\nc\n>>>>>>> REPLACE");
  assert(nested.size() == 1);
  assert(nested[0].line == 3);

  auto indented = lint_diff("  <<<<<<< SEARCH\na\n=======\nb\n>>>>>>> REPLACE");
  bool saw_indented = false;
  for (const auto& issue : indented) {
    if (issue.line == 1 && contains(issue.message, "indented")) saw_indented = true;
  }
  assert(saw_indented);
}

// ---------------- apply_diff ----------------

static void test_exact_match() {
  std::string doc = "{\n  \"name\": \"a\",\n  \"size\": 1\n}";
  PatchResult r = apply_diff(doc, hunk("\"size\": 1", "\"size\": 2"));
  assert(r.success);
  assert(r.kind == PatchErrorKind::None);
  assert(*r.content == "{\n  \"name\": \"a\",\n  \"size\": 2\n}");
  assert(r.applied.size() == 1);
  assert(r.applied[0].start_line == 2);
  assert(r.applied[0].removed_lines == 1);
  assert(r.applied[0].inserted_lines == 1);
}

static void test_noop_hunk() {
  std::string doc = "a\nb\nc";
  PatchResult r = apply_diff(doc, hunk("  b  ", "b"));
  assert(r.success);
  assert(*r.content == doc);
  assert(r.applied.size() == 1);
  assert(r.applied[0].noop);
}

static void test_format_rejection() {
  PatchResult r = apply_diff("a\nb", "no markers here");
  assert(!r.success);
  assert(r.kind == PatchErrorKind::InvalidFormat);
  assert(*r.error == "Invalid diff format - missing required SEARCH/REPLACE sections");
  assert(!r.content);
  assert(std::string(patch_error_kind_name(r.kind)) == "INVALID_FORMAT");
}

static void test_threshold_boundary() {
  std::string doc = "{\n  abcd\n}";
  std::string diff = hunk("abcX", "zzzz");

  PatchResult accepted = apply_diff(doc, diff, 0.75);
  assert(accepted.success);
  assert(*accepted.content == "{\n  zzzz\n}");

  PatchResult rejected = apply_diff(doc, diff, 0.76);
  assert(!rejected.success);
  assert(rejected.kind == PatchErrorKind::NoConfidentMatch);
  assert(*rejected.error == "No sufficiently similar match found (75% similar, needs 76%)");
  assert(std::fabs(rejected.best_score - 0.75) < 1e-12);
}

static void test_percent_is_floored() {
  // 0.29 * 100 is 28.999..., which floors to 28.
  PatchResult r = apply_diff("{\n  abcd\n}", hunk("zzzzzzzz", "x"), 0.29);
  assert(!r.success);
  assert(*r.error == "No sufficiently similar match found (0% similar, needs 28%)");
}

static void test_sequential_dependency() {
  std::string doc = "alpha\nbeta\ngamma";
  std::string second = hunk("delta\nepsilon\nzeta", "omega");
  std::string diff = hunk("beta", "delta\nepsilon\nzeta") + "\n" + second;

  PatchResult r = apply_diff(doc, diff);
  assert(r.success);
  assert(*r.content == "alpha\nomega\ngamma");

  // The second hunk alone has nothing to match in the original.
  PatchResult alone = apply_diff(doc, second);
  assert(!alone.success);
  assert(alone.kind == PatchErrorKind::NoConfidentMatch);

  // Reversed order: the later hunk's target does not exist yet.
  PatchResult reversed = apply_diff(doc, second + "\n" + hunk("beta", "delta\nepsilon\nzeta"));
  assert(!reversed.success);
  assert(reversed.kind == PatchErrorKind::NoConfidentMatch);
  assert(reversed.failed_hunk && *reversed.failed_hunk == 0);
  assert(!reversed.content);
}

static void test_round_trip_json() {
  Json original = Json(JsonObject{{"size", 1.0}});
  std::string text = dumps_json_pretty(original);
  assert(text == "{\n  \"size\": 1\n}");

  PatchResult r = apply_diff(text, hunk("\"size\": 1", "\"size\": 2"));
  assert(r.success);
  assert(*r.content == "{\n  \"size\": 2\n}");
  assert(loads_json(*r.content).as_object().at("size").as_number() == 2);
}

static void test_failure_example() {
  std::string doc = "{\n  \"name\": \"a\"\n}";
  PatchResult r = apply_diff(doc, hunk("completely different text here", "x"));
  assert(!r.success);
  assert(r.kind == PatchErrorKind::NoConfidentMatch);
  assert(contains(*r.error, "No sufficiently similar match found ("));
  assert(contains(*r.error, "needs 80%"));
  assert(!r.content);
  assert(r.failed_hunk && *r.failed_hunk == 0);
}

static void test_all_or_nothing() {
  std::string doc = "a\nb\nc";
  std::string diff = hunk("a", "A") + "\n" + hunk("nothing like this", "x");
  PatchResult r = apply_diff(doc, diff);
  assert(!r.success);
  assert(!r.content);
  assert(r.applied.empty());
  assert(r.failed_hunk && *r.failed_hunk == 1);
}

static void test_multi_hunk() {
  std::string doc =
      "{\n"
      "  \"apple\": 1,\n"
      "  \"banana\": 2,\n"
      "  \"cherry\": 3,\n"
      "  \"date\": 4,\n"
      "  \"elderberry\": 5,\n"
      "  \"fig\": 6,\n"
      "  \"grape\": 7,\n"
      "  \"honeydew\": 8\n"
      "}";
  std::string diff = hunk("\"banana\": 2,", "\"banana\": 20,") + "\n" + hunk("\"grape\": 7,", "\"grape\": 70,");

  PatchResult r = apply_diff(doc, diff);
  assert(r.success);
  std::string expected =
      "{\n"
      "  \"apple\": 1,\n"
      "  \"banana\": 20,\n"
      "  \"cherry\": 3,\n"
      "  \"date\": 4,\n"
      "  \"elderberry\": 5,\n"
      "  \"fig\": 6,\n"
      "  \"grape\": 70,\n"
      "  \"honeydew\": 8\n"
      "}";
  assert(*r.content == expected);
  assert(r.applied.size() == 2);
  assert(r.applied[0].start_line == 2);
  assert(r.applied[1].start_line == 7);
}

static void test_crlf_preserved() {
  PatchResult r = apply_diff("a\r\nb\r\nc", hunk("b", "B"));
  assert(r.success);
  assert(*r.content == "a\r\nB\r\nc");

  LineBuffer lf = split_document("a\nb");
  assert(lf.line_ending == "\n");
  assert(lf.lines.size() == 2);
  LineBuffer crlf = split_document("a\r\nb");
  assert(crlf.line_ending == "\r\n");
  assert(join_document(crlf) == "a\r\nb");
}

static void test_deletion() {
  PatchResult r = apply_diff("a\nb\nc", hunk("b", ""));
  assert(r.success);
  assert(*r.content == "a\nc");
  assert(r.applied[0].inserted_lines == 0);

  PatchResult ws = apply_diff("a\nb\nc", hunk("b", "   "));
  assert(ws.success);
  assert(*ws.content == "a\nc");
}

static void test_whole_document_search() {
  PatchResult r = apply_diff("a\nb\nc", hunk("a\nb\nc", "z"));
  assert(r.success);
  assert(*r.content == "z");
}

static void test_indentation_preserved() {
  std::string doc = "root:\n    child: 1\n    other: 2";
  std::string diff = hunk("child: 1\nother: 2", "child: 10\n  nested: true\nother: 2");

  PatchResult r = apply_diff(doc, diff);
  assert(r.success);
  assert(*r.content == "root:\n    child: 10\n      nested: true\n    other: 2");

  PatchConfig verbatim;
  verbatim.preserve_indentation = false;
  PatchResult v = apply_diff(doc, diff, verbatim);
  assert(v.success);
  assert(*v.content == "root:\nchild: 10\n  nested: true\nother: 2");
}

static void test_indentation_rebased() {
  std::string doc = "begin\n    x = 1\nend";
  PatchResult r = apply_diff(doc, hunk("x = 1", "        x = 2\n          y = 3\n\n        z = 4"));
  assert(r.success);
  assert(*r.content == "begin\n    x = 2\n      y = 3\n\n    z = 4\nend");
}

static void test_patch_applier_steps() {
  std::string diff = hunk("a", "A") + "\n" + hunk("b", "B");
  PatchApplier applier("a\nb", parse_hunks(diff));
  assert(applier.state() == PatchApplier::State::Ready);

  assert(applier.step());
  assert(applier.state() == PatchApplier::State::Applying);
  assert(applier.hunk_index() == 1);
  assert(applier.lines().size() == 2);
  assert(applier.lines()[0] == "A");

  assert(!applier.step());
  assert(applier.state() == PatchApplier::State::Succeeded);
  assert(!applier.step());

  PatchResult r = applier.run();
  assert(r.success);
  assert(*r.content == "A\nB");
}

static void test_patch_applier_failure_discards() {
  std::string diff = hunk("a", "A") + "\n" + hunk("qqqqqq", "x");
  PatchApplier applier("a\nb", parse_hunks(diff));
  PatchResult r = applier.run();
  assert(applier.state() == PatchApplier::State::Failed);
  assert(!r.success);
  assert(applier.lines().empty());
}

// ---------------- JSON ----------------

static void test_json_parse_and_dump() {
  Json v = loads_json("{\"a\": [1, 2.5, \"x\\u00e9\"], \"b\": null, \"c\": true}");
  const auto& obj = v.as_object();
  const auto& arr = obj.at("a").as_array();
  assert(arr.size() == 3);
  assert(arr[0].as_number() == 1);
  assert(arr[1].as_number() == 2.5);
  assert(arr[2].as_string() == "x\xC3\xA9");
  assert(obj.at("b").is_null());
  assert(obj.at("c").as_bool());

  assert(dumps_json(v) == "{\"a\":[1,2.5,\"x\xC3\xA9\"],\"b\":null,\"c\":true}");

  Json emoji = loads_json("\"\\ud83d\\ude00\"");
  assert(emoji.as_string() == "\xF0\x9F\x98\x80");
}

static void test_json_pretty() {
  Json v = Json(JsonObject{{"a", JsonArray{Json(1.0), Json(2.0)}}, {"b", JsonObject{}}, {"c", "s"}});
  assert(dumps_json_pretty(v) == "{\n  \"a\": [\n    1,\n    2\n  ],\n  \"b\": {},\n  \"c\": \"s\"\n}");
}

static void test_json_strict_errors() {
  const char* bad[] = {"{'a': 1}", "{\"a\": 1,}", "{\"a\": 1} x", "[1, 2", "{\"a\" 1}", ""};
  for (const char* text : bad) {
    try {
      (void)loads_json(text);
      assert(false && "expected parse error");
    } catch (const std::runtime_error& e) {
      assert(contains(e.what(), "JSON parse error"));
    }
  }

  JsonParseConfig lenient;
  lenient.allow_single_quotes = true;
  assert(loads_json("{'a': 'b'}", lenient).as_object().at("a").as_string() == "b");
}

static void test_json_numbers_round_trip() {
  const double tenths = 0.1 + 0.2;
  const double third = 1.0 / 3.0;
  assert(dumps_json(Json(tenths)) == "0.30000000000000004");
  assert(dumps_json(Json(third)) == "0.3333333333333333");
  assert(dumps_json(Json(0.5)) == "0.5");

  Json v = loads_json(dumps_json_pretty(Json(JsonArray{Json(tenths), Json(third), Json(-1.0e-7)})));
  assert(v.as_array()[0].as_number() == tenths);
  assert(v.as_array()[1].as_number() == third);
  assert(v.as_array()[2].as_number() == -1.0e-7);
}

static void test_json_max_depth() {
  const std::string deep = std::string(100000, '[') + std::string(100000, ']');
  try {
    (void)loads_json(deep);
    assert(false && "expected parse error");
  } catch (const std::runtime_error& e) {
    assert(contains(e.what(), "nesting too deep"));
  }

  JsonParseConfig shallow;
  shallow.max_depth = 2;
  assert(loads_json("[[1]]", shallow).as_array().size() == 1);
  assert(loads_json("{\"a\": [1]}", shallow).is_object());
  try {
    (void)loads_json("[[[1]]]", shallow);
    assert(false && "expected parse error");
  } catch (const std::runtime_error& e) {
    assert(contains(e.what(), "nesting too deep"));
  }
}

static void test_json_duplicate_key_policy() {
  assert(loads_json("{\"a\":1,\"a\":2}").as_object().at("a").as_number() == 2);

  JsonParseConfig first;
  first.duplicate_key_policy = JsonParseConfig::DuplicateKeyPolicy::FirstWins;
  assert(loads_json("{\"a\":1,\"a\":2}", first).as_object().at("a").as_number() == 1);

  JsonParseConfig error;
  error.duplicate_key_policy = JsonParseConfig::DuplicateKeyPolicy::Error;
  try {
    (void)loads_json("{\"a\":1,\"a\":2}", error);
    assert(false && "expected parse error");
  } catch (const std::runtime_error& e) {
    assert(contains(e.what(), "duplicate key"));
  }
}

static void test_json_pointer_from_path() {
  assert(json_pointer_from_path("$") == "");
  assert(json_pointer_from_path("$.nodes[0].id") == "/nodes/0/id");
  assert(json_pointer_from_path("$.a/b") == "/a~1b");
}

// ---------------- Validation ----------------

static Json sample_node() {
  return Json(JsonObject{
      {"type", "x"},
      {"name", "Old"},
      {"description", "d"},
      {"inputs", JsonArray{}},
      {"outputs", JsonArray{}},
      {"parameters", JsonArray{}},
      {"executeCode", "return 1;"},
  });
}

static Json sample_scene() {
  return Json(JsonObject{{"nodes", JsonArray{}}, {"edges", JsonArray{}}});
}

static void test_node_structure() {
  assert(validate_node_structure(sample_node()).empty());

  Json missing = sample_node();
  missing.as_object().erase("executeCode");
  auto errs = validate_node_structure(missing);
  assert(errs.size() == 1);
  assert(errs[0].path == "$.executeCode");
  assert(errs[0].message == "missing required property: executeCode");

  Json wrong = sample_node();
  wrong.as_object()["name"] = Json(5.0);
  wrong.as_object()["inputs"] = Json("none");
  auto all = validate_node_structure(wrong);
  assert(all.size() == 2);
  for (const auto& e : all) assert(e.kind == "type");

  assert(validate_node_structure(Json(JsonArray{})).size() == 1);
}

static void test_validate_throws_first() {
  Json schema = Json(JsonObject{{"type", "string"}, {"enum", JsonArray{Json("a"), Json("b")}}});
  validate(Json("a"), schema);
  try {
    validate(Json("c"), schema);
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.path == "$");
    assert(std::string(e.what()) == "value not in enum");
  }

  Json list = Json(JsonObject{{"type", "array"}, {"items", JsonObject{{"type", "number"}}}});
  try {
    validate(loads_json("[1, \"two\"]"), list);
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.path == "$[1]");
    assert(e.kind == "type");
  }
}

static void test_scene_structure() {
  assert(validate_scene_structure(sample_scene()).empty());
  auto errs = validate_scene_structure(loads_json("{\"nodes\": {}}"));
  assert(errs.size() == 2);
}

static void test_check_scene() {
  Json scene = loads_json(
      "{\"nodes\": [{\"id\": \"n1\", \"type\": \"t\", \"position\": {\"x\": 1, \"y\": \"2\"}, \"data\": {}}],"
      " \"edges\": [{\"id\": \"e1\", \"source\": \"n1\"}]}");
  SceneReport report = check_scene(scene);
  assert(!report.success);
  assert(report.errors.size() == 2);
  assert(report.errors[0] == "Node 0 position must have numeric x and y values");
  assert(report.errors[1] == "Edge 0 missing target");
  assert(report.warnings.size() == 2);

  SceneReport ok = check_scene(sample_scene());
  assert(ok.success);
  assert(ok.errors.empty());

  SceneReport bad = check_scene(Json("scene"));
  assert(!bad.success);
}

// ---------------- Node / scene diffs ----------------

static void test_node_diff_success() {
  JsonDiffResult r = apply_node_diff(sample_node(), hunk("\"name\": \"Old\",", "\"name\": \"New\","));
  assert(r.success);
  assert(r.kind == PatchErrorKind::None);
  assert(r.value->as_object().at("name").as_string() == "New");
}

static void test_node_diff_parsing_error() {
  JsonDiffResult r = apply_node_diff(sample_node(), hunk("\"name\": \"Old\",", "\"name\": \"New\""));
  assert(!r.success);
  assert(r.kind == PatchErrorKind::ParsingError);
  assert(r.error->rfind("Failed to apply node diff: JSON parse error", 0) == 0);
  assert(r.patch.success);
}

static void test_node_diff_structure_error() {
  JsonDiffResult r = apply_node_diff(sample_node(), hunk("\"executeCode\": \"return 1;\",", "\"executeCode\": 5,"));
  assert(!r.success);
  assert(r.kind == PatchErrorKind::StructureError);
  assert(*r.error == "Modified JSON does not match required node structure");
  assert(r.issues.size() == 1);
  assert(r.issues[0].path == "$.executeCode");
}

static void test_node_diff_forwards_patch_failure() {
  JsonDiffResult r = apply_node_diff(sample_node(), hunk("entirely unrelated content goes here", "x"));
  assert(!r.success);
  assert(r.kind == PatchErrorKind::NoConfidentMatch);
  assert(contains(*r.error, "needs 80%"));

  JsonDiffResult f = apply_node_diff(sample_node(), "garbage");
  assert(f.kind == PatchErrorKind::InvalidFormat);
}

static void test_node_diff_keeps_untouched_numbers() {
  const double tenths = 0.1 + 0.2;
  const double third = 1.0 / 3.0;
  Json node = sample_node();
  node.as_object()["parameters"] = Json(JsonArray{
      Json(JsonObject{{"default", Json(tenths)}}),
      Json(JsonObject{{"default", Json(third)}}),
  });

  JsonDiffResult r = apply_node_diff(node, hunk("\"name\": \"Old\",", "\"name\": \"New\","));
  assert(r.success);
  const auto& params = r.value->as_object().at("parameters").as_array();
  assert(params[0].as_object().at("default").as_number() == tenths);
  assert(params[1].as_object().at("default").as_number() == third);
}

static void test_scene_diff_deep_nesting_is_parse_error() {
  JsonDiffResult r =
      apply_scene_diff(sample_scene(), hunk("\"nodes\": []", "\"nodes\": " + std::string(200000, '[')));
  assert(!r.success);
  assert(r.kind == PatchErrorKind::ParsingError);
  assert(r.error->rfind("Failed to apply scene diff: JSON parse error: nesting too deep", 0) == 0);
}

static void test_scene_diff() {
  JsonDiffResult ok = apply_scene_diff(sample_scene(), hunk("\"nodes\": []", "\"nodes\": [{\"id\": \"n1\"}]"));
  assert(ok.success);
  assert(ok.value->as_object().at("nodes").as_array().size() == 1);

  JsonDiffResult removed = apply_scene_diff(sample_scene(), hunk("\"edges\": [],", ""));
  assert(!removed.success);
  assert(removed.kind == PatchErrorKind::StructureError);
  assert(*removed.error == "Modified JSON does not match required scene structure");
  assert(removed.issues.size() == 1);
  assert(removed.issues[0].path == "$.edges");
}

// ---------------- Configuration ----------------

static void test_patch_config_from_json() {
  PatchConfig defaults = patch_config_from_json(loads_json("{}"));
  assert(defaults.fuzzy_threshold == 0.8);
  assert(defaults.preserve_indentation);

  PatchConfig c = patch_config_from_json(loads_json("{\"fuzzyThreshold\": 0.9, \"preserveIndentation\": false, \"x\": 1}"));
  assert(c.fuzzy_threshold == 0.9);
  assert(!c.preserve_indentation);

  const char* bad[] = {"{\"fuzzyThreshold\": \"high\"}", "{\"fuzzyThreshold\": 1.5}", "{\"preserveIndentation\": 1}", "[]"};
  for (const char* text : bad) {
    try {
      (void)patch_config_from_json(loads_json(text));
      assert(false && "expected ValidationError");
    } catch (const ValidationError& e) {
      assert(e.kind == "config");
    }
  }

  try {
    (void)patch_config_from_json(loads_json("{\"fuzzyThreshold\": -1}"));
    assert(false && "expected ValidationError");
  } catch (const ValidationError& e) {
    assert(e.path == "$.fuzzyThreshold");
    assert(json_pointer_from_path(e.path) == "/fuzzyThreshold");
  }
}

int main() {
  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("levenshtein_distance", test_levenshtein_distance);
    run("similarity_normalization", test_similarity_normalization);
    run("locate_prefers_center", test_locate_prefers_center);
    run("locate_multi_line_window", test_locate_multi_line_window);
    run("locate_range_too_small", test_locate_range_too_small);
    run("locate_skips_truncated_tail", test_locate_skips_truncated_tail);
    run("parse_hunks_order_and_lines", test_parse_hunks_order_and_lines);
    run("parse_hunks_crlf", test_parse_hunks_crlf);
    run("create_diff_template", test_create_diff_template);
    run("lint_diff", test_lint_diff);
    run("exact_match", test_exact_match);
    run("noop_hunk", test_noop_hunk);
    run("format_rejection", test_format_rejection);
    run("threshold_boundary", test_threshold_boundary);
    run("percent_is_floored", test_percent_is_floored);
    run("sequential_dependency", test_sequential_dependency);
    run("round_trip_json", test_round_trip_json);
    run("failure_example", test_failure_example);
    run("all_or_nothing", test_all_or_nothing);
    run("multi_hunk", test_multi_hunk);
    run("crlf_preserved", test_crlf_preserved);
    run("deletion", test_deletion);
    run("whole_document_search", test_whole_document_search);
    run("indentation_preserved", test_indentation_preserved);
    run("indentation_rebased", test_indentation_rebased);
    run("patch_applier_steps", test_patch_applier_steps);
    run("patch_applier_failure_discards", test_patch_applier_failure_discards);
    run("json_parse_and_dump", test_json_parse_and_dump);
    run("json_pretty", test_json_pretty);
    run("json_strict_errors", test_json_strict_errors);
    run("json_numbers_round_trip", test_json_numbers_round_trip);
    run("json_max_depth", test_json_max_depth);
    run("json_duplicate_key_policy", test_json_duplicate_key_policy);
    run("json_pointer_from_path", test_json_pointer_from_path);
    run("node_structure", test_node_structure);
    run("validate_throws_first", test_validate_throws_first);
    run("scene_structure", test_scene_structure);
    run("check_scene", test_check_scene);
    run("node_diff_success", test_node_diff_success);
    run("node_diff_parsing_error", test_node_diff_parsing_error);
    run("node_diff_structure_error", test_node_diff_structure_error);
    run("node_diff_forwards_patch_failure", test_node_diff_forwards_patch_failure);
    run("node_diff_keeps_untouched_numbers", test_node_diff_keeps_untouched_numbers);
    run("scene_diff_deep_nesting_is_parse_error", test_scene_diff_deep_nesting_is_parse_error);
    run("scene_diff", test_scene_diff);
    run("patch_config_from_json", test_patch_config_from_json);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
