#include "llm_patch.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace llm_patch;

static std::string read_all_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

static std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static Json load_json_file(const std::string& path) {
  std::string text = read_file(path);
  try {
    return loads_json(text);
  } catch (const ValidationError&) {
    throw;
  } catch (const std::exception& e) {
    throw ValidationError(std::string(e.what()) + " in " + path, "$", "parse");
  }
}

static void usage() {
  std::cerr
      << "llm_patch_cli <apply|node|scene|template|lint|check-scene> [options]\n"
      << "  --original <file>     document to patch (node/scene/check-scene: JSON)\n"
      << "  --diff <file>         SEARCH/REPLACE patch, read from stdin when absent\n"
      << "  --search <file>       template: search text\n"
      << "  --replace <file>      template: replacement text\n"
      << "  --threshold <0..1>    fuzzy match threshold (default 0.8)\n"
      << "  --config <file.json>  {\"fuzzyThreshold\": 0.8, \"preserveIndentation\": true}\n"
      << "  --no-indent           insert replacement lines verbatim\n"
      << "  --verbose             trace each hunk on stderr\n";
}

static void trace_hunks(const PatchResult& r) {
  for (const auto& h : r.applied) {
    std::cerr << "hunk " << h.index << ": ";
    if (h.noop) {
      std::cerr << "no-op\n";
      continue;
    }
    std::cerr << "line " << (h.start_line + 1) << ", -" << h.removed_lines << " +" << h.inserted_lines
              << ", score " << h.score << "\n";
  }
  if (r.failed_hunk) {
    std::cerr << "hunk " << *r.failed_hunk << ": failed, best score " << r.best_score << "\n";
  }
}

static int print_failure(const std::string& error, PatchErrorKind kind, const PatchResult& patch,
                         const std::vector<ValidationError>& issues) {
  JsonObject o;
  o["error"] = error;
  o["kind"] = std::string(patch_error_kind_name(kind));
  if (patch.failed_hunk) o["hunk"] = static_cast<int64_t>(*patch.failed_hunk);
  if (!issues.empty()) {
    JsonArray arr;
    for (const auto& e : issues) {
      JsonObject item;
      item["message"] = e.message;
      item["path"] = e.path;
      item["kind"] = e.kind;
      arr.push_back(Json(item));
    }
    o["issues"] = arr;
  }
  std::cout << dumps_json(Json(o)) << "\n";
  return 1;
}

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      usage();
      return 2;
    }

    std::string mode = argv[1];
    std::string original_path;
    std::string diff_path;
    std::string search_path;
    std::string replace_path;
    std::string config_path;
    std::optional<double> threshold;
    bool no_indent = false;
    bool verbose = false;

    for (int i = 2; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--original" && i + 1 < argc) {
        original_path = argv[++i];
      } else if (a == "--diff" && i + 1 < argc) {
        diff_path = argv[++i];
      } else if (a == "--search" && i + 1 < argc) {
        search_path = argv[++i];
      } else if (a == "--replace" && i + 1 < argc) {
        replace_path = argv[++i];
      } else if (a == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (a == "--threshold" && i + 1 < argc) {
        std::string v = argv[++i];
        char* end = nullptr;
        double t = std::strtod(v.c_str(), &end);
        if (v.empty() || *end != '\0' || !(t >= 0.0 && t <= 1.0)) {
          std::cerr << "error: --threshold expects a number in [0, 1]\n";
          return 2;
        }
        threshold = t;
      } else if (a == "--no-indent") {
        no_indent = true;
      } else if (a == "--verbose") {
        verbose = true;
      } else {
        usage();
        return 2;
      }
    }

    PatchConfig config;
    if (!config_path.empty()) config = patch_config_from_json(load_json_file(config_path));
    if (threshold) config.fuzzy_threshold = *threshold;
    if (no_indent) config.preserve_indentation = false;

    if (mode == "template") {
      if (search_path.empty() || replace_path.empty()) {
        usage();
        return 2;
      }
      std::cout << create_diff_template(read_file(search_path), read_file(replace_path)) << "\n";
      return 0;
    }

    if (mode == "lint") {
      std::string diff = diff_path.empty() ? read_all_stdin() : read_file(diff_path);
      JsonArray arr;
      for (const auto& issue : lint_diff(diff)) {
        JsonObject item;
        item["line"] = static_cast<int64_t>(issue.line);
        item["message"] = issue.message;
        arr.push_back(Json(item));
      }
      JsonObject o;
      o["ok"] = arr.empty();
      o["hunks"] = static_cast<int64_t>(parse_hunks(diff).size());
      o["issues"] = arr;
      std::cout << dumps_json(Json(o)) << "\n";
      return arr.empty() ? 0 : 1;
    }

    if (original_path.empty()) {
      usage();
      return 2;
    }

    if (mode == "check-scene") {
      SceneReport report = check_scene(load_json_file(original_path));
      JsonArray errors;
      for (const auto& e : report.errors) errors.push_back(e);
      JsonArray warnings;
      for (const auto& w : report.warnings) warnings.push_back(w);
      JsonObject o;
      o["success"] = report.success;
      o["errors"] = errors;
      o["warnings"] = warnings;
      std::cout << dumps_json_pretty(Json(o)) << "\n";
      return report.success ? 0 : 1;
    }

    if (mode == "apply") {
      std::string original = read_file(original_path);
      std::string diff = diff_path.empty() ? read_all_stdin() : read_file(diff_path);
      PatchResult r = apply_diff(original, diff, config);
      if (verbose) trace_hunks(r);
      if (!r.success) return print_failure(r.error.value_or(""), r.kind, r, {});
      std::cout << *r.content;
      return 0;
    }

    if (mode == "node" || mode == "scene") {
      Json original = load_json_file(original_path);
      std::string diff = diff_path.empty() ? read_all_stdin() : read_file(diff_path);
      JsonDiffResult r =
          mode == "node" ? apply_node_diff(original, diff, config) : apply_scene_diff(original, diff, config);
      if (verbose) trace_hunks(r.patch);
      if (!r.success) return print_failure(r.error.value_or(""), r.kind, r.patch, r.issues);
      std::cout << dumps_json_pretty(*r.value) << "\n";
      return 0;
    }

    usage();
    return 2;
  } catch (const ValidationError& e) {
    JsonObject o;
    o["error"] = std::string(e.what());
    o["kind"] = e.kind;
    o["path"] = e.path;
    std::cout << dumps_json(Json(o)) << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
