#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "llm_patch.hpp"

namespace py = pybind11;

using llm_patch::Json;
using llm_patch::JsonArray;
using llm_patch::JsonDiffResult;
using llm_patch::JsonObject;
using llm_patch::PatchConfig;
using llm_patch::PatchResult;
using llm_patch::ValidationError;

static py::object ToPy(const Json& v);

static bool FromPy(py::handle v, Json& out);

static py::object ToPyObject(const JsonObject& o) {
  py::dict d;
  for (const auto& kv : o) {
    d[py::str(kv.first)] = ToPy(kv.second);
  }
  return std::move(d);
}

static py::object ToPyArray(const JsonArray& a) {
  py::list out;
  for (const auto& el : a) {
    out.append(ToPy(el));
  }
  return std::move(out);
}

static py::object ToPyNumber(double n) {
  if (std::isfinite(n)) {
    const double ip = std::trunc(n);
    if (ip == n && ip >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        ip <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
      return py::int_(static_cast<int64_t>(ip));
    }
  }
  return py::float_(n);
}

static py::object ToPy(const Json& v) {
  if (v.is_null()) return py::none();
  if (v.is_bool()) return py::bool_(v.as_bool());
  if (v.is_number()) return ToPyNumber(v.as_number());
  if (v.is_string()) return py::str(v.as_string());
  if (v.is_array()) return ToPyArray(v.as_array());
  return ToPyObject(v.as_object());
}

static bool FromPyObject(py::handle v, Json& out) {
  py::dict d = py::reinterpret_borrow<py::dict>(v);
  JsonObject obj;
  for (auto item : d) {
    if (!py::isinstance<py::str>(item.first)) return false;
    std::string key = py::cast<std::string>(item.first);
    Json child;
    if (!FromPy(item.second, child)) return false;
    obj.emplace(std::move(key), std::move(child));
  }
  out = Json(std::move(obj));
  return true;
}

static bool FromPyArray(py::handle v, Json& out) {
  py::sequence seq = py::reinterpret_borrow<py::sequence>(v);
  JsonArray arr;
  arr.reserve(seq.size());
  for (auto item : seq) {
    Json child;
    if (!FromPy(item, child)) return false;
    arr.push_back(std::move(child));
  }
  out = Json(std::move(arr));
  return true;
}

static bool FromPy(py::handle v, Json& out) {
  if (v.is_none()) {
    out = Json(nullptr);
    return true;
  }
  if (py::isinstance<py::bool_>(v)) {
    out = Json(py::cast<bool>(v));
    return true;
  }
  if (py::isinstance<py::int_>(v)) {
    out = Json(py::cast<int64_t>(v));
    return true;
  }
  if (py::isinstance<py::float_>(v)) {
    out = Json(py::cast<double>(v));
    return true;
  }
  if (py::isinstance<py::str>(v)) {
    out = Json(py::cast<std::string>(v));
    return true;
  }
  if (py::isinstance<py::dict>(v)) {
    return FromPyObject(v, out);
  }
  if (py::isinstance<py::list>(v) || py::isinstance<py::tuple>(v)) {
    return FromPyArray(v, out);
  }
  return false;
}

// Accepts a dict/list value or its JSON text.
static Json DocumentFromPy(py::handle doc, const char* what) {
  if (py::isinstance<py::str>(doc)) {
    return llm_patch::loads_json(py::cast<std::string>(doc));
  }
  Json out;
  if (!FromPy(doc, out)) {
    throw py::type_error(std::string(what) + " must be a JSON-serializable dict/list or a JSON string");
  }
  return out;
}

// None -> defaults, number -> threshold, dict -> {"fuzzyThreshold", "preserveIndentation"}.
static PatchConfig PatchConfigFromPy(py::handle o) {
  if (o.is_none()) return PatchConfig{};
  if ((py::isinstance<py::float_>(o) || py::isinstance<py::int_>(o)) && !py::isinstance<py::bool_>(o)) {
    Json cfg = Json(JsonObject{{"fuzzyThreshold", Json(py::cast<double>(o))}});
    return llm_patch::patch_config_from_json(cfg);
  }
  if (!py::isinstance<py::dict>(o)) throw py::type_error("config must be None, a number or a dict");
  Json cfg;
  if (!FromPy(o, cfg)) throw py::type_error("config must be JSON-serializable");
  return llm_patch::patch_config_from_json(cfg);
}

static py::dict MakeIssue(const ValidationError& e) {
  py::dict d;
  d["message"] = std::string(e.what());
  d["path"] = e.path;
  d["kind"] = e.kind;
  d["jsonPointer"] = llm_patch::json_pointer_from_path(e.path);
  return d;
}

static py::dict PatchResultToPy(const PatchResult& r) {
  py::dict out;
  out["success"] = r.success;
  out["content"] = r.content ? py::object(py::str(*r.content)) : py::object(py::none());
  out["error"] = r.error ? py::object(py::str(*r.error)) : py::object(py::none());
  out["kind"] = llm_patch::patch_error_kind_name(r.kind);
  out["failed_hunk"] = r.failed_hunk ? py::object(py::int_(*r.failed_hunk)) : py::object(py::none());
  out["best_score"] = r.best_score;

  py::list applied;
  for (const auto& h : r.applied) {
    py::dict d;
    d["index"] = h.index;
    d["noop"] = h.noop;
    d["start_line"] = h.start_line;
    d["removed_lines"] = h.removed_lines;
    d["inserted_lines"] = h.inserted_lines;
    d["score"] = h.score;
    applied.append(d);
  }
  out["applied"] = applied;
  return out;
}

static py::dict JsonDiffResultToPy(const JsonDiffResult& r) {
  py::dict out;
  out["success"] = r.success;
  out["value"] = r.value ? ToPy(*r.value) : py::object(py::none());
  out["error"] = r.error ? py::object(py::str(*r.error)) : py::object(py::none());
  out["kind"] = llm_patch::patch_error_kind_name(r.kind);
  py::list issues;
  for (const auto& e : r.issues) issues.append(MakeIssue(e));
  out["issues"] = issues;
  out["patch"] = PatchResultToPy(r.patch);
  return out;
}

static py::object ValidationErrorType;

static void TranslateValidationError(const ValidationError& e) {
  const std::string msg = std::string(e.what());
  const std::string full = e.path.empty() ? msg : (e.path + ": " + msg);
  py::object exc = ValidationErrorType(py::str(full));
  exc.attr("message") = py::str(msg);
  exc.attr("path") = py::str(e.path);
  exc.attr("kind") = py::str(e.kind);
  exc.attr("jsonPointer") = py::str(llm_patch::json_pointer_from_path(e.path));
  PyErr_SetObject(ValidationErrorType.ptr(), exc.ptr());
}

PYBIND11_MODULE(_native, m) {
  m.doc() = "C++17-backed fuzzy SEARCH/REPLACE patching for text and JSON documents (pybind11)";

  ValidationErrorType = py::reinterpret_steal<py::object>(PyErr_NewException("llm_patch.ValidationError", PyExc_Exception, nullptr));
  m.attr("ValidationError") = ValidationErrorType;

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const ValidationError& e) {
      TranslateValidationError(e);
    }
  });

  m.def("json_pointer_from_path", &llm_patch::json_pointer_from_path);

  m.def("apply_diff", [](const std::string& original, const std::string& diff, py::object config) {
    return PatchResultToPy(llm_patch::apply_diff(original, diff, PatchConfigFromPy(config)));
  }, py::arg("original"), py::arg("diff"), py::arg("config") = py::none());

  m.def("apply_node_diff", [](py::object node, const std::string& diff, py::object config) {
    Json original = DocumentFromPy(node, "node");
    return JsonDiffResultToPy(llm_patch::apply_node_diff(original, diff, PatchConfigFromPy(config)));
  }, py::arg("node"), py::arg("diff"), py::arg("config") = py::none());

  m.def("apply_scene_diff", [](py::object scene, const std::string& diff, py::object config) {
    Json original = DocumentFromPy(scene, "scene");
    return JsonDiffResultToPy(llm_patch::apply_scene_diff(original, diff, PatchConfigFromPy(config)));
  }, py::arg("scene"), py::arg("diff"), py::arg("config") = py::none());

  m.def("create_diff_template", &llm_patch::create_diff_template, py::arg("search"), py::arg("replace"));

  m.def("similarity", &llm_patch::similarity, py::arg("original"), py::arg("search"));

  m.def("parse_hunks", [](const std::string& diff) {
    py::list out;
    for (const auto& h : llm_patch::parse_hunks(diff)) {
      py::dict d;
      d["search"] = h.search;
      d["replace"] = h.replace;
      d["line"] = h.line;
      out.append(d);
    }
    return out;
  }, py::arg("diff"));

  m.def("lint_diff", [](const std::string& diff) {
    py::list out;
    for (const auto& issue : llm_patch::lint_diff(diff)) {
      py::dict d;
      d["line"] = issue.line;
      d["message"] = issue.message;
      out.append(d);
    }
    return out;
  }, py::arg("diff"));

  m.def("check_scene", [](py::object scene) {
    auto report = llm_patch::check_scene(DocumentFromPy(scene, "scene"));
    py::dict out;
    out["success"] = report.success;
    out["errors"] = report.errors;
    out["warnings"] = report.warnings;
    return out;
  }, py::arg("scene"));
}
