#include <node_api.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "llm_patch.hpp"

using llm_patch::Json;
using llm_patch::JsonDiffResult;
using llm_patch::JsonObject;
using llm_patch::PatchConfig;
using llm_patch::PatchResult;
using llm_patch::ValidationError;

static void ThrowTypeError(napi_env env, const char* msg) { napi_throw_type_error(env, nullptr, msg); }

static napi_value MakeString(napi_env env, const std::string& s);

static void ThrowErrorWithKind(napi_env env, const std::string& msg, const std::string& kind) {
  napi_value message;
  napi_create_string_utf8(env, msg.c_str(), msg.size(), &message);

  napi_value err;
  napi_create_error(env, nullptr, message, &err);
  napi_set_named_property(env, err, "message", message);
  napi_set_named_property(env, err, "kind", MakeString(env, kind));
  napi_throw(env, err);
}

static void ThrowValidationError(napi_env env, const ValidationError& e) {
  napi_value msg;
  napi_create_string_utf8(env, e.what(), NAPI_AUTO_LENGTH, &msg);

  napi_value err;
  napi_create_error(env, nullptr, msg, &err);
  napi_set_named_property(env, err, "message", msg);
  napi_set_named_property(env, err, "name", MakeString(env, "ValidationError"));
  napi_set_named_property(env, err, "path", MakeString(env, e.path));
  napi_set_named_property(env, err, "jsonPointer", MakeString(env, llm_patch::json_pointer_from_path(e.path)));
  napi_set_named_property(env, err, "kind", MakeString(env, e.kind));
  napi_throw(env, err);
}

static bool GetStringUtf8(napi_env env, napi_value v, std::string& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_string) return false;

  size_t len = 0;
  if (napi_get_value_string_utf8(env, v, nullptr, 0, &len) != napi_ok) return false;

  out.resize(len);
  size_t written = 0;
  if (napi_get_value_string_utf8(env, v, out.data(), out.size() + 1, &written) != napi_ok) return false;
  out.resize(written);
  return true;
}

static napi_value MakeString(napi_env env, const std::string& s) {
  napi_value out;
  napi_create_string_utf8(env, s.c_str(), s.size(), &out);
  return out;
}

static napi_value MakeBool(napi_env env, bool b) {
  napi_value out;
  napi_get_boolean(env, b, &out);
  return out;
}

static napi_value MakeNumber(napi_env env, double n) {
  napi_value out;
  napi_create_double(env, n, &out);
  return out;
}

static napi_value MakeNull(napi_env env) {
  napi_value out;
  napi_get_null(env, &out);
  return out;
}

static napi_value ToNapi(napi_env env, const Json& v);

static bool FromNapi(napi_env env, napi_value v, Json& out);

static bool FromNapiObject(napi_env env, napi_value v, Json& out) {
  napi_value names;
  if (napi_get_property_names(env, v, &names) != napi_ok) return false;

  uint32_t len = 0;
  if (napi_get_array_length(env, names, &len) != napi_ok) return false;

  JsonObject obj;
  for (uint32_t i = 0; i < len; ++i) {
    napi_value keyv;
    if (napi_get_element(env, names, i, &keyv) != napi_ok) return false;
    std::string key;
    if (!GetStringUtf8(env, keyv, key)) return false;

    napi_value val;
    if (napi_get_property(env, v, keyv, &val) != napi_ok) return false;

    Json child;
    if (!FromNapi(env, val, child)) return false;
    obj.emplace(std::move(key), std::move(child));
  }
  out = Json(std::move(obj));
  return true;
}

static bool FromNapiArray(napi_env env, napi_value v, Json& out) {
  uint32_t len = 0;
  if (napi_get_array_length(env, v, &len) != napi_ok) return false;
  llm_patch::JsonArray arr;
  arr.reserve(len);
  for (uint32_t i = 0; i < len; ++i) {
    napi_value el;
    if (napi_get_element(env, v, i, &el) != napi_ok) return false;
    Json child;
    if (!FromNapi(env, el, child)) return false;
    arr.push_back(std::move(child));
  }
  out = Json(std::move(arr));
  return true;
}

static bool FromNapi(napi_env env, napi_value v, Json& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;

  if (t == napi_null || t == napi_undefined) {
    out = Json(nullptr);
    return true;
  }
  if (t == napi_boolean) {
    bool b = false;
    if (napi_get_value_bool(env, v, &b) != napi_ok) return false;
    out = Json(b);
    return true;
  }
  if (t == napi_number) {
    double n = 0;
    if (napi_get_value_double(env, v, &n) != napi_ok) return false;
    out = Json(n);
    return true;
  }
  if (t == napi_string) {
    std::string s;
    if (!GetStringUtf8(env, v, s)) return false;
    out = Json(std::move(s));
    return true;
  }
  if (t == napi_object) {
    bool is_array = false;
    if (napi_is_array(env, v, &is_array) != napi_ok) return false;
    if (is_array) return FromNapiArray(env, v, out);
    return FromNapiObject(env, v, out);
  }
  return false;
}

static napi_value ToNapiObject(napi_env env, const JsonObject& o) {
  napi_value obj;
  napi_create_object(env, &obj);
  for (const auto& kv : o) {
    napi_value val = ToNapi(env, kv.second);
    napi_set_named_property(env, obj, kv.first.c_str(), val);
  }
  return obj;
}

static napi_value ToNapiArray(napi_env env, const llm_patch::JsonArray& a) {
  napi_value arr;
  napi_create_array_with_length(env, a.size(), &arr);
  for (size_t i = 0; i < a.size(); ++i) {
    napi_value val = ToNapi(env, a[i]);
    napi_set_element(env, arr, static_cast<uint32_t>(i), val);
  }
  return arr;
}

static napi_value ToNapi(napi_env env, const Json& v) {
  if (v.is_null()) return MakeNull(env);
  if (v.is_bool()) return MakeBool(env, v.as_bool());
  if (v.is_number()) return MakeNumber(env, v.as_number());
  if (v.is_string()) return MakeString(env, v.as_string());
  if (v.is_array()) return ToNapiArray(env, v.as_array());
  return ToNapiObject(env, v.as_object());
}

static napi_value ToNapiPatchResult(napi_env env, const PatchResult& r) {
  napi_value obj;
  napi_create_object(env, &obj);

  napi_set_named_property(env, obj, "success", MakeBool(env, r.success));
  napi_set_named_property(env, obj, "content", r.content ? MakeString(env, *r.content) : MakeNull(env));
  napi_set_named_property(env, obj, "error", r.error ? MakeString(env, *r.error) : MakeNull(env));
  napi_set_named_property(env, obj, "kind", MakeString(env, llm_patch::patch_error_kind_name(r.kind)));
  napi_set_named_property(
      env, obj, "failedHunk", r.failed_hunk ? MakeNumber(env, static_cast<double>(*r.failed_hunk)) : MakeNull(env));
  napi_set_named_property(env, obj, "bestScore", MakeNumber(env, r.best_score));

  napi_value applied;
  napi_create_array_with_length(env, r.applied.size(), &applied);
  for (size_t i = 0; i < r.applied.size(); ++i) {
    const auto& h = r.applied[i];
    napi_value item;
    napi_create_object(env, &item);
    napi_set_named_property(env, item, "index", MakeNumber(env, static_cast<double>(h.index)));
    napi_set_named_property(env, item, "noop", MakeBool(env, h.noop));
    napi_set_named_property(env, item, "startLine", MakeNumber(env, h.start_line));
    napi_set_named_property(env, item, "removedLines", MakeNumber(env, h.removed_lines));
    napi_set_named_property(env, item, "insertedLines", MakeNumber(env, h.inserted_lines));
    napi_set_named_property(env, item, "score", MakeNumber(env, h.score));
    napi_set_element(env, applied, static_cast<uint32_t>(i), item);
  }
  napi_set_named_property(env, obj, "applied", applied);
  return obj;
}

static napi_value ToNapiJsonDiffResult(napi_env env, const JsonDiffResult& r) {
  napi_value obj;
  napi_create_object(env, &obj);

  napi_set_named_property(env, obj, "success", MakeBool(env, r.success));
  napi_set_named_property(env, obj, "value", r.value ? ToNapi(env, *r.value) : MakeNull(env));
  napi_set_named_property(env, obj, "error", r.error ? MakeString(env, *r.error) : MakeNull(env));
  napi_set_named_property(env, obj, "kind", MakeString(env, llm_patch::patch_error_kind_name(r.kind)));

  napi_value issues;
  napi_create_array_with_length(env, r.issues.size(), &issues);
  for (size_t i = 0; i < r.issues.size(); ++i) {
    const auto& e = r.issues[i];
    napi_value item;
    napi_create_object(env, &item);
    napi_set_named_property(env, item, "message", MakeString(env, e.what()));
    napi_set_named_property(env, item, "path", MakeString(env, e.path));
    napi_set_named_property(env, item, "jsonPointer", MakeString(env, llm_patch::json_pointer_from_path(e.path)));
    napi_set_named_property(env, item, "kind", MakeString(env, e.kind));
    napi_set_element(env, issues, static_cast<uint32_t>(i), item);
  }
  napi_set_named_property(env, obj, "issues", issues);
  napi_set_named_property(env, obj, "patch", ToNapiPatchResult(env, r.patch));
  return obj;
}

// undefined/null -> defaults, number -> threshold, object -> {fuzzyThreshold, preserveIndentation}.
static bool PatchConfigFromNapi(napi_env env, napi_value v, PatchConfig& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t == napi_null || t == napi_undefined) return true;

  Json cfg;
  if (t == napi_number) {
    double n = 0;
    if (napi_get_value_double(env, v, &n) != napi_ok) return false;
    cfg = Json(JsonObject{{"fuzzyThreshold", Json(n)}});
  } else if (t == napi_object) {
    if (!FromNapi(env, v, cfg)) {
      ThrowTypeError(env, "config must be a plain object");
      return false;
    }
  } else {
    ThrowTypeError(env, "config must be a number or an object");
    return false;
  }

  try {
    out = llm_patch::patch_config_from_json(cfg);
    return true;
  } catch (const ValidationError& e) {
    ThrowValidationError(env, e);
    return false;
  }
}

// Accepts a JSON string or a plain object.
static bool DocumentFromNapi(napi_env env, napi_value v, Json& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t == napi_string) {
    std::string text;
    if (!GetStringUtf8(env, v, text)) return false;
    try {
      out = llm_patch::loads_json(text);
      return true;
    } catch (const std::exception& e) {
      ThrowErrorWithKind(env, e.what(), "parse");
      return false;
    }
  }
  if (t == napi_object) {
    if (!FromNapi(env, v, out)) {
      ThrowTypeError(env, "document must be JSON-serializable");
      return false;
    }
    return true;
  }
  ThrowTypeError(env, "document must be a JSON string or an object");
  return false;
}

static napi_value ApplyDiff(napi_env env, napi_callback_info info) {
  size_t argc = 3;
  napi_value argv[3];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc < 2) {
    ThrowTypeError(env, "applyDiff(original, diff, config?) expects at least 2 arguments");
    return nullptr;
  }

  std::string original;
  std::string diff;
  if (!GetStringUtf8(env, argv[0], original) || !GetStringUtf8(env, argv[1], diff)) {
    ThrowTypeError(env, "applyDiff(original, diff, config?) expects strings");
    return nullptr;
  }

  PatchConfig config;
  if (argc >= 3 && !PatchConfigFromNapi(env, argv[2], config)) return nullptr;

  return ToNapiPatchResult(env, llm_patch::apply_diff(original, diff, config));
}

static napi_value ApplyDocumentDiff(napi_env env, napi_callback_info info, const char* usage, bool scene) {
  size_t argc = 3;
  napi_value argv[3];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc < 2) {
    ThrowTypeError(env, usage);
    return nullptr;
  }

  Json original;
  if (!DocumentFromNapi(env, argv[0], original)) return nullptr;

  std::string diff;
  if (!GetStringUtf8(env, argv[1], diff)) {
    ThrowTypeError(env, usage);
    return nullptr;
  }

  PatchConfig config;
  if (argc >= 3 && !PatchConfigFromNapi(env, argv[2], config)) return nullptr;

  JsonDiffResult r =
      scene ? llm_patch::apply_scene_diff(original, diff, config) : llm_patch::apply_node_diff(original, diff, config);
  return ToNapiJsonDiffResult(env, r);
}

static napi_value ApplyNodeDiff(napi_env env, napi_callback_info info) {
  return ApplyDocumentDiff(env, info, "applyNodeDiff(node, diff, config?) expects a node and a diff string", false);
}

static napi_value ApplySceneDiff(napi_env env, napi_callback_info info) {
  return ApplyDocumentDiff(env, info, "applySceneDiff(scene, diff, config?) expects a scene and a diff string", true);
}

static napi_value CreateDiffTemplate(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;

  std::string search;
  std::string replace;
  if (argc != 2 || !GetStringUtf8(env, argv[0], search) || !GetStringUtf8(env, argv[1], replace)) {
    ThrowTypeError(env, "createDiffTemplate(search, replace) expects 2 strings");
    return nullptr;
  }
  return MakeString(env, llm_patch::create_diff_template(search, replace));
}

static napi_value Similarity(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;

  std::string original;
  std::string search;
  if (argc != 2 || !GetStringUtf8(env, argv[0], original) || !GetStringUtf8(env, argv[1], search)) {
    ThrowTypeError(env, "similarity(original, search) expects 2 strings");
    return nullptr;
  }
  return MakeNumber(env, llm_patch::similarity(original, search));
}

static bool GetSingleString(napi_env env, napi_callback_info info, const char* usage, std::string& out) {
  size_t argc = 1;
  napi_value argv[1];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return false;
  if (argc != 1 || !GetStringUtf8(env, argv[0], out)) {
    ThrowTypeError(env, usage);
    return false;
  }
  return true;
}

static napi_value ParseHunks(napi_env env, napi_callback_info info) {
  std::string diff;
  if (!GetSingleString(env, info, "parseHunks(diff) expects a string", diff)) return nullptr;

  const auto hunks = llm_patch::parse_hunks(diff);
  napi_value arr;
  napi_create_array_with_length(env, hunks.size(), &arr);
  for (size_t i = 0; i < hunks.size(); ++i) {
    napi_value item;
    napi_create_object(env, &item);
    napi_set_named_property(env, item, "search", MakeString(env, hunks[i].search));
    napi_set_named_property(env, item, "replace", MakeString(env, hunks[i].replace));
    napi_set_named_property(env, item, "line", MakeNumber(env, hunks[i].line));
    napi_set_element(env, arr, static_cast<uint32_t>(i), item);
  }
  return arr;
}

static napi_value LintDiff(napi_env env, napi_callback_info info) {
  std::string diff;
  if (!GetSingleString(env, info, "lintDiff(diff) expects a string", diff)) return nullptr;

  const auto issues = llm_patch::lint_diff(diff);
  napi_value arr;
  napi_create_array_with_length(env, issues.size(), &arr);
  for (size_t i = 0; i < issues.size(); ++i) {
    napi_value item;
    napi_create_object(env, &item);
    napi_set_named_property(env, item, "line", MakeNumber(env, issues[i].line));
    napi_set_named_property(env, item, "message", MakeString(env, issues[i].message));
    napi_set_element(env, arr, static_cast<uint32_t>(i), item);
  }
  return arr;
}

static napi_value MakeStringArray(napi_env env, const std::vector<std::string>& items) {
  napi_value arr;
  napi_create_array_with_length(env, items.size(), &arr);
  for (size_t i = 0; i < items.size(); ++i) {
    napi_set_element(env, arr, static_cast<uint32_t>(i), MakeString(env, items[i]));
  }
  return arr;
}

static napi_value CheckScene(napi_env env, napi_callback_info info) {
  size_t argc = 1;
  napi_value argv[1];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc != 1) {
    ThrowTypeError(env, "checkScene(scene) expects 1 argument");
    return nullptr;
  }

  Json scene;
  if (!DocumentFromNapi(env, argv[0], scene)) return nullptr;

  const auto report = llm_patch::check_scene(scene);
  napi_value obj;
  napi_create_object(env, &obj);
  napi_set_named_property(env, obj, "success", MakeBool(env, report.success));
  napi_set_named_property(env, obj, "errors", MakeStringArray(env, report.errors));
  napi_set_named_property(env, obj, "warnings", MakeStringArray(env, report.warnings));
  return obj;
}

static napi_value Init(napi_env env, napi_value exports) {
  napi_property_descriptor props[] = {
      {"applyDiff", nullptr, ApplyDiff, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"applyNodeDiff", nullptr, ApplyNodeDiff, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"applySceneDiff", nullptr, ApplySceneDiff, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"createDiffTemplate", nullptr, CreateDiffTemplate, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"similarity", nullptr, Similarity, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"parseHunks", nullptr, ParseHunks, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"lintDiff", nullptr, LintDiff, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"checkScene", nullptr, CheckScene, nullptr, nullptr, nullptr, napi_default, nullptr},
  };

  napi_define_properties(env, exports, sizeof(props) / sizeof(props[0]), props);
  return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)
