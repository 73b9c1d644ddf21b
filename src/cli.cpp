#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "warden/config.hpp"
#include "warden/engine.hpp"
#include "warden/errors.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/runtime.hpp"
#include "warden/version.hpp"

namespace {

bool read_file(const std::string& path, std::string* out) {
  if (path == "-") {
    *out = std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  *out = std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

bool write_file(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
  return static_cast<bool>(ofs);
}

int fail(warden::ErrorCode code, const std::string& message, int exit_code = 2) {
  std::cerr << warden::error_to_json(code, message) << "\n";
  return exit_code;
}

std::string option(int argc, char** argv, const std::string& name, int from) {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == name && i + 1 < argc) return argv[i + 1];
  }
  return "";
}

void usage() {
  std::cerr << "usage: warden [--config FILE] <command>\n"
               "  exec [--request FILE|-] [--out FILE]   run one request (default stdin)\n"
               "  batch FILE                             run {\"requests\":[...]} concurrently\n"
               "  languages                              registered languages and runtimes\n"
               "  limits                                 default limits and ceilings\n"
               "  doctor                                 check configuration and toolchains\n"
               "  version                                version manifest\n";
}

std::string languages_json(const warden::Engine& engine) {
  std::string out = "[";
  bool first = true;
  for (warden::Language lang : warden::kAllLanguages) {
    auto info = engine.environment_info(warden::to_string(lang));
    if (!info) continue;
    if (!first) out += ",";
    first = false;
    out += warden::environment_info_to_json(*info);
  }
  out += "]";
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  int cmd_index = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config") {
      ++i;
      continue;
    }
    if (a.rfind("--", 0) == 0) continue;
    cmd = a;
    cmd_index = i;
    break;
  }
  if (cmd.empty()) {
    usage();
    return 1;
  }

  if (cmd == "version") {
    std::cout << warden::version::manifest_to_json(warden::version::current_manifest()) << "\n";
    return 0;
  }

  warden::EngineConfig config = warden::EngineConfig::from_env();
  const std::string config_path = option(argc, argv, "--config", 1);
  if (!config_path.empty()) {
    std::string doc;
    if (!read_file(config_path, &doc)) {
      return fail(warden::ErrorCode::invalid_request, "cannot read config " + config_path);
    }
    std::string err;
    if (!warden::apply_config_json(config, doc, &err)) {
      return fail(warden::ErrorCode::json_parse_error, "config " + config_path + ": " + err);
    }
  }

  warden::Engine engine(config);

  if (cmd == "languages") {
    std::cout << languages_json(engine) << "\n";
    return 0;
  }

  if (cmd == "limits") {
    const auto& c = engine.config().ceilings;
    warden::jsonlite::Object ceilings;
    ceilings["timeoutMs"] = static_cast<std::uint64_t>(c.timeout_ms);
    ceilings["maxMemoryMB"] = static_cast<std::uint64_t>(c.max_memory_mb);
    ceilings["maxOutputSize"] = static_cast<std::uint64_t>(c.max_output_size);
    ceilings["maxInputSize"] = static_cast<std::uint64_t>(c.max_input_size);
    std::cout << "{\"defaults\":" << warden::limits_to_json(engine.default_limits())
              << ",\"ceilings\":" << warden::jsonlite::to_json(warden::jsonlite::Value(ceilings))
              << "}\n";
    return 0;
  }

  if (cmd == "doctor") {
    const auto check = warden::validate_config(engine.config());
    const auto h = warden::hash_runtime_info();
    bool ok = check.ok;
    warden::jsonlite::Array errors, warnings, missing;
    for (const auto& e : check.errors) errors.emplace_back(e);
    for (const auto& w : check.warnings) warnings.emplace_back(w);
    for (warden::Language lang : engine.config().required_languages) {
      auto info = engine.environment_info(warden::to_string(lang));
      if (!info || !info->available) {
        ok = false;
        missing.emplace_back(warden::to_string(lang));
      }
    }
    warden::jsonlite::Object o;
    o["ok"] = ok;
    o["configErrors"] = errors;
    o["configWarnings"] = warnings;
    o["missingRequiredLanguages"] = missing;
    o["hashPrimitive"] = h.primitive;
    o["hashVersion"] = h.version;
    o["sandboxEnabled"] = engine.config().sandbox.sandbox_enabled;
    o["scratchRoot"] = warden::scratch_root_of(engine.config());
    std::cout << "{\"doctor\":" << warden::jsonlite::to_json(warden::jsonlite::Value(o))
              << ",\"languages\":" << languages_json(engine) << "}\n";
    return ok ? 0 : 1;
  }

  if (cmd != "exec" && cmd != "batch") {
    usage();
    return 1;
  }

  try {
    engine.initialize();
  } catch (const warden::EngineError& e) {
    return fail(e.code(), e.what());
  }

  if (cmd == "exec") {
    std::string in = option(argc, argv, "--request", cmd_index + 1);
    if (in.empty()) in = "-";
    const std::string out = option(argc, argv, "--out", cmd_index + 1);
    std::string payload;
    if (!read_file(in, &payload)) {
      return fail(warden::ErrorCode::invalid_request, "cannot read request " + in);
    }
    std::string err;
    auto req = warden::parse_request_json(payload, &err);
    if (!err.empty()) return fail(warden::ErrorCode::json_parse_error, err);

    warden::ExecutionResult res;
    try {
      res = engine.execute(req);
    } catch (const warden::EngineError& e) {
      return fail(e.code(), e.what());
    }
    const std::string json = warden::result_to_json(res);
    if (out.empty()) {
      std::cout << json << "\n";
    } else if (!write_file(out, json)) {
      return fail(warden::ErrorCode::invalid_request, "cannot write " + out);
    }
    return res.success ? 0 : 1;
  }

  // batch
  std::string in = option(argc, argv, "--request", cmd_index + 1);
  if (in.empty() && cmd_index + 1 < argc) in = argv[cmd_index + 1];
  if (in.empty()) {
    usage();
    return 1;
  }
  std::string payload;
  if (!read_file(in, &payload)) {
    return fail(warden::ErrorCode::invalid_request, "cannot read batch " + in);
  }
  std::optional<warden::jsonlite::JsonError> jerr;
  auto doc = warden::jsonlite::parse(payload, &jerr);
  if (jerr) return fail(warden::ErrorCode::json_parse_error, jerr->code + ": " + jerr->message);
  const auto* items = warden::jsonlite::get_array(doc, "requests");
  if (!items) return fail(warden::ErrorCode::invalid_request, "requests must be an array");

  // Malformed entries become failed results in place; the rest run together.
  std::vector<warden::ExecutionRequest> requests;
  std::vector<std::optional<warden::ExecutionResult>> parse_failures;
  for (const auto& item : *items) {
    std::string err;
    warden::ExecutionRequest req;
    if (const auto* obj = std::get_if<warden::jsonlite::Object>(&item.v)) {
      req = warden::parse_request_object(*obj, &err);
    } else {
      err = "request must be an object";
    }
    if (err.empty()) {
      parse_failures.emplace_back(std::nullopt);
    } else {
      parse_failures.emplace_back(
          warden::failed_result(req.language, warden::ErrorCode::invalid_request, err));
    }
    requests.push_back(std::move(req));
  }

  std::vector<warden::ExecutionRequest> runnable;
  for (std::size_t i = 0; i < requests.size(); ++i) {
    if (!parse_failures[i]) runnable.push_back(requests[i]);
  }
  auto ran = engine.execute_multiple(runnable);

  warden::jsonlite::Array results;
  bool all_ok = true;
  std::size_t next = 0;
  for (std::size_t i = 0; i < requests.size(); ++i) {
    const warden::ExecutionResult& r = parse_failures[i] ? *parse_failures[i] : ran[next++];
    all_ok = all_ok && r.success;
    results.push_back(warden::result_to_value(r));
  }
  warden::jsonlite::Object o;
  o["results"] = std::move(results);
  std::cout << warden::jsonlite::to_json(warden::jsonlite::Value(std::move(o))) << "\n";
  return all_ok ? 0 : 1;
}
