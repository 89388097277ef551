#include "hawk_hook_loader.h"
#include "logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool ParsePattern(const json& value, UrlPattern* pattern, std::string* error) {
  if (value.is_string()) {
    *pattern = UrlPattern::String(value.get<std::string>());
  } else if (value.is_object() && value.contains("regex") && value["regex"].is_string()) {
    *pattern = UrlPattern::Regex(value["regex"].get<std::string>());
  } else {
    *error = "URL pattern must be a string or {\"regex\": \"...\"}";
    return false;
  }
  return HawkHookRegistry::ValidatePattern(*pattern, error);
}

bool ParsePatternList(const json& value, const char* key,
                      std::vector<UrlPattern>* patterns, std::string* error) {
  if (!value.is_array()) {
    *error = std::string("'") + key + "' must be an array";
    return false;
  }
  for (const auto& item : value) {
    UrlPattern pattern;
    if (!ParsePattern(item, &pattern, error)) {
      *error = std::string(key) + ": " + *error;
      return false;
    }
    patterns->push_back(pattern);
  }
  return true;
}

bool ParseHeaderRules(const json& value, const char* key,
                      HawkHeaderMap* headers, std::string* error) {
  if (!value.is_object()) {
    *error = std::string("'") + key + "' must be an object";
    return false;
  }
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (!it.value().is_string()) {
      *error = std::string(key) + "." + it.key() + " must be a string";
      return false;
    }
    (*headers)[it.key()] = it.value().get<std::string>();
  }
  return true;
}

bool ParseCaptureRules(const json& value, CaptureRules* rules, std::string* error) {
  if (!value.is_object()) {
    *error = "'captureRules' must be an object";
    return false;
  }

  if (value.contains("methods")) {
    const json& methods = value["methods"];
    if (!methods.is_array()) {
      *error = "'methods' must be an array";
      return false;
    }
    for (const auto& m : methods) {
      if (!m.is_string()) {
        *error = "'methods' entries must be strings";
        return false;
      }
      rules->methods.push_back(m.get<std::string>());
    }
  }

  if (value.contains("statusCodes")) {
    const json& codes = value["statusCodes"];
    if (!codes.is_array()) {
      *error = "'statusCodes' must be an array";
      return false;
    }
    for (const auto& c : codes) {
      if (!c.is_number_integer()) {
        *error = "'statusCodes' entries must be integers";
        return false;
      }
      rules->status_codes.push_back(c.get<int>());
    }
  }

  if (value.contains("requestUrlPatterns")) {
    std::vector<UrlPattern> patterns;
    if (!ParsePatternList(value["requestUrlPatterns"], "requestUrlPatterns", &patterns, error)) {
      return false;
    }
    rules->request_url_patterns = patterns;
  }

  if (value.contains("responseUrlPatterns")) {
    std::vector<UrlPattern> patterns;
    if (!ParsePatternList(value["responseUrlPatterns"], "responseUrlPatterns", &patterns, error)) {
      return false;
    }
    rules->response_url_patterns = patterns;
  }

  if (value.contains("requestHeaders") &&
      !ParseHeaderRules(value["requestHeaders"], "requestHeaders", &rules->request_headers, error)) {
    return false;
  }
  if (value.contains("responseHeaders") &&
      !ParseHeaderRules(value["responseHeaders"], "responseHeaders", &rules->response_headers, error)) {
    return false;
  }

  for (const char* key : {"captureResponseBody", "captureResponses"}) {
    if (value.contains(key) && !value[key].is_boolean()) {
      *error = std::string("'") + key + "' must be a boolean";
      return false;
    }
  }
  rules->capture_response_body = value.value("captureResponseBody", true);
  rules->capture_responses = value.value("captureResponses", true);
  return true;
}

}  // namespace

std::shared_ptr<HawkCaptureHook> HawkHookLoader::ParseHookDefinition(const json& doc,
                                                                    std::string* error) {
  if (!doc.is_object()) {
    *error = "hook definition must be a JSON object";
    return nullptr;
  }

  HookConfig config;

  if (!doc.contains("name") || !doc["name"].is_string() || doc["name"].get<std::string>().empty()) {
    *error = "missing 'name'";
    return nullptr;
  }
  config.name = doc["name"].get<std::string>();

  if (doc.contains("description")) {
    if (!doc["description"].is_string()) {
      *error = "'description' must be a string";
      return nullptr;
    }
    config.description = doc["description"].get<std::string>();
  }

  if (doc.contains("enabled")) {
    if (!doc["enabled"].is_boolean()) {
      *error = "'enabled' must be a boolean";
      return nullptr;
    }
    config.enabled = doc["enabled"].get<bool>();
  }

  if (!doc.contains("urlPatterns")) {
    *error = "missing 'urlPatterns'";
    return nullptr;
  }
  if (!ParsePatternList(doc["urlPatterns"], "urlPatterns", &config.url_patterns, error)) {
    return nullptr;
  }
  if (config.url_patterns.empty()) {
    *error = "'urlPatterns' is empty";
    return nullptr;
  }

  if (!doc.contains("captureRules")) {
    *error = "missing 'captureRules'";
    return nullptr;
  }
  if (!ParseCaptureRules(doc["captureRules"], &config.capture_rules, error)) {
    return nullptr;
  }

  std::string endpoint_prefix;
  if (doc.contains("endpointPrefix")) {
    if (!doc["endpointPrefix"].is_string()) {
      *error = "'endpointPrefix' must be a string";
      return nullptr;
    }
    endpoint_prefix = doc["endpointPrefix"].get<std::string>();
  }

  return std::make_shared<HawkConfigHook>(std::move(config), std::move(endpoint_prefix));
}

std::shared_ptr<HawkCaptureHook> HawkHookLoader::LoadHookFile(const std::string& path,
                                                             std::string* error) {
  std::ifstream in(path);
  if (!in) {
    *error = "cannot open file";
    return nullptr;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  json doc = json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded()) {
    *error = "invalid JSON";
    return nullptr;
  }
  return ParseHookDefinition(doc, error);
}

size_t HawkHookLoader::LoadHooks(const std::string& directory, HawkHookRegistry* registry) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    LOG_WARN("HookLoader", "Hooks directory not found: " + directory);
    return 0;
  }

  std::vector<fs::path> files;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() == ".json" && it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    LOG_WARN("HookLoader", "Failed to scan " + directory + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  size_t loaded = 0;
  for (const auto& file : files) {
    std::string error;
    std::shared_ptr<HawkCaptureHook> hook = LoadHookFile(file.string(), &error);
    if (!hook) {
      LOG_ERROR("HookLoader", "Failed to load hook " + file.filename().string() + ": " + error);
      continue;
    }
    if (registry->RegisterHook(hook)) {
      loaded++;
    }
  }

  LOG_INFO("HookLoader", "Loaded " + std::to_string(loaded) + " capture hooks from " + directory);
  return loaded;
}
