#include "hawk_capture_config.h"
#include "logger.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

bool ReadString(const json& doc, const char* key, std::string* out, std::string* error) {
  auto it = doc.find(key);
  if (it == doc.end()) return true;
  if (!it->is_string()) {
    *error = std::string("'") + key + "' must be a string";
    return false;
  }
  *out = it->get<std::string>();
  return true;
}

bool ReadBool(const json& doc, const char* key, bool* out, std::string* error) {
  auto it = doc.find(key);
  if (it == doc.end()) return true;
  if (!it->is_boolean()) {
    *error = std::string("'") + key + "' must be a boolean";
    return false;
  }
  *out = it->get<bool>();
  return true;
}

bool ReadSize(const json& doc, const char* key, size_t* out, std::string* error) {
  auto it = doc.find(key);
  if (it == doc.end()) return true;
  if (!it->is_number_unsigned()) {
    *error = std::string("'") + key + "' must be a non-negative integer";
    return false;
  }
  *out = it->get<size_t>();
  return true;
}

const char* GetEnv(const char* name) {
  const char* value = std::getenv(name);
  return (value && value[0] != '\0') ? value : nullptr;
}

}  // namespace

bool LoadCaptureConfigFile(const std::string& file_path,
                           HawkCaptureConfig* config,
                           std::string* error) {
  std::ifstream in(file_path);
  if (!in) {
    *error = "cannot open config file: " + file_path;
    return false;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  json doc = json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    *error = "config file is not a JSON object: " + file_path;
    return false;
  }

  // Parse into a copy so a bad key leaves the caller's config untouched
  HawkCaptureConfig parsed = *config;
  if (!ReadString(doc, "outputDirectory", &parsed.output_directory, error) ||
      !ReadString(doc, "outputFormat", &parsed.output_format, error) ||
      !ReadBool(doc, "perHookFiles", &parsed.per_hook_files, error) ||
      !ReadSize(doc, "maxCaptureSize", &parsed.max_capture_size, error) ||
      !ReadString(doc, "hooksDirectory", &parsed.hooks_directory, error) ||
      !ReadString(doc, "logFile", &parsed.log_file, error) ||
      !ReadString(doc, "logLevel", &parsed.log_level, error)) {
    return false;
  }

  *config = parsed;
  LOG_DEBUG("Config", "Loaded config file: " + file_path);
  return true;
}

void ApplyEnvironmentOverrides(HawkCaptureConfig* config) {
  if (const char* value = GetEnv("HAWK_OUTPUT_DIR")) {
    config->output_directory = value;
  }
  if (const char* value = GetEnv("HAWK_OUTPUT_FORMAT")) {
    config->output_format = value;
  }
  if (const char* value = GetEnv("HAWK_MAX_CAPTURE_SIZE")) {
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(value, &end, 10);
    if (end && *end == '\0' && parsed > 0) {
      config->max_capture_size = static_cast<size_t>(parsed);
    } else {
      LOG_WARN("Config", std::string("Ignoring invalid HAWK_MAX_CAPTURE_SIZE: ") + value);
    }
  }
  if (const char* value = GetEnv("HAWK_HOOKS_DIR")) {
    config->hooks_directory = value;
  }
  if (const char* value = GetEnv("HAWK_LOG_FILE")) {
    config->log_file = value;
  }
  if (const char* value = GetEnv("HAWK_LOG_LEVEL")) {
    config->log_level = value;
  }
}

bool ValidateCaptureConfig(const HawkCaptureConfig& config, std::string* error) {
  if (config.max_capture_size == 0) {
    *error = "maxCaptureSize must be at least 1";
    return false;
  }
  if (config.output_format != "jsonl" && config.output_format != "none") {
    *error = "outputFormat must be 'jsonl' or 'none', got '" + config.output_format + "'";
    return false;
  }
  if (config.output_directory.empty()) {
    *error = "outputDirectory must not be empty";
    return false;
  }
  HawkLogger::Level level;
  if (!HawkLogger::Logger::ParseLevel(config.log_level, &level)) {
    *error = "unknown logLevel '" + config.log_level + "'";
    return false;
  }
  return true;
}

void ApplyLoggingConfig(const HawkCaptureConfig& config) {
  if (!config.log_file.empty()) {
    HawkLogger::Logger::Init(config.log_file);
  } else {
    HawkLogger::Logger::Init();
  }

  HawkLogger::Level level;
  if (HawkLogger::Logger::ParseLevel(config.log_level, &level)) {
    HawkLogger::Logger::SetLevel(level);
  }
}
