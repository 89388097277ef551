#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hawk_capture_config.h"
#include "hawk_capture_engine.h"
#include "hawk_capture_store.h"
#include "hawk_hook_loader.h"
#include "hawk_hook_registry.h"
#include "hawk_string_utils.h"
#include "hawk_task_runner.h"
#include "logger.h"

namespace fs = std::filesystem;

namespace {

struct CliOptions {
  std::string command;
  std::vector<std::string> positional;
  std::string config_file;
  std::string hooks_dir;
  std::string format;
  std::string output;
  std::string filter_type;
  std::string hook_name;
  std::string session_id;
  size_t limit = 10;
  bool show_tokens = false;
  bool verbose = false;
  bool help = false;
};

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [--config FILE] [--verbose] COMMAND [ARGS]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  status [--hooks-dir DIR]         Load hooks and print engine status as JSON\n";
  std::cout << "  validate DIR                     Load every hook in DIR and report the result\n";
  std::cout << "  list FILE.jsonl [OPTIONS]        Summarize the newest records of a capture log\n";
  std::cout << "      --limit N                    Number of records (default: 10)\n";
  std::cout << "      --filter TYPE                request, response, websocket or page\n";
  std::cout << "      --hook NAME                  Only records of this hook\n";
  std::cout << "      --show-tokens                Print tokens extracted by hooks\n";
  std::cout << "  export FILE.jsonl --format F     Convert a capture log to json, jsonl or csv\n";
  std::cout << "      --output PATH                Destination (default: <outputDir>/<name>-export-<time>.<ext>)\n";
  std::cout << "  reload [--hooks-dir DIR]         Reload hooks from DIR and list them\n";
  std::cout << "  cleanup [--session ID]           Delete streamed capture logs (all when no ID)\n";
  std::cout << "\n";
  std::cout << "Global options:\n";
  std::cout << "  --config FILE    JSON configuration file\n";
  std::cout << "  --verbose        Debug logging\n";
  std::cout << "  --help           Show this help message\n";
  std::cout << "\n";
  std::cout << "Environment: HAWK_OUTPUT_DIR, HAWK_OUTPUT_FORMAT, HAWK_MAX_CAPTURE_SIZE,\n";
  std::cout << "             HAWK_HOOKS_DIR, HAWK_LOG_FILE, HAWK_LOG_LEVEL\n";
}

bool ParseCount(const std::string& text, size_t* value) {
  if (text.empty()) return false;
  char* end = nullptr;
  long parsed = std::strtol(text.c_str(), &end, 10);
  if (*end != '\0' || parsed <= 0) return false;
  *value = static_cast<size_t>(parsed);
  return true;
}

bool ParseArguments(int argc, char* argv[], CliOptions* options) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      options->config_file = argv[++i];
    } else if (arg == "--verbose") {
      options->verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      options->help = true;
    } else if (arg == "--hooks-dir" && i + 1 < argc) {
      options->hooks_dir = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      options->format = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      options->output = argv[++i];
    } else if (arg == "--filter" && i + 1 < argc) {
      options->filter_type = argv[++i];
    } else if (arg == "--hook" && i + 1 < argc) {
      options->hook_name = argv[++i];
    } else if (arg == "--session" && i + 1 < argc) {
      options->session_id = argv[++i];
    } else if (arg == "--show-tokens") {
      options->show_tokens = true;
    } else if (arg == "--limit" && i + 1 < argc) {
      if (!ParseCount(argv[++i], &options->limit)) {
        std::cerr << "Invalid --limit value: " << argv[i] << std::endl;
        return false;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    } else if (options->command.empty()) {
      options->command = arg;
    } else {
      options->positional.push_back(arg);
    }
  }
  return true;
}

bool ResolveConfig(const CliOptions& options, HawkCaptureConfig* config) {
  std::string error;
  if (!options.config_file.empty() &&
      !LoadCaptureConfigFile(options.config_file, config, &error)) {
    std::cerr << "Config error: " << error << std::endl;
    return false;
  }
  ApplyEnvironmentOverrides(config);
  if (!options.hooks_dir.empty()) {
    config->hooks_directory = options.hooks_dir;
  }
  if (!ValidateCaptureConfig(*config, &error)) {
    std::cerr << "Config error: " << error << std::endl;
    return false;
  }

  ApplyLoggingConfig(*config);
  if (options.verbose) {
    HawkLogger::Logger::SetLevel(HawkLogger::DEBUG);
  }
  return true;
}

int RunStatus(const HawkCaptureConfig& config) {
  // Inspection only: nothing is streamed
  HawkCaptureConfig inspect_config = config;
  inspect_config.output_format = "none";

  hawk::TimerQueue timers;
  HawkCaptureEngine engine(inspect_config, &timers);
  engine.LoadHooks(config.hooks_directory);

  nlohmann::json status = engine.GetStatus().ToJson();
  status["outputFormat"] = config.output_format;
  status["hooksDirectory"] = config.hooks_directory;
  std::cout << status.dump(2) << std::endl;

  timers.Shutdown();
  return 0;
}

int RunValidate(const CliOptions& options) {
  if (options.positional.empty()) {
    std::cerr << "validate: missing hooks directory" << std::endl;
    return 1;
  }

  const std::string& directory = options.positional[0];
  HawkHookRegistry registry;
  size_t loaded = HawkHookLoader::LoadHooks(directory, &registry);

  for (const auto& hook : registry.Describe()) {
    std::cout << "  " << hook.name << (hook.enabled ? "" : " (disabled)");
    if (!hook.description.empty()) {
      std::cout << " - " << hook.description;
    }
    std::cout << "\n";
    for (const auto& pattern : hook.patterns) {
      std::cout << "      " << pattern << "\n";
    }
  }
  std::cout << loaded << " hooks registered from " << directory << std::endl;
  return loaded > 0 ? 0 : 1;
}

// Tokens a hook extracted into custom.tokens, values cut to 30 characters
void PrintTokens(const CaptureRecord& record) {
  if (!record.custom.is_object()) return;
  auto tokens = record.custom.find("tokens");
  if (tokens == record.custom.end() || !tokens->is_object() || tokens->empty()) return;

  std::cout << "    tokens: " << tokens->size() << " found\n";
  for (auto it = tokens->begin(); it != tokens->end(); ++it) {
    std::string value = it.value().is_string() ? it.value().get<std::string>()
                                               : it.value().dump();
    if (value.size() > 30) {
      value = value.substr(0, 30) + "...";
    }
    std::cout << "      " << it.key() << ": " << value << "\n";
  }
}

int RunList(const CliOptions& options) {
  if (options.positional.empty()) {
    std::cerr << "list: missing capture file" << std::endl;
    return 1;
  }

  CaptureType filter = CaptureType::REQUEST;
  if (!options.filter_type.empty() && !ParseCaptureType(options.filter_type, &filter)) {
    std::cerr << "list: unknown record type: " << options.filter_type << std::endl;
    return 1;
  }

  std::vector<CaptureRecord> records;
  std::string error;
  if (!HawkCaptureStore::ReadJsonl(options.positional[0], &records, &error)) {
    std::cerr << "list: " << error << std::endl;
    return 1;
  }

  std::vector<const CaptureRecord*> selected;
  for (const auto& record : records) {
    if (!options.filter_type.empty() && record.type != filter) continue;
    if (!options.hook_name.empty() && record.hook_name != options.hook_name) continue;
    selected.push_back(&record);
  }

  size_t start = selected.size() > options.limit ? selected.size() - options.limit : 0;
  for (size_t i = start; i < selected.size(); i++) {
    const CaptureRecord& record = *selected[i];
    std::cout << record.timestamp << "  " << CaptureTypeToString(record.type) << "  "
              << record.hook_name << "  ";
    if (record.method) std::cout << *record.method << " ";
    if (record.status) std::cout << *record.status << " ";
    std::cout << record.url;
    if (record.body_truncated && record.body_size) {
      std::cout << "  [body truncated, " << *record.body_size << " chars]";
    }
    std::cout << "\n";
    if (options.show_tokens) {
      PrintTokens(record);
    }
  }
  std::cout << (selected.size() - start) << " of " << selected.size() << " matching records ("
            << records.size() << " total)" << std::endl;
  return 0;
}

int RunExport(const CliOptions& options, const HawkCaptureConfig& config) {
  if (options.positional.empty()) {
    std::cerr << "export: missing capture file" << std::endl;
    return 1;
  }
  if (options.format.empty()) {
    std::cerr << "export: --format is required (json, jsonl, csv)" << std::endl;
    return 1;
  }

  const std::string& input = options.positional[0];
  std::vector<CaptureRecord> records;
  std::string error;
  if (!HawkCaptureStore::ReadJsonl(input, &records, &error)) {
    std::cerr << "export: " << error << std::endl;
    return 1;
  }

  std::string output = options.output;
  if (output.empty()) {
    std::string file_name = fs::path(input).stem().string() + "-export-" +
                            HawkUtil::FilenameTimestampNow() + "." + options.format;
    output = (fs::path(config.output_directory) / file_name).string();
  }

  ExportResult result = HawkCaptureStore::ExportRecords(records, options.format, output);
  if (!result.success) {
    std::cerr << "export failed: " << result.error << std::endl;
    return 1;
  }

  std::cout << "Exported " << result.count << " records (" << result.size << " bytes) to "
            << result.file_path << std::endl;
  return 0;
}

int RunReload(const HawkCaptureConfig& config) {
  HawkCaptureConfig inspect_config = config;
  inspect_config.output_format = "none";

  hawk::TimerQueue timers;
  HawkCaptureEngine engine(inspect_config, &timers);
  size_t loaded = engine.ReloadHooks(config.hooks_directory);

  std::cout << "Reloaded " << loaded << " hooks from " << config.hooks_directory << std::endl;
  for (const auto& hook : engine.GetStatus().hooks) {
    std::cout << "  " << hook.name << ": " << hook.description << "\n";
  }

  timers.Shutdown();
  return loaded > 0 ? 0 : 1;
}

int RunCleanup(const CliOptions& options, const HawkCaptureConfig& config) {
  std::vector<std::string> removed;
  std::string error;
  if (!HawkCaptureStore::RemoveCaptureLogs(config.output_directory, options.session_id,
                                           &removed, &error)) {
    std::cerr << "cleanup: " << error << std::endl;
    return 1;
  }

  for (const auto& path : removed) {
    std::cout << "  removed " << path << "\n";
  }
  if (options.session_id.empty()) {
    std::cout << "Cleaned up all capture logs in " << config.output_directory;
  } else {
    std::cout << "Cleaned up session " << options.session_id;
  }
  std::cout << " (" << removed.size() << " files)" << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  HawkLogger::Logger::Init();

  CliOptions options;
  if (!ParseArguments(argc, argv, &options)) {
    PrintUsage(argv[0]);
    return 1;
  }
  if (options.help || options.command.empty()) {
    PrintUsage(argv[0]);
    return options.help ? 0 : 1;
  }

  HawkCaptureConfig config;
  if (!ResolveConfig(options, &config)) {
    return 1;
  }

  if (options.command == "status") {
    return RunStatus(config);
  } else if (options.command == "validate") {
    return RunValidate(options);
  } else if (options.command == "list") {
    return RunList(options);
  } else if (options.command == "export") {
    return RunExport(options, config);
  } else if (options.command == "reload") {
    return RunReload(config);
  } else if (options.command == "cleanup") {
    return RunCleanup(options, config);
  }

  std::cerr << "Unknown command: " << options.command << std::endl;
  PrintUsage(argv[0]);
  return 1;
}
