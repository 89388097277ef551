/**
 * Hawk Capture - Configuration
 *
 * Priority order: CLI flags > Environment variables > Config file > Defaults
 *
 * Environment variables:
 *   HAWK_OUTPUT_DIR         Directory for JSONL logs and exports
 *   HAWK_OUTPUT_FORMAT      "jsonl" (stream every capture) or "none"
 *   HAWK_MAX_CAPTURE_SIZE   Ring buffer capacity per session
 *   HAWK_HOOKS_DIR          Directory scanned for hook definitions
 *   HAWK_LOG_FILE           Append log lines to this file
 *   HAWK_LOG_LEVEL          debug | info | warn | error
 */

#ifndef HAWK_CAPTURE_CONFIG_H_
#define HAWK_CAPTURE_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <string>

// Default configuration values
#define HAWK_DEFAULT_OUTPUT_DIR "./captured-requests"
#define HAWK_DEFAULT_OUTPUT_FORMAT "jsonl"
#define HAWK_DEFAULT_HOOKS_DIR "./capture-hooks"
#define HAWK_DEFAULT_MAX_CAPTURE_SIZE 1000
#define HAWK_DEFAULT_LOG_LEVEL "info"

// Response bodies up to this many characters are stored verbatim
constexpr size_t kMaxInlineBodyChars = 100000;
// Length of bodyPreview for larger bodies
constexpr size_t kBodyPreviewChars = 1000;
// Commands forwarded into a sub-target are abandoned after this long
constexpr int64_t kTargetRpcTimeoutMs = 8000;

struct HawkCaptureConfig {
  std::string output_directory = HAWK_DEFAULT_OUTPUT_DIR;
  std::string output_format = HAWK_DEFAULT_OUTPUT_FORMAT;  // "jsonl" or "none"
  bool per_hook_files = true;
  size_t max_capture_size = HAWK_DEFAULT_MAX_CAPTURE_SIZE;
  std::string hooks_directory = HAWK_DEFAULT_HOOKS_DIR;
  std::string log_file;
  std::string log_level = HAWK_DEFAULT_LOG_LEVEL;

  // True when every capture is appended to the per-hook JSONL files
  bool StreamsJsonl() const { return output_format == "jsonl" && per_hook_files; }
};

/**
 * Load configuration from a JSON file. Keys mirror the struct fields in
 * camelCase (outputDirectory, outputFormat, perHookFiles, maxCaptureSize,
 * hooksDirectory, logFile, logLevel). Unknown keys are ignored.
 *
 * @return false if the file cannot be read, is not a JSON object, or a
 *         known key has the wrong type. |error| receives the reason.
 */
bool LoadCaptureConfigFile(const std::string& file_path,
                           HawkCaptureConfig* config,
                           std::string* error);

// Overlay HAWK_* environment variables onto |config|.
void ApplyEnvironmentOverrides(HawkCaptureConfig* config);

// Checks ranges and enumerations. |error| receives the first problem found.
bool ValidateCaptureConfig(const HawkCaptureConfig& config, std::string* error);

// Applies log_level and log_file to the process logger.
void ApplyLoggingConfig(const HawkCaptureConfig& config);

#endif  // HAWK_CAPTURE_CONFIG_H_
