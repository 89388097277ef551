#ifndef HAWK_HOOK_LOADER_H_
#define HAWK_HOOK_LOADER_H_

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "hawk_capture_hook.h"
#include "hawk_hook_registry.h"

/**
 * Hook definition files.
 *
 * One hook per *.json file:
 *
 *   {
 *     "name": "vidiq-api",
 *     "description": "vidIQ API traffic",
 *     "enabled": true,
 *     "urlPatterns": ["https://api.vidiq.com/*", {"regex": "vidiq\\.com/v\\d+/"}],
 *     "captureRules": {
 *       "methods": ["GET", "POST"],
 *       "statusCodes": [200],
 *       "requestUrlPatterns": [...],
 *       "responseUrlPatterns": [...],
 *       "requestHeaders": {"authorization": ""},
 *       "responseHeaders": {"content-type": "json"},
 *       "captureResponseBody": true,
 *       "captureResponses": true
 *     },
 *     "endpointPrefix": "https://api.vidiq.com"
 *   }
 *
 * "captureRules" is required; every key inside it is optional.
 */
class HawkHookLoader {
 public:
  // Parses one definition. Returns nullptr and fills |error| on a schema error.
  static std::shared_ptr<HawkCaptureHook> ParseHookDefinition(const nlohmann::json& doc,
                                                              std::string* error);

  // Reads and parses one file.
  static std::shared_ptr<HawkCaptureHook> LoadHookFile(const std::string& path,
                                                       std::string* error);

  // Registers every *.json hook in |directory| in lexical filename order.
  // Bad files are logged and skipped. Returns the number registered; a
  // missing directory logs a warning and returns 0.
  static size_t LoadHooks(const std::string& directory, HawkHookRegistry* registry);
};

#endif  // HAWK_HOOK_LOADER_H_
