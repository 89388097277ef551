#ifndef HAWK_HOOK_REGISTRY_H_
#define HAWK_HOOK_REGISTRY_H_

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "hawk_capture_hook.h"

// Summary of one registered hook, for status output
struct HookDescription {
  std::string name;
  std::string description;
  bool enabled = true;
  std::vector<std::string> patterns;
};

// Pattern -> hook index. Every URL pattern of a hook is a separate key; a key
// registered again by a later hook is taken over by that hook.
class HawkHookRegistry {
 public:
  HawkHookRegistry();
  ~HawkHookRegistry();

  HawkHookRegistry(const HawkHookRegistry&) = delete;
  HawkHookRegistry& operator=(const HawkHookRegistry&) = delete;

  // Rejects hooks with no name, no URL patterns, or a regex that does not
  // compile. Returns false (and logs) when rejected.
  bool RegisterHook(std::shared_ptr<HawkCaptureHook> hook);

  void Clear();

  // Hooks with any pattern matching |url|, deduplicated by name, in pattern
  // registration order. Disabled hooks are included; callers check enabled().
  std::vector<std::shared_ptr<HawkCaptureHook>> FindMatchingHooks(const std::string& url) const;

  bool ShouldCaptureRequest(const HookRequestInfo& request, const HawkCaptureHook& hook) const;
  bool ShouldCaptureResponse(const HookResponseInfo& response, const HawkCaptureHook& hook) const;

  // Pattern semantics shared with capture rules: plain strings match exactly
  // or as a prefix, '*' is a wildcard over an anchored match, regex patterns
  // search anywhere in the URL.
  bool UrlMatches(const std::string& url, const UrlPattern& pattern) const;

  size_t HookCount() const;
  size_t PatternCount() const;
  std::vector<HookDescription> Describe() const;

  // Returns false and fills |error| when a regex in |pattern| is invalid.
  static bool ValidatePattern(const UrlPattern& pattern, std::string* error);

 private:
  struct PatternEntry {
    UrlPattern pattern;
    std::shared_ptr<HawkCaptureHook> hook;
  };

  bool UrlMatchesLocked(const std::string& url, const UrlPattern& pattern) const;
  bool AnyPatternMatchesLocked(const std::string& url,
                               const std::vector<UrlPattern>& patterns) const;
  const std::regex* GetCompiledLocked(const UrlPattern& pattern) const;
  static bool HeadersSatisfy(const HawkHeaderMap& headers, const HawkHeaderMap& rules);

  mutable std::mutex mutex_;

  // Insertion-ordered; an overwritten key keeps its original slot
  std::vector<PatternEntry> entries_;
  std::unordered_map<std::string, size_t> entry_index_;

  // Pattern key -> compiled regex (wildcards and native regexes)
  mutable std::unordered_map<std::string, std::regex> regex_cache_;
};

#endif  // HAWK_HOOK_REGISTRY_H_
