#ifndef HAWK_CAPTURE_RECORD_H_
#define HAWK_CAPTURE_RECORD_H_

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using HawkHeaderMap = std::map<std::string, std::string>;

enum class CaptureType {
  REQUEST,
  RESPONSE,
  WEBSOCKET,
  PAGE
};

// Execution context a capture is attributed to. Best-effort metadata only:
// initiator heuristics cannot reliably tell a service worker from an
// extension background script.
enum class CaptureSource {
  NONE,            // Not attributed (field omitted)
  PAGE,
  EXTENSION,
  SERVICE_WORKER,
  SCRIPT,
  GLOBAL           // Response seen on a sub-target, origin unknown
};

const char* CaptureTypeToString(CaptureType type);
bool ParseCaptureType(const std::string& value, CaptureType* type);
const char* CaptureSourceToString(CaptureSource source);
bool ParseCaptureSource(const std::string& value, CaptureSource* source);

struct CaptureFrameInfo {
  std::optional<std::string> url;
  std::optional<std::string> name;
};

// The request a response belongs to, as seen from the response side
struct CaptureRequestSummary {
  std::string method;
  HawkHeaderMap headers;
};

struct CaptureInitiator {
  std::string type = "unknown";
  std::optional<std::string> url;
  nlohmann::json stack;  // null when the browser reported no stack
};

// One persisted observation. Records are copied into the store and never
// modified afterwards.
struct CaptureRecord {
  std::string timestamp;                        // ISO-8601 UTC
  CaptureType type = CaptureType::REQUEST;
  CaptureSource source = CaptureSource::NONE;
  std::optional<std::string> request_id;
  std::string hook_name;
  std::string session_id;
  std::string url;
  std::optional<std::string> method;
  std::optional<int> status;
  std::optional<std::string> status_text;
  HawkHeaderMap headers;
  std::optional<std::string> post_data;
  std::optional<std::string> resource_type;
  std::optional<bool> is_navigation_request;
  std::optional<CaptureFrameInfo> frame;
  std::optional<CaptureRequestSummary> request;
  std::optional<CaptureInitiator> initiator;
  std::optional<std::string> mime_type;
  std::optional<std::string> title;
  std::optional<bool> is_extension_websocket;

  // Either body, or body_size + body_truncated + body_preview
  std::optional<std::string> body;
  std::optional<size_t> body_size;
  bool body_truncated = false;
  std::optional<std::string> body_preview;
  std::optional<std::string> body_error;

  nlohmann::json custom;  // Extra data returned by hook callbacks; null when absent
};

// Stores |body| verbatim when it is at most kMaxInlineBodyChars characters,
// otherwise records its size and a kBodyPreviewChars preview. Empty bodies
// leave the record untouched.
void ApplyResponseBody(const std::string& body, CaptureRecord* record);

// JSON form uses the persisted field names (requestId, hookName, ...).
nlohmann::json CaptureRecordToJson(const CaptureRecord& record);
nlohmann::json CaptureRecordsToJson(const std::vector<CaptureRecord>& records);

// Returns false when |value| is not an object or lacks type/url.
bool CaptureRecordFromJson(const nlohmann::json& value, CaptureRecord* record);

// Compact single-line serialization; invalid UTF-8 is replaced, never thrown.
std::string SerializeCaptureRecord(const CaptureRecord& record);

#endif  // HAWK_CAPTURE_RECORD_H_
