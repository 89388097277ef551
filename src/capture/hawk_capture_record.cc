#include "hawk_capture_record.h"
#include "hawk_capture_config.h"
#include "hawk_string_utils.h"

using json = nlohmann::json;

const char* CaptureTypeToString(CaptureType type) {
  switch (type) {
    case CaptureType::REQUEST: return "request";
    case CaptureType::RESPONSE: return "response";
    case CaptureType::WEBSOCKET: return "websocket";
    case CaptureType::PAGE: return "page";
    default: return "request";
  }
}

bool ParseCaptureType(const std::string& value, CaptureType* type) {
  if (value == "request") *type = CaptureType::REQUEST;
  else if (value == "response") *type = CaptureType::RESPONSE;
  else if (value == "websocket") *type = CaptureType::WEBSOCKET;
  else if (value == "page") *type = CaptureType::PAGE;
  else return false;
  return true;
}

const char* CaptureSourceToString(CaptureSource source) {
  switch (source) {
    case CaptureSource::PAGE: return "page";
    case CaptureSource::EXTENSION: return "extension";
    case CaptureSource::SERVICE_WORKER: return "service_worker";
    case CaptureSource::SCRIPT: return "script";
    case CaptureSource::GLOBAL: return "global";
    default: return "";
  }
}

bool ParseCaptureSource(const std::string& value, CaptureSource* source) {
  if (value == "page") *source = CaptureSource::PAGE;
  else if (value == "extension") *source = CaptureSource::EXTENSION;
  else if (value == "service_worker") *source = CaptureSource::SERVICE_WORKER;
  else if (value == "script") *source = CaptureSource::SCRIPT;
  else if (value == "global") *source = CaptureSource::GLOBAL;
  else return false;
  return true;
}

void ApplyResponseBody(const std::string& body, CaptureRecord* record) {
  if (body.empty()) {
    return;
  }

  size_t length = HawkUtil::Utf8Length(body);
  if (length <= kMaxInlineBodyChars) {
    record->body = body;
  } else {
    record->body_size = length;
    record->body_truncated = true;
    record->body_preview = HawkUtil::Utf8Prefix(body, kBodyPreviewChars);
  }
}

namespace {

json NullableString(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

json HeadersToJson(const HawkHeaderMap& headers) {
  json out = json::object();
  for (const auto& h : headers) {
    out[h.first] = h.second;
  }
  return out;
}

void HeadersFromJson(const json& value, HawkHeaderMap* headers) {
  headers->clear();
  if (!value.is_object()) return;
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (it.value().is_string()) {
      (*headers)[it.key()] = it.value().get<std::string>();
    } else {
      (*headers)[it.key()] = it.value().dump();
    }
  }
}

std::optional<std::string> OptionalString(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

std::optional<bool> OptionalBool(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_boolean()) return std::nullopt;
  return it->get<bool>();
}

}  // namespace

json CaptureRecordToJson(const CaptureRecord& record) {
  json out = json::object();
  out["timestamp"] = record.timestamp;
  out["type"] = CaptureTypeToString(record.type);
  if (record.source != CaptureSource::NONE) {
    out["source"] = CaptureSourceToString(record.source);
  }
  if (record.request_id) out["requestId"] = *record.request_id;
  out["hookName"] = record.hook_name;
  out["sessionId"] = record.session_id;
  out["url"] = record.url;
  if (record.method) out["method"] = *record.method;
  if (record.status) out["status"] = *record.status;
  if (record.status_text) out["statusText"] = *record.status_text;
  out["headers"] = HeadersToJson(record.headers);
  if (record.post_data) out["postData"] = *record.post_data;
  if (record.resource_type) out["resourceType"] = *record.resource_type;
  if (record.is_navigation_request) out["isNavigationRequest"] = *record.is_navigation_request;
  if (record.frame) {
    out["frame"] = {{"url", NullableString(record.frame->url)},
                    {"name", NullableString(record.frame->name)}};
  }
  if (record.request) {
    out["request"] = {{"method", record.request->method},
                      {"headers", HeadersToJson(record.request->headers)}};
  }
  if (record.initiator) {
    out["initiator"] = {{"type", record.initiator->type},
                        {"url", NullableString(record.initiator->url)},
                        {"stack", record.initiator->stack}};
  }
  if (record.mime_type) out["mimeType"] = *record.mime_type;
  if (record.title) out["title"] = *record.title;
  if (record.is_extension_websocket) out["isExtensionWebSocket"] = *record.is_extension_websocket;
  if (record.body) out["body"] = *record.body;
  if (record.body_size) out["bodySize"] = *record.body_size;
  if (record.body_truncated) out["bodyTruncated"] = true;
  if (record.body_preview) out["bodyPreview"] = *record.body_preview;
  if (record.body_error) out["bodyError"] = *record.body_error;
  if (!record.custom.is_null()) out["custom"] = record.custom;
  return out;
}

json CaptureRecordsToJson(const std::vector<CaptureRecord>& records) {
  json out = json::array();
  for (const auto& record : records) {
    out.push_back(CaptureRecordToJson(record));
  }
  return out;
}

bool CaptureRecordFromJson(const json& value, CaptureRecord* record) {
  if (!value.is_object()) return false;

  auto type_str = OptionalString(value, "type");
  auto url = OptionalString(value, "url");
  CaptureRecord parsed;
  if (!type_str || !url || !ParseCaptureType(*type_str, &parsed.type)) {
    return false;
  }
  parsed.url = *url;

  parsed.timestamp = OptionalString(value, "timestamp").value_or("");
  if (auto source = OptionalString(value, "source")) {
    ParseCaptureSource(*source, &parsed.source);
  }
  parsed.request_id = OptionalString(value, "requestId");
  parsed.hook_name = OptionalString(value, "hookName").value_or("");
  parsed.session_id = OptionalString(value, "sessionId").value_or("");
  parsed.method = OptionalString(value, "method");
  auto status = value.find("status");
  if (status != value.end() && status->is_number_integer()) {
    parsed.status = status->get<int>();
  }
  parsed.status_text = OptionalString(value, "statusText");
  if (value.contains("headers")) {
    HeadersFromJson(value["headers"], &parsed.headers);
  }
  parsed.post_data = OptionalString(value, "postData");
  parsed.resource_type = OptionalString(value, "resourceType");
  parsed.is_navigation_request = OptionalBool(value, "isNavigationRequest");

  auto frame = value.find("frame");
  if (frame != value.end() && frame->is_object()) {
    CaptureFrameInfo info;
    info.url = OptionalString(*frame, "url");
    info.name = OptionalString(*frame, "name");
    parsed.frame = info;
  }

  auto request = value.find("request");
  if (request != value.end() && request->is_object()) {
    CaptureRequestSummary summary;
    summary.method = OptionalString(*request, "method").value_or("");
    if (request->contains("headers")) {
      HeadersFromJson((*request)["headers"], &summary.headers);
    }
    parsed.request = summary;
  }

  auto initiator = value.find("initiator");
  if (initiator != value.end() && initiator->is_object()) {
    CaptureInitiator info;
    info.type = OptionalString(*initiator, "type").value_or("unknown");
    info.url = OptionalString(*initiator, "url");
    if (initiator->contains("stack")) {
      info.stack = (*initiator)["stack"];
    }
    parsed.initiator = info;
  }

  parsed.mime_type = OptionalString(value, "mimeType");
  parsed.title = OptionalString(value, "title");
  parsed.is_extension_websocket = OptionalBool(value, "isExtensionWebSocket");
  parsed.body = OptionalString(value, "body");
  auto body_size = value.find("bodySize");
  if (body_size != value.end() && body_size->is_number_unsigned()) {
    parsed.body_size = body_size->get<size_t>();
  }
  parsed.body_truncated = OptionalBool(value, "bodyTruncated").value_or(false);
  parsed.body_preview = OptionalString(value, "bodyPreview");
  parsed.body_error = OptionalString(value, "bodyError");
  if (value.contains("custom")) {
    parsed.custom = value["custom"];
  }

  *record = std::move(parsed);
  return true;
}

std::string SerializeCaptureRecord(const CaptureRecord& record) {
  return CaptureRecordToJson(record).dump(-1, ' ', false, json::error_handler_t::replace);
}
