#include "hawk_capture_store.h"
#include "hawk_string_utils.h"
#include "logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const char kCsvHeader[] = "timestamp,type,hookName,url,method,status,headers";

std::string CsvField(const std::string& value) {
  if (value.find_first_of(",\"\n\r") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string ToCsv(const std::vector<CaptureRecord>& records) {
  std::string out = kCsvHeader;
  for (const auto& record : records) {
    json headers = json::object();
    for (const auto& h : record.headers) {
      headers[h.first] = h.second;
    }
    out += "\n";
    out += CsvField(record.timestamp) + ",";
    out += CsvField(CaptureTypeToString(record.type)) + ",";
    out += CsvField(record.hook_name) + ",";
    out += CsvField(record.url) + ",";
    out += CsvField(record.method.value_or("")) + ",";
    out += (record.status ? std::to_string(*record.status) : std::string()) + ",";
    out += CsvField(headers.dump(-1, ' ', false, json::error_handler_t::replace));
  }
  return out;
}

bool EnsureParentDirectory(const std::string& file_path, std::string* error) {
  fs::path parent = fs::path(file_path).parent_path();
  if (parent.empty()) {
    return true;
  }
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    *error = "cannot create directory " + parent.string() + ": " + ec.message();
    return false;
  }
  return true;
}

}  // namespace

HawkCaptureStore::HawkCaptureStore(const HawkCaptureConfig& config) : config_(config) {
  LOG_DEBUG("CaptureStore", "Capture store initialized, max " +
            std::to_string(config_.max_capture_size) + " records per session");
}

HawkCaptureStore::~HawkCaptureStore() {}

std::string HawkCaptureStore::SanitizeProfileAlias(const std::string& profile_name) {
  if (profile_name.empty()) {
    return "unknown";
  }
  return HawkUtil::SanitizeForFilename(profile_name);
}

void HawkCaptureStore::SetProfileAlias(const std::string& session_id,
                                       const std::string& profile_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  profile_aliases_[session_id] = SanitizeProfileAlias(profile_name);
}

std::string HawkCaptureStore::GetProfileAlias(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = profile_aliases_.find(session_id);
  return it != profile_aliases_.end() ? it->second : "unknown";
}

void HawkCaptureStore::DropProfileAlias(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  profile_aliases_.erase(session_id);
}

std::string HawkCaptureStore::JsonlPath(const std::string& session_id,
                                        const std::string& hook_name) const {
  std::string file_name = GetProfileAlias(session_id) + "-" +
                          (hook_name.empty() ? "general" : hook_name) + "-" +
                          session_id + ".jsonl";
  return (fs::path(config_.output_directory) / file_name).string();
}

void HawkCaptureStore::Store(const std::string& session_id, const CaptureRecord& record) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& buffer = buffers_[session_id];
    buffer.push_back(record);
    while (buffer.size() > config_.max_capture_size) {
      buffer.pop_front();
    }
  }

  LOG_DEBUG("CaptureStore", std::string("Captured ") + CaptureTypeToString(record.type) +
            " for " + record.hook_name + ": " + record.url);

  if (config_.StreamsJsonl()) {
    AppendToSink(session_id, record);
  }
}

void HawkCaptureStore::AppendToSink(const std::string& session_id, const CaptureRecord& record) {
  std::string path = JsonlPath(session_id, record.hook_name);
  std::string line = SerializeCaptureRecord(record);

  std::lock_guard<std::mutex> lock(sink_mutex_);

  std::string error;
  if (!EnsureParentDirectory(path, &error)) {
    LOG_WARN("CaptureStore", "Failed to write capture to file: " + error);
    return;
  }

  std::ofstream out(path, std::ios::app | std::ios::binary);
  if (!out) {
    LOG_WARN("CaptureStore", "Failed to write capture to file: cannot open " + path);
    return;
  }
  out << line << '\n';
  if (!out) {
    LOG_WARN("CaptureStore", "Failed to write capture to file: " + path);
  }
}

std::vector<CaptureRecord> HawkCaptureStore::Get(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buffers_.find(session_id);
  if (it == buffers_.end()) {
    return {};
  }
  return std::vector<CaptureRecord>(it->second.begin(), it->second.end());
}

size_t HawkCaptureStore::Count(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buffers_.find(session_id);
  return it != buffers_.end() ? it->second.size() : 0;
}

size_t HawkCaptureStore::TotalCaptured() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t total = 0;
  for (const auto& pair : buffers_) {
    total += pair.second.size();
  }
  return total;
}

std::map<std::string, size_t> HawkCaptureStore::SessionCounts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, size_t> counts;
  for (const auto& pair : buffers_) {
    counts[pair.first] = pair.second.size();
  }
  return counts;
}

void HawkCaptureStore::DropSession(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  buffers_.erase(session_id);
}

bool HawkCaptureStore::FormatRecords(const std::vector<CaptureRecord>& records,
                                     const std::string& format,
                                     std::string* output) {
  if (format == "json") {
    *output = CaptureRecordsToJson(records).dump(2, ' ', false, json::error_handler_t::replace);
  } else if (format == "jsonl") {
    output->clear();
    for (size_t i = 0; i < records.size(); i++) {
      if (i > 0) *output += "\n";
      *output += SerializeCaptureRecord(records[i]);
    }
  } else if (format == "csv") {
    *output = ToCsv(records);
  } else {
    return false;
  }
  return true;
}

ExportResult HawkCaptureStore::ExportRecords(const std::vector<CaptureRecord>& records,
                                             const std::string& format,
                                             const std::string& output_path) {
  ExportResult result;
  result.format = format;

  if (records.empty()) {
    result.error = "No captures to export";
    return result;
  }

  std::string content;
  if (!FormatRecords(records, format, &content)) {
    result.error = "Unsupported format: " + format;
    return result;
  }

  if (!EnsureParentDirectory(output_path, &result.error)) {
    return result;
  }

  std::ofstream out(output_path, std::ios::trunc | std::ios::binary);
  if (!out) {
    result.error = "cannot open " + output_path + " for writing";
    return result;
  }
  out << content;
  out.close();
  if (!out) {
    result.error = "failed writing " + output_path;
    return result;
  }

  result.success = true;
  result.file_path = output_path;
  result.count = records.size();
  result.size = content.size();
  return result;
}

ExportResult HawkCaptureStore::Export(const std::string& session_id,
                                      const std::string& format,
                                      const std::string& output_path) const {
  std::vector<CaptureRecord> records = Get(session_id);
  if (records.empty()) {
    ExportResult result;
    result.format = format;
    result.error = "No captures found for session " + session_id;
    return result;
  }

  std::string path = output_path;
  if (path.empty()) {
    std::string file_name = GetProfileAlias(session_id) + "-export-" + session_id + "-" +
                            HawkUtil::FilenameTimestampNow() + "." + format;
    path = (fs::path(config_.output_directory) / file_name).string();
  }

  ExportResult result = ExportRecords(records, format, path);
  if (result.success) {
    LOG_INFO("CaptureStore", "Exported " + std::to_string(result.count) + " captures to " +
             result.file_path);
  } else {
    LOG_WARN("CaptureStore", "Export failed for session " + session_id + ": " + result.error);
  }
  return result;
}

bool HawkCaptureStore::ReadJsonl(const std::string& path,
                                 std::vector<CaptureRecord>* records,
                                 std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    *error = "cannot open " + path;
    return false;
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    line_number++;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    json value = json::parse(line, nullptr, false);
    CaptureRecord record;
    if (value.is_discarded() || !CaptureRecordFromJson(value, &record)) {
      LOG_WARN("CaptureStore", "Skipping malformed line " + std::to_string(line_number) +
               " in " + path);
      continue;
    }
    records->push_back(std::move(record));
  }
  return true;
}

bool HawkCaptureStore::RemoveCaptureLogs(const std::string& directory,
                                         const std::string& session_id,
                                         std::vector<std::string>* removed,
                                         std::string* error) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return true;
  }

  const std::string suffix = session_id.empty() ? ".jsonl" : "-" + session_id + ".jsonl";
  std::vector<fs::path> doomed;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    std::string name = it->path().filename().string();
    if (name.size() < suffix.size() ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0 ||
        name.find("-export-") != std::string::npos) {
      continue;
    }
    doomed.push_back(it->path());
  }
  if (ec) {
    *error = "cannot list " + directory + ": " + ec.message();
    return false;
  }

  std::sort(doomed.begin(), doomed.end());
  for (const auto& path : doomed) {
    bool existed = fs::remove(path, ec);
    if (ec) {
      *error = "cannot remove " + path.string() + ": " + ec.message();
      return false;
    }
    if (existed) removed->push_back(path.string());
    LOG_DEBUG("CaptureStore", "Removed capture log " + path.string());
  }
  return true;
}
