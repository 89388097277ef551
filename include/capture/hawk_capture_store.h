#ifndef HAWK_CAPTURE_STORE_H_
#define HAWK_CAPTURE_STORE_H_

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "hawk_capture_config.h"
#include "hawk_capture_record.h"

// Outcome of an export. On failure only |error| (and |format|) are meaningful.
struct ExportResult {
  bool success = false;
  std::string file_path;
  std::string format;
  size_t count = 0;
  uint64_t size = 0;  // Bytes written
  std::string error;
};

// Bounded per-session capture buffers plus the JSONL sink.
//
// Each session keeps at most max_capture_size records, oldest evicted first.
// When JSONL streaming is enabled every stored record is also appended to
// <outputDir>/<profileAlias>-<hookName>-<sessionId>.jsonl. The sink is
// unbounded and its failures never affect the buffer.
class HawkCaptureStore {
 public:
  explicit HawkCaptureStore(const HawkCaptureConfig& config);
  ~HawkCaptureStore();

  HawkCaptureStore(const HawkCaptureStore&) = delete;
  HawkCaptureStore& operator=(const HawkCaptureStore&) = delete;

  void Store(const std::string& session_id, const CaptureRecord& record);

  // Snapshot copy, oldest first. Empty for unknown sessions.
  std::vector<CaptureRecord> Get(const std::string& session_id) const;
  size_t Count(const std::string& session_id) const;
  size_t TotalCaptured() const;
  std::map<std::string, size_t> SessionCounts() const;
  void DropSession(const std::string& session_id);

  // Profile aliases name the JSONL and export files of a session
  void SetProfileAlias(const std::string& session_id, const std::string& profile_name);
  std::string GetProfileAlias(const std::string& session_id) const;
  void DropProfileAlias(const std::string& session_id);

  // Writes the session's buffer as json, jsonl or csv. An empty
  // |output_path| selects
  // <outputDir>/<profileAlias>-export-<sessionId>-<timestamp>.<ext>.
  ExportResult Export(const std::string& session_id,
                      const std::string& format,
                      const std::string& output_path = "") const;

  // Writes |records| to |output_path| in |format|.
  static ExportResult ExportRecords(const std::vector<CaptureRecord>& records,
                                    const std::string& format,
                                    const std::string& output_path);

  // Returns false for unsupported formats.
  static bool FormatRecords(const std::vector<CaptureRecord>& records,
                            const std::string& format,
                            std::string* output);

  // Parses a persisted JSONL file. Blank and malformed lines are skipped.
  static bool ReadJsonl(const std::string& path,
                        std::vector<CaptureRecord>* records,
                        std::string* error);

  // Deletes the streamed JSONL logs in |directory|: those of |session_id|
  // (files ending in "-<sessionId>.jsonl"), or every capture log when
  // |session_id| is empty. Export files are kept. A missing directory is not
  // an error.
  static bool RemoveCaptureLogs(const std::string& directory,
                                const std::string& session_id,
                                std::vector<std::string>* removed,
                                std::string* error);

  // Lowercase, [A-Za-z0-9_-] kept, everything else '-'. Empty -> "unknown".
  static std::string SanitizeProfileAlias(const std::string& profile_name);

  std::string JsonlPath(const std::string& session_id, const std::string& hook_name) const;

  const HawkCaptureConfig& config() const { return config_; }

 private:
  void AppendToSink(const std::string& session_id, const CaptureRecord& record);

  const HawkCaptureConfig config_;

  mutable std::mutex mutex_;
  std::map<std::string, std::deque<CaptureRecord>> buffers_;
  std::map<std::string, std::string> profile_aliases_;

  // Serializes file appends so concurrent lines never interleave
  std::mutex sink_mutex_;
};

#endif  // HAWK_CAPTURE_STORE_H_
