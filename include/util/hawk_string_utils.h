#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace HawkUtil {

std::string ToLower(const std::string& input);

bool StartsWith(const std::string& text, const std::string& prefix);

// Milliseconds since the Unix epoch
int64_t EpochMillisNow();

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:30:45.123Z
std::string IsoTimestamp(int64_t epoch_millis);
std::string IsoTimestampNow();

// ISO timestamp with ':' and '.' replaced by '-' so it can sit in a filename
std::string FilenameTimestampNow();

// Lowercases and replaces every character outside [A-Za-z0-9_-] with '-'
std::string SanitizeForFilename(const std::string& name);

// Decodes standard base64; whitespace and invalid characters are skipped
std::string Base64Decode(const std::string& encoded);

// Length in code points, treating the input as UTF-8
size_t Utf8Length(const std::string& text);

// First max_chars code points of text; never splits a multi-byte sequence
std::string Utf8Prefix(const std::string& text, size_t max_chars);

}  // namespace HawkUtil
