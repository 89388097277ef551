#include "hawk_string_utils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace HawkUtil {

std::string ToLower(const std::string& input) {
  std::string lower = input;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() &&
         text.compare(0, prefix.size(), prefix) == 0;
}

int64_t EpochMillisNow() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string IsoTimestamp(int64_t epoch_millis) {
  std::time_t seconds = static_cast<std::time_t>(epoch_millis / 1000);
  int64_t ms = epoch_millis % 1000;
  if (ms < 0) {
    ms += 1000;
    seconds -= 1;
  }

  std::tm bt;
  gmtime_r(&seconds, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
  return oss.str();
}

std::string IsoTimestampNow() {
  return IsoTimestamp(EpochMillisNow());
}

std::string FilenameTimestampNow() {
  std::string stamp = IsoTimestampNow();
  std::replace(stamp.begin(), stamp.end(), ':', '-');
  std::replace(stamp.begin(), stamp.end(), '.', '-');
  return stamp;
}

std::string SanitizeForFilename(const std::string& name) {
  std::string clean;
  clean.reserve(name.size());
  for (unsigned char c : name) {
    if (std::isalnum(c) || c == '-' || c == '_') {
      clean += static_cast<char>(std::tolower(c));
    } else {
      clean += '-';
    }
  }
  return clean;
}

std::string Base64Decode(const std::string& encoded) {
  static const std::string base64_chars =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string decoded;
  decoded.reserve(encoded.size() / 4 * 3);
  int i = 0;
  uint8_t char_array_4[4];
  uint8_t char_array_3[3];

  for (char c : encoded) {
    if (c == '=') break;
    size_t index = base64_chars.find(c);
    if (index == std::string::npos) continue;

    char_array_4[i++] = static_cast<uint8_t>(index);
    if (i == 4) {
      char_array_3[0] = (char_array_4[0] << 2) + ((char_array_4[1] & 0x30) >> 4);
      char_array_3[1] = ((char_array_4[1] & 0xf) << 4) + ((char_array_4[2] & 0x3c) >> 2);
      char_array_3[2] = ((char_array_4[2] & 0x3) << 6) + char_array_4[3];
      decoded.append(reinterpret_cast<const char*>(char_array_3), 3);
      i = 0;
    }
  }

  if (i > 1) {
    for (int j = i; j < 4; j++) {
      char_array_4[j] = 0;
    }
    char_array_3[0] = (char_array_4[0] << 2) + ((char_array_4[1] & 0x30) >> 4);
    char_array_3[1] = ((char_array_4[1] & 0xf) << 4) + ((char_array_4[2] & 0x3c) >> 2);
    decoded.append(reinterpret_cast<const char*>(char_array_3), i - 1);
  }

  return decoded;
}

size_t Utf8Length(const std::string& text) {
  size_t count = 0;
  for (unsigned char c : text) {
    // Continuation bytes are 10xxxxxx
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

std::string Utf8Prefix(const std::string& text, size_t max_chars) {
  size_t count = 0;
  for (size_t pos = 0; pos < text.size(); ++pos) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    if ((c & 0xC0) != 0x80) {
      if (count == max_chars) {
        return text.substr(0, pos);
      }
      ++count;
    }
  }
  return text;
}

}  // namespace HawkUtil
