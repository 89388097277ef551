#include "logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace HawkLogger {

namespace {

#ifdef HAWK_DEBUG_BUILD
std::atomic<Level> g_level{DEBUG};
#else
std::atomic<Level> g_level{INFO};
#endif

std::mutex g_sink_mutex;
std::string g_file_path;  // Empty when logging to stderr only

int OpenForAppend(const std::string& path) {
  return open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}

// UTC with milliseconds, the same shape capture records use
std::string NowUtc() {
  auto now = std::chrono::system_clock::now();
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count() % 1000;
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm utc;
  gmtime_r(&seconds, &utc);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(millis));
  return out;
}

} // namespace

void Logger::Init() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_file_path.clear();
}

void Logger::Init(const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_file_path.clear();

  int fd = OpenForAppend(log_file_path);
  if (fd < 0) {
    std::cerr << "[Logger] cannot open log file " << log_file_path
              << ", logging to stderr only" << std::endl;
    return;
  }
  close(fd);
  g_file_path = log_file_path;
}

void Logger::SetLevel(Level level) {
  g_level.store(level);
}

Level Logger::GetLevel() {
  return g_level.load();
}

bool Logger::ParseLevel(const std::string& name, Level* level) {
  std::string lower(name.size(), '\0');
  std::transform(name.begin(), name.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  static const struct { const char* name; Level level; } kNames[] = {
    {"debug", DEBUG}, {"info", INFO}, {"warn", WARN}, {"warning", WARN}, {"error", ERROR},
  };
  for (const auto& entry : kNames) {
    if (lower == entry.name) {
      *level = entry.level;
      return true;
    }
  }
  return false;
}

const char* Logger::LevelName(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
  }
  return "?????";
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (!IsEnabled(level)) return;

  std::string line = NowUtc();
  line += " [";
  line += LevelName(level);
  line += "] [";
  line += component;
  line += "] ";
  line += message;
  line += '\n';

  std::lock_guard<std::mutex> lock(g_sink_mutex);
  std::cerr << line;

  // Opened per line so rotated or deleted files are recreated and several
  // capture processes can append to one log
  if (!g_file_path.empty()) {
    int fd = OpenForAppend(g_file_path);
    if (fd >= 0) {
      ssize_t written = write(fd, line.data(), line.size());
      (void)written;
      close(fd);
    }
  }
}

} // namespace HawkLogger
