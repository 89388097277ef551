#ifndef HAWK_LOGGER_H_
#define HAWK_LOGGER_H_

#include <string>

namespace HawkLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

// Process-wide capture log. Lines go to stderr and, after Init(path), are
// appended to a file as well (opened per line with O_APPEND):
//   2024-05-01T10:00:00.500Z [WARN ] [TargetMux] message
class Logger {
public:
  static void Init();                                  // stderr only
  static void Init(const std::string& log_file_path);  // stderr + file
  static void SetLevel(Level level);
  static Level GetLevel();
  static bool IsEnabled(Level level) { return level >= GetLevel(); }

  // Accepts debug, info, warn/warning, error in any case
  static bool ParseLevel(const std::string& name, Level* level);
  static const char* LevelName(Level level);

  static void Log(Level level, const std::string& component, const std::string& message);
};

} // namespace HawkLogger

#ifdef HAWK_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) HawkLogger::Logger::Log(HawkLogger::DEBUG, component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) HawkLogger::Logger::Log(HawkLogger::INFO, component, msg)
#define LOG_WARN(component, msg) HawkLogger::Logger::Log(HawkLogger::WARN, component, msg)
#define LOG_ERROR(component, msg) HawkLogger::Logger::Log(HawkLogger::ERROR, component, msg)

#endif  // HAWK_LOGGER_H_
