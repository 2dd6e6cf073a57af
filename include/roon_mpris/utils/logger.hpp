#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roon_mpris::utils {

enum class LogLevel : std::uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  None = 4
};

struct LogMessage {
  LogLevel m_level;
  std::chrono::system_clock::time_point m_timestamp;
  std::string m_component;
  std::string m_message;
};

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(const LogMessage& message) = 0;
  virtual void flush() = 0;
};

class Logger {
 public:
  using SinkPtr = std::unique_ptr<LogSink>;

  explicit Logger(LogLevel min_level = LogLevel::Info);
  ~Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel get_level() const;
  [[nodiscard]] bool is_enabled(LogLevel level) const;
  void add_sink(SinkPtr sink);

  void debug(std::string_view component, std::string_view message);
  void info(std::string_view component, std::string_view message);
  void warning(std::string_view component, std::string_view message);
  void error(std::string_view component, std::string_view message);

  void flush();

 private:
  void log(LogLevel level, std::string_view component, std::string_view message);

  LogLevel m_min_level;
  std::vector<SinkPtr> m_sinks;
  mutable std::mutex m_mutex;
};

class ConsoleSink : public LogSink {
 public:
  explicit ConsoleSink(bool use_colors = true);
  void write(const LogMessage& message) override;
  void flush() override;

 private:
  bool m_use_colors;
  [[nodiscard]] std::string colorize(std::string_view text,
                                     LogLevel level) const;
};

class FileSink : public LogSink {
 public:
  explicit FileSink(const std::filesystem::path& path, bool truncate = false);
  ~FileSink() override;

  void write(const LogMessage& message) override;
  void flush() override;
  [[nodiscard]] bool is_open() const;

 private:
  std::ofstream m_file;
};

// Process-wide logger, replaceable at startup and in tests
class LoggerManager {
 public:
  static Logger& get_instance();
  static void set_instance(std::unique_ptr<Logger> logger);
  static std::unique_ptr<Logger> create_default_logger();

 private:
  static std::unique_ptr<Logger> s_logger;
  static std::mutex s_init_mutex;
};

[[nodiscard]] std::string format_log_line(const LogMessage& message);

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None: return "none";
    }
    return "info";
}

// Strict parse, used where a bad value must be reported (CLI)
inline std::optional<LogLevel> parse_log_level(std::string_view str) {
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warning" || str == "warn") return LogLevel::Warning;
    if (str == "error") return LogLevel::Error;
    if (str == "none") return LogLevel::None;
    return std::nullopt;
}

inline LogLevel log_level_from_string(std::string_view str) {
    return parse_log_level(str).value_or(LogLevel::Info);
}

#define LOG_DEBUG(component, message) \
  ::roon_mpris::utils::LoggerManager::get_instance().debug(component, message)

#define LOG_INFO(component, message) \
  ::roon_mpris::utils::LoggerManager::get_instance().info(component, message)

#define LOG_WARNING(component, message) \
  ::roon_mpris::utils::LoggerManager::get_instance().warning(component, message)

#define LOG_ERROR(component, message) \
  ::roon_mpris::utils::LoggerManager::get_instance().error(component, message)

}  // namespace roon_mpris::utils
