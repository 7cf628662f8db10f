// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

namespace dnsrotor
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Process-wide logger with levels, date-stamped log files, retention
/// and an optional console mirror.
///
/// The logger is synchronous: every call formats and writes under one mutex.
/// Files are named "<base>.YYYY-MM-DD.log" and created with mode 0640 inside
/// a directory created with mode 0750.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler. Receives the level, the fully formatted
  /// line and the raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Configures the logger.
  /// \param level Minimum level that is emitted
  /// \param filePath Base path of the log file; empty logs to stdout only
  /// \param retentionDays Rotated files older than this are deleted (0 keeps all)
  /// \param console Mirror every line to stdout in addition to the file
  /// \param timeFormat strftime format for the %T placeholder
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   int retentionDays = 7, bool console = false,
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.logBasePath = filePath;
    data.retentionDays = retentionDays;
    data.console = console;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    data.currentLogDate.clear();
    rotateLogFileIfNeeded();
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    std::cout.flush();
  }

  /// \brief Flushes and closes the current log file.
  static void shutdown()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
      data.fileStream.reset();
    }
    data.logBasePath.clear();
    data.currentLogDate.clear();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Routes all output to \p handler instead of file and console.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the log line format.
  /// Supported placeholders:
  ///   %T - timestamp
  ///   %t - thread ID (hex hash)
  ///   %L - log level
  ///   %m - message content
  ///   %F - source file name
  ///   %l - source line number
  ///   %f - function name
  ///   %% - literal percent sign
  /// \note Source location placeholders are only filled by the DNSROTOR_LOG_* macros.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    compileFormat(format, data.compiledFormat);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  /// \brief Path of the file currently written, empty when logging to stdout.
  static std::string currentLogFile()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.currentLogFile;
  }

  static std::string currentDate()
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

  /// \brief Parses "trace", "debug", "info", "warning"/"warn", "error", "fatal".
  static std::optional<Level> levelFromString(const std::string &name)
  {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warning" || lower == "warn")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
      return Level::Fatal;
    return std::nullopt;
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    }
    return "UNKNOWN";
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information.
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }

    std::string output = formatLine(level, message, file, line, function);

    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
      return;
    }

    rotateLogFileIfNeeded();
    if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    if (!data.fileStream || data.console)
    {
      std::cout << output;
    }
  }

private:
  friend class LoggerStream;

  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal;
  };

  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string logBasePath;
    std::string currentLogDate;
    std::string currentLogFile;
    int retentionDays = 7;
    bool console = false;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  /// Caller holds data.mutex.
  static void rotateLogFileIfNeeded()
  {
    auto &data = getData();
    if (data.logBasePath.empty())
    {
      return;
    }

    namespace fs = std::filesystem;
    auto logPath = fs::path(data.logBasePath);
    auto logDir = logPath.parent_path();
    if (logDir.empty())
    {
      logDir = fs::current_path();
    }

    std::error_code ec;
    if (!fs::exists(logDir, ec))
    {
      fs::create_directories(logDir, ec);
      if (ec)
      {
        std::cerr << "[Logger] Failed to create log directory: " << logDir << " - "
                  << ec.message() << std::endl;
        return;
      }
      ::chmod(logDir.c_str(), 0750);
    }

    std::string today = currentDate();
    if (today == data.currentLogDate && data.fileStream)
    {
      return;
    }

    data.currentLogDate = today;
    std::string rotatedPath =
      (logDir / (logPath.filename().string() + "." + today + ".log")).string();

    bool existed = fs::exists(rotatedPath, ec);
    data.fileStream = std::make_unique<std::ofstream>(rotatedPath, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "[Logger] Failed to open log file: " << rotatedPath << std::endl;
      data.fileStream.reset();
      data.currentLogFile.clear();
      return;
    }
    if (!existed)
    {
      ::chmod(rotatedPath.c_str(), 0640);
    }
    data.currentLogFile = rotatedPath;

    deleteOldLogFiles(logDir, logPath.filename().string());
  }

  static void deleteOldLogFiles(const std::filesystem::path &logDir, const std::string &baseName)
  {
    auto &data = getData();
    if (data.retentionDays <= 0)
    {
      return;
    }

    namespace fs = std::filesystem;
    auto now = std::chrono::system_clock::now();
    std::string prefix = baseName + ".";

    std::error_code dirEc;
    for (const auto &entry : fs::directory_iterator(logDir, dirEc))
    {
      std::string fname = entry.path().filename().string();
      if (fname.rfind(prefix, 0) != 0 || fname.size() < prefix.size() + 10)
      {
        continue;
      }

      std::tm tm{};
      std::istringstream ss(fname.substr(prefix.size(), 10));
      ss >> std::get_time(&tm, "%Y-%m-%d");
      if (ss.fail())
      {
        continue;
      }
      auto fileTime = std::chrono::system_clock::from_time_t(std::mktime(&tm));
      auto fileDays = std::chrono::duration_cast<std::chrono::hours>(now - fileTime).count() / 24;
      if (fileDays >= data.retentionDays)
      {
        std::error_code ec;
        fs::remove(entry.path(), ec);
        if (ec)
        {
          std::cerr << "[Logger] Failed to delete old log file: " << entry.path() << " - "
                    << ec.message() << std::endl;
        }
      }
    }
    if (dirEc)
    {
      std::cerr << "[Logger] Failed to iterate log directory: " << logDir << " - "
                << dirEc.message() << std::endl;
    }
  }

  static void compileFormat(const std::string &format, std::vector<FormatSegment> &segments)
  {
    segments.clear();
    std::string literal;

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }

      FormatToken token;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        literal += '%';
        ++i;
        continue;
      default:
        // Unknown placeholder, keep the '%' as text
        literal += format[i];
        continue;
      }

      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(literal)});
        literal.clear();
      }
      segments.push_back({token, ""});
      ++i;
    }

    if (!literal.empty())
    {
      segments.push_back({FormatToken::Literal, std::move(literal)});
    }
  }

  /// Caller holds data.mutex.
  static std::string formatLine(Level level, const std::string &message, const char *file,
                                int line, const char *function)
  {
    auto &data = getData();
    std::ostringstream oss;
    for (const auto &seg : data.compiledFormat)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << timestamp(data.timestampFormat);
        break;
      case FormatToken::ThreadId:
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
          oss << detail::basename(file);
        break;
      case FormatToken::Line:
        if (file)
          oss << line;
        break;
      case FormatToken::Function:
        if (function)
          oss << function;
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }

  static std::string timestamp(const std::string &format)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    if (format.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }
};

/// \brief Stream interface for composing a log line.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    try
    {
      if (!_flushed && !_stream.str().empty())
      {
        flush();
      }
    }
    catch (const std::exception &e)
    {
      std::cerr << "[Logger] stream flush failed: " << e.what() << std::endl;
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _flushed = true;
  }
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace dnsrotor

#define DNSROTOR_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    dnsrotor::core::Logger::log(dnsrotor::core::Logger::Level::level, _oss.str(), __FILE__,        \
                                __LINE__, __func__);                                               \
  } while (0)

#define DNSROTOR_LOG_TRACE(msg) DNSROTOR_LOG_WITH_LEVEL(Trace, msg)
#define DNSROTOR_LOG_DEBUG(msg) DNSROTOR_LOG_WITH_LEVEL(Debug, msg)
#define DNSROTOR_LOG_INFO(msg) DNSROTOR_LOG_WITH_LEVEL(Info, msg)
#define DNSROTOR_LOG_WARN(msg) DNSROTOR_LOG_WITH_LEVEL(Warning, msg)
#define DNSROTOR_LOG_ERROR(msg) DNSROTOR_LOG_WITH_LEVEL(Error, msg)
#define DNSROTOR_LOG_FATAL(msg) DNSROTOR_LOG_WITH_LEVEL(Fatal, msg)
