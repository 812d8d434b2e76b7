#pragma once
/** @file  Logger.hpp
 *  @brief Synchronous CSV logger for the local diagnostics channel.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <mutex>
#include <string>

#include "core/Clock.hpp"
#include "io/FileLogger.hpp"

namespace crashwatch {
  namespace core {

    enum class LogLevel { Debug, Info, Warning, Error };

    const char* toString(LogLevel level);

    struct LogEvent {
      LogLevel level{ LogLevel::Info };
      std::string component; ///< e.g. "ErrorReporter"
      std::string message;
    };

    /**
 * @class Logger
 * @brief Writes one CSV row per event: `unix_time,LEVEL,component,"message"`.
 *
 *  * Runs on the caller's thread; a mutex serialises concurrent reporters.
 *  * Without an open file rows go to std::cerr.
 *  * Warnings and errors are flushed immediately.
 */
    class Logger {

    public:
      explicit Logger(std::shared_ptr<Clock> clock = nullptr);
      virtual ~Logger();

      // --- public API ---
      bool open(const std::string& path); ///< append to \p path instead of stderr
      virtual void log(const LogEvent& event);
      void close();

      void setMinLevel(LogLevel level);

      void debug(const std::string& component, const std::string& message);
      void info(const std::string& component, const std::string& message);
      void warn(const std::string& component, const std::string& message);
      void error(const std::string& component, const std::string& message);

      /// CSV row for \p event stamped at \p unixTime (no trailing newline).
      static std::string formatRow(std::int64_t unixTime, const LogEvent& event);

    private:
      std::shared_ptr<Clock> clock_;
      io::FileLogger file_;
      LogLevel minLevel_{ LogLevel::Info };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace crashwatch
