#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous leveled logger (runs its own worker thread).
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace deskctl {
  namespace core {

    enum class LogLevel { Debug, Info, Warn, Error };

    inline const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warn:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    struct LogEvent {
      std::chrono::system_clock::time_point when;
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Request threads enqueue, one worker formats and writes.
 *
 *  * `log()` never blocks on I/O; when the ring buffer is full the event is
 *    dropped and counted.
 *  * Outside `start()`..`stop()` events go straight to stderr.
 *  * Lines: `[YYYY-MM-DD HH:MM:SS] [LEVEL] [component] message`.
 */
    class Logger {

    public:
      explicit Logger(std::size_t capacity = 1024);
      ~Logger(); ///< stop() if still running

      // --- public API ---
      /// Open the optional file sink and launch the worker. Returns false if
      /// the file could not be opened (console logging still starts).
      bool start(const std::string& filePath, bool verbose);
      void log(LogLevel level, const std::string& component, const std::string& message);
      void stop(); ///< drain + flush + join worker thread

      void debug(const std::string& component, const std::string& msg) { log(LogLevel::Debug, component, msg); }
      void info(const std::string& component, const std::string& msg) { log(LogLevel::Info, component, msg); }
      void warn(const std::string& component, const std::string& msg) { log(LogLevel::Warn, component, msg); }
      void error(const std::string& component, const std::string& msg) { log(LogLevel::Error, component, msg); }

      void setVerbose(bool verbose) { verbose_ = verbose; }
      bool verbose() const { return verbose_; }
      std::size_t dropped() const { return dropped_; }

      static std::string format(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void writeConsole(const std::string& line);

      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::mutex mtx_; ///< guards buffer_, running_, stopRequested_
      std::condition_variable cv_;
      std::mutex consoleMtx_;
      io::FileLogger file_; ///< touched by the worker only while running
      std::thread worker_;
      bool running_{ false };
      bool stopRequested_{ false };
      std::atomic<bool> verbose_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace deskctl
