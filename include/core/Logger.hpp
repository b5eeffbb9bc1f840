#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous run logger (numbered file + console, own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace autopilot {
  namespace core {

    enum class LogLevel { Info, Warning, Error };

    struct LogEvent {
      std::chrono::system_clock::time_point time{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    class Logger {

    public:
      /// @param logDir  directory that receives `log_N.txt`
      /// @param echoToConsole  mirror every line to std::clog
      explicit Logger(std::string logDir = "logs", bool echoToConsole = true);
      ~Logger(); ///< finishRun()

      // --- public API ---
      void startNewRun();              ///< open next log_N.txt + launch worker thread
      void log(const LogEvent& event); ///< enqueue event (non-blocking)
      void finishRun();                ///< drain + flush + join worker thread

      void info(std::string message);
      void warn(std::string message);
      void error(std::string message);

      /// Path of the file opened by the last startNewRun() (empty before).
      const std::string& currentFile() const { return currentFile_; }

      std::size_t droppedEvents() const { return dropped_.load(); }

      /// "YYYY-mm-dd HH:MM:SS,mmm - LEVEL - message"
      static std::string format(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void emit(const std::string& line);

      std::string logDir_;
      bool echo_{ true };
      std::string currentFile_{};
      io::FileLogger file_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace autopilot
