/* @file Logger.cpp
 * @brief async logger: producers enqueue, one worker formats + writes file and console
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

// Autopilot headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace autopilot::core;

namespace {

  constexpr std::size_t kQueueCapacity = 1024;
  constexpr std::chrono::milliseconds kWorkerWait{ 50 };

  const char* levelName(LogLevel level) {
    switch (level) {
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Info:
    default:
      return "INFO";
    }
  }

  // log_1.txt, log_2.txt, ... first unused number wins
  std::filesystem::path nextLogPath(const std::filesystem::path& dir) {
    for (unsigned n = 1;; ++n) {
      auto candidate = dir / ("log_" + std::to_string(n) + ".txt");
      std::error_code ec;
      if (!std::filesystem::exists(candidate, ec))
        return candidate;
    }
  }

} // namespace

Logger::Logger(std::string logDir, bool echoToConsole)
    : logDir_(std::move(logDir)), echo_(echoToConsole),
      buffer_(std::make_unique<RingBuffer<LogEvent>>(kQueueCapacity)) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun() {
  if (running_)
    return;

  std::error_code ec;
  std::filesystem::create_directories(logDir_, ec);
  if (ec)
    throw std::runtime_error("[Logger] cannot create log directory " + logDir_ + ": " +
                             ec.message());

  const auto path = nextLogPath(logDir_);
  if (!file_.open(path.string()))
    throw std::runtime_error("[Logger] cannot open log file " + path.string());

  currentFile_ = path.string();
  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
}

void Logger::log(const LogEvent& event) {
  if (!running_) {
    // no run open yet: console only
    if (echo_)
      std::clog << format(event) << '\n';
    return;
  }
  if (!buffer_->push(event))
    ++dropped_;
}

void Logger::info(std::string message) {
  log({ std::chrono::system_clock::now(), LogLevel::Info, std::move(message) });
}

void Logger::warn(std::string message) {
  log({ std::chrono::system_clock::now(), LogLevel::Warning, std::move(message) });
}

void Logger::error(std::string message) {
  log({ std::chrono::system_clock::now(), LogLevel::Error, std::move(message) });
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;
  if (worker_.joinable())
    worker_.join();
  file_.close();
}

std::string Logger::format(const LogEvent& event) {
  using namespace std::chrono;
  const std::time_t secs = system_clock::to_time_t(event.time);
  const auto millis = duration_cast<milliseconds>(event.time.time_since_epoch()).count() % 1000;

  std::tm tm{};
  localtime_r(&secs, &tm);

  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0')
     << millis << " - " << levelName(event.level) << " - " << event.message;
  return os.str();
}

void Logger::emit(const std::string& line) {
  file_.write(line + "\n");
  if (echo_)
    std::clog << line << '\n';
}

void Logger::workerLoop() {
  // keep draining after running_ drops so finishRun() loses nothing already queued
  while (running_ || !buffer_->empty()) {
    auto event = buffer_->popFor(kWorkerWait);
    if (!event)
      continue;
    emit(format(*event));
    if (buffer_->empty())
      file_.flush();
  }
  file_.flush();
}
