/* @file Logger.cpp
 * @brief ring-buffered async logger; one worker drains to stderr and the optional log file
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iostream>
#include <vector>

// deskctl headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace deskctl::core;

Logger::Logger(std::size_t capacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { stop(); }

std::string Logger::format(const LogEvent& event) {
  std::time_t t = std::chrono::system_clock::to_time_t(event.when);
  std::tm local{};
  localtime_r(&t, &local);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

  std::string line;
  line.reserve(event.message.size() + 48);
  line += '[';
  line += stamp;
  line += "] [";
  line += toString(event.level);
  line += "] [";
  line += event.component;
  line += "] ";
  line += event.message;
  line += '\n';
  return line;
}

bool Logger::start(const std::string& filePath, bool verbose) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (running_)
    return true;

  verbose_ = verbose;
  bool fileOk = true;
  if (!filePath.empty())
    fileOk = file_.open(filePath);

  stopRequested_ = false;
  running_ = true;
  worker_ = std::thread([this] { workerLoop(); });

  if (!fileOk)
    writeConsole("[deskctl] cannot open log file " + filePath + ", logging to stderr only\n");
  return fileOk;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
  if (level == LogLevel::Debug && !verbose_)
    return;

  LogEvent event{ std::chrono::system_clock::now(), level, component, message };
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_) {
      if (!buffer_->push(std::move(event)))
        ++dropped_;
      cv_.notify_one();
      return;
    }
  }
  writeConsole(format(event));
}

void Logger::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_ && !worker_.joinable())
      return;
    stopRequested_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();

  file_.close();
  if (dropped_ > 0)
    writeConsole("[deskctl] logger dropped " + std::to_string(dropped_.load()) + " events\n");
}

void Logger::workerLoop() {
  std::vector<LogEvent> batch;
  while (true) {
    bool exiting = false;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return !buffer_->empty() || stopRequested_; });
      while (auto event = buffer_->pop())
        batch.push_back(std::move(*event));
      if (stopRequested_) {
        // later log() calls fall back to synchronous stderr
        running_ = false;
        exiting = true;
      }
    }

    for (const auto& event : batch) {
      std::string line = format(event);
      writeConsole(line);
      file_.write(line);
    }
    batch.clear();
    if (file_.isOpen() && !file_.flush())
      writeConsole("[deskctl] log file write failed\n");

    if (exiting)
      return;
  }
}

void Logger::writeConsole(const std::string& line) {
  std::lock_guard<std::mutex> lock(consoleMtx_);
  std::cerr << line;
  std::cerr.flush();
}
