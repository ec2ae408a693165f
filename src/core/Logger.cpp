/* @file Logger.cpp
 * @brief worker-thread CSV logger over io::FileLogger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// axostim headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace axostim::core;

namespace {
  constexpr const char* kCsvHeader = "timestamp_ms,stage,sweep,episode,message\n";
  constexpr auto kIdleWait = std::chrono::milliseconds{ 50 };

  std::string quoted(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos)
      return field;
    std::string out = "\"";
    for (char c : field) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }
} // namespace

LogEvent LogEvent::now(std::string stage, std::string message, std::int64_t sweep,
                       std::int64_t episode) {
  LogEvent ev;
  ev.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  ev.stage = std::move(stage);
  ev.sweep = sweep;
  ev.episode = episode;
  ev.message = std::move(message);
  return ev;
}

std::string LogEvent::toCsv() const {
  return std::to_string(timestampMs) + ',' + quoted(stage) + ',' + std::to_string(sweep) + ',' +
         std::to_string(episode) + ',' + quoted(message) + '\n';
}

Logger::Logger(std::size_t capacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  if (running_)
    finishRun();
  // events that slipped in after the previous run drained belong to no file
  dropped_ += buffer_->clear();
  if (!csvFile_.open(csvPath))
    throw std::runtime_error("[Logger] cannot open log file: " + csvPath);
  csvFile_.write(kCsvHeader);

  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
}

void Logger::log(const LogEvent& event) {
  if (!running_) {
    ++dropped_;
    return;
  }
  LogEvent copy = event;
  if (!buffer_->tryPush(std::move(copy))) {
    ++dropped_;
    return;
  }
  wake_.notify_one();
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;
  wake_.notify_all();
  if (worker_.joinable())
    worker_.join();
  drain(); // anything queued after the worker's last pass
  csvFile_.close();
}

void Logger::workerLoop() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(wakeMtx_);
      wake_.wait_for(lock, kIdleWait, [this] { return !running_ || !buffer_->empty(); });
    }
    drain();
  }
}

void Logger::drain() {
  LogEvent ev;
  bool wrote = false;
  while (buffer_->tryPop(ev)) {
    csvFile_.write(ev.toCsv());
    wrote = true;
  }
  if (wrote && !csvFile_.flush())
    std::cerr << "[Logger] flush to disk failed\n";
}
