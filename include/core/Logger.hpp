#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV decode logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace axostim {
  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /// One CSV row: timestamp_ms,stage,sweep,episode,message
    struct LogEvent {
      std::int64_t timestampMs{ 0 };
      std::string stage;          ///< ingest / resolve / synthesize / triggers
      std::int64_t sweep{ -1 };   ///< -1 when not sweep specific
      std::int64_t episode{ -1 };
      std::string message;

      /// Stamp with the wall clock.
      static LogEvent now(std::string stage, std::string message, std::int64_t sweep = -1,
                          std::int64_t episode = -1);

      /// Row text including trailing '\n'; message quoted when it holds ',' or '"'.
      std::string toCsv() const;
    };

    class Logger {

    public:
      explicit Logger(std::size_t capacity = 1024);
      ~Logger(); ///< finishRun()

      // --- public API ---
      void startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(const LogEvent& event);              ///< enqueue event (non-blocking)
      void finishRun();                             ///< flush + join worker thread

      bool running() const { return running_.load(); }

      /// Events lost because the buffer was full or no run was open.
      std::size_t dropped() const { return dropped_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void drain();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
      std::mutex wakeMtx_;
      std::condition_variable wake_;
    };

  } // namespace core
} // namespace axostim
