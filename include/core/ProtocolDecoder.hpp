#pragma once

/** @file  ProtocolDecoder.hpp
 *  @brief Public API for axostim::core::ProtocolDecoder.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/AlternationFactory.hpp"
#include "core/DecoderConfig.hpp"
#include "protocols/ProtocolDescriptor.hpp"
#include "protocols/SweepWaveform.hpp"
#include "protocols/TriggerProtocol.hpp"

namespace axostim {
  namespace protocols {
    class AlternationStrategy;
  }

  namespace core {

    class ErrorMonitor;
    class Logger;

    /**
 * @class ProtocolDecoder
 * @brief Runs Ingest -> Resolve -> Synthesize for one recording.
 *
 *  * load() once, then decode any sweep from any thread.
 *  * Every ProtocolError is reported to the ErrorMonitor and the log, then rethrown.
 */
    class ProtocolDecoder {

    public:
      ProtocolDecoder(DecoderConfig config, std::shared_ptr<ErrorMonitor> errMonitor,
                      std::shared_ptr<Logger> logger = nullptr,
                      const AlternationFactory& factory = AlternationFactory());
      ~ProtocolDecoder();

      // ---- Public API ----
      /// Ingest a recording's annotation bundle (software/protocol/EpochInfo/dictEpochInfoPerDAC).
      void load(const nlohmann::json& annotations);
      /// Adopt an already ingested descriptor.
      void load(std::shared_ptr<const protocols::ProtocolDescriptor> descriptor);

      bool loaded() const { return currentState_ == State::LOADED; }

      /// Throws std::logic_error before load().
      const protocols::ProtocolDescriptor& descriptor() const;
      std::shared_ptr<const protocols::ProtocolDescriptor> sharedDescriptor() const;

      std::uint64_t sweepCount() const;

      /// Episode within the run is sweep % episodesPerRun.
      protocols::SweepWaveform decodeSweep(std::uint32_t sweep) const;
      protocols::SweepWaveform decodeSweep(std::uint32_t sweep, std::uint32_t episode) const;

      /// Trigger events of \p sweep per the configured line map.
      protocols::TriggerProtocol triggers(std::uint32_t sweep) const;

      /// From fADCSequenceInterval when recorded, else 1 / samplingRateHz.
      double sampleIntervalSeconds() const;

    private:
      enum class State { EMPTY, LOADED };

      void requireLoaded(const char* what) const;
      void report(const char* stage, std::int64_t sweep, std::int64_t episode,
                  const std::string& what) const;
      void note(const char* stage, std::int64_t sweep, std::int64_t episode,
                const std::string& what) const;

      DecoderConfig config_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      std::unique_ptr<protocols::AlternationStrategy> strategy_;
      std::shared_ptr<const protocols::ProtocolDescriptor> descriptor_;
      State currentState_{ State::EMPTY };
    };

  } // namespace core
} // namespace axostim
