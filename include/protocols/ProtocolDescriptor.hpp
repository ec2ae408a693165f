#pragma once
/** @file  ProtocolDescriptor.hpp
 *  @brief Immutable, typed model of one recording's stimulation protocol.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <optional>

namespace axostim {
  namespace protocols {

    constexpr int kMinEpochNumber = 0;
    constexpr int kMaxEpochNumber = 9;

    /**
 * @enum EpochType
 * @brief Closed set of analog epoch shapes.
 *
 *  ABF codes: 1 Step, 2 Ramp, 3 PulseTrain, 4 Triangle, 5 Cosine, 7 BiphasicTrain.
 *  Code 0 marks a disabled epoch and never reaches this enum.
 */
    enum class EpochType : std::uint8_t { Step, Ramp, PulseTrain, BiphasicTrain, Triangle, Cosine, Count };
    static_assert(static_cast<std::uint8_t>(EpochType::Count) == 6,
                  "EpochType count changed please update the synthesizer switch");

    inline const char* toString(EpochType t) {
      switch (t) {
      case EpochType::Step:
        return "Step";
      case EpochType::Ramp:
        return "Ramp";
      case EpochType::PulseTrain:
        return "PulseTrain";
      case EpochType::BiphasicTrain:
        return "BiphasicTrain";
      case EpochType::Triangle:
        return "Triangle";
      case EpochType::Cosine:
        return "Cosine";
      default:
        return "Unknown";
      }
    }

    /// Maps an ABF `nEpochType` code; throws core::UnrecognizedEpochType for anything else.
    EpochType epochTypeFromCode(int code);

    /// Inverse of epochTypeFromCode().
    int toCode(EpochType t);

    /// True for the shapes that repeat at `pulsePeriod`.
    inline bool isTrain(EpochType t) {
      return t == EpochType::PulseTrain || t == EpochType::BiphasicTrain ||
             t == EpochType::Triangle || t == EpochType::Cosine;
    }

    /// 4-bit digital output group: Low = lines #3-0, High = lines #7-4.
    enum class Registry : std::uint8_t { Low, High };

    inline const char* toString(Registry r) { return r == Registry::Low ? "#3-0" : "#7-4"; }

    /** @struct EpochWaveform
 *  @brief One epoch's analog definition on one DAC channel.
 */
    struct EpochWaveform {
      int epochNumber{ 0 };
      int dacNumber{ 0 };
      EpochType type{ EpochType::Step };
      double levelInit{ 0.0 };
      double levelIncrementPerEpisode{ 0.0 };
      std::uint32_t durationInit{ 0 };           ///< samples
      std::int32_t durationIncrementPerEpisode{ 0 }; ///< samples
      std::uint32_t pulsePeriod{ 0 };            ///< samples, trains only
      std::uint32_t pulseWidth{ 0 };             ///< samples, trains only
    };

    /// Active epochs of one DAC, ascending by epoch number.
    using EpochMap = std::map<int, EpochWaveform>;

    /** @struct DACChannel
 *  @brief One analog output with waveform enabled.
 *
 *  * `alternateEpochs` is set only when the protocol defines a distinct
 *    waveform set for alternate sweeps.
 */
    struct DACChannel {
      int channelNumber{ 0 };
      double holdingLevel{ 0.0 };
      EpochMap epochs;
      std::optional<EpochMap> alternateEpochs;
    };

    /** @struct EpochDigitalInfo
 *  @brief Digital output definition of one epoch, shared by all DAC channels.
 */
    struct EpochDigitalInfo {
      int epochNumber{ 0 };
      Registry registry{ Registry::Low };
      Registry alternateRegistry{ Registry::Low };
      std::uint8_t digitalValue{ 0 };
      std::uint8_t alternateDigitalValue{ 0 };
      std::uint8_t digitalTrainValue{ 0 };
      std::uint8_t alternateDigitalTrainValue{ 0 };
    };

    /// Protocol-level flags as read from the `protocol` annotation.
    struct ProtocolSettings {
      std::uint32_t runsPerTrial{ 1 };
      std::uint32_t episodesPerRun{ 1 };
      bool alternateAnalogOutputs{ false };
      bool alternateDigitalOutputs{ false };
      int digitalDACChannel{ 0 };
      bool trainActiveLogic{ false };
      std::uint32_t samplesPerSweep{ 0 }; ///< 0 = span of the longest channel
      double sampleIntervalUs{ 0.0 };     ///< 0 = unknown
    };

    /**
 * @class ProtocolDescriptor
 * @brief Owns every DACChannel and EpochDigitalInfo of a recording.
 *
 *  * Built once by ingest(), read-only afterwards.
 *  * Safe to share across threads as `shared_ptr<const ProtocolDescriptor>`.
 */
    class ProtocolDescriptor {
    public:
      ProtocolDescriptor(ProtocolSettings settings, std::map<int, DACChannel> channels,
                         std::map<int, EpochDigitalInfo> digitalEpochs);

      const ProtocolSettings& settings() const { return settings_; }
      std::uint32_t runsPerTrial() const { return settings_.runsPerTrial; }
      std::uint32_t episodesPerRun() const { return settings_.episodesPerRun; }
      bool alternateAnalogOutputs() const { return settings_.alternateAnalogOutputs; }
      bool alternateDigitalOutputs() const { return settings_.alternateDigitalOutputs; }
      int digitalDACChannel() const { return settings_.digitalDACChannel; }
      bool trainActiveLogic() const { return settings_.trainActiveLogic; }

      /// Runs were averaged by the acquisition software.
      bool averagedRuns() const { return settings_.runsPerTrial > 1; }

      /// runsPerTrial x episodesPerRun; valid sweep indices are below this.
      std::uint64_t sweepCount() const;

      const std::map<int, DACChannel>& channels() const { return channels_; }
      const std::map<int, EpochDigitalInfo>& digitalEpochs() const { return digitalEpochs_; }

      /// nullptr when the channel has no waveform.
      const DACChannel* findChannel(int channelNumber) const;
      const EpochDigitalInfo* findDigitalEpoch(int epochNumber) const;

    private:
      ProtocolSettings settings_;
      std::map<int, DACChannel> channels_;
      std::map<int, EpochDigitalInfo> digitalEpochs_;
    };

  } // namespace protocols
} // namespace axostim
