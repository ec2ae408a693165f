#pragma once
/** @file  AlternationResolver.hpp
 *  @brief Projects a ProtocolDescriptor onto one sweep's active parameter sets.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <vector>

// axostim headers
#include "protocols/AlternationStrategy.hpp"
#include "protocols/ProtocolDescriptor.hpp"

namespace axostim {
  namespace protocols {

    /// One DAC channel's epochs as played on the resolved sweep.
    struct ResolvedChannel {
      int channelNumber{ 0 };
      double holdingLevel{ 0.0 };
      Parity waveformSet{ Parity::Primary }; ///< which EpochMap was copied
      std::vector<EpochWaveform> epochs;     ///< ascending epoch number
    };

    /// One epoch's digital output as played on the resolved sweep.
    struct ResolvedDigitalEpoch {
      int epochNumber{ 0 };
      Registry registry{ Registry::Low };
      std::uint8_t value{ 0 };      ///< static bits
      std::uint8_t trainValue{ 0 }; ///< train / transition bits
    };

    /**
 * @struct ResolvedSweep
 * @brief Everything the synthesizer needs for one sweep, owned by value.
 *
 *  * Holds copies, never pointers into the descriptor.
 *  * `analogParity` / `digitalParity` are Primary whenever the matching
 *    alternation flag is off.
 *  * `digitalTiming` is the `digitalDACChannel` tab as it times the digital
 *    lines. It follows the tab's alternate set only when digital alternation
 *    is on, so analog-only alternation leaves the digital output unchanged.
 */
    struct ResolvedSweep {
      std::uint32_t sweepIndex{ 0 };
      Parity analogParity{ Parity::Primary };
      Parity digitalParity{ Parity::Primary };
      ProtocolSettings settings;
      std::vector<ResolvedChannel> channels;      ///< ascending channel number
      std::vector<ResolvedDigitalEpoch> digital;  ///< ascending epoch number
      std::optional<ResolvedChannel> digitalTiming; ///< empty when the tab has no waveform

      /// nullptr when the channel has no waveform on this sweep.
      const ResolvedChannel* findChannel(int channelNumber) const;
    };

    /// resolve() with ParityAlternation.
    ResolvedSweep resolve(const ProtocolDescriptor& descriptor, std::uint32_t sweepIndex);

    /**
 * @brief Select primary or alternate analog/digital parameters for \p sweepIndex.
 *
 * Throws core::OutOfRangeSweep when sweepIndex >= runsPerTrial x episodesPerRun.
 */
    ResolvedSweep resolve(const ProtocolDescriptor& descriptor, std::uint32_t sweepIndex,
                          const AlternationStrategy& strategy);

  } // namespace protocols
} // namespace axostim
