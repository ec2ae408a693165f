#pragma once
/** @file  WaveformSynthesizer.hpp
 *  @brief Expands a ResolvedSweep into per-DAC segments and per-line digital states.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>

// axostim headers
#include "protocols/AlternationResolver.hpp"
#include "protocols/SweepWaveform.hpp"

namespace axostim::protocols {

  struct SynthesisOptions {
    /// Fail with core::EpochOrderingGap unless every channel's epochs run 0..N without holes.
    bool requireContiguousEpochs{ false };
  };

  /// Effective duration of \p ep on episode \p episode; throws core::MalformedProtocol if negative.
  std::uint64_t effectiveDuration(const EpochWaveform& ep, std::uint32_t episode);

  /// levelInit + episode * levelIncrementPerEpisode.
  double effectiveLevel(const EpochWaveform& ep, std::uint32_t episode);

  /**
 * @brief Build the SweepWaveform of \p sweep on episode \p episodeNumberWithinRun.
 *
 *  * Epochs are laid end to end from sample 0 in ascending epoch number; each
 *    epoch starts from the level the previous one ended on (holding level first).
 *  * Digital lines take their timing from `sweep.digitalTiming`, which also
 *    counts towards the sweep span.
 *  * Pure: the same inputs always give the same waveform.
 *
 * Throws core::OutOfRangeSweep (episode >= episodesPerRun), core::MalformedProtocol
 * (negative effective duration) and core::EpochOrderingGap (strict coverage only).
 */
  SweepWaveform synthesize(const ResolvedSweep& sweep, std::uint32_t episodeNumberWithinRun,
                           const SynthesisOptions& options = {});

} // namespace axostim::protocols
