/* @file WaveformSynthesizer.cpp
 * @brief epoch fold per DAC + digital line plans borrowed from the digital DAC tab
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// axostim headers
#include "core/ProtocolError.hpp"
#include "protocols/DigitalRegistry.hpp"
#include "protocols/WaveformSynthesizer.hpp"

namespace axostim::protocols {

  namespace {

    struct ChannelLayout {
      std::vector<AnalogEpochPlan> plans;
      std::uint64_t end{ 0 };
    };

    // level the output sits at once the epoch is over
    double endLevel(const AnalogEpochPlan& p) {
      if (isTrain(p.type) && p.period != 0)
        return p.baseline;
      return p.level;
    }

    ChannelLayout layOut(const ResolvedChannel& ch, std::uint32_t episode) {
      ChannelLayout out;
      out.plans.reserve(ch.epochs.size());

      double level = ch.holdingLevel; // carried from one epoch to the next
      for (const auto& ep : ch.epochs) {
        AnalogEpochPlan p;
        p.epochNumber = ep.epochNumber;
        p.type = ep.type;
        p.start = out.end;
        try {
          p.duration = effectiveDuration(ep, episode);
        } catch (const core::MalformedProtocol& e) {
          throw core::MalformedProtocol("[Synthesizer] DAC " + std::to_string(ch.channelNumber) +
                                        ": " + e.what());
        }
        p.baseline = level;
        p.level = effectiveLevel(ep, episode);
        p.period = ep.pulsePeriod;
        p.width = ep.pulseWidth;

        out.end += p.duration;
        if (p.duration > 0)
          level = endLevel(p);
        out.plans.push_back(p);
      }
      return out;
    }

    void checkContiguous(const ResolvedSweep& sweep) {
      for (const auto& ch : sweep.channels) {
        for (std::size_t k = 0; k < ch.epochs.size(); ++k) {
          if (ch.epochs[k].epochNumber != static_cast<int>(k))
            throw core::EpochOrderingGap("[Synthesizer] DAC " + std::to_string(ch.channelNumber) +
                                         " is missing epoch " + std::to_string(k));
        }
      }
      for (std::size_t k = 0; k < sweep.digital.size(); ++k) {
        if (sweep.digital[k].epochNumber != static_cast<int>(k))
          throw core::EpochOrderingGap("[Synthesizer] digital outputs are missing epoch " +
                                       std::to_string(k));
      }
    }

    LineMode lineMode(bool staticBit, bool trainBit, bool trainActiveLogic,
                      const AnalogEpochPlan& timing) {
      if (trainBit) {
        if (!trainActiveLogic)
          return LineMode::High;
        // degenerate trains: no period -> held high, no width -> never rises
        if (timing.period == 0 || timing.width >= timing.period)
          return LineMode::High;
        if (timing.width == 0)
          return LineMode::Low;
        return LineMode::Train;
      }
      return staticBit ? LineMode::High : LineMode::Low;
    }

    std::array<std::vector<LineEpochPlan>, kDigitalLineCount>
    digitalPlans(const ResolvedSweep& sweep, const ChannelLayout* timing) {
      std::array<std::vector<LineEpochPlan>, kDigitalLineCount> lines;
      if (timing == nullptr)
        return lines;

      std::map<int, const ResolvedDigitalEpoch*> byEpoch;
      for (const auto& d : sweep.digital)
        byEpoch.emplace(d.epochNumber, &d);

      for (const auto& ep : timing->plans) {
        LineStates statics{};
        LineStates trains{};
        if (auto it = byEpoch.find(ep.epochNumber); it != byEpoch.end()) {
          statics = lineStates(it->second->registry, it->second->value);
          trains = lineStates(it->second->registry, it->second->trainValue);
        }

        for (int line = 0; line < kDigitalLineCount; ++line) {
          LineEpochPlan lp;
          lp.epochNumber = ep.epochNumber;
          lp.start = ep.start;
          lp.duration = ep.duration;
          lp.mode = lineMode(statics[line], trains[line], sweep.settings.trainActiveLogic, ep);
          lp.period = ep.period;
          lp.width = ep.width;
          lines[line].push_back(lp);
        }
      }
      return lines;
    }

  } // namespace

  std::uint64_t effectiveDuration(const EpochWaveform& ep, std::uint32_t episode) {
    const std::int64_t d = static_cast<std::int64_t>(ep.durationInit) +
                           static_cast<std::int64_t>(episode) * ep.durationIncrementPerEpisode;
    if (d < 0)
      throw core::MalformedProtocol("epoch " + std::to_string(ep.epochNumber) +
                                    " duration goes negative (" + std::to_string(d) +
                                    " samples) on episode " + std::to_string(episode));
    return static_cast<std::uint64_t>(d);
  }

  double effectiveLevel(const EpochWaveform& ep, std::uint32_t episode) {
    return ep.levelInit + static_cast<double>(episode) * ep.levelIncrementPerEpisode;
  }

  SweepWaveform synthesize(const ResolvedSweep& sweep, std::uint32_t episodeNumberWithinRun,
                           const SynthesisOptions& options) {
    if (episodeNumberWithinRun >= sweep.settings.episodesPerRun)
      throw core::OutOfRangeSweep("[Synthesizer] episode " + std::to_string(episodeNumberWithinRun) +
                                  " out of range; run has " +
                                  std::to_string(sweep.settings.episodesPerRun) + " episodes");
    if (options.requireContiguousEpochs)
      checkContiguous(sweep);

    std::vector<ChannelLayout> layouts;
    layouts.reserve(sweep.channels.size());
    std::uint64_t span = sweep.settings.samplesPerSweep;
    for (const auto& ch : sweep.channels) {
      layouts.push_back(layOut(ch, episodeNumberWithinRun));
      span = std::max(span, layouts.back().end);
    }
    std::optional<ChannelLayout> timing;
    if (sweep.digitalTiming) {
      timing = layOut(*sweep.digitalTiming, episodeNumberWithinRun);
      span = std::max(span, timing->end);
    }

    SweepWaveform out;
    out.sweepIndex = sweep.sweepIndex;
    out.episode = episodeNumberWithinRun;
    out.sampleCount = span;

    auto lines = digitalPlans(sweep, timing ? &*timing : nullptr);
    for (int line = 0; line < kDigitalLineCount; ++line)
      out.digital[line] = DigitalTrace(line, std::move(lines[line]), span);

    out.analog.reserve(sweep.channels.size());
    for (std::size_t k = 0; k < sweep.channels.size(); ++k)
      out.analog.emplace_back(sweep.channels[k].channelNumber, sweep.channels[k].holdingLevel,
                              std::move(layouts[k].plans), span);
    return out;
  }

} // namespace axostim::protocols
