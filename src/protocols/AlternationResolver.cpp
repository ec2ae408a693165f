/* @file AlternationResolver.cpp
 * @brief primary / alternate parameter selection per sweep
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// axostim headers
#include "core/ProtocolError.hpp"
#include "protocols/AlternationResolver.hpp"

using namespace axostim::protocols;

namespace {

  ResolvedChannel copyChannel(int number, const DACChannel& ch, Parity set) {
    ResolvedChannel rc;
    rc.channelNumber = number;
    rc.holdingLevel = ch.holdingLevel;
    rc.waveformSet = set;

    const EpochMap& epochs = set == Parity::Alternate ? *ch.alternateEpochs : ch.epochs;
    rc.epochs.reserve(epochs.size());
    for (const auto& [_, ep] : epochs)
      rc.epochs.push_back(ep);
    return rc;
  }

} // namespace

const ResolvedChannel* ResolvedSweep::findChannel(int channelNumber) const {
  for (const auto& ch : channels)
    if (ch.channelNumber == channelNumber)
      return &ch;
  return nullptr;
}

ResolvedSweep axostim::protocols::resolve(const ProtocolDescriptor& descriptor,
                                          std::uint32_t sweepIndex) {
  const ParityAlternation parity;
  return resolve(descriptor, sweepIndex, parity);
}

ResolvedSweep axostim::protocols::resolve(const ProtocolDescriptor& descriptor,
                                          std::uint32_t sweepIndex,
                                          const AlternationStrategy& strategy) {
  if (sweepIndex >= descriptor.sweepCount())
    throw core::OutOfRangeSweep("[Resolver] sweep " + std::to_string(sweepIndex) +
                                " out of range; protocol has " +
                                std::to_string(descriptor.sweepCount()) + " sweeps");

  const Parity variant = strategy.selectVariant(sweepIndex);

  ResolvedSweep out;
  out.sweepIndex = sweepIndex;
  out.settings = descriptor.settings();
  out.analogParity = descriptor.alternateAnalogOutputs() ? variant : Parity::Primary;
  out.digitalParity = descriptor.alternateDigitalOutputs() ? variant : Parity::Primary;

  out.channels.reserve(descriptor.channels().size());
  for (const auto& [number, ch] : descriptor.channels()) {
    // a DAC without its own alternate set plays the primary set on every sweep
    const bool useAlternate = out.analogParity == Parity::Alternate && ch.alternateEpochs;
    out.channels.push_back(
        copyChannel(number, ch, useAlternate ? Parity::Alternate : Parity::Primary));

    if (number != out.settings.digitalDACChannel)
      continue;
    // digital lines keep the primary timing unless they alternate themselves
    if (useAlternate && !descriptor.alternateDigitalOutputs())
      out.digitalTiming = copyChannel(number, ch, Parity::Primary);
    else
      out.digitalTiming = out.channels.back();
  }

  out.digital.reserve(descriptor.digitalEpochs().size());
  for (const auto& [number, info] : descriptor.digitalEpochs()) {
    ResolvedDigitalEpoch rd;
    rd.epochNumber = number;
    if (out.digitalParity == Parity::Alternate) {
      rd.registry = info.alternateRegistry;
      rd.value = info.alternateDigitalValue;
      rd.trainValue = info.alternateDigitalTrainValue;
    } else {
      rd.registry = info.registry;
      rd.value = info.digitalValue;
      rd.trainValue = info.digitalTrainValue;
    }
    out.digital.push_back(rd);
  }
  return out;
}
