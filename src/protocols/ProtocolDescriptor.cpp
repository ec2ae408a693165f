/* @file ProtocolDescriptor.cpp
 * @brief immutable protocol model + ABF epoch type codes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// axostim headers
#include "core/ProtocolError.hpp"
#include "protocols/ProtocolDescriptor.hpp"

using namespace axostim::protocols;

EpochType axostim::protocols::epochTypeFromCode(int code) {
  switch (code) {
  case 1:
    return EpochType::Step;
  case 2:
    return EpochType::Ramp;
  case 3:
    return EpochType::PulseTrain;
  case 4:
    return EpochType::Triangle;
  case 5:
    return EpochType::Cosine;
  case 7:
    return EpochType::BiphasicTrain;
  default:
    throw core::UnrecognizedEpochType(code);
  }
}

int axostim::protocols::toCode(EpochType t) {
  switch (t) {
  case EpochType::Step:
    return 1;
  case EpochType::Ramp:
    return 2;
  case EpochType::PulseTrain:
    return 3;
  case EpochType::Triangle:
    return 4;
  case EpochType::Cosine:
    return 5;
  case EpochType::BiphasicTrain:
    return 7;
  default:
    return 0;
  }
}

ProtocolDescriptor::ProtocolDescriptor(ProtocolSettings settings,
                                       std::map<int, DACChannel> channels,
                                       std::map<int, EpochDigitalInfo> digitalEpochs)
    : settings_(settings), channels_(std::move(channels)),
      digitalEpochs_(std::move(digitalEpochs)) {}

std::uint64_t ProtocolDescriptor::sweepCount() const {
  return static_cast<std::uint64_t>(settings_.runsPerTrial) * settings_.episodesPerRun;
}

const DACChannel* ProtocolDescriptor::findChannel(int channelNumber) const {
  auto it = channels_.find(channelNumber);
  return it == channels_.end() ? nullptr : &it->second;
}

const EpochDigitalInfo* ProtocolDescriptor::findDigitalEpoch(int epochNumber) const {
  auto it = digitalEpochs_.find(epochNumber);
  return it == digitalEpochs_.end() ? nullptr : &it->second;
}
