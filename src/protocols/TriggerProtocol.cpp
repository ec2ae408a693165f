/* @file TriggerProtocol.cpp
 * @brief digital rising edges -> typed trigger events
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

// axostim headers
#include "protocols/TriggerProtocol.hpp"

using namespace axostim::protocols;

const char* axostim::protocols::defaultLabel(TriggerEventType type) {
  if (hasFlag(type, TriggerEventType::Presynaptic))
    return "epsp";
  if (hasFlag(type, TriggerEventType::Postsynaptic))
    return "ap";
  if (hasFlag(type, TriggerEventType::Photostimulation))
    return "photo";
  if (hasFlag(type, TriggerEventType::Imaging))
    return "imaging";
  if (hasFlag(type, TriggerEventType::Sweep))
    return "sweep";
  if (hasFlag(type, TriggerEventType::User))
    return "user";
  return "event";
}

TriggerEventType axostim::protocols::triggerEventTypeFromName(const std::string& name) {
  static const std::map<std::string, TriggerEventType> kNames{
    { "presynaptic", TriggerEventType::Presynaptic },
    { "postsynaptic", TriggerEventType::Postsynaptic },
    { "photostimulation", TriggerEventType::Photostimulation },
    { "imaging_frame", TriggerEventType::ImagingFrame },
    { "frame", TriggerEventType::ImagingFrame },
    { "imaging_line", TriggerEventType::ImagingLine },
    { "line", TriggerEventType::ImagingLine },
    { "sweep", TriggerEventType::Sweep },
    { "user", TriggerEventType::User },
  };
  auto it = kNames.find(name);
  if (it == kNames.end())
    throw std::invalid_argument("[Triggers] unknown trigger event type: " + name);
  return it->second;
}

std::size_t TriggerProtocol::eventCount() const {
  std::size_t n = 0;
  for (const auto* ev : { &presynaptic, &postsynaptic, &photostimulation })
    if (*ev)
      n += (*ev)->times.size();
  for (const auto& ev : acquisition)
    n += ev.times.size();
  for (const auto& ev : user)
    n += ev.times.size();
  return n;
}

std::vector<std::uint64_t> axostim::protocols::risingEdges(const DigitalTrace& trace) {
  std::vector<std::uint64_t> edges;
  for (const auto& t : trace)
    if (t.state)
      edges.push_back(t.sampleOffset);
  return edges;
}

TriggerProtocol axostim::protocols::extractTriggers(const SweepWaveform& waveform,
                                                    const TriggerLineMap& lines,
                                                    double sampleIntervalSeconds) {
  if (!(sampleIntervalSeconds > 0.0))
    throw std::invalid_argument("[Triggers] sample interval must be positive");

  TriggerProtocol out;
  out.sweepIndex = waveform.sweepIndex;
  out.name = "sweep_" + std::to_string(waveform.sweepIndex);

  // Out-of-range lines and shared single-slot types fail whether or not the lines pulse.
  std::map<TriggerEventType, int> singleSlot;
  for (const auto& [line, type] : lines) {
    if (line < 0 || line >= kDigitalLineCount)
      throw std::invalid_argument("[Triggers] digital line " + std::to_string(line) +
                                  " out of range");
    if (type != TriggerEventType::Presynaptic && type != TriggerEventType::Postsynaptic &&
        type != TriggerEventType::Photostimulation)
      continue;
    const auto [it, inserted] = singleSlot.emplace(type, line);
    if (!inserted)
      throw std::invalid_argument("[Triggers] lines " + std::to_string(it->second) + " and " +
                                  std::to_string(line) + " both map to " + defaultLabel(type));
  }

  for (const auto& [line, type] : lines) {
    const auto edges = risingEdges(waveform.digital[line]);
    if (edges.empty())
      continue;

    TriggerEvent ev;
    ev.type = type;
    ev.label = defaultLabel(type);
    ev.line = line;
    ev.times.reserve(edges.size());
    for (auto sample : edges)
      ev.times.push_back(static_cast<double>(sample) * sampleIntervalSeconds);

    switch (type) {
    case TriggerEventType::Presynaptic:
      out.presynaptic = std::move(ev);
      break;
    case TriggerEventType::Postsynaptic:
      out.postsynaptic = std::move(ev);
      break;
    case TriggerEventType::Photostimulation:
      out.photostimulation = std::move(ev);
      break;
    case TriggerEventType::User:
      out.user.push_back(std::move(ev));
      break;
    default:
      out.acquisition.push_back(std::move(ev));
      break;
    }
  }
  return out;
}
