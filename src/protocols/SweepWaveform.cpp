/* @file SweepWaveform.cpp
 * @brief on-demand generation of analog segments and digital transitions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <utility>

// axostim headers
#include "protocols/SweepWaveform.hpp"

using namespace axostim::protocols;

namespace {

  constexpr double kTwoPi = 6.283185307179586476925286766559;

  AnalogSegment flat(std::uint64_t offset, std::uint64_t count, double level) {
    AnalogSegment s;
    s.sampleOffset = offset;
    s.sampleCount = count;
    s.shape = SegmentShape::Flat;
    s.level = level;
    s.endLevel = level;
    return s;
  }

  AnalogSegment linear(std::uint64_t offset, std::uint64_t count, double from, double to) {
    AnalogSegment s;
    s.sampleOffset = offset;
    s.sampleCount = count;
    s.shape = SegmentShape::Linear;
    s.level = from;
    s.endLevel = to;
    return s;
  }

  std::uint64_t epochEnd(const AnalogEpochPlan& p) { return p.start + p.duration; }

  // Triangle rise time; the fall takes the rest of the period.
  std::uint64_t triangleRise(const AnalogEpochPlan& p) {
    return p.width != 0 ? p.width : p.period / 2;
  }

} // namespace

//---AnalogSegment-------------------------------------------------------------

double AnalogSegment::valueAt(std::uint64_t i) const {
  switch (shape) {
  case SegmentShape::Linear:
    if (sampleCount == 0)
      return level;
    return level + (endLevel - level) * static_cast<double>(i) / static_cast<double>(sampleCount);
  case SegmentShape::Cosine:
    if (period == 0)
      return level + amplitude;
    return level + amplitude * std::cos(kTwoPi * static_cast<double>(i) / period);
  case SegmentShape::Flat:
  default:
    return level;
  }
}

//---AnalogTrace---------------------------------------------------------------

AnalogTrace::AnalogTrace(int channelNumber, double holdingLevel,
                         std::vector<AnalogEpochPlan> plans, std::uint64_t sweepSamples)
    : channel_(channelNumber), holding_(holdingLevel), plans_(std::move(plans)),
      span_(sweepSamples) {}

bool AnalogTrace::advance(AnalogCursor& c, AnalogSegment& out) const {
  auto nextPlan = [&c] {
    ++c.plan;
    c.cycle = 0;
    c.phase = 0;
  };

  while (c.plan < plans_.size()) {
    const AnalogEpochPlan& p = plans_[c.plan];
    const std::uint64_t end = epochEnd(p);

    if (p.duration == 0) {
      nextPlan();
      continue;
    }

    const bool train = isTrain(p.type) && p.period != 0;
    const bool pulses = p.type == EpochType::PulseTrain || p.type == EpochType::BiphasicTrain;

    // Step, Ramp, trains without a period, and pulse trains with zero-width pulses
    if (!train || (pulses && p.width == 0)) {
      if (c.phase != 0) {
        nextPlan();
        continue;
      }
      c.phase = 1;
      if (p.type == EpochType::Ramp)
        out = linear(p.start, p.duration, p.baseline, p.level);
      else if (pulses && train)
        out = flat(p.start, p.duration, p.baseline);
      else
        out = flat(p.start, p.duration, p.level);
      return true;
    }

    const std::uint64_t cs = p.start + c.cycle * p.period;
    if (cs >= end) {
      nextPlan();
      continue;
    }

    if (pulses) {
      if (c.phase == 0) {
        c.phase = 1;
        const double lvl =
            (p.type == EpochType::BiphasicTrain && (c.cycle % 2) == 1) ? -p.level : p.level;
        out = flat(cs, std::min<std::uint64_t>(p.width, end - cs), lvl);
        return true;
      }
      c.phase = 0;
      ++c.cycle;
      const std::uint64_t off = cs + p.width;
      if (p.width < p.period && off < end) {
        out = flat(off, std::min<std::uint64_t>(p.period - p.width, end - off), p.baseline);
        return true;
      }
      continue;
    }

    if (p.type == EpochType::Triangle) {
      const std::uint64_t rise = std::min<std::uint64_t>(triangleRise(p), p.period);
      const std::uint64_t fall = p.period - rise;
      if (c.phase == 0) {
        c.phase = 1;
        const std::uint64_t len = std::min(rise, end - cs);
        if (len > 0) {
          const double to = p.baseline + (p.level - p.baseline) * static_cast<double>(len) /
                                             static_cast<double>(rise);
          out = linear(cs, len, p.baseline, to);
          return true;
        }
      }
      c.phase = 0;
      ++c.cycle;
      const std::uint64_t off = cs + rise;
      if (fall > 0 && off < end) {
        const std::uint64_t len = std::min(fall, end - off);
        const double to = p.level + (p.baseline - p.level) * static_cast<double>(len) /
                                        static_cast<double>(fall);
        out = linear(off, len, p.level, to);
        return true;
      }
      continue;
    }

    // Cosine: one segment per period, phase restarting at each period
    ++c.cycle;
    out.sampleOffset = cs;
    out.sampleCount = std::min<std::uint64_t>(p.period, end - cs);
    out.shape = SegmentShape::Cosine;
    out.level = p.baseline;
    out.amplitude = p.level;
    out.period = p.period;
    out.endLevel = p.baseline;
    return true;
  }

  if (!c.tailDone) {
    c.tailDone = true;
    const std::uint64_t last = plans_.empty() ? 0 : epochEnd(plans_.back());
    if (last < span_) {
      out = flat(last, span_ - last, holding_);
      return true;
    }
  }
  return false;
}

std::vector<double> AnalogTrace::render() const {
  std::vector<double> samples(span_, holding_);
  for (const auto& seg : *this)
    for (std::uint64_t i = 0; i < seg.sampleCount && seg.sampleOffset + i < span_; ++i)
      samples[seg.sampleOffset + i] = seg.valueAt(i);
  return samples;
}

//---DigitalTrace--------------------------------------------------------------

DigitalTrace::DigitalTrace(int line, std::vector<LineEpochPlan> plans, std::uint64_t sweepSamples)
    : line_(line), plans_(std::move(plans)), span_(sweepSamples) {}

// Level runs in time order, possibly repeating the current state.
bool DigitalTrace::rawNext(DigitalCursor& c, DigitalTransition& out) const {
  auto nextPlan = [&c] {
    ++c.plan;
    c.cycle = 0;
    c.phase = 0;
  };

  while (c.plan < plans_.size()) {
    const LineEpochPlan& p = plans_[c.plan];
    const std::uint64_t end = p.start + p.duration;

    if (p.duration == 0) {
      nextPlan();
      continue;
    }

    if (p.mode != LineMode::Train) {
      if (c.phase != 0) {
        nextPlan();
        continue;
      }
      c.phase = 1;
      out = { p.start, p.mode == LineMode::High };
      return true;
    }

    const std::uint64_t cs = p.start + c.cycle * p.period;
    if (cs >= end) {
      nextPlan();
      continue;
    }
    if (c.phase == 0) {
      c.phase = 1;
      out = { cs, true };
      return true;
    }
    c.phase = 0;
    ++c.cycle;
    const std::uint64_t off = cs + p.width;
    if (off < end) {
      out = { off, false };
      return true;
    }
  }

  if (!c.tailDone) {
    c.tailDone = true;
    const std::uint64_t last = plans_.empty() ? 0 : plans_.back().start + plans_.back().duration;
    if (!c.emitted || last < span_) {
      out = { c.emitted ? last : 0, false };
      return true;
    }
  }
  return false;
}

bool DigitalTrace::advance(DigitalCursor& c, DigitalTransition& out) const {
  DigitalTransition run;
  while (rawNext(c, run)) {
    if (!c.emitted || run.state != c.lastState) {
      c.emitted = true;
      c.lastState = run.state;
      out = run;
      return true;
    }
  }
  return false;
}

bool DigitalTrace::alwaysLow() const {
  return std::none_of(begin(), end(), [](const DigitalTransition& t) { return t.state; });
}

std::vector<std::uint8_t> DigitalTrace::render() const {
  std::vector<std::uint8_t> samples(span_, 0);
  const auto transitions = collect();
  for (std::size_t k = 0; k < transitions.size(); ++k) {
    const std::uint64_t from = transitions[k].sampleOffset;
    const std::uint64_t to = k + 1 < transitions.size() ? transitions[k + 1].sampleOffset : span_;
    for (std::uint64_t i = from; i < to && i < span_; ++i)
      samples[i] = transitions[k].state ? 1 : 0;
  }
  return samples;
}

//---SweepWaveform-------------------------------------------------------------

const AnalogTrace* SweepWaveform::findChannel(int channelNumber) const {
  for (const auto& trace : analog)
    if (trace.channelNumber() == channelNumber)
      return &trace;
  return nullptr;
}
