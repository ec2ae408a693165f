/* @file ProtocolDecoder.cpp
 * @brief ingest / resolve / synthesize pipeline with fault reporting and CSV logging
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// axostim headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ProtocolDecoder.hpp"
#include "core/ProtocolError.hpp"
#include "protocols/AlternationResolver.hpp"
#include "protocols/AlternationStrategy.hpp"
#include "protocols/ProtocolIngest.hpp"
#include "protocols/WaveformSynthesizer.hpp"

using namespace axostim::core;
using namespace axostim::protocols;

namespace {
  constexpr const char* kAxonSoftware = "Axon";
}

ProtocolDecoder::ProtocolDecoder(DecoderConfig config, std::shared_ptr<ErrorMonitor> errMonitor,
                                 std::shared_ptr<Logger> logger, const AlternationFactory& factory)
    : config_(std::move(config)), errorMonitor_(std::move(errMonitor)),
      logger_(std::move(logger)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[ProtocolDecoder] error monitor is nullptr");

  strategy_ = factory.create(config_.alternation);

  if (!logger_ && !config_.logPath.empty()) {
    logger_ = std::make_shared<Logger>();
    logger_->startNewRun(config_.logPath);
  }
}

ProtocolDecoder::~ProtocolDecoder() = default;

void ProtocolDecoder::load(const nlohmann::json& annotations) {
  std::shared_ptr<const ProtocolDescriptor> parsed;
  try {
    if (!annotations.is_object())
      throw MalformedProtocol("[ProtocolDecoder] annotations must be an object");

    // only Axon recordings carry this protocol layout
    if (annotations.contains("software")) {
      const auto& sw = annotations.at("software");
      if (!sw.is_string() || sw.get<std::string>() != kAxonSoftware)
        throw MalformedProtocol("[ProtocolDecoder] not an Axon recording (software = " +
                                sw.dump() + ")");
    }
    for (const char* key : { "protocol", "EpochInfo", "dictEpochInfoPerDAC" })
      if (!annotations.contains(key))
        throw MalformedProtocol(std::string("[ProtocolDecoder] annotations lack ") + key);

    const nlohmann::json alternate = annotations.contains("dictEpochInfoPerDACAlternate")
                                         ? annotations.at("dictEpochInfoPerDACAlternate")
                                         : nlohmann::json();
    parsed = std::make_shared<const ProtocolDescriptor>(
        ingest(annotations.at("protocol"), annotations.at("EpochInfo"),
               annotations.at("dictEpochInfoPerDAC"), alternate));
  } catch (const ProtocolError& e) {
    report("ingest", -1, -1, e.what());
    throw;
  }
  load(std::move(parsed));
}

void ProtocolDecoder::load(std::shared_ptr<const ProtocolDescriptor> descriptor) {
  if (!descriptor)
    throw std::invalid_argument("[ProtocolDecoder] descriptor is nullptr");

  descriptor_ = std::move(descriptor);
  currentState_ = State::LOADED;

  note("ingest", -1, -1,
       std::to_string(descriptor_->channels().size()) + " DAC channel(s), " +
           std::to_string(descriptor_->digitalEpochs().size()) + " epoch(s), " +
           std::to_string(descriptor_->sweepCount()) + " sweep(s)" +
           (descriptor_->averagedRuns() ? ", averaged runs" : ""));
}

const ProtocolDescriptor& ProtocolDecoder::descriptor() const {
  requireLoaded("descriptor");
  return *descriptor_;
}

std::shared_ptr<const ProtocolDescriptor> ProtocolDecoder::sharedDescriptor() const {
  requireLoaded("sharedDescriptor");
  return descriptor_;
}

std::uint64_t ProtocolDecoder::sweepCount() const {
  requireLoaded("sweepCount");
  return descriptor_->sweepCount();
}

SweepWaveform ProtocolDecoder::decodeSweep(std::uint32_t sweep) const {
  requireLoaded("decodeSweep");
  return decodeSweep(sweep, sweep % descriptor_->episodesPerRun());
}

SweepWaveform ProtocolDecoder::decodeSweep(std::uint32_t sweep, std::uint32_t episode) const {
  requireLoaded("decodeSweep");

  const char* stage = "resolve";
  try {
    const ResolvedSweep resolved = resolve(*descriptor_, sweep, *strategy_);
    stage = "synthesize";
    SynthesisOptions opts;
    opts.requireContiguousEpochs = config_.strictEpochCoverage;
    SweepWaveform out = synthesize(resolved, episode, opts);

    note(stage, sweep, episode,
         std::string("analog ") + toString(resolved.analogParity) + ", digital " +
             toString(resolved.digitalParity) + ", " + std::to_string(out.sampleCount) +
             " samples");
    return out;
  } catch (const ProtocolError& e) {
    report(stage, sweep, episode, e.what());
    throw;
  }
}

TriggerProtocol ProtocolDecoder::triggers(std::uint32_t sweep) const {
  const SweepWaveform wave = decodeSweep(sweep);
  TriggerProtocol out = extractTriggers(wave, config_.triggerLines, sampleIntervalSeconds());
  note("triggers", sweep, wave.episode, std::to_string(out.eventCount()) + " trigger(s)");
  return out;
}

double ProtocolDecoder::sampleIntervalSeconds() const {
  if (descriptor_ && descriptor_->settings().sampleIntervalUs > 0.0)
    return descriptor_->settings().sampleIntervalUs * 1e-6;
  return 1.0 / config_.samplingRateHz;
}

void ProtocolDecoder::requireLoaded(const char* what) const {
  if (currentState_ != State::LOADED)
    throw std::logic_error(std::string("[ProtocolDecoder] ") + what + "() before load()");
}

void ProtocolDecoder::report(const char* stage, std::int64_t sweep, std::int64_t episode,
                             const std::string& what) const {
  errorMonitor_->notifyFailure(what);
  note(stage, sweep, episode, "FAILED: " + what);
}

void ProtocolDecoder::note(const char* stage, std::int64_t sweep, std::int64_t episode,
                           const std::string& what) const {
  if (logger_)
    logger_->log(LogEvent::now(stage, what, sweep, episode));
}
