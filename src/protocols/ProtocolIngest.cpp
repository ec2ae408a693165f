/* @file ProtocolIngest.cpp
 * @brief ABF annotation schema -> ProtocolDescriptor, with all structural checks up front
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// axostim headers
#include "core/ProtocolError.hpp"
#include "protocols/DigitalRegistry.hpp"
#include "protocols/ProtocolIngest.hpp"

using nlohmann::json;
using axostim::core::MalformedProtocol;

namespace axostim::protocols {

  namespace {

    [[noreturn]] void fail(const std::string& what) {
      throw MalformedProtocol("[Ingest] " + what);
    }

    // ABF integers may arrive as ints, bools (flags) or whole floats.
    std::optional<std::int64_t> asInteger(const json& v) {
      if (v.is_number_integer())
        return v.get<std::int64_t>();
      if (v.is_boolean())
        return v.get<bool>() ? 1 : 0;
      if (v.is_number_float()) {
        const double d = v.get<double>();
        if (std::isfinite(d) && std::floor(d) == d)
          return static_cast<std::int64_t>(d);
      }
      return std::nullopt;
    }

    std::int64_t requireInt(const json& rec, const char* key, const std::string& ctx) {
      if (!rec.contains(key))
        fail(ctx + ": missing field " + key);
      auto v = asInteger(rec.at(key));
      if (!v)
        fail(ctx + ": field " + key + " is not an integer");
      return *v;
    }

    std::int64_t intOr(const json& rec, const char* key, std::int64_t fallback,
                       const std::string& ctx) {
      return rec.contains(key) ? requireInt(rec, key, ctx) : fallback;
    }

    double requireNumber(const json& rec, const char* key, const std::string& ctx) {
      if (!rec.contains(key))
        fail(ctx + ": missing field " + key);
      const auto& v = rec.at(key);
      if (!v.is_number())
        fail(ctx + ": field " + key + " is not a number");
      return v.get<double>();
    }

    double numberOr(const json& rec, const char* key, double fallback, const std::string& ctx) {
      return rec.contains(key) ? requireNumber(rec, key, ctx) : fallback;
    }

    // first key present wins; the recording software has used both spellings
    bool flagOr(const json& rec, std::initializer_list<const char*> keys, const std::string& ctx) {
      for (const char* key : keys)
        if (rec.contains(key))
          return requireInt(rec, key, ctx) != 0;
      return false;
    }

    std::uint32_t nonNegative(std::int64_t v, const char* key, const std::string& ctx) {
      if (v < 0 || v > std::numeric_limits<std::uint32_t>::max())
        fail(ctx + ": " + key + " out of range (" + std::to_string(v) + ")");
      return static_cast<std::uint32_t>(v);
    }

    int narrowInt(std::int64_t v, const char* key, const std::string& ctx) {
      if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        fail(ctx + ": " + key + " out of range (" + std::to_string(v) + ")");
      return static_cast<int>(v);
    }

    int checkedEpochNumber(std::int64_t n, const std::string& ctx) {
      if (n < kMinEpochNumber || n > kMaxEpochNumber)
        fail(ctx + ": epoch number " + std::to_string(n) + " outside 0-9");
      return static_cast<int>(n);
    }

    std::uint8_t digitalCode(const json& rec, const char* key, bool required,
                             const std::string& ctx) {
      const std::int64_t v = required ? requireInt(rec, key, ctx) : intOr(rec, key, 0, ctx);
      if (v < 0 || v > static_cast<std::int64_t>(kMaxDigitalValue))
        fail(ctx + ": " + key + " = " + std::to_string(v) + " outside 0-15");
      return static_cast<std::uint8_t>(v);
    }

    Registry registryCode(const json& rec, const char* key, const std::string& ctx) {
      switch (intOr(rec, key, 0, ctx)) {
      case 0:
        return Registry::Low;
      case 1:
        return Registry::High;
      default:
        fail(ctx + ": " + key + " must be 0 (#3-0) or 1 (#7-4)");
      }
    }

    int parseKey(const std::string& key, const std::string& ctx) {
      std::size_t used = 0;
      int value = 0;
      try {
        value = std::stoi(key, &used);
      } catch (const std::exception&) {
        fail(ctx + ": key '" + key + "' is not a number");
      }
      if (used != key.size())
        fail(ctx + ": key '" + key + "' is not a number");
      return value;
    }

    ProtocolSettings parseSettings(const json& protocol) {
      const std::string ctx = "protocol";
      if (!protocol.is_object())
        fail("protocol annotation must be an object");

      ProtocolSettings s;
      const auto runs = intOr(protocol, "lRunsPerTrial", 1, ctx);
      const auto episodes = intOr(protocol, "lEpisodesPerRun", 1, ctx);
      if (runs <= 0)
        fail("lRunsPerTrial must be >= 1, got " + std::to_string(runs));
      if (episodes <= 0)
        fail("lEpisodesPerRun must be >= 1, got " + std::to_string(episodes));
      s.runsPerTrial = nonNegative(runs, "lRunsPerTrial", ctx);
      s.episodesPerRun = nonNegative(episodes, "lEpisodesPerRun", ctx);

      s.alternateAnalogOutputs =
          flagOr(protocol, { "nAlternateDACOutputState", "nAlternativeDACOutputState" }, ctx);
      s.alternateDigitalOutputs = flagOr(
          protocol, { "nAlternateDigitalOutputState", "nAlternativeDigitalOutputState" }, ctx);
      s.digitalDACChannel =
          narrowInt(intOr(protocol, "nDigitalDACChannel", 0, ctx), "nDigitalDACChannel", ctx);
      if (s.digitalDACChannel < 0)
        fail("nDigitalDACChannel must not be negative, got " + std::to_string(s.digitalDACChannel));
      s.trainActiveLogic = intOr(protocol, "nDigitalTrainActiveLogic", 0, ctx) != 0;
      s.samplesPerSweep =
          nonNegative(intOr(protocol, "lNumSamplesPerEpisode", 0, ctx), "lNumSamplesPerEpisode", ctx);
      s.sampleIntervalUs = numberOr(protocol, "fADCSequenceInterval", 0.0, ctx);
      if (s.sampleIntervalUs < 0.0)
        fail("fADCSequenceInterval must not be negative");
      return s;
    }

    std::map<int, EpochDigitalInfo> parseDigitalEpochs(const json& epochInfo,
                                                       const ProtocolSettings& s) {
      if (!epochInfo.is_array())
        fail("EpochInfo must be an array of epoch records");

      std::map<int, EpochDigitalInfo> out;
      for (const auto& rec : epochInfo) {
        if (!rec.is_object())
          fail("EpochInfo entries must be objects");

        EpochDigitalInfo info;
        info.epochNumber = checkedEpochNumber(requireInt(rec, "nEpochNum", "EpochInfo"), "EpochInfo");
        const std::string ctx = "EpochInfo[" + std::to_string(info.epochNumber) + "]";

        info.digitalValue = digitalCode(rec, "nDigitalValue", true, ctx);
        info.digitalTrainValue = digitalCode(rec, "nDigitalTrainValue", true, ctx);
        // alternates are only meaningful (and only required) with digital alternation on
        const bool needAlt = s.alternateDigitalOutputs;
        info.alternateDigitalValue = digitalCode(rec, "nAlternateDigitalValue", needAlt, ctx);
        info.alternateDigitalTrainValue =
            digitalCode(rec, "nAlternateDigitalTrainValue", needAlt, ctx);
        info.registry = registryCode(rec, "nDigitalRegistry", ctx);
        info.alternateRegistry = registryCode(rec, "nAlternateDigitalRegistry", ctx);

        if (!out.emplace(info.epochNumber, info).second)
          fail("duplicate epoch " + std::to_string(info.epochNumber) + " in EpochInfo");
      }
      return out;
    }

    // nullopt for a disabled (type 0) epoch
    std::optional<EpochWaveform> parseEpochWaveform(const json& rec, int dac,
                                                    const std::string& ctx) {
      if (!rec.is_object())
        fail(ctx + ": epoch record must be an object");

      EpochWaveform ep;
      ep.epochNumber = checkedEpochNumber(requireInt(rec, "nEpochNum", ctx), ctx);
      ep.dacNumber = narrowInt(intOr(rec, "nDACNum", dac, ctx), "nDACNum", ctx);
      if (ep.dacNumber != dac)
        fail(ctx + ": nDACNum " + std::to_string(ep.dacNumber) + " filed under DAC " +
             std::to_string(dac));

      const auto code = requireInt(rec, "nEpochType", ctx);
      if (code == 0)
        return std::nullopt;
      ep.type = epochTypeFromCode(static_cast<int>(code));

      ep.levelInit = requireNumber(rec, "fEpochInitLevel", ctx);
      ep.levelIncrementPerEpisode = numberOr(rec, "fEpochLevelInc", 0.0, ctx);
      ep.durationInit =
          nonNegative(requireInt(rec, "lEpochInitDuration", ctx), "lEpochInitDuration", ctx);

      const auto inc = intOr(rec, "lEpochDurationInc", 0, ctx);
      if (inc < std::numeric_limits<std::int32_t>::min() ||
          inc > std::numeric_limits<std::int32_t>::max())
        fail(ctx + ": lEpochDurationInc out of range");
      ep.durationIncrementPerEpisode = static_cast<std::int32_t>(inc);

      ep.pulsePeriod = nonNegative(intOr(rec, "lEpochPulsePeriod", 0, ctx), "lEpochPulsePeriod", ctx);
      ep.pulseWidth = nonNegative(intOr(rec, "lEpochPulseWidth", 0, ctx), "lEpochPulseWidth", ctx);
      if (isTrain(ep.type) && ep.pulsePeriod != 0 && ep.pulseWidth != 0 &&
          ep.pulseWidth > ep.pulsePeriod)
        fail(ctx + ": pulse width " + std::to_string(ep.pulseWidth) + " exceeds period " +
             std::to_string(ep.pulsePeriod));
      return ep;
    }

    // DAC number -> active epochs; DACs whose epochs are all disabled are dropped.
    // Keys are compared by number, so "0" and "00" clash.
    std::map<int, EpochMap> parseEpochsPerDac(const json& perDac, const char* name,
                                              const std::map<int, EpochDigitalInfo>& globals) {
      if (!perDac.is_object())
        fail(std::string(name) + " must be an object keyed by DAC number");

      std::map<int, EpochMap> out;
      std::set<int> seen;
      for (const auto& [dacKey, epochs] : perDac.items()) {
        const int dac = parseKey(dacKey, name);
        const std::string ctx = std::string(name) + "[" + std::to_string(dac) + "]";
        if (!seen.insert(dac).second)
          fail(std::string(name) + ": duplicate DAC " + std::to_string(dac) + " (key \"" +
               dacKey + "\")");

        EpochMap active;
        auto take = [&](const json& rec, std::optional<int> keyedAs) {
          auto ep = parseEpochWaveform(rec, dac, ctx);
          if (!ep)
            return;
          if (keyedAs && *keyedAs != ep->epochNumber)
            fail(ctx + ": epoch filed under key " + std::to_string(*keyedAs) + " has nEpochNum " +
                 std::to_string(ep->epochNumber));
          if (globals.find(ep->epochNumber) == globals.end())
            fail(ctx + ": epoch " + std::to_string(ep->epochNumber) +
                 " is not in the active epoch list");
          if (!active.emplace(ep->epochNumber, *ep).second)
            fail(ctx + ": duplicate epoch " + std::to_string(ep->epochNumber));
        };

        if (epochs.is_object()) {
          for (const auto& [epochKey, rec] : epochs.items())
            take(rec, parseKey(epochKey, ctx));
        } else if (epochs.is_array()) {
          for (const auto& rec : epochs)
            take(rec, std::nullopt);
        } else {
          fail(ctx + " must be an object or array of epoch records");
        }

        if (!active.empty())
          out.emplace(dac, std::move(active));
      }
      return out;
    }

    double holdingLevelFor(const json& protocol, int dac) {
      if (!protocol.contains("fDACHoldingLevel"))
        return 0.0;
      const auto& levels = protocol.at("fDACHoldingLevel");
      if (!levels.is_array())
        fail("fDACHoldingLevel must be an array indexed by DAC number");
      if (dac < 0 || static_cast<std::size_t>(dac) >= levels.size())
        return 0.0;
      if (!levels.at(dac).is_number())
        fail("fDACHoldingLevel[" + std::to_string(dac) + "] is not a number");
      return levels.at(dac).get<double>();
    }

    bool drivesDigitalOutput(const EpochDigitalInfo& d, bool alternating) {
      if (d.digitalValue != 0 || d.digitalTrainValue != 0)
        return true;
      return alternating && (d.alternateDigitalValue != 0 || d.alternateDigitalTrainValue != 0);
    }

    // digital lines borrow the epoch timing of the digitalDACChannel tab
    void checkDigitalTiming(const ProtocolSettings& s, const std::map<int, DACChannel>& channels,
                            const std::map<int, EpochDigitalInfo>& digital) {
      for (const auto& [num, info] : digital) {
        if (!drivesDigitalOutput(info, s.alternateDigitalOutputs))
          continue;

        auto ch = channels.find(s.digitalDACChannel);
        const std::string what = "digital output of epoch " + std::to_string(num) +
                                 " needs its timing on DAC " +
                                 std::to_string(s.digitalDACChannel);
        if (ch == channels.end())
          fail(what + ", which has no waveform");
        if (ch->second.epochs.count(num) == 0)
          fail(what);
        if (s.alternateAnalogOutputs && s.alternateDigitalOutputs && ch->second.alternateEpochs &&
            ch->second.alternateEpochs->count(num) == 0)
          fail(what + " (alternate waveform set)");
      }
    }

  } // namespace

  ProtocolDescriptor ingest(const json& protocol, const json& epochInfo, const json& epochInfoPerDac) {
    return ingest(protocol, epochInfo, epochInfoPerDac, json());
  }

  ProtocolDescriptor ingest(const json& protocol, const json& epochInfo, const json& epochInfoPerDac,
                            const json& alternateEpochInfoPerDac) {
    const ProtocolSettings settings = parseSettings(protocol);
    auto digital = parseDigitalEpochs(epochInfo, settings);

    std::map<int, DACChannel> channels;
    for (auto& [dac, epochs] : parseEpochsPerDac(epochInfoPerDac, "dictEpochInfoPerDAC", digital)) {
      DACChannel ch;
      ch.channelNumber = dac;
      ch.holdingLevel = holdingLevelFor(protocol, dac);
      ch.epochs = std::move(epochs);
      channels.emplace(dac, std::move(ch));
    }

    if (!alternateEpochInfoPerDac.is_null()) {
      for (auto& [dac, epochs] :
           parseEpochsPerDac(alternateEpochInfoPerDac, "dictEpochInfoPerDACAlternate", digital)) {
        auto it = channels.find(dac);
        if (it == channels.end()) {
          DACChannel ch;
          ch.channelNumber = dac;
          ch.holdingLevel = holdingLevelFor(protocol, dac);
          it = channels.emplace(dac, std::move(ch)).first;
        }
        it->second.alternateEpochs = std::move(epochs);
      }
    }

    checkDigitalTiming(settings, channels, digital);
    return ProtocolDescriptor(settings, std::move(channels), std::move(digital));
  }

} // namespace axostim::protocols
