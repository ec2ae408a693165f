/* @file DecoderConfig.cpp
 * @brief schema checks for the decoder config
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// axostim headers
#include "core/DecoderConfig.hpp"

using namespace axostim::core;

DecoderConfig DecoderConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object())
    throw std::invalid_argument("[DecoderConfig] config root must be an object");

  DecoderConfig cfg;
  if (j.contains("alternation")) {
    if (!j.at("alternation").is_string())
      throw std::invalid_argument("[DecoderConfig] alternation must be a string");
    cfg.alternation = j.at("alternation").get<std::string>();
  }
  if (j.contains("strictEpochCoverage")) {
    if (!j.at("strictEpochCoverage").is_boolean())
      throw std::invalid_argument("[DecoderConfig] strictEpochCoverage must be a bool");
    cfg.strictEpochCoverage = j.at("strictEpochCoverage").get<bool>();
  }
  if (j.contains("samplingRateHz")) {
    const auto& rate = j.at("samplingRateHz");
    if (!rate.is_number() || !(rate.get<double>() > 0.0))
      throw std::invalid_argument("[DecoderConfig] samplingRateHz must be a positive number");
    cfg.samplingRateHz = rate.get<double>();
  }
  if (j.contains("logPath")) {
    if (!j.at("logPath").is_string())
      throw std::invalid_argument("[DecoderConfig] logPath must be a string");
    cfg.logPath = j.at("logPath").get<std::string>();
  }
  if (j.contains("triggerLines")) {
    const auto& lines = j.at("triggerLines");
    if (!lines.is_object())
      throw std::invalid_argument("[DecoderConfig] triggerLines must map line numbers to types");
    for (const auto& [key, value] : lines.items()) {
      std::size_t used = 0;
      int line = -1;
      try {
        line = std::stoi(key, &used);
      } catch (const std::exception&) {
        used = 0;
      }
      if (used != key.size() || line < 0 || line >= protocols::kDigitalLineCount)
        throw std::invalid_argument("[DecoderConfig] bad digital line '" + key + "'");
      if (!value.is_string())
        throw std::invalid_argument("[DecoderConfig] trigger type for line " + key +
                                    " must be a string");
      cfg.triggerLines[line] = protocols::triggerEventTypeFromName(value.get<std::string>());
    }
  }
  return cfg;
}
