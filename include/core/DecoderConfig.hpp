#pragma once
/** @file  DecoderConfig.hpp
 *  @brief Typed decoder settings parsed from the JSON config.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "protocols/TriggerProtocol.hpp"

namespace axostim {
  namespace core {

    /**
 * @struct DecoderConfig
 * @brief Everything ProtocolDecoder needs besides the annotations.
 *
 *  Example:
 *  @code
 *  { "alternation": "parity", "strictEpochCoverage": false,
 *    "samplingRateHz": 10000, "logPath": "decode.csv",
 *    "triggerLines": { "0": "presynaptic", "2": "photostimulation" } }
 *  @endcode
 */
    struct DecoderConfig {
      std::string alternation{ "parity" }; ///< AlternationFactory key
      bool strictEpochCoverage{ false };   ///< opt into EpochOrderingGap
      double samplingRateHz{ 10000.0 };    ///< used when the protocol has no fADCSequenceInterval
      std::string logPath{};               ///< empty = no CSV decode log
      protocols::TriggerLineMap triggerLines{};

      /// Missing keys keep their defaults; wrong types / values throw `std::invalid_argument`.
      static DecoderConfig fromJson(const nlohmann::json& j);
    };

  } // namespace core
} // namespace axostim
