#pragma once
/** @file  TriggerProtocol.hpp
 *  @brief Typed trigger events recovered from a sweep's digital lines.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// axostim headers
#include "protocols/SweepWaveform.hpp"

namespace axostim {
  namespace protocols {

    /**
 * @enum TriggerEventType
 * @brief Bit flags; Imaging and Acquisition are unions of the single types.
 */
    enum class TriggerEventType : std::uint8_t {
      Presynaptic = 1,      ///< synaptic stimulus (TTL to a stim box)
      Postsynaptic = 2,     ///< somatic current injection eliciting APs
      Photostimulation = 4, ///< uncaging / laser shutter TTL
      ImagingFrame = 8,
      ImagingLine = 16,
      Sweep = 32, ///< external acquisition trigger
      User = 64,
      Imaging = ImagingFrame | ImagingLine,
      Acquisition = Imaging | Sweep,
    };

    inline bool hasFlag(TriggerEventType value, TriggerEventType flag) {
      return (static_cast<std::uint8_t>(value) & static_cast<std::uint8_t>(flag)) != 0;
    }

    /// "epsp", "ap", "photo", "imaging", "sweep", "user" or "event".
    const char* defaultLabel(TriggerEventType type);

    /// Parses "presynaptic", "imaging_frame", ... ; throws std::invalid_argument.
    TriggerEventType triggerEventTypeFromName(const std::string& name);

    struct TriggerEvent {
      TriggerEventType type{ TriggerEventType::User };
      std::string label;
      int line{ 0 };             ///< digital line the event was read from
      std::vector<double> times; ///< seconds from sweep start
    };

    /**
 * @struct TriggerProtocol
 * @brief The triggers delivered during one sweep.
 *
 *  * At most one presynaptic, postsynaptic and photostimulation event; each may
 *    hold several time stamps.
 *  * Imaging and sweep triggers go to `acquisition`, user triggers to `user`.
 */
    struct TriggerProtocol {
      std::string name;
      std::uint32_t sweepIndex{ 0 };
      std::optional<TriggerEvent> presynaptic;
      std::optional<TriggerEvent> postsynaptic;
      std::optional<TriggerEvent> photostimulation;
      std::vector<TriggerEvent> acquisition;
      std::vector<TriggerEvent> user;

      /// Total number of time stamps across all events.
      std::size_t eventCount() const;
      bool empty() const { return eventCount() == 0; }
    };

    /// digital line -> what the line triggers
    using TriggerLineMap = std::map<int, TriggerEventType>;

    /// Sample offsets where \p trace goes high (including sample 0 if it starts high).
    std::vector<std::uint64_t> risingEdges(const DigitalTrace& trace);

    /**
 * @brief Collect the rising edges of every mapped line as trigger events.
 *
 * Throws std::invalid_argument when \p sampleIntervalSeconds is not positive, a
 * line is outside 0-7, or two lines claim the same single-event slot.
 */
    TriggerProtocol extractTriggers(const SweepWaveform& waveform, const TriggerLineMap& lines,
                                    double sampleIntervalSeconds);

  } // namespace protocols
} // namespace axostim
