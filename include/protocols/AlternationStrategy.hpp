#pragma once
/** @file  AlternationStrategy.hpp
 *  @brief Abstract base for choosing the parameter set a sweep plays.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

namespace axostim::protocols {

  /// Which of the two parameter sets a sweep uses.
  enum class Parity : std::uint8_t { Primary, Alternate };

  inline const char* toString(Parity p) { return p == Parity::Primary ? "primary" : "alternate"; }

  /**
 * @class AlternationStrategy
 * @brief Common polymorphic interface for sweep -> parameter-set selection.
 *
 *  * Must be a pure function of the sweep index (resolve() may run concurrently).
 *  * Only the two-set scheme is defined by the recording format today.
 */
  class AlternationStrategy {
  public:
    virtual ~AlternationStrategy() = default;

    /// @param sweepIndex 0-based sweep within the run.
    virtual Parity selectVariant(std::uint32_t sweepIndex) const = 0;
  };

  /// Even sweeps primary, odd sweeps alternate.
  class ParityAlternation final : public AlternationStrategy {
  public:
    Parity selectVariant(std::uint32_t sweepIndex) const override {
      return (sweepIndex % 2u) == 0u ? Parity::Primary : Parity::Alternate;
    }
  };

} // namespace axostim::protocols
