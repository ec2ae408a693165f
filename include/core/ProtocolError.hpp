#pragma once
/** @file  ProtocolError.hpp
 *  @brief Typed failures raised while decoding a stimulation protocol.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace axostim {
  namespace core {

    /**
 * @class ProtocolError
 * @brief Root of every decode failure so callers can catch one type.
 */
    class ProtocolError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Structural or range violation in the annotations, or a negative episode duration.
    class MalformedProtocol : public ProtocolError {
    public:
      using ProtocolError::ProtocolError;
    };

    /// Epoch type code outside the closed set of known shapes.
    class UnrecognizedEpochType : public MalformedProtocol {
    public:
      explicit UnrecognizedEpochType(int code)
          : MalformedProtocol("[Ingest] unrecognized epoch type code " + std::to_string(code)),
            code_(code) {}

      int code() const noexcept { return code_; }

    private:
      int code_;
    };

    /// Sweep index past runsPerTrial x episodesPerRun, or episode past episodesPerRun.
    class OutOfRangeSweep : public ProtocolError {
    public:
      using ProtocolError::ProtocolError;
    };

    /// Only raised when the caller asks for contiguous epoch coverage.
    class EpochOrderingGap : public ProtocolError {
    public:
      using ProtocolError::ProtocolError;
    };

  } // namespace core
} // namespace axostim
