#pragma once
/** @file  DigitalRegistry.hpp
 *  @brief Decimal <-> bit decoding of the 4-bit digital output registries.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>

// axostim headers
#include "protocols/ProtocolDescriptor.hpp"

namespace axostim {
  namespace protocols {

    constexpr int kBitsPerRegistry = 4;
    constexpr int kDigitalLineCount = 8;
    constexpr unsigned kMaxDigitalValue = 15;

    using RegistryBits = std::array<bool, kBitsPerRegistry>;
    using LineStates = std::array<bool, kDigitalLineCount>;

    /// bit_k(v) = (v >> k) & 1; throws core::MalformedProtocol when v > 15.
    RegistryBits decodeBits(unsigned value);

    /// Inverse of decodeBits().
    unsigned encodeBits(const RegistryBits& bits);

    /// Absolute digital line driven by bit \p bit of registry \p r (Low -> 0..3, High -> 4..7).
    int absoluteLine(Registry r, int bit);

    /// States of all eight lines when \p value is written to registry \p r.
    LineStates lineStates(Registry r, unsigned value);

  } // namespace protocols
} // namespace axostim
