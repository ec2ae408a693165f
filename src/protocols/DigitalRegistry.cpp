/* @file DigitalRegistry.cpp
 * @brief decimal code to digital line mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// axostim headers
#include "core/ProtocolError.hpp"
#include "protocols/DigitalRegistry.hpp"

using namespace axostim::protocols;

RegistryBits axostim::protocols::decodeBits(unsigned value) {
  if (value > kMaxDigitalValue)
    throw core::MalformedProtocol("[Ingest] digital value " + std::to_string(value) +
                                  " does not fit a 4-bit registry");

  RegistryBits bits{};
  for (int k = 0; k < kBitsPerRegistry; ++k)
    bits[k] = ((value >> k) & 1u) != 0;
  return bits;
}

unsigned axostim::protocols::encodeBits(const RegistryBits& bits) {
  unsigned value = 0;
  for (int k = 0; k < kBitsPerRegistry; ++k)
    if (bits[k])
      value |= 1u << k;
  return value;
}

int axostim::protocols::absoluteLine(Registry r, int bit) {
  if (bit < 0 || bit >= kBitsPerRegistry)
    throw std::out_of_range("[Registry] bit index " + std::to_string(bit) + " out of range");
  return r == Registry::Low ? bit : bit + kBitsPerRegistry;
}

LineStates axostim::protocols::lineStates(Registry r, unsigned value) {
  LineStates lines{};
  const auto bits = decodeBits(value);
  for (int k = 0; k < kBitsPerRegistry; ++k)
    lines[absoluteLine(r, k)] = bits[k];
  return lines;
}
