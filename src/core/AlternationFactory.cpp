/* @file AlternationFactory.cpp
 * @brief name -> AlternationStrategy registry
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <utility>

// axostim headers
#include "core/AlternationFactory.hpp"
#include "protocols/AlternationStrategy.hpp"

using namespace axostim::core;

AlternationFactory::AlternationFactory() {
  registerStrategy("parity", [] { return std::make_unique<protocols::ParityAlternation>(); });
}

bool AlternationFactory::registerStrategy(const std::string& name, Creator maker) {
  if (!maker)
    throw std::invalid_argument("[AlternationFactory] empty creator for '" + name + "'");
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<axostim::protocols::AlternationStrategy>
AlternationFactory::create(const std::string& name) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[AlternationFactory] unknown alternation scheme: " + name);
  return it->second();
}

std::vector<std::string> AlternationFactory::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, _] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}
