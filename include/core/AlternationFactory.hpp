#pragma once
/** @file  AlternationFactory.hpp
 *  @brief Runtime registry that maps alternation scheme names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace axostim::protocols {
  class AlternationStrategy;
}

namespace axostim::core {

  /**
 * @class AlternationFactory
 * @brief Register & instantiate alternation strategies by string key.
 *
 *  * Keeps ProtocolDecoder decoupled from concrete strategies (config names one).
 *  * Comes pre-loaded with `"parity"`.
 */
  class AlternationFactory {
  public:
    using Creator = std::function<std::unique_ptr<protocols::AlternationStrategy>()>;

    AlternationFactory();

    /// Register a strategy under \p name.  Returns false on duplicate.
    bool registerStrategy(const std::string &name, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<protocols::AlternationStrategy> create(const std::string &name) const;

    /// Registered names, sorted.
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace axostim::core
