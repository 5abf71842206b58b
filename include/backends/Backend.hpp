#pragma once
/** @file  Backend.hpp
 *  @brief Base class for backends and the discovery contract they satisfy.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "components/Component.hpp"

namespace boardlink::backends {

  /**
 * @class Backend
 * @brief Drives one physical (or simulated) board through one transport.
 *
 *  * Owned by exactly one Board; holds no reference back to it.
 *  * Concrete backends also derive from every Interface their Board requires.
 *  * Hardware backends own their device handle exclusively and serialize access to it.
 */
  class Backend {
  public:
    virtual ~Backend() = default;

    virtual std::string serialNumber() = 0;
    virtual std::optional<std::string> firmwareVersion() = 0;

    Backend() = default;
    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;
  };

  /**
 * @brief What `BoardGroup` and `Environment` need from a backend type:
 *
 *  * `BoardType`: the single board class it drives;
 *  * `Config`: default-constructible discovery options;
 *  * `kName`: human readable backend name;
 *  * `discover(config)`: boards for every validated device;
 *  * every interface in `BoardType::RequiredInterfaces`.
 */
  template <typename B>
  concept DiscoverableBackend =
      std::derived_from<B, Backend> && std::default_initializable<typename B::Config> &&
      components::ImplementsInterfaces<B, typename B::BoardType::RequiredInterfaces> &&
      requires(const typename B::Config& config) {
        { B::kName } -> std::convertible_to<const char*>;
        {
          B::discover(config)
        } -> std::same_as<std::vector<std::unique_ptr<typename B::BoardType>>>;
      };

} // namespace boardlink::backends
