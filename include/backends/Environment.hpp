#pragma once
/** @file  Environment.hpp
 *  @brief Registry of which backend discovers each board class.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <any>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

// boardlink headers
#include "backends/Backend.hpp"
#include "boards/BoardGroup.hpp"
#include "core/Errors.hpp"

namespace boardlink::backends {

  /**
 * @class Environment
 * @brief A set of backends that work together, e.g. everything needed to drive
 *        real hardware, or everything needed to simulate it on the console.
 *
 *  * At most one backend per board class.
 *  * Each registration keeps its own copy of the backend's `Config`.
 *  * `boardGroup()` runs discovery under the environment's mutex, so concurrent
 *    callers never enumerate the same transport at once.
 *  * Passed explicitly to whoever needs it; there is no global instance.
 */
  class Environment {
  public:
    explicit Environment(std::string name) : name_(std::move(name)) {}

    Environment(Environment&& other) {
      std::lock_guard<std::mutex> lk(other.mtx_);
      name_ = std::move(other.name_);
      registry_ = std::move(other.registry_);
    }
    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    /// @throws std::runtime_error when a backend is already registered for the board.
    template <DiscoverableBackend BackendT>
    Environment& registerBackend(typename BackendT::Config config = {}) {
      using BoardT = typename BackendT::BoardType;
      Entry entry{ BackendT::kName, BoardT::kName,
                   std::function<boards::BoardGroup<BoardT>()>(
                       [config = std::move(config)] {
                         return boards::BoardGroup<BoardT>::template discover<BackendT>(config);
                       }) };

      std::lock_guard<std::mutex> lk(mtx_);
      if (!registry_.emplace(std::type_index(typeid(BoardT)), std::move(entry)).second)
        throw std::runtime_error("Attempted to register multiple backends for " +
                                 std::string(BoardT::kName) + " in the same environment.");
      return *this;
    }

    template <typename BoardT> bool supports() const {
      std::lock_guard<std::mutex> lk(mtx_);
      return registry_.count(std::type_index(typeid(BoardT))) != 0;
    }

    /// Name of the backend registered for \p BoardT.
    /// @throws core::NotSupportedByEnvironment when none is.
    template <typename BoardT> std::string backendName() const {
      std::lock_guard<std::mutex> lk(mtx_);
      return find<BoardT>().backendName;
    }

    /// Discovers every \p BoardT through the registered backend.
    /// @throws core::NotSupportedByEnvironment when no backend is registered.
    template <typename BoardT> boards::BoardGroup<BoardT> boardGroup() const {
      std::lock_guard<std::mutex> lk(mtx_);
      const Entry& entry = find<BoardT>();
      return std::any_cast<const std::function<boards::BoardGroup<BoardT>()>&>(entry.discover)();
    }

    /// Adds every registration of \p other.
    /// @throws std::runtime_error when both environments register the same board;
    ///         nothing is merged in that case.
    void merge(const Environment& other);

    /// Board names this environment can discover, sorted.
    std::vector<std::string> supportedBoards() const;

    const std::string& name() const { return name_; }

  private:
    struct Entry {
      std::string backendName;
      std::string boardName;
      std::any discover; ///< std::function<boards::BoardGroup<BoardT>()>
    };

    template <typename BoardT> const Entry& find() const {
      auto it = registry_.find(std::type_index(typeid(BoardT)));
      if (it == registry_.end())
        throw core::NotSupportedByEnvironment("The " + name_ + " does not support " +
                                              std::string(BoardT::kName));
      return it->second;
    }

    std::string name_;
    mutable std::mutex mtx_;
    std::map<std::type_index, Entry> registry_;
  };

} // namespace boardlink::backends
