#pragma once
/** @file  ComponentList.hpp
 *  @brief Fixed, read-only collection of same-kind components owned by a board.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "core/Errors.hpp"

namespace boardlink::components {

  /**
 * @class ComponentList
 * @brief Builds one component per identifier at construction; never grows or shrinks.
 *
 *  * Elements never move, so references handed out stay valid for the owner's lifetime.
 */
  template <typename T> class ComponentList {
  public:
    /// Every component receives its identifier followed by \p args.
    template <typename... Args>
    explicit ComponentList(const std::vector<int>& identifiers, Args&&... args) {
      for (int id : identifiers)
        items_.emplace_back(id, args...);
    }

    /// Positional access; throws `core::InvalidArgument` when out of range.
    T& operator[](std::size_t index) {
      if (index >= items_.size())
        throw core::InvalidArgument("index " + std::to_string(index) +
                                    " is out of range for " + std::to_string(items_.size()) +
                                    " components");
      return items_[index];
    }

    /// Lookup by component identifier; throws `core::InvalidArgument` when absent.
    T& byIdentifier(int identifier) {
      for (T& item : items_) {
        if (item.identifier() == identifier)
          return item;
      }
      throw core::InvalidArgument("no component with identifier " + std::to_string(identifier));
    }

    std::size_t size() const { return items_.size(); }

    auto begin() { return items_.begin(); }
    auto end() { return items_.end(); }
    auto begin() const { return items_.begin(); }
    auto end() const { return items_.end(); }

    ComponentList(const ComponentList&) = delete;
    ComponentList& operator=(const ComponentList&) = delete;

  private:
    std::deque<T> items_;
  };

} // namespace boardlink::components
