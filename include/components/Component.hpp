#pragma once
/** @file  Component.hpp
 *  @brief Base class for components and the compile-time interface checklist.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <type_traits>

namespace boardlink::components {

  /// Type list of the interfaces a board needs from its backend.
  template <typename... Interfaces> struct InterfaceList {};

  template <typename Backend, typename List> struct ImplementsAll : std::false_type {};

  template <typename Backend, typename... Interfaces>
  struct ImplementsAll<Backend, InterfaceList<Interfaces...>>
      : std::bool_constant<(std::is_base_of_v<Interfaces, Backend> && ...)> {};

  /// Holds when \p Backend provides every interface listed in \p List.
  template <typename Backend, typename List>
  concept ImplementsInterfaces = ImplementsAll<Backend, List>::value;

  /**
 * @class Component
 * @brief Smallest addressable piece of hardware on a board.
 *
 *  * The identifier is fixed at construction and unique within the board.
 *  * Derived classes keep a reference to their interface and nothing else; every
 *    read goes back to the backend.
 */
  class Component {
  public:
    explicit Component(int identifier) : identifier_(identifier) {}
    virtual ~Component() = default;

    int identifier() const { return identifier_; }

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

  private:
    const int identifier_;
  };

} // namespace boardlink::components
