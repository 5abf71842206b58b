#pragma once
/** @file  BoardGroup.hpp
 *  @brief Discovered boards of one class, keyed by serial number.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <concepts>
#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "backends/Backend.hpp"
#include "boards/Board.hpp"
#include "core/Errors.hpp"
#include "core/SafetyReport.hpp"

namespace boardlink::boards {

  /**
 * @class BoardGroup
 * @brief Immutable result of one discovery call.
 *
 *  * Iterates in discovery order; serial numbers are unique keys.
 *  * A fresh discovery produces a fresh group; there is no hot-plug.
 *  * Move-only: the group owns its boards.
 */
  template <typename BoardT> class BoardGroup {
  public:
    /// Runs `BackendT::discover(config)` and groups the result.
    /// @throws core::DiscoveryAmbiguity when two boards share a serial number.
    template <backends::DiscoverableBackend BackendT>
      requires std::same_as<typename BackendT::BoardType, BoardT>
    static BoardGroup discover(const typename BackendT::Config& config = {}) {
      return BoardGroup(BackendT::kName, BackendT::discover(config));
    }

    /// @throws core::DiscoveryAmbiguity when two boards share a serial number.
    BoardGroup(std::string backendName, std::vector<std::unique_ptr<BoardT>> boards)
        : backendName_(std::move(backendName)), boards_(std::move(boards)) {
      for (std::size_t i = 0; i < boards_.size(); ++i) {
        std::string serial = boards_[i]->serialNumber();
        if (!index_.emplace(serial, i).second)
          throw core::DiscoveryAmbiguity(serial);
      }
    }

    BoardGroup(BoardGroup&&) noexcept = default;
    BoardGroup& operator=(BoardGroup&&) noexcept = default;
    BoardGroup(const BoardGroup&) = delete;
    BoardGroup& operator=(const BoardGroup&) = delete;

    /// The only board in the group.
    /// @throws core::BoardCountError unless exactly one board was discovered.
    BoardT& singular() const {
      if (boards_.size() != 1)
        throw core::BoardCountError(BoardT::kName, boards_.size());
      return *boards_.front();
    }

    /// @throws core::BoardNotFound for an unknown serial number.
    BoardT& get(const std::string& serial) const {
      auto it = index_.find(serial);
      if (it == index_.end())
        throw core::BoardNotFound(serial);
      return *boards_[it->second];
    }

    BoardT& operator[](const std::string& serial) const { return get(serial); }

    bool contains(const std::string& serial) const { return index_.count(serial) != 0; }
    std::size_t count() const { return boards_.size(); }
    bool empty() const { return boards_.empty(); }

    const std::string& backendName() const { return backendName_; }

    /// Makes every board safe; one board's faults never stop the next board.
    core::SafetyReport makeSafe() {
      core::SafetyReport report;
      for (auto& board : boards_)
        report.merge(board->makeSafe());
      return report;
    }

    class Iterator {
    public:
      using Inner = typename std::vector<std::unique_ptr<BoardT>>::const_iterator;
      using iterator_category = std::forward_iterator_tag;
      using value_type = BoardT;
      using difference_type = std::ptrdiff_t;
      using pointer = BoardT*;
      using reference = BoardT&;

      Iterator() = default;
      explicit Iterator(Inner it) : it_(it) {}

      BoardT& operator*() const { return **it_; }
      BoardT* operator->() const { return it_->get(); }
      Iterator& operator++() {
        ++it_;
        return *this;
      }
      Iterator operator++(int) {
        Iterator prev = *this;
        ++it_;
        return prev;
      }
      bool operator==(const Iterator& other) const { return it_ == other.it_; }
      bool operator!=(const Iterator& other) const { return it_ != other.it_; }

    private:
      Inner it_;
    };

    Iterator begin() const { return Iterator(boards_.begin()); }
    Iterator end() const { return Iterator(boards_.end()); }

  private:
    std::string backendName_;
    std::vector<std::unique_ptr<BoardT>> boards_;
    std::map<std::string, std::size_t> index_;
  };

} // namespace boardlink::boards
