#pragma once

#include "core/Subrelation.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace core {

/*
 * The joint action of one ply: a role->move mapping, kept sorted by role. Covers one role in
 * sequential games and several in simultaneous-move games. An empty Turn is the "no one moved"
 * marker.
 */
class Turn {
 public:
  using play_t = std::pair<Role, Move>;
  using plays_t = std::vector<play_t>;
  using const_iterator = plays_t::const_iterator;

  Turn() { init_hash(); }
  explicit Turn(plays_t plays);
  Turn(std::initializer_list<play_t> plays) : Turn(plays_t(plays)) {}

  // Returns nullptr if role has no move in this turn.
  const Move* find(const Role& role) const;

  // Throws util::Exception if role has no move in this turn.
  const Move& at(const Role& role) const;

  bool contains(const Role& role) const { return find(role) != nullptr; }
  bool contains(const Role& role, const Move& move) const;

  // The turn consisting of role's move only (empty if role did not move).
  Turn restrict(const Role& role) const;

  // true if every play of other is also a play of this.
  bool includes(const Turn& other) const;

  const_iterator begin() const { return plays_.begin(); }
  const_iterator end() const { return plays_.end(); }
  size_t size() const { return plays_.size(); }
  bool empty() const { return plays_.empty(); }

  size_t hash() const { return hash_; }
  std::string to_string() const;

  bool operator==(const Turn& other) const {
    return hash_ == other.hash_ && plays_ == other.plays_;
  }
  bool operator!=(const Turn& other) const { return !(*this == other); }
  bool operator<(const Turn& other) const { return plays_ < other.plays_; }

 private:
  void init_hash();

  plays_t plays_;
  size_t hash_ = 0;
};

}  // namespace core

namespace std {

template <>
struct hash<core::Turn> {
  size_t operator()(const core::Turn& t) const { return t.hash(); }
};

}  // namespace std
