#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/*
 * A ground term of the rules language: a bare symbol (x, dealt), a number (3), or a compound term
 * (cell(1,2,b)). Facts of a state, roles and moves are all Subrelation's.
 *
 * A Subrelation is stored in its canonical textual form, "name(arg1,arg2)" with no whitespace.
 * Equality, ordering and hashing operate on that form, so two constructions of the same term are
 * interchangeable as map keys.
 */
class Subrelation {
 public:
  Subrelation() = default;

  // Canonical text of a symbol or compound term. Whitespace is stripped.
  explicit Subrelation(std::string_view text);

  Subrelation(std::string_view name, std::initializer_list<Subrelation> arguments);
  Subrelation(std::string_view name, const std::vector<Subrelation>& arguments);

  static Subrelation number(int n);

  // "cell" for cell(1,2,b); the whole text for a symbol.
  std::string_view name() const;
  std::vector<Subrelation> arguments() const;
  int arity() const;
  bool is_number() const;

  const std::string& to_string() const { return repr_; }
  size_t hash() const { return hash_; }

  bool operator==(const Subrelation& other) const { return repr_ == other.repr_; }
  bool operator!=(const Subrelation& other) const { return repr_ != other.repr_; }
  bool operator<(const Subrelation& other) const { return repr_ < other.repr_; }

 private:
  void init_hash() { hash_ = std::hash<std::string>{}(repr_); }

  std::string repr_;
  size_t hash_ = 0;
};

using Role = Subrelation;
using Move = Subrelation;

// The chance role of the rules language.
inline const Role& random_role() {
  static const Role role("random");
  return role;
}

}  // namespace core

namespace std {

template <>
struct hash<core::Subrelation> {
  size_t operator()(const core::Subrelation& s) const { return s.hash(); }
};

}  // namespace std
