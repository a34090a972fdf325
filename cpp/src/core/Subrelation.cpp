#include "core/Subrelation.hpp"

#include "util/Asserts.hpp"

#include <boost/algorithm/string/join.hpp>

#include <cctype>

namespace core {

namespace {

std::string strip_whitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
  }
  return out;
}

std::string join_arguments(std::string_view name, const std::vector<Subrelation>& arguments) {
  std::string out(name);
  if (arguments.empty()) return out;

  std::vector<std::string> parts;
  parts.reserve(arguments.size());
  for (const auto& arg : arguments) {
    parts.push_back(arg.to_string());
  }
  out += "(";
  out += boost::algorithm::join(parts, ",");
  out += ")";
  return out;
}

}  // namespace

Subrelation::Subrelation(std::string_view text) : repr_(strip_whitespace(text)) {
  RELEASE_ASSERT(!repr_.empty(), "empty subrelation");
  init_hash();
}

Subrelation::Subrelation(std::string_view name, std::initializer_list<Subrelation> arguments)
    : Subrelation(name, std::vector<Subrelation>(arguments)) {}

Subrelation::Subrelation(std::string_view name, const std::vector<Subrelation>& arguments)
    : repr_(join_arguments(strip_whitespace(name), arguments)) {
  RELEASE_ASSERT(!repr_.empty(), "empty subrelation");
  init_hash();
}

Subrelation Subrelation::number(int n) { return Subrelation(std::to_string(n)); }

std::string_view Subrelation::name() const {
  std::string_view view(repr_);
  size_t paren = view.find('(');
  if (paren == std::string_view::npos) return view;
  return view.substr(0, paren);
}

std::vector<Subrelation> Subrelation::arguments() const {
  std::vector<Subrelation> out;
  size_t paren = repr_.find('(');
  if (paren == std::string::npos) return out;

  RELEASE_ASSERT(repr_.back() == ')', "malformed subrelation {}", repr_);
  int level = 0;
  size_t start = paren + 1;
  for (size_t i = start; i + 1 < repr_.size(); ++i) {
    char c = repr_[i];
    if (c == '(') {
      ++level;
    } else if (c == ')') {
      --level;
    } else if (c == ',' && level == 0) {
      out.emplace_back(std::string_view(repr_).substr(start, i - start));
      start = i + 1;
    }
  }
  out.emplace_back(std::string_view(repr_).substr(start, repr_.size() - 1 - start));
  return out;
}

int Subrelation::arity() const { return arguments().size(); }

bool Subrelation::is_number() const {
  if (repr_.empty()) return false;
  size_t i = repr_[0] == '-' ? 1 : 0;
  if (i == repr_.size()) return false;
  for (; i < repr_.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(repr_[i]))) return false;
  }
  return true;
}

}  // namespace core
