/**
  Hashing strategies for CountMap.

  A strategy decides which keys are "the same" key: every key it maps to the same
  token is counted under one record. CountMap expects a HashOps type with the same
  data/methods as the following example:

  struct ExampleHashOps {
    // Any type usable as a std::unordered_map key.
    using Token = std::string;
    // Deterministic and total over the keys in use.
    Token Hash(const Key& key) const;
    // Identifies the grouping rule. Two maps compare equal only if their
    // strategies report the same name, regardless of how Hash is written.
    std::string_view Name() const;
  };

 */

#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <iomanip>
#include <limits>
#include <functional>
#include <type_traits>
#include <utility>

#include "countmap/common.hpp"

template <typename Key>
struct ToStringHash {
  using Token = std::string;

  Token Hash(const Key& key) const {
    if constexpr (std::is_convertible_v<const Key&, std::string_view>) {
      return std::string{std::string_view{key}};
    } else if constexpr (std::is_integral_v<Key> and not std::is_same_v<Key, bool>) {
      return std::to_string(key);
    } else if constexpr (std::is_floating_point_v<Key>) {
      // Enough digits to round-trip, so distinct values never share a token.
      std::ostringstream os;
      os << std::setprecision(std::numeric_limits<Key>::max_digits10) << key;
      return os.str();
    } else {
      std::ostringstream os;
      os << key;
      return os.str();
    }
  }

  std::string_view Name() const { return "to_string"; }
};

std::string FoldCase(std::string_view str);

/* Groups strings that differ only in ASCII letter case. The first spelling seen
 * becomes the representative. */
struct CaseFoldHash {
  using Token = std::string;

  Token Hash(const std::string& key) const { return FoldCase(key); }

  std::string_view Name() const { return "case_fold"; }
};

/* Wraps an arbitrary callable. The name stands in for the function's identity, so
 * two FunctionHash instances with equal names are treated as the same grouping rule
 * even if their callables differ. */
template <typename Key, typename TokenType = std::string>
class FunctionHash {
 public:
  using Token = TokenType;
  using Function = std::function<Token(const Key&)>;

  FunctionHash(std::string name, Function fn)
      : name_{std::move(name)}, fn_{std::move(fn)} {
    Assert(fn_);
  }

  Token Hash(const Key& key) const { return fn_(key); }

  std::string_view Name() const { return name_; }

 private:
  std::string name_;
  Function fn_;
};

enum class HashKind { ToString, CaseFold };

HashKind ParseHashKind(std::string_view name);

std::string_view HashKindName(HashKind kind);
