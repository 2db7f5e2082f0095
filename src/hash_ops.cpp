#include "countmap/hash_ops.hpp"

#include <cctype>

std::string FoldCase(std::string_view str) {
  std::string result{str};
  for (auto& c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

HashKind ParseHashKind(std::string_view name) {
  if (name == "exact" or name == "to_string") {
    return HashKind::ToString;
  }
  if (name == "fold" or name == "case_fold") {
    return HashKind::CaseFold;
  }
  FailInvalidArgument(("Unknown hash kind '" + std::string{name} + "'").c_str());
}

std::string_view HashKindName(HashKind kind) {
  switch (kind) {
    case HashKind::ToString:
      return "to_string";
    case HashKind::CaseFold:
      return "case_fold";
  }
  Fail("Unreachable");
}
