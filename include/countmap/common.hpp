#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>
#include <map>
#include <unordered_map>
#include <string>
#include <string_view>
#include <sstream>
#include <stdexcept>
#include <functional>
#include <type_traits>
#include <iostream>

//////////////////////////////////////////////////////////////////////////////////////

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wshadow"
#pragma GCC diagnostic ignored "-Wstack-usage="
#include <range/v3/all.hpp>
#pragma GCC diagnostic pop

#include "countmap/debug.hpp"

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

#ifdef KEEP_ASSERTS
#ifdef USE_CPPTRACE
#define Assert(x)                                                       \
  {                                                                     \
    if (not(x)) {                                                       \
      std::cerr << "Assert failed: \"" #x "\" in " __FILE__             \
                   ":" TOSTRING(__LINE__) "\n";                         \
      DebugItem::print_current_trace();                                 \
      throw std::runtime_error("Assert failed: \"" #x "\" in " __FILE__ \
                               ":" TOSTRING(__LINE__));                 \
    }                                                                   \
  }
#else
#define Assert(x)                                                       \
  {                                                                     \
    if (not(x)) {                                                       \
      std::cerr << "Assert failed: \"" #x "\" in " __FILE__             \
                   ":" TOSTRING(__LINE__) "\n";                         \
      throw std::runtime_error("Assert failed: \"" #x "\" in " __FILE__ \
                               ":" TOSTRING(__LINE__));                 \
    }                                                                   \
  }
#endif
#else
#define Assert(x) \
  {}
#endif

[[noreturn]] inline void Fail(const char* msg) {
#ifdef KEEP_ASSERTS
  std::cerr << msg << "\n";
#endif
#ifdef USE_CPPTRACE
  DebugItem::print_current_trace();
#endif
  throw std::runtime_error(msg);
}

[[noreturn]] inline void Fail(const std::string& msg) { Fail(msg.c_str()); }

// Raised when a caller hands a count operation a value outside its domain, such as a
// negative amount to Add.
struct InvalidArgument : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

[[noreturn]] inline void FailInvalidArgument(const char* msg) {
#ifdef KEEP_ASSERTS
  std::cerr << msg << "\n";
#endif
#ifdef USE_CPPTRACE
  DebugItem::print_current_trace();
#endif
  throw InvalidArgument(msg);
}

//////////////////////////////////////////////////////////////////////////////////////

// Common utilities

inline std::vector<std::string> SplitString(const std::string& str, char delim) {
  std::vector<std::string> tokens;
  size_t start = 0;
  size_t end = str.find(delim);

  while (end != std::string::npos) {
    tokens.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delim, start);
  }
  tokens.push_back(str.substr(start));

  return tokens;
}

inline int ParseNumber(std::string_view str) {
  int result{};
  std::istringstream stream{std::string{str}};
  stream >> result;
  if (stream.fail()) {
    throw std::runtime_error("Invalid number");
  }
  return result;
}

//////////////////////////////////////////////////////////////////////////////////////
