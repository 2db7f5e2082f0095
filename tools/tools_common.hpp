#pragma once

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <string_view>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>

#include "version.hpp"
#include "countmap/common.hpp"

[[noreturn]] inline static void Fail() {
  std::cerr << "Run with -h or --help to see usage.\n";

  std::exit(EXIT_FAILURE);
}

inline static void Version(std::string program_name) {
  std::cout << program_name << "\n";
  std::cout << "Build version: " << VERSION_NUMBER << "\n";
  std::cout << "Build date: " << GIT_COMMIT_DATE << "\n";
  std::cout << "Build commit: " << GIT_COMMIT_HASH << "\n";
  std::cout << "Build type: " << BUILD_TYPE << "\n";

  exit(EXIT_SUCCESS);
}

//////////////////////////////////////////////////////////////////////////////////////

// Commandline Parsers

inline auto GetArguments(int argc, char** argv) {
  return ranges::views::counted(argv, argc) | ranges::views::drop(1) |
         ranges::views::transform([](auto i) { return std::string_view{i}; }) |
         ranges::views::chunk_by([](auto lhs, auto rhs) {
           return lhs.find('-') == 0 and rhs.find('-') != 0;
         }) |
         ranges::views::transform([](auto i) {
           return std::make_pair(*i.begin(), i | ranges::views::drop(1));
         });
}

using Arguments = decltype(GetArguments(0, nullptr));

inline auto FormatUsage(
    const std::string& program_desc, const std::vector<std::string>& usage_examples,
    const std::vector<std::pair<std::string, std::string>>& flag_desc_pairs) {
  std::stringstream os;

  if (!program_desc.empty()) {
    os << program_desc << "\n\n";
  }

  os << "Usage:\n";
  for (const auto& usage_example : usage_examples) {
    os << "  " << usage_example << "\n";
  }
  os << "\n";

  size_t max_flag_width = 0;
  for (const auto& [flag, desc] : flag_desc_pairs) {
    std::ignore = desc;
    max_flag_width = std::max(max_flag_width, flag.size());
  }

  os << "Options:\n";
  for (const auto& [flag, desc] : flag_desc_pairs) {
    const auto lines = SplitString(desc, '\n');
    for (size_t i = 0; i < lines.size(); i++) {
      os << "  " << std::left << std::setw(static_cast<int>(max_flag_width) + 2)
         << ((i == 0) ? flag : "");
      os << ((i == 0) ? "" : "  ") << lines[i] << "\n";
    }
  }

  return os.str();
}

// Helper to detect vector types
template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename Alloc>
struct is_vector<std::vector<T, Alloc>> : std::true_type {};

template <typename Params>
inline void CheckParamCount(std::string_view name, const Params& params,
                            const long req_num_params) {
  auto num_params = std::distance(params.begin(), params.end());
  if (num_params != req_num_params) {
    std::cerr << "ERROR: Incorrect number of params for `" << name
              << "` option (expected " << req_num_params << ", got " << num_params
              << ").\n";
    Fail();
  }
}

// Flags (bool) take no params and flip their initial value. Strings and integers take
// exactly one param.
template <typename Params, typename ParamType>
inline void ParseOption(std::string_view name, const Params& params_in,
                        ParamType& params_out) {
  if constexpr (std::is_same<bool, ParamType>::value) {
    CheckParamCount(name, params_in, 0);
    params_out = !params_out;
  } else if constexpr (std::is_same<std::string, ParamType>::value) {
    CheckParamCount(name, params_in, 1);
    params_out = std::string{*params_in.begin()};
  } else if constexpr (std::is_integral<ParamType>::value) {
    CheckParamCount(name, params_in, 1);
    try {
      params_out = static_cast<ParamType>(ParseNumber(*params_in.begin()));
    } catch (const std::runtime_error&) {
      std::cerr << "ERROR: Expected a number for `" << name << "` option, got '"
                << *params_in.begin() << "'.\n";
      Fail();
    }
  } else if constexpr (is_vector<ParamType>::value) {
    CheckParamCount(name, params_in, 1);
    params_out.emplace_back(*params_in.begin());
  } else {
    static_assert(!std::is_same<ParamType, ParamType>::value,
                  "Param type is not supported.");
  }
}
