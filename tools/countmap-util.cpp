#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "tools_common.hpp"
#include "countmap/count_map.hpp"
#include "countmap/hash_ops.hpp"
#include "countmap/key_loader.hpp"

[[noreturn]] static void Usage() {
  std::string program_desc =
      "countmap-util: tool for counting whitespace-separated keys in files";

  std::vector<std::string> usage_examples = {
      {"countmap-util [-i,--input FILE]... [-s,--subtract FILE]... [options]"}};

  std::vector<std::pair<std::string, std::string>> flag_desc_pairs = {
      {"-i,--input FILE",
       "Path to plain or gzipped key file, may be repeated \n"
       "(default: keys read from stdin)"},
      {"-s,--subtract FILE", "Path to file of keys to subtract, may be repeated"},
      {"-o,--output FILE", "Path to output file (default: written to stdout)"},
      {"--hash ENUM",
       "Key identity (default: exact) \n"
       "[exact, fold]"},
      {"--allow-negative", "Allow counts to drop below zero"},
      {"--view ENUM",
       "Output view (default: entries) \n"
       "[entries, keys, array, total]"},
      {"--min-count INT", "Only print entries with at least this count"},
      {"--verbose", "Print progress to stderr"},
      {"--version", "Print build version"},
      {"-h,--help", "Print this help"}};

  std::cout << FormatUsage(program_desc, usage_examples, flag_desc_pairs);

  std::exit(EXIT_SUCCESS);
}

enum class View { Entries, Keys, Array, Total };

struct Options {
  std::vector<std::string> input_paths;
  std::vector<std::string> subtract_paths;
  std::string output_path;
  HashKind hash_kind = HashKind::ToString;
  NegativeCounts negative_counts = NegativeCounts::Clamp;
  View view = View::Entries;
  std::optional<int> min_count;
  bool verbose = false;
};

static View ParseView(std::string_view name) {
  if (name == "entries") {
    return View::Entries;
  } else if (name == "keys") {
    return View::Keys;
  } else if (name == "array") {
    return View::Array;
  } else if (name == "total") {
    return View::Total;
  }
  std::cerr << "ERROR: Unknown view '" << name << "'.\n";
  Fail();
}

static std::vector<std::string> LoadAll(const std::vector<std::string>& paths,
                                        bool verbose) {
  std::vector<std::string> result;
  for (const auto& path : paths) {
    auto keys = LoadKeys(path);
    if (verbose) {
      std::cerr << "Loaded " << keys.size() << " keys from '" << path << "'\n";
    }
    result.insert(result.end(), std::make_move_iterator(keys.begin()),
                  std::make_move_iterator(keys.end()));
  }
  return result;
}

template <typename Map>
static void WriteView(const Map& map, const Options& options, std::ostream& out) {
  using Entry = std::pair<std::string, int64_t>;
  switch (options.view) {
    case View::Entries: {
      auto entries = map.Entries() | ranges::views::transform([](auto entry) {
                       return Entry{entry.first, entry.second};
                     }) |
                     ranges::to_vector;
      if (options.min_count.has_value()) {
        entries |= ranges::actions::remove_if([&options](const Entry& entry) {
          return entry.second < options.min_count.value();
        });
      }
      ranges::sort(entries, [](const Entry& lhs, const Entry& rhs) {
        return lhs.second != rhs.second ? lhs.second > rhs.second
                                        : lhs.first < rhs.first;
      });
      for (const auto& [key, count] : entries) {
        out << key << "\t" << count << "\n";
      }
      break;
    }
    case View::Keys: {
      auto keys = ranges::to_vector(map.Keys());
      keys |= ranges::actions::sort;
      for (const auto& key : keys) {
        out << key << "\n";
      }
      break;
    }
    case View::Array: {
      auto keys = map.ToVector();
      keys |= ranges::actions::sort;
      for (const auto& key : keys) {
        out << key << "\n";
      }
      break;
    }
    case View::Total:
      out << map.TotalCount() << "\n";
      break;
  }
}

template <typename HashOps>
static void Run(const Options& options, HashOps hash_ops) {
  CountMap<std::string, HashOps> map{std::move(hash_ops), options.negative_counts};

  if (options.input_paths.empty()) {
    map.ConcatInPlace(ReadKeys(std::cin));
    if (options.verbose) {
      std::cerr << "Loaded " << map.TotalCount() << " keys from stdin\n";
    }
  } else {
    map.ConcatInPlace(LoadAll(options.input_paths, options.verbose));
  }

  for (const auto& key : LoadAll(options.subtract_paths, options.verbose)) {
    map.Subtract(key);
  }

  if (options.verbose) {
    std::cerr << "Counted " << map.Size() << " distinct keys using '"
              << map.GetHashOps().Name() << "'\n";
  }

  if (options.output_path.empty()) {
    WriteView(map, options, std::cout);
  } else {
    std::ofstream outfile{options.output_path};
    if (not outfile) {
      std::cerr << "ERROR: Failed to open output file '" << options.output_path
                << "'.\n";
      Fail();
    }
    WriteView(map, options, outfile);
  }
}

int main(int argc, char** argv) try {
  Arguments args = GetArguments(argc, argv);

  Options options;

  for (auto [name, params] : args) {
    if (name == "-h" or name == "--help") {
      Usage();
    } else if (name == "--version") {
      Version("countmap-util");
    } else if (name == "-i" or name == "--input") {
      ParseOption(name, params, options.input_paths);
    } else if (name == "-s" or name == "--subtract") {
      ParseOption(name, params, options.subtract_paths);
    } else if (name == "-o" or name == "--output") {
      ParseOption(name, params, options.output_path);
    } else if (name == "--hash") {
      std::string temp;
      ParseOption(name, params, temp);
      try {
        options.hash_kind = ParseHashKind(temp);
      } catch (const InvalidArgument& e) {
        std::cerr << "ERROR: " << e.what() << ".\n";
        Fail();
      }
    } else if (name == "--allow-negative") {
      CheckParamCount(name, params, 0);
      options.negative_counts = NegativeCounts::Allow;
    } else if (name == "--view") {
      std::string temp;
      ParseOption(name, params, temp);
      options.view = ParseView(temp);
    } else if (name == "--min-count") {
      int temp = 0;
      ParseOption(name, params, temp);
      options.min_count = temp;
    } else if (name == "--verbose") {
      ParseOption(name, params, options.verbose);
    } else {
      std::cerr << "Unknown argument '" << name << "'.\n";
      Fail();
    }
  }

  if (options.min_count.has_value() and options.view != View::Entries) {
    std::cerr << "ERROR: --min-count only applies to --view entries.\n";
    Fail();
  }

  switch (options.hash_kind) {
    case HashKind::ToString:
      Run(options, ToStringHash<std::string>{});
      break;
    case HashKind::CaseFold:
      Run(options, CaseFoldHash{});
      break;
  }

  return EXIT_SUCCESS;
} catch (std::exception& e) {
  std::cerr << "Uncaught exception: " << e.what() << std::endl;
  std::terminate();
} catch (...) {
  std::abort();
}
