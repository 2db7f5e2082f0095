#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <sys/wait.h>

#include "test_common.hpp"

namespace {

const std::string output_path = "countmap_util_test_output.txt";

// Runs countmap-util with the given arguments and returns its exit code.
int run_countmap_util(const std::string& args) {
  std::string command = std::string{"'"} + COUNTMAP_UTIL_PATH + "' " + args;
  std::cout << "Running: " << command << std::endl;
  int status = std::system(command.c_str());
  if (status == -1 or not WIFEXITED(status)) {
    return -1;
  }
  return WEXITSTATUS(status);
}

std::string run_to_string(const std::string& args) {
  std::remove(output_path.c_str());
  int result = run_countmap_util(args + " -o " + output_path);
  TestAssert(result == 0);
  std::ifstream in{output_path};
  TestAssert(in.good());
  std::stringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

std::string input(const std::string& name) {
  return "-i '" + test_data_path(name) + "'";
}

}  // namespace

static void test_util_entries() {
  TestAssert(run_to_string(input("words.txt")) ==
             "apple\t3\ncherry\t2\nAPPLE\t1\nBanana\t1\nbanana\t1\ndate\t1\n");
  TestAssert(run_to_string(input("words.txt.gz") + " --view entries") ==
             run_to_string(input("words.txt")));
  TestAssert(run_to_string(input("words.txt") + " --hash fold") ==
             "apple\t4\nBanana\t2\ncherry\t2\ndate\t1\n");
  TestAssert(run_to_string(input("words.txt") + " " + input("words.txt") +
                           " --min-count 4") == "apple\t6\ncherry\t4\n");
  TestAssert(run_to_string(input("words.txt") + " --min-count 2") ==
             "apple\t3\ncherry\t2\n");
}

static void test_util_subtract() {
  const std::string subtract = " -s '" + test_data_path("subtract.txt") + "'";
  TestAssert(run_to_string(input("words.txt") + subtract) ==
             "apple\t2\nAPPLE\t1\nBanana\t1\nbanana\t1\ncherry\t0\ndate\t0\n");
  TestAssert(run_to_string(input("words.txt") + subtract + " --allow-negative") ==
             "apple\t2\nAPPLE\t1\nBanana\t1\nbanana\t1\ndate\t0\ncherry\t-1\n");
  TestAssert(run_to_string(input("words.txt") + subtract + " --view total") == "5\n");
}

static void test_util_views() {
  TestAssert(run_to_string(input("words.txt") + " --view total") == "9\n");
  TestAssert(run_to_string(input("words.txt") + " --hash fold --view keys") ==
             "Banana\napple\ncherry\ndate\n");
  TestAssert(run_to_string(input("words.txt") + " --hash fold --view array") ==
             "Banana\nBanana\napple\napple\napple\napple\ncherry\ncherry\ndate\n");
  TestAssert(run_to_string("--view total < '" + test_data_path("words.txt") + "'") ==
             "9\n");
}

static void test_util_usage_errors() {
  TestAssert(run_countmap_util(input("words.txt") + " --hash bogus") == 1);
  TestAssert(run_countmap_util(input("words.txt") + " --view bogus") == 1);
  TestAssert(run_countmap_util(input("words.txt") + " --min-count 2 --view keys") == 1);
  TestAssert(run_countmap_util(input("words.txt") + " --min-count two") == 1);
  TestAssert(run_countmap_util("--unknown") == 1);
  TestAssert(run_countmap_util(input("no_such_file.txt")) != 0);
  TestAssert(run_countmap_util("--help > /dev/null") == 0);
}

[[maybe_unused]] static const auto test_added0 =
    add_test({test_util_entries, "countmap-util: entries", {"cli"}});
[[maybe_unused]] static const auto test_added1 =
    add_test({test_util_subtract, "countmap-util: subtract", {"cli"}});
[[maybe_unused]] static const auto test_added2 =
    add_test({test_util_views, "countmap-util: views", {"cli"}});
[[maybe_unused]] static const auto test_added3 =
    add_test({test_util_usage_errors, "countmap-util: usage errors", {"cli"}});
