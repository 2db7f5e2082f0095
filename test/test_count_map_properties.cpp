#include "countmap/count_map.hpp"

#include <limits>
#include <map>
#include <random>
#include <vector>

#include "test_common.hpp"

static void test_accumulation(NegativeCounts negative_counts) {
  std::mt19937 generator{42};
  std::uniform_int_distribution<int> key_dist{-20, 20};
  std::uniform_int_distribution<int> amount_dist{0, 9};

  CountMap<int> map{ToStringHash<int>{}, negative_counts};
  std::map<int, int64_t> expected;
  for (size_t i = 0; i < 2000; ++i) {
    int key = key_dist(generator);
    int amount = amount_dist(generator);
    expected[key] += amount;
    TestAssert(map.Add(key, amount) == expected[key]);
  }

  TestAssert(map.Size() == expected.size());
  int64_t total = 0;
  for (const auto& [key, count] : expected) {
    TestAssert(map.Get(key) == count);
    TestAssert(map.Has(key));
    total += count;
  }
  TestAssert(map.TotalCount() == total);
  TestAssert(static_cast<int64_t>(map.ToVector().size()) == total);
}

static void test_subtract_then_add() {
  CountMap<int> map{3, 3, 3, 3, 3};
  TestAssert(map.Subtract(3, 2) == 3);
  TestAssert(map.Add(3, 2) == 5);

  // Clamping loses the excess, so adding it back does not restore the count.
  TestAssert(map.Subtract(3, 8) == 0);
  TestAssert(map.Subtract(3, 8) == 0);
  TestAssert(map.Subtract(3) == 0);
  TestAssert(map.Add(3, 8) == 8);

  CountMap<int> negative{{3, 3, 3, 3, 3}, ToStringHash<int>{}, NegativeCounts::Allow};
  TestAssert(negative.Subtract(3, 8) == -3);
  TestAssert(negative.Add(3, 8) == 5);
}

static void test_has_lifecycle() {
  CountMap<std::string> map;
  TestAssert(not map.Has("k"));
  map.Add("k");
  TestAssert(map.Has("k"));
  map.Subtract("k");
  TestAssert(map.Get("k") == 0);
  TestAssert(map.Has("k"));
  map.Subtract("k", 5);
  TestAssert(map.Has("k"));
  TestAssert(map.Get("k") == 0);
  TestAssert(map.Delete("k"));
  TestAssert(not map.Has("k"));

  map.Set("s", 0);
  TestAssert(map.Has("s"));
  TestAssert(map.ToVector().empty());

  map.Subtract("absent", 3);
  TestAssert(not map.Has("absent"));
}

static void test_representative_is_first_key() {
  CountMap<std::string, CaseFoldHash> map;
  map.Add("Apple");
  map.Add("APPLE", 2);
  map.Set("apple", 10);
  TestAssert(map.Size() == 1);
  TestAssert((ranges::to_vector(map.Keys()) == std::vector<std::string>{"Apple"}));
  TestAssert(map.Get("aPPle") == 10);

  map.Delete("APPLE");
  map.Add("apple");
  TestAssert((ranges::to_vector(map.Keys()) == std::vector<std::string>{"apple"}));
}

static void test_to_vector_length() {
  CountMap<int> map{ToStringHash<int>{}, NegativeCounts::Allow};
  map.Set(1, 4);
  map.Set(2, 0);
  map.Set(3, -7);
  map.Set(4, 1);
  TestAssert(map.ToVector().size() == 5);
  TestAssert(map.TotalCount() == 5);
  TestAssert(map.Size() == 4);
}

static void test_clone_independence() {
  CountMap<std::string> original{"a", "b", "b", "c"};
  CountMap<std::string> clone = original.Clone();
  TestAssert(clone == original);
  TestAssert(original == clone);

  clone.Add("d");
  clone.Subtract("b");
  clone.Delete("a");
  TestAssert(original.Get("b") == 2);
  TestAssert(original.Has("a"));
  TestAssert(not original.Has("d"));

  original.Set("c", 9);
  TestAssert(clone.Get("c") == 1);

  original.Clear();
  TestAssert(original.Empty());
  TestAssert(clone.Size() == 3);
  TestAssert(original.GetHashOps().Name() == "to_string");
}

static void test_failed_mutation_leaves_map_unchanged() {
  CountMap<int> map{1, 2, 2};
  CountMap<int> before = map.Clone();
  TestThrowAs(map.Add(5, -1), InvalidArgument);
  TestThrowAs(map.Subtract(2, -1), InvalidArgument);
  TestThrowAs(map.Set(9, -1), InvalidArgument);
  TestAssert(map == before);
  TestAssert(not map.Has(5));
  TestAssert(not map.Has(9));
}

static void test_negative_mode_switch() {
  CountMap<int> map{1};
  map.SetNegativeCounts(NegativeCounts::Allow);
  TestAssert(map.Subtract(1, 3) == -2);
  map.SetNegativeCounts(NegativeCounts::Clamp);
  // Stored counts are left alone when the policy changes.
  TestAssert(map.Get(1) == -2);
  TestAssert(map.Subtract(1) == 0);
  TestThrowAs(map.Set(1, -1), InvalidArgument);
}

static void test_count_overflow() {
  constexpr int64_t max = std::numeric_limits<int64_t>::max();
  constexpr int64_t min = std::numeric_limits<int64_t>::min();

  CountMap<int> map;
  TestAssert(map.Add(1, max) == max);
  TestThrowAs(map.Add(1), InvalidArgument);
  TestAssert(map.Get(1) == max);
  TestAssert(map.Subtract(1, max) == 0);
  TestAssert(map.Subtract(1, max) == 0);

  CountMap<int> negative{ToStringHash<int>{}, NegativeCounts::Allow};
  negative.Set(2, min);
  TestThrowAs(negative.Subtract(2), InvalidArgument);
  TestAssert(negative.Get(2) == min);
  TestAssert(negative.Add(2, max) == -1);
  TestAssert(negative.Subtract(2, max) == min);

  // Clamping never reaches the bound.
  negative.SetNegativeCounts(NegativeCounts::Clamp);
  TestAssert(negative.Subtract(2, max) == 0);
}

[[maybe_unused]] static const auto test_added0 = add_test(
    {[] { test_accumulation(NegativeCounts::Clamp); }, "Properties: accumulation"});
[[maybe_unused]] static const auto test_added1 =
    add_test({[] { test_accumulation(NegativeCounts::Allow); },
              "Properties: accumulation (negative mode)"});
[[maybe_unused]] static const auto test_added2 =
    add_test({test_subtract_then_add, "Properties: subtract then add"});
[[maybe_unused]] static const auto test_added3 =
    add_test({test_has_lifecycle, "Properties: has lifecycle"});
[[maybe_unused]] static const auto test_added4 =
    add_test({test_representative_is_first_key, "Properties: representative key"});
[[maybe_unused]] static const auto test_added5 =
    add_test({test_to_vector_length, "Properties: to vector length"});
[[maybe_unused]] static const auto test_added6 =
    add_test({test_clone_independence, "Properties: clone independence"});
[[maybe_unused]] static const auto test_added7 = add_test(
    {test_failed_mutation_leaves_map_unchanged, "Properties: failed mutation"});
[[maybe_unused]] static const auto test_added8 =
    add_test({test_negative_mode_switch, "Properties: negative mode switch"});
[[maybe_unused]] static const auto test_added9 =
    add_test({test_count_overflow, "Properties: count overflow"});
