/**
  A multiset that counts keys under a caller-defined notion of identity.

  Every key passes through a HashOps strategy (see hash_ops.hpp). Keys producing the
  same token share one record, which keeps the first key seen as its representative
  together with an integer count. A record lives until it is deleted, so a count can
  sit at zero (or, when negative counts are allowed, below zero) while Has() still
  reports the key.

  Keys(), Entries() and ToVector() are unordered. The views returned by Keys() and
  Entries() refer to the map's table and are invalidated by any mutation.

  Not thread-safe; concurrent use needs an external lock around the whole map.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>
#include <initializer_list>
#include <unordered_map>
#include <utility>
#include <vector>
#include <ostream>

#include "countmap/common.hpp"
#include "countmap/hash_ops.hpp"

enum class NegativeCounts { Clamp, Allow };

template <typename Key, typename HashOps = ToStringHash<Key>, typename Count = int64_t>
class CountMap {
  static_assert(std::numeric_limits<Count>::is_integer and
                    std::numeric_limits<Count>::is_signed,
                "CountMap counts must be a signed integer type");

 public:
  using key_type = Key;
  using count_type = Count;
  using hash_ops_type = HashOps;
  using Token = typename HashOps::Token;

  struct Record {
    Token hash;
    Key key;
    Count count;
    // Creation sequence number, used to pick the surviving representative when
    // Rehash merges records.
    size_t order;
  };

  CountMap(HashOps hash_ops = HashOps{},
           NegativeCounts negative_counts = NegativeCounts::Clamp);

  CountMap(std::initializer_list<Key> keys, HashOps hash_ops = HashOps{},
           NegativeCounts negative_counts = NegativeCounts::Clamp);

  template <typename Range,
            typename = std::enable_if_t<
                ranges::input_range<Range> and
                std::is_convertible_v<ranges::range_reference_t<Range>, const Key&>>>
  CountMap(Range&& keys, HashOps hash_ops = HashOps{},
           NegativeCounts negative_counts = NegativeCounts::Clamp);

  CountMap(const CountMap&) = default;
  CountMap(CountMap&&) = default;
  CountMap& operator=(const CountMap&) = default;
  CountMap& operator=(CountMap&&) = default;
  ~CountMap() = default;

  /* Adds `amount` occurrences of key and returns the resulting count. Throws
   * InvalidArgument on a negative amount, or when a bounded Count would overflow. */
  Count Add(const Key& key, const Count& amount = 1);

  /* Removes `amount` occurrences of key and returns the resulting count. An absent
   * key is left absent and 0 is returned. Throws InvalidArgument on a negative
   * amount, or when a negative count would fall below the range of Count. */
  Count Subtract(const Key& key, const Count& amount = 1);

  /* Overwrites the count of key, creating the record if needed. Throws
   * InvalidArgument on a negative amount unless negative counts are allowed. */
  Count Set(const Key& key, const Count& amount);

  template <typename Range>
  CountMap& ConcatInPlace(Range&& keys);

  template <typename Range>
  CountMap Concat(Range&& keys) const;

  bool Delete(const Key& key);

  Count Get(const Key& key) const;

  bool Has(const Key& key) const;

  CountMap Clone() const;

  // Rebuilds the table with the current hash strategy. Records whose representatives
  // now share a token are merged: counts are summed and the earliest created
  // representative is kept.
  CountMap& Rehash();

  auto Keys() const;

  auto Entries() const;

  std::vector<Key> ToVector() const;

  bool Equals(const CountMap& other) const;

  bool operator==(const CountMap& other) const { return Equals(other); }
  bool operator!=(const CountMap& other) const { return not Equals(other); }

  size_t Size() const;
  bool Empty() const;
  Count TotalCount() const;
  void Clear();

  const HashOps& GetHashOps() const;
  HashOps& GetHashOps();
  void SetHashOps(HashOps hash_ops);

  NegativeCounts GetNegativeCounts() const;
  void SetNegativeCounts(NegativeCounts negative_counts);

 private:
  Record& Emplace(Token token, const Key& key, const Count& count);

  std::unordered_map<Token, Record> records_;
  HashOps hash_ops_;
  NegativeCounts negative_counts_;
  size_t next_order_ = 0;
  COUNTMAP_DEBUG_THIS;
};

template <typename Key, typename HashOps, typename Count>
std::ostream& operator<<(std::ostream& os, const CountMap<Key, HashOps, Count>& map);

#include "countmap/impl/count_map_impl.hpp"
