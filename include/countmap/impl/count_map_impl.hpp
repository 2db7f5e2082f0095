#include <algorithm>

template <typename Key, typename HashOps, typename Count>
CountMap<Key, HashOps, Count>::CountMap(HashOps hash_ops, NegativeCounts negative_counts)
    : hash_ops_{std::move(hash_ops)}, negative_counts_{negative_counts} {}

template <typename Key, typename HashOps, typename Count>
CountMap<Key, HashOps, Count>::CountMap(std::initializer_list<Key> keys,
                                        HashOps hash_ops,
                                        NegativeCounts negative_counts)
    : CountMap{std::move(hash_ops), negative_counts} {
  ConcatInPlace(keys);
}

template <typename Key, typename HashOps, typename Count>
template <typename Range, typename>
CountMap<Key, HashOps, Count>::CountMap(Range&& keys, HashOps hash_ops,
                                        NegativeCounts negative_counts)
    : CountMap{std::move(hash_ops), negative_counts} {
  ConcatInPlace(std::forward<Range>(keys));
}

template <typename Key, typename HashOps, typename Count>
Count CountMap<Key, HashOps, Count>::Add(const Key& key, const Count& amount) {
  COUNTMAP_DEBUG_USE;
  if (amount < 0) {
    FailInvalidArgument("Amount should be positive. Try using Subtract.");
  }
  Token token = hash_ops_.Hash(key);
  auto it = records_.find(token);
  if (it == records_.end()) {
    return Emplace(std::move(token), key, amount).count;
  }
  Count& count = it->second.count;
  if constexpr (std::numeric_limits<Count>::is_bounded) {
    if (count > std::numeric_limits<Count>::max() - amount) {
      FailInvalidArgument("Amount would overflow the stored count.");
    }
  }
  count += amount;
  return count;
}

template <typename Key, typename HashOps, typename Count>
Count CountMap<Key, HashOps, Count>::Subtract(const Key& key, const Count& amount) {
  COUNTMAP_DEBUG_USE;
  if (amount < 0) {
    FailInvalidArgument("Amount to subtract by should be positive.");
  }
  auto it = records_.find(hash_ops_.Hash(key));
  if (it == records_.end()) {
    return Count{0};
  }
  Count& count = it->second.count;
  if (negative_counts_ == NegativeCounts::Clamp) {
    count = count < amount ? Count{0} : Count{count - amount};
    return count;
  }
  if constexpr (std::numeric_limits<Count>::is_bounded) {
    if (count < std::numeric_limits<Count>::min() + amount) {
      FailInvalidArgument("Amount would underflow the stored count.");
    }
  }
  count -= amount;
  return count;
}

template <typename Key, typename HashOps, typename Count>
Count CountMap<Key, HashOps, Count>::Set(const Key& key, const Count& amount) {
  COUNTMAP_DEBUG_USE;
  if (negative_counts_ == NegativeCounts::Clamp and amount < 0) {
    FailInvalidArgument("Negative counts disabled. Amount should be positive.");
  }
  Token token = hash_ops_.Hash(key);
  auto it = records_.find(token);
  if (it == records_.end()) {
    return Emplace(std::move(token), key, amount).count;
  }
  it->second.count = amount;
  return it->second.count;
}

template <typename Key, typename HashOps, typename Count>
template <typename Range>
CountMap<Key, HashOps, Count>& CountMap<Key, HashOps, Count>::ConcatInPlace(
    Range&& keys) {
  for (auto&& key : keys) {
    Add(key);
  }
  return *this;
}

template <typename Key, typename HashOps, typename Count>
template <typename Range>
CountMap<Key, HashOps, Count> CountMap<Key, HashOps, Count>::Concat(
    Range&& keys) const {
  CountMap result = Clone();
  result.ConcatInPlace(std::forward<Range>(keys));
  return result;
}

template <typename Key, typename HashOps, typename Count>
bool CountMap<Key, HashOps, Count>::Delete(const Key& key) {
  COUNTMAP_DEBUG_USE;
  return records_.erase(hash_ops_.Hash(key)) > 0;
}

template <typename Key, typename HashOps, typename Count>
Count CountMap<Key, HashOps, Count>::Get(const Key& key) const {
  COUNTMAP_DEBUG_USE;
  auto it = records_.find(hash_ops_.Hash(key));
  if (it == records_.end()) {
    return Count{0};
  }
  return it->second.count;
}

template <typename Key, typename HashOps, typename Count>
bool CountMap<Key, HashOps, Count>::Has(const Key& key) const {
  COUNTMAP_DEBUG_USE;
  return records_.find(hash_ops_.Hash(key)) != records_.end();
}

// Records are copied together with their creation order, so a later Rehash of the
// clone keeps the same representatives as a Rehash of the original.
template <typename Key, typename HashOps, typename Count>
CountMap<Key, HashOps, Count> CountMap<Key, HashOps, Count>::Clone() const {
  COUNTMAP_DEBUG_USE;
  return CountMap{*this};
}

template <typename Key, typename HashOps, typename Count>
CountMap<Key, HashOps, Count>& CountMap<Key, HashOps, Count>::Rehash() {
  COUNTMAP_DEBUG_USE;
  std::vector<const Record*> replay;
  replay.reserve(records_.size());
  for (const auto& [token, record] : records_) {
    std::ignore = token;
    replay.push_back(&record);
  }
  ranges::sort(replay, std::less<>{},
               [](const Record* record) { return record->order; });

  // Built aside and swapped in, so a throwing Hash leaves the map untouched.
  std::unordered_map<Token, Record> rebuilt;
  for (const Record* record : replay) {
    Token token = hash_ops_.Hash(record->key);
    auto it = rebuilt.find(token);
    if (it == rebuilt.end()) {
      Record copy = *record;
      copy.hash = token;
      rebuilt.emplace(std::move(token), std::move(copy));
    } else {
      Count& count = it->second.count;
      if constexpr (std::numeric_limits<Count>::is_bounded) {
        if ((record->count > 0 and
             count > std::numeric_limits<Count>::max() - record->count) or
            (record->count < 0 and
             count < std::numeric_limits<Count>::min() - record->count)) {
          Fail("Merged counts would overflow during Rehash.");
        }
      }
      count += record->count;
    }
  }
  records_.swap(rebuilt);
  return *this;
}

template <typename Key, typename HashOps, typename Count>
auto CountMap<Key, HashOps, Count>::Keys() const {
  COUNTMAP_DEBUG_USE;
  return records_ | ranges::views::values |
         ranges::views::transform([](const Record& record) -> const Key& {
           return record.key;
         });
}

template <typename Key, typename HashOps, typename Count>
auto CountMap<Key, HashOps, Count>::Entries() const {
  COUNTMAP_DEBUG_USE;
  return records_ | ranges::views::values |
         ranges::views::transform([](const Record& record) {
           return std::pair<const Key&, const Count&>{record.key, record.count};
         });
}

template <typename Key, typename HashOps, typename Count>
std::vector<Key> CountMap<Key, HashOps, Count>::ToVector() const {
  COUNTMAP_DEBUG_USE;
  std::vector<Key> result;
  for (const auto& [key, count] : Entries()) {
    for (Count i = 0; i < count; ++i) {
      result.push_back(key);
    }
  }
  return result;
}

template <typename Key, typename HashOps, typename Count>
bool CountMap<Key, HashOps, Count>::Equals(const CountMap& other) const {
  COUNTMAP_DEBUG_USE;
  if (hash_ops_.Name() != other.hash_ops_.Name() or
      negative_counts_ != other.negative_counts_) {
    return false;
  }
  auto same_count = [this, &other](const Key& key) {
    return Get(key) == other.Get(key);
  };
  return ranges::all_of(other.Keys(), same_count) and
         ranges::all_of(Keys(), same_count);
}

template <typename Key, typename HashOps, typename Count>
size_t CountMap<Key, HashOps, Count>::Size() const {
  COUNTMAP_DEBUG_USE;
  return records_.size();
}

template <typename Key, typename HashOps, typename Count>
bool CountMap<Key, HashOps, Count>::Empty() const {
  COUNTMAP_DEBUG_USE;
  return records_.empty();
}

template <typename Key, typename HashOps, typename Count>
Count CountMap<Key, HashOps, Count>::TotalCount() const {
  COUNTMAP_DEBUG_USE;
  Count result = 0;
  for (const auto& [key, count] : Entries()) {
    std::ignore = key;
    if (count > 0) {
      result += count;
    }
  }
  return result;
}

template <typename Key, typename HashOps, typename Count>
void CountMap<Key, HashOps, Count>::Clear() {
  COUNTMAP_DEBUG_USE;
  records_.clear();
}

template <typename Key, typename HashOps, typename Count>
const HashOps& CountMap<Key, HashOps, Count>::GetHashOps() const {
  return hash_ops_;
}

template <typename Key, typename HashOps, typename Count>
HashOps& CountMap<Key, HashOps, Count>::GetHashOps() {
  return hash_ops_;
}

template <typename Key, typename HashOps, typename Count>
void CountMap<Key, HashOps, Count>::SetHashOps(HashOps hash_ops) {
  hash_ops_ = std::move(hash_ops);
}

template <typename Key, typename HashOps, typename Count>
NegativeCounts CountMap<Key, HashOps, Count>::GetNegativeCounts() const {
  return negative_counts_;
}

template <typename Key, typename HashOps, typename Count>
void CountMap<Key, HashOps, Count>::SetNegativeCounts(NegativeCounts negative_counts) {
  negative_counts_ = negative_counts;
}

template <typename Key, typename HashOps, typename Count>
typename CountMap<Key, HashOps, Count>::Record& CountMap<Key, HashOps, Count>::Emplace(
    Token token, const Key& key, const Count& count) {
  auto [it, inserted] =
      records_.emplace(token, Record{token, key, count, next_order_++});
  Assert(inserted);
  return it->second;
}

template <typename Key, typename HashOps, typename Count>
std::ostream& operator<<(std::ostream& os, const CountMap<Key, HashOps, Count>& map) {
  if (map.Empty()) {
    os << "{}";
    return os;
  }
  bool first = true;
  os << "{";
  for (const auto& [key, count] : map.Entries()) {
    if (not first) {
      os << ", ";
    }
    os << key << ": " << count;
    first = false;
  }
  os << "}";
  return os;
}
