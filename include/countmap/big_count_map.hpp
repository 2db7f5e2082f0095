#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include "countmap/count_map.hpp"

using BigCount = boost::multiprecision::cpp_int;

/* CountMap whose counts never overflow, for tallies that outgrow int64_t. */
template <typename Key, typename HashOps = ToStringHash<Key>>
using BigCountMap = CountMap<Key, HashOps, BigCount>;
