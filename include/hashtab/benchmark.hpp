/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_BENCHMARK_H_
#define HASHTAB_BENCHMARK_H_

#include <cstddef>
#include <iostream>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace hashtab {

// The alphabet whose permutations form the benchmark keys. There are
// 10! = 3,628,800 distinct keys available.
static constexpr char kBenchmarkAlphabet[] = "abcdefghij";

// A simple data structure for storing the median, mean, and standard deviation
// of a random variable.
struct SufficientStatistics {
  // The median of the set of samples.
  double median = -1;

  // The mean of the set of samples.
  double mean = -1;

  // The (population) standard deviation of the set of samples.
  double standard_deviation = -1;
};

// Returns the median of a given vector.
template <typename T>
double Median(const std::vector<T>& vec);

// Returns the mean of a given vector.
template <typename T>
double Mean(const std::vector<T>& vec);

// Returns the population standard deviation of a given vector with a given
// mean.
template <typename T>
double StandardDeviation(const std::vector<T>& vec, double mean);

// Returns the SufficientStatistics properties for a given vector.
template <typename T>
SufficientStatistics GetSufficientStatistics(const std::vector<T>& vec);

// Pretty prints the SufficientStatistics structure.
void PrintSufficientStatistics(const SufficientStatistics& stats,
                               const std::string& label, std::ostream& os);

// Parses a comma-separated list of floating-point values, e.g., "0.6,0.75".
// Throws std::invalid_argument on a malformed or empty entry.
std::vector<double> ParseDoubleList(const std::string& list);

// The inputs of a single benchmark run.
struct BenchmarkData {
  // The keys to insert, in insertion order. May contain duplicates.
  std::vector<std::string> keys;

  // The values to insert, parallel to 'keys'.
  std::vector<double> values;

  // Each distinct member of 'keys' exactly once, in deletion order.
  std::vector<std::string> delete_keys;
};

// Returns the first 'num_keys' lexicographic permutations of
// 'kBenchmarkAlphabet' in a shuffled order, paired with uniform values from
// [0, 1). If 'duplicate_keys' is true, the key list is resampled with
// replacement, which leaves roughly 1 - 1/e (about 63%) of the keys distinct.
// Throws std::invalid_argument if more keys are requested than exist.
BenchmarkData GenerateBenchmarkData(
    std::size_t num_keys, bool duplicate_keys, std::mt19937* generator);

// The measurements of a single benchmark run.
struct BenchmarkResult {
  double insertion_seconds = 0;
  double lookup_seconds = 0;
  double memory_megabytes = 0;
  double deletion_seconds = 0;
};

// Uniform access to the hashtab maps and to std::unordered_map.
template <class Map, typename KeyType, typename ValueType>
void BenchmarkInsert(Map* map, const KeyType& key, const ValueType& value);
template <typename KeyType, typename ValueType, class Hash, class KeyEqual,
          class Allocator>
void BenchmarkInsert(
    std::unordered_map<KeyType, ValueType, Hash, KeyEqual, Allocator>* map,
    const KeyType& key, const ValueType& value);

template <class Map, typename KeyType>
const auto& BenchmarkLookup(const Map& map, const KeyType& key);
template <typename KeyType, typename ValueType, class Hash, class KeyEqual,
          class Allocator>
const ValueType& BenchmarkLookup(
    const std::unordered_map<KeyType, ValueType, Hash, KeyEqual, Allocator>&
        map,
    const KeyType& key);

template <class Map, typename KeyType>
void BenchmarkErase(Map* map, const KeyType& key);
template <typename KeyType, typename ValueType, class Hash, class KeyEqual,
          class Allocator>
void BenchmarkErase(
    std::unordered_map<KeyType, ValueType, Hash, KeyEqual, Allocator>* map,
    const KeyType& key);

// Times the insertion of every (key, value) pair of 'data' into the empty
// 'map', then the lookup of every inserted pair, measures the deep memory
// footprint of the filled map, and finally times the erasure of every key.
//
// The lookups of the last value inserted for each key are checked, and a
// mismatch throws std::logic_error. Lookups of the superseded duplicate pairs
// are still performed, so that runs with duplicates do the same amount of
// work, but not checked.
//
// With a 'verbosity' above two, each phase is reported on std::cout.
template <class Map>
BenchmarkResult RunBenchmark(Map* map, const std::string& description,
                             const BenchmarkData& data, int verbosity);

}  // namespace hashtab

#include "hashtab/benchmark-impl.hpp"

#endif  // ifndef HASHTAB_BENCHMARK_H_
