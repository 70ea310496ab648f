/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_BENCHMARK_IMPL_H_
#define HASHTAB_BENCHMARK_IMPL_H_

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "hashtab/benchmark.hpp"
#include "hashtab/errors.hpp"
#include "hashtab/memory_usage.hpp"
#include "hashtab/timer.hpp"

namespace hashtab {

template <typename T>
double Median(const std::vector<T>& vec) {
  const std::size_t num_entries = vec.size();
  if (num_entries == 0) {
    std::cerr << "Invalid median request of empty list." << std::endl;
    return 0.;
  }

  std::vector<T> vec_copy(vec);
  std::sort(vec_copy.begin(), vec_copy.end());
  if (num_entries % 2 == 0) {
    return (vec_copy[(num_entries / 2) - 1] + vec_copy[num_entries / 2]) / 2.;
  } else {
    return vec_copy[num_entries / 2];
  }
}

template <typename T>
double Mean(const std::vector<T>& vec) {
  const std::size_t num_entries = vec.size();
  if (num_entries == 0) {
    std::cerr << "Invalid mean request of empty list." << std::endl;
    return 0.;
  }

  double mean = 0.;
  for (std::size_t index = 0; index < num_entries; ++index) {
    mean += vec[index] / static_cast<double>(num_entries);
  }

  return mean;
}

template <typename T>
double StandardDeviation(const std::vector<T>& vec, double mean) {
  const std::size_t num_entries = vec.size();
  if (num_entries == 0) {
    std::cerr << "Invalid standard dev. request of empty list." << std::endl;
    return 0.;
  }

  double variance = 0.;
  for (std::size_t index = 0; index < num_entries; ++index) {
    const double difference_from_mean = static_cast<double>(vec[index]) - mean;
    variance += difference_from_mean * difference_from_mean / num_entries;
  }

  return std::sqrt(variance);
}

template <typename T>
SufficientStatistics GetSufficientStatistics(const std::vector<T>& vec) {
  SufficientStatistics stats;
  stats.median = Median(vec);
  stats.mean = Mean(vec);
  stats.standard_deviation = StandardDeviation(vec, stats.mean);
  return stats;
}

inline void PrintSufficientStatistics(const SufficientStatistics& stats,
                                      const std::string& label,
                                      std::ostream& os) {
  os << label << ": median=" << stats.median << ", mean=" << stats.mean
     << ", stddev=" << stats.standard_deviation << std::endl;
}

inline std::vector<double> ParseDoubleList(const std::string& list) {
  std::vector<double> values;
  std::istringstream stream(list);
  std::string token;
  while (std::getline(stream, token, ',')) {
    std::size_t num_parsed = 0;
    double value = 0;
    try {
      value = std::stod(token, &num_parsed);
    } catch (const std::logic_error&) {
      throw std::invalid_argument("Could not parse '" + token +
                                  "' as a number.");
    }
    if (num_parsed != token.size()) {
      throw std::invalid_argument("Trailing characters in '" + token + "'.");
    }
    values.push_back(value);
  }
  if (values.empty()) {
    throw std::invalid_argument("Expected at least one number.");
  }
  return values;
}

inline BenchmarkData GenerateBenchmarkData(
    std::size_t num_keys, bool duplicate_keys, std::mt19937* generator) {
  std::string permutation(kBenchmarkAlphabet);
  std::size_t num_permutations = 1;
  for (std::size_t i = 2; i <= permutation.size(); ++i) {
    num_permutations *= i;
  }
  if (num_keys > num_permutations) {
    throw std::invalid_argument(
        "Requested " + std::to_string(num_keys) + " keys but only " +
        std::to_string(num_permutations) + " are available.");
  }

  BenchmarkData data;
  data.keys.reserve(num_keys);
  for (std::size_t i = 0; i < num_keys; ++i) {
    data.keys.push_back(permutation);
    std::next_permutation(permutation.begin(), permutation.end());
  }
  std::shuffle(data.keys.begin(), data.keys.end(), *generator);

  if (duplicate_keys && num_keys > 0) {
    std::uniform_int_distribution<std::size_t> index_dist(0, num_keys - 1);
    std::vector<std::string> resampled;
    resampled.reserve(num_keys);
    for (std::size_t i = 0; i < num_keys; ++i) {
      resampled.push_back(data.keys[index_dist(*generator)]);
    }
    data.keys = std::move(resampled);
  }

  data.delete_keys = data.keys;
  std::sort(data.delete_keys.begin(), data.delete_keys.end());
  data.delete_keys.erase(
      std::unique(data.delete_keys.begin(), data.delete_keys.end()),
      data.delete_keys.end());
  std::shuffle(data.delete_keys.begin(), data.delete_keys.end(), *generator);

  std::uniform_real_distribution<double> value_dist(0., 1.);
  data.values.reserve(num_keys);
  for (std::size_t i = 0; i < num_keys; ++i) {
    data.values.push_back(value_dist(*generator));
  }

  return data;
}

template <class Map, typename KeyType, typename ValueType>
void BenchmarkInsert(Map* map, const KeyType& key, const ValueType& value) {
  map->Insert(key, value);
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual,
          class Allocator>
void BenchmarkInsert(
    std::unordered_map<KeyType, ValueType, Hash, KeyEqual, Allocator>* map,
    const KeyType& key, const ValueType& value) {
  (*map)[key] = value;
}

template <class Map, typename KeyType>
const auto& BenchmarkLookup(const Map& map, const KeyType& key) {
  return map.Get(key);
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual,
          class Allocator>
const ValueType& BenchmarkLookup(
    const std::unordered_map<KeyType, ValueType, Hash, KeyEqual, Allocator>&
        map,
    const KeyType& key) {
  auto iter = map.find(key);
  if (iter == map.end()) {
    throw KeyNotFoundError("The requested key is not in the map.");
  }
  return iter->second;
}

template <class Map, typename KeyType>
void BenchmarkErase(Map* map, const KeyType& key) {
  map->Erase(key);
}

template <typename KeyType, typename ValueType, class Hash, class KeyEqual,
          class Allocator>
void BenchmarkErase(
    std::unordered_map<KeyType, ValueType, Hash, KeyEqual, Allocator>* map,
    const KeyType& key) {
  if (map->erase(key) == 0) {
    throw KeyNotFoundError("The key to be erased is not in the map.");
  }
}

template <class Map>
BenchmarkResult RunBenchmark(Map* map, const std::string& description,
                             const BenchmarkData& data, int verbosity) {
  const std::size_t num_pairs = data.keys.size();
  if (data.values.size() != num_pairs) {
    throw std::invalid_argument("The keys and values differ in length.");
  }

  BenchmarkResult result;
  Timer timer;

  timer.Start();
  for (std::size_t i = 0; i < num_pairs; ++i) {
    BenchmarkInsert(map, data.keys[i], data.values[i]);
  }
  result.insertion_seconds = timer.Stop();
  if (verbosity > 2) {
    std::cout << description << " completed insertion benchmark in "
              << result.insertion_seconds << " s" << std::endl;
  }

  // Walk the pairs backwards: the first occurrence of a key is the value
  // that must be stored, later ones were overwritten.
  std::vector<std::size_t> answer_indices;
  std::vector<std::size_t> extra_indices;
  {
    std::unordered_set<std::string> seen_keys;
    for (std::size_t i = num_pairs; i-- > 0;) {
      if (seen_keys.insert(data.keys[i]).second) {
        answer_indices.push_back(i);
      } else {
        extra_indices.push_back(i);
      }
    }
  }

  timer.Start();
  for (const std::size_t index : answer_indices) {
    const double value = BenchmarkLookup(*map, data.keys[index]);
    if (value != data.values[index]) {
      timer.Stop();
      std::ostringstream os;
      os << "Value " << value << " for key " << data.keys[index]
         << " did not match expected value " << data.values[index];
      throw std::logic_error(os.str());
    }
  }
  double checksum = 0;
  for (const std::size_t index : extra_indices) {
    checksum += BenchmarkLookup(*map, data.keys[index]);
  }
  result.lookup_seconds = timer.Stop();
  if (verbosity > 2) {
    std::cout << description << " completed lookup benchmark in "
              << result.lookup_seconds << " s (checksum " << checksum << ")"
              << std::endl;
  }

  result.memory_megabytes = DeepSizeOf(*map) / 1e6;
  if (verbosity > 2) {
    std::cout << description << " used " << result.memory_megabytes << " MB"
              << std::endl;
  }

  timer.Start();
  for (const std::string& key : data.delete_keys) {
    BenchmarkErase(map, key);
  }
  result.deletion_seconds = timer.Stop();
  if (verbosity > 2) {
    std::cout << description << " completed deletion benchmark in "
              << result.deletion_seconds << " s" << std::endl;
  }

  return result;
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_BENCHMARK_IMPL_H_
