/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "hashtab.hpp"
#include "specify.hpp"

namespace {

// Keys are ten-character strings; values are doubles.
typedef hashtab::ChainingHashMap<std::string, double> ChainingMap;
typedef hashtab::LinearProbingHashMap<std::string, double> LinearMap;
typedef hashtab::QuadraticProbingHashMap<std::string, double> QuadraticMap;
typedef std::unordered_map<std::string, double> BaselineMap;

// The summarized measurements of one map configuration over all repetitions.
struct TrialSummary {
  // The name of the map type.
  std::string label;

  // The maximum load factor the map was configured with.
  double max_load_factor = 0;

  hashtab::SufficientStatistics insertion_seconds;
  hashtab::SufficientStatistics lookup_seconds;
  hashtab::SufficientStatistics memory_megabytes;
  hashtab::SufficientStatistics deletion_seconds;
};

// Returns the control of a benchmarked map with the default initial capacity.
hashtab::HashMapControl MakeControl(double max_load_factor,
                                    bool print_resizes) {
  hashtab::HashMapControl control = hashtab::MakeHashMapControl(
      hashtab::kDefaultInitialCapacity, max_load_factor);
  control.print_resizes = print_resizes;
  return control;
}

// Pretty prints the TrialSummary structure.
void PrintTrialSummary(const TrialSummary& summary) {
  std::cout << summary.label << "(max_load_factor=" << summary.max_load_factor
            << "):\n";
  hashtab::PrintSufficientStatistics(
      summary.insertion_seconds, "  insertion seconds", std::cout);
  hashtab::PrintSufficientStatistics(
      summary.lookup_seconds, "  lookup seconds", std::cout);
  hashtab::PrintSufficientStatistics(
      summary.memory_megabytes, "  memory MB", std::cout);
  hashtab::PrintSufficientStatistics(
      summary.deletion_seconds, "  deletion seconds", std::cout);
}

// Runs 'repetitions' benchmarks for each maximum load factor, building a
// fresh map with 'make_map(max_load_factor)' each time.
template <class MapFactory>
void RunTrials(const std::string& label,
               const std::vector<double>& max_load_factors,
               int repetitions,
               const hashtab::BenchmarkData& data,
               int verbosity,
               MapFactory make_map,
               std::vector<TrialSummary>* summaries) {
  if (verbosity == 1) {
    std::cout << "Running benchmarks for " << label << std::endl;
  }
  for (const double max_load_factor : max_load_factors) {
    std::ostringstream description;
    description << label << "(max_load_factor=" << max_load_factor << ")";
    if (verbosity > 1) {
      std::cout << "Running benchmarks for " << description.str()
                << std::endl;
    }

    std::vector<double> insertion_seconds;
    std::vector<double> lookup_seconds;
    std::vector<double> memory_megabytes;
    std::vector<double> deletion_seconds;
    for (int repetition = 0; repetition < repetitions; ++repetition) {
      auto map = make_map(max_load_factor);
      const hashtab::BenchmarkResult result =
          hashtab::RunBenchmark(&map, description.str(), data, verbosity);
      insertion_seconds.push_back(result.insertion_seconds);
      lookup_seconds.push_back(result.lookup_seconds);
      memory_megabytes.push_back(result.memory_megabytes);
      deletion_seconds.push_back(result.deletion_seconds);
    }

    TrialSummary summary;
    summary.label = label;
    summary.max_load_factor = max_load_factor;
    summary.insertion_seconds =
        hashtab::GetSufficientStatistics(insertion_seconds);
    summary.lookup_seconds = hashtab::GetSufficientStatistics(lookup_seconds);
    summary.memory_megabytes =
        hashtab::GetSufficientStatistics(memory_megabytes);
    summary.deletion_seconds =
        hashtab::GetSufficientStatistics(deletion_seconds);
    summaries->push_back(summary);
  }
}

// Writes one CSV row per (map, load factor, metric) so that each metric can
// be plotted against the maximum load factor.
bool WriteSummaries(const std::string& filename,
                    const std::vector<TrialSummary>& summaries,
                    bool error_bars) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    std::cerr << "Could not open " << filename << std::endl;
    return false;
  }

  file << "map,max_load_factor,metric,mean";
  if (error_bars) {
    file << ",stddev";
  }
  file << "\n";
  for (const TrialSummary& summary : summaries) {
    const std::pair<const char*, const hashtab::SufficientStatistics*>
        metrics[] = {
            {"insert", &summary.insertion_seconds},
            {"lookup", &summary.lookup_seconds},
            {"memory", &summary.memory_megabytes},
            {"delete", &summary.deletion_seconds},
        };
    for (const auto& metric : metrics) {
      file << summary.label << "," << summary.max_load_factor << ","
           << metric.first << "," << metric.second->mean;
      if (error_bars) {
        file << "," << metric.second->standard_deviation;
      }
      file << "\n";
    }
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  specify::ArgumentParser parser(argc, argv);
  const std::string name = parser.OptionalInput<std::string>(
      "name", "The name of the trial, used as the prefix of the output file.",
      "example");
  const int num_keys = parser.OptionalInput<int>(
      "num_keys",
      "The number of keys to benchmark with (at most 3628800).",
      1000000);
  const int repetitions = parser.OptionalInput<int>(
      "repetitions",
      "The number of times to repeat each experiment to lower the variance.",
      1);
  const std::string chaining_load_factors_string =
      parser.OptionalInput<std::string>(
          "chaining_load_factors",
          "Comma-separated maximum load factors of the chaining map "
          "(may exceed 1).",
          "0.6,0.7,0.8,0.9,1.0,1.1,1.2");
  const std::string linear_load_factors_string =
      parser.OptionalInput<std::string>(
          "linear_load_factors",
          "Comma-separated maximum load factors of the linear probing map "
          "(must be below 1).",
          "0.6,0.65,0.7,0.75,0.8,0.85");
  const std::string quadratic_load_factors_string =
      parser.OptionalInput<std::string>(
          "quadratic_load_factors",
          "Comma-separated maximum load factors of the quadratic probing map "
          "(must be below 1).",
          "0.6,0.65,0.7,0.75,0.8,0.85");
  const bool duplicates = parser.OptionalInput<bool>(
      "duplicates",
      "Resample the keys with replacement so that some are duplicated?",
      false);
  const bool error_bars = parser.OptionalInput<bool>(
      "error_bars",
      "Write the standard deviation of each measurement?",
      false);
  const int verbosity = parser.OptionalInput<int>(
      "verbosity",
      "The amount of progress information to print.\n"
      "0:none, 1:per map, 2:per load factor, 3:per phase",
      0);
  const bool print_resizes = parser.OptionalInput<bool>(
      "print_resizes", "Report every resize of the hashtab maps?", false);
  const int seed = parser.OptionalInput<int>(
      "seed", "The seed of the pseudo-random number generator.", 17);
  const std::string output_directory = parser.OptionalInput<std::string>(
      "output_directory", "The directory the results are written to.",
      "plots");
  if (!parser.OK()) {
    return 0;
  }
  if (num_keys < 0 || repetitions <= 0) {
    std::cerr << "'num_keys' must be non-negative and 'repetitions' must be "
                 "positive." << std::endl;
    parser.PrintReport();
    return 1;
  }

  std::vector<double> chaining_load_factors;
  std::vector<double> linear_load_factors;
  std::vector<double> quadratic_load_factors;
  try {
    chaining_load_factors =
        hashtab::ParseDoubleList(chaining_load_factors_string);
    linear_load_factors = hashtab::ParseDoubleList(linear_load_factors_string);
    quadratic_load_factors =
        hashtab::ParseDoubleList(quadratic_load_factors_string);
  } catch (const std::invalid_argument& error) {
    std::cerr << "Invalid load factor list: " << error.what() << std::endl;
    return 1;
  }
  std::sort(chaining_load_factors.begin(), chaining_load_factors.end());
  std::sort(linear_load_factors.begin(), linear_load_factors.end());
  std::sort(quadratic_load_factors.begin(), quadratic_load_factors.end());
  for (const double load_factor : linear_load_factors) {
    if (load_factor >= 1.) {
      std::cerr << "Warning: linear probing with a maximum load factor of "
                << load_factor << " may fill its table." << std::endl;
    }
  }
  for (const double load_factor : quadratic_load_factors) {
    if (load_factor >= 1.) {
      std::cerr << "Warning: quadratic probing with a maximum load factor of "
                << load_factor << " may fill its table." << std::endl;
    }
  }

  // The baseline runs once per distinct load factor of the other maps so that
  // it appears across the full horizontal range of each plot.
  std::set<double> all_load_factors(chaining_load_factors.begin(),
                                    chaining_load_factors.end());
  all_load_factors.insert(linear_load_factors.begin(),
                          linear_load_factors.end());
  all_load_factors.insert(quadratic_load_factors.begin(),
                          quadratic_load_factors.end());
  const std::vector<double> baseline_load_factors(all_load_factors.begin(),
                                                  all_load_factors.end());

  std::cout << "____Beginning trial \"" << name << "\"____" << std::endl;

  std::mt19937 generator(static_cast<std::uint32_t>(seed));
  hashtab::BenchmarkData data;
  try {
    data = hashtab::GenerateBenchmarkData(num_keys, duplicates, &generator);
  } catch (const std::invalid_argument& error) {
    std::cerr << error.what() << std::endl;
    return 1;
  }

  std::vector<TrialSummary> summaries;
  try {
    RunTrials(
        "ChainingHashMap", chaining_load_factors, repetitions, data,
        verbosity,
        [print_resizes](double max_load_factor) {
          return ChainingMap(MakeControl(max_load_factor, print_resizes));
        },
        &summaries);
    RunTrials(
        "LinearProbingHashMap", linear_load_factors, repetitions, data,
        verbosity,
        [print_resizes](double max_load_factor) {
          return LinearMap(MakeControl(max_load_factor, print_resizes));
        },
        &summaries);
    RunTrials(
        "QuadraticProbingHashMap", quadratic_load_factors, repetitions, data,
        verbosity,
        [print_resizes](double max_load_factor) {
          return QuadraticMap(MakeControl(max_load_factor, print_resizes));
        },
        &summaries);
    RunTrials(
        "std::unordered_map", baseline_load_factors, repetitions, data,
        verbosity,
        [](double /* max_load_factor */) { return BaselineMap(); },
        &summaries);
  } catch (const std::exception& error) {
    std::cerr << "Benchmark failed: " << error.what() << std::endl;
    return 1;
  }

  for (const TrialSummary& summary : summaries) {
    PrintTrialSummary(summary);
  }

  std::error_code error_code;
  std::filesystem::create_directories(output_directory, error_code);
  if (error_code) {
    std::cerr << "Could not create " << output_directory << ": "
              << error_code.message() << std::endl;
    return 1;
  }
  const std::string filename =
      output_directory + "/" + name + "_results.csv";
  if (!WriteSummaries(filename, summaries, error_bars)) {
    return 1;
  }
  std::cout << "Wrote " << filename << std::endl;

  return 0;
}
