/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_TIMER_H_
#define HASHTAB_TIMER_H_

#include <chrono>
#include <vector>

#include "hashtab/macros.hpp"

namespace hashtab {

// A steady-clock stopwatch which remembers the duration of every interval
// between a 'Start' and a 'Stop'.
class Timer {
 public:
  Timer() HASHTAB_NOEXCEPT;

  // (Re)starts the timer.
  void Start() HASHTAB_NOEXCEPT;

  // Stops the timer, records the interval as a lap, and returns its length
  // in seconds.
  double Stop();

  // Returns true if the timer is between a 'Start' and a 'Stop'.
  bool Running() const HASHTAB_NOEXCEPT;

  // Returns the time in seconds since the last start.
  double SecondsSinceLastStart() const HASHTAB_NOEXCEPT;

  // Returns the lengths, in seconds, of all completed intervals since the
  // last 'Reset'.
  const std::vector<double>& Laps() const HASHTAB_NOEXCEPT;

  // Returns the total time that the timer has run since the last 'Reset',
  // including the current interval if the timer is running.
  double TotalSeconds() const HASHTAB_NOEXCEPT;

  // Stops the timer and forgets all laps.
  void Reset() HASHTAB_NOEXCEPT;

 private:
  // True if the timer is currently running.
  bool running_;

  // The time the timer was last started.
  std::chrono::steady_clock::time_point last_time_;

  // The completed intervals.
  std::vector<double> laps_;

  // The sum of 'laps_'.
  double total_seconds_;
};

}  // namespace hashtab

#include "hashtab/timer-impl.hpp"

#endif  // ifndef HASHTAB_TIMER_H_
