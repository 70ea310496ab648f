/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_TIMER_IMPL_H_
#define HASHTAB_TIMER_IMPL_H_

#include "hashtab/timer.hpp"

namespace hashtab {

inline Timer::Timer() HASHTAB_NOEXCEPT
: running_(false), total_seconds_(0) { }

inline void Timer::Start() HASHTAB_NOEXCEPT {
  last_time_ = std::chrono::steady_clock::now();
  running_ = true;
}

inline double Timer::Stop() {
  HASHTAB_ASSERT(running_, "The Timer was stopped when it was not running.");
  if (!running_) {
    return 0;
  }
  const double lap = SecondsSinceLastStart();
  running_ = false;
  laps_.push_back(lap);
  total_seconds_ += lap;
  return lap;
}

inline bool Timer::Running() const HASHTAB_NOEXCEPT { return running_; }

inline double Timer::SecondsSinceLastStart() const HASHTAB_NOEXCEPT {
  if (running_) {
    const std::chrono::duration<double> duration =
        std::chrono::steady_clock::now() - last_time_;
    return duration.count();
  }
  return laps_.empty() ? 0. : laps_.back();
}

inline const std::vector<double>& Timer::Laps() const HASHTAB_NOEXCEPT {
  return laps_;
}

inline double Timer::TotalSeconds() const HASHTAB_NOEXCEPT {
  if (running_) {
    return total_seconds_ + SecondsSinceLastStart();
  }
  return total_seconds_;
}

inline void Timer::Reset() HASHTAB_NOEXCEPT {
  running_ = false;
  laps_.clear();
  total_seconds_ = 0;
}

}  // namespace hashtab

#endif  // ifndef HASHTAB_TIMER_IMPL_H_
