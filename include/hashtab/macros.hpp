/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_MACROS_H_
#define HASHTAB_MACROS_H_

#include <iostream>

// An attribute for routines which are known to not throw exceptions in
// release mode.
#ifdef HASHTAB_DEBUG
#define HASHTAB_NOEXCEPT
#else
#define HASHTAB_NOEXCEPT noexcept
#endif

#ifdef HASHTAB_DEBUG
#define HASHTAB_ASSERT(assertion, message) \
  {                                        \
    if (!(assertion)) {                    \
      std::cerr << (message) << std::endl; \
    }                                      \
  }
#else
#define HASHTAB_ASSERT(condition, message)
#endif

#endif  // ifndef HASHTAB_MACROS_H_
