/*
 * Copyright (c) 2018 Jack Poulson <jack@hodgestar.com>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#ifndef HASHTAB_H_
#define HASHTAB_H_

#include "hashtab/benchmark.hpp"
#include "hashtab/chaining_hash_map.hpp"
#include "hashtab/errors.hpp"
#include "hashtab/hash_map_control.hpp"
#include "hashtab/io_utils.hpp"
#include "hashtab/macros.hpp"
#include "hashtab/memory_usage.hpp"
#include "hashtab/open_addressing_hash_map.hpp"
#include "hashtab/probe_sequence.hpp"
#include "hashtab/slot.hpp"
#include "hashtab/timer.hpp"

#endif // ifndef HASHTAB_H_
