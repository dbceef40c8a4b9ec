//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "parade/detail/add_message_types.hpp"

#include "parade/chunk.hpp"
#include "parade/error.hpp"
#include "parade/event.hpp"
#include "parade/label_set.hpp"
#include "parade/metric.hpp"
#include "parade/metric_key.hpp"
#include "parade/procession.hpp"

#include <caf/init_global_meta_objects.hpp>
#include <caf/inspector_access.hpp>

namespace parade::detail {

void add_message_types() {
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::parade_types>();
}

} // namespace parade::detail
