//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace parade::detail {

/// Registers the CAF meta objects for all types that parade announces. Must
/// run once before errors carrying `parade::ec` get rendered by CAF.
void add_message_types();

} // namespace parade::detail
