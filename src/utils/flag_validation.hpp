// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

/// @file
///
/// Macros that define a gflags command line flag together with its validator.
///
/// @code
/// DEFINE_VALIDATED_int32(max_depth, 0, "Nesting limit, 0 for none", FLAG_IN_RANGE(0, 1024));
///
/// DEFINE_VALIDATED_string(input, "", "File to read", {
///   if (!value.empty()) return true;
///   std::cout << "--" << flagname << " can't be empty" << std::endl;
///   return false;
/// });
/// @endcode
///
/// Inside the validation body the new flag value is bound to `value` and the
/// flag name to `flagname`.

#include <cstdint>
#include <iostream>
#include <string>

#include "gflags/gflags.h"

#define DEFINE_VALIDATED_FLAG(flag_type, flag_name, default_value, description, cpp_type, validation_body) \
  DEFINE_##flag_type(flag_name, default_value, description);                                               \
  namespace {                                                                                              \
  bool validate_##flag_name(const char *flagname, cpp_type value) validation_body                          \
  }                                                                                                        \
  DEFINE_validator(flag_name, &validate_##flag_name)

#define DEFINE_VALIDATED_bool(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(bool, flag_name, default_value, description, bool, validation_body)

#define DEFINE_VALIDATED_int32(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(int32, flag_name, default_value, description, std::int32_t, validation_body)

#define DEFINE_VALIDATED_string(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(string, flag_name, default_value, description, const std::string &, validation_body)

/// Validator body accepting numeric values in [lower_bound, upper_bound].
#define FLAG_IN_RANGE(lower_bound, upper_bound)                                                                \
  {                                                                                                            \
    if (value >= lower_bound && value <= upper_bound) return true;                                             \
    std::cout << "Expected --" << flagname << " to be in range [" << lower_bound << ", " << upper_bound << "]" \
              << std::endl;                                                                                    \
    return false;                                                                                              \
  }
