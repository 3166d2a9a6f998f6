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

#include <gflags/gflags.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "codec/buffer.hpp"
#include "codec/dump.hpp"
#include "codec/reader.hpp"
#include "codec/registry.hpp"
#include "flags/log_level.hpp"
#include "utils/exceptions.hpp"
#include "utils/flag_validation.hpp"
#include "utils/hex.hpp"
#include "utils/logging.hpp"

DEFINE_string(input, "", "Path to a file holding a sequence of encoded values.");
DEFINE_string(hex, "", "Encoded values given as hex digits, e.g. \"07 00 00 00 07 E7 03 0F\".");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_int32(max_depth, 0, "Maximum nesting depth of a decoded value, 0 for unlimited.",
                       FLAG_IN_RANGE(0, std::numeric_limits<int32_t>::max()));
DEFINE_bool(skip_unknown_custom_types, false,
            "Set to true to decode values of unregistered custom types as null instead of failing.");

namespace {

std::optional<std::vector<uint8_t>> LoadInput() {
  if (!FLAGS_hex.empty()) {
    try {
      return graphbin::utils::ParseHex(FLAGS_hex);
    } catch (const graphbin::utils::ParseException &e) {
      spdlog::critical("Invalid --hex value: {}", e.what());
      return std::nullopt;
    }
  }

  std::ifstream file(FLAGS_input, std::ios::binary);
  if (!file) {
    spdlog::critical("Couldn't open {}", FLAGS_input);
    return std::nullopt;
  }
  std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
  if (file.bad()) {
    spdlog::critical("Failed to read {}", FLAGS_input);
    return std::nullopt;
  }
  return bytes;
}

}  // namespace

int main(int argc, char *argv[]) {
  gflags::SetUsageMessage("Print the values stored in a graphbin encoded byte sequence.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  graphbin::flags::InitializeLogger();

  if (FLAGS_input.empty() == FLAGS_hex.empty()) {
    spdlog::critical("Exactly one of --input and --hex has to be given");
    return 1;
  }

  auto bytes = LoadInput();
  if (!bytes) return 1;

  graphbin::codec::Buffer buffer(std::move(*bytes));
  graphbin::codec::ReaderConfig config{
      .max_depth = static_cast<uint32_t>(FLAGS_max_depth),
      .unknown_custom_types = FLAGS_skip_unknown_custom_types ? graphbin::codec::UnknownCustomTypePolicy::kSkip
                                                              : graphbin::codec::UnknownCustomTypePolicy::kFail};
  graphbin::codec::Reader reader(graphbin::codec::TypeRegistry::Builtins(), config);

  const auto result = graphbin::codec::DumpValues(&buffer, &reader, std::cout);
  std::cout.flush();
  if (!result.complete) return 1;
  spdlog::info("Decoded {} values", result.values);
  return 0;
}
