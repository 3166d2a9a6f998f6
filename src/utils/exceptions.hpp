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

/// @file
/// Exception types shared by every graphbin module.
#pragma once

#include <exception>
#include <string>
#include <utility>

#include <fmt/core.h>  // https://github.com/fmtlib/fmt/issues/2419
#include <fmt/format.h>

namespace graphbin::utils {

/// Overrides `name()` with the exception's class name. Every concrete
/// exception type has to use it, so logs can tell failures apart.
#define SPECIALIZE_GET_EXCEPTION_NAME(exep) \
  std::string name() const override { return #exep; }

/**
 * Root of the graphbin exception hierarchy.
 *
 * Holds the message the exception was created with. Messages are usually
 * built with fmt:
 *
 * @code
 * throw BasicException("Expected {} bytes, got {}", expected, actual);
 * @endcode
 */
class BasicException : public std::exception {
 public:
  explicit BasicException(std::string message) noexcept : msg_(std::move(message)) {}

  template <class... Args>
  explicit BasicException(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : msg_(fmt::format(fmt, std::forward<Args>(args)...)) {}

  ~BasicException() override = default;

  const char *what() const noexcept override { return msg_.c_str(); }

  virtual std::string name() const { return "BasicException"; }

 protected:
  std::string msg_;
};

/// Textual input (a UUID, a hex dump) couldn't be parsed.
class ParseException final : public BasicException {
 public:
  explicit ParseException(const std::string &what) noexcept : BasicException("Parsing failed: " + what) {}

  template <class... Args>
  explicit ParseException(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : ParseException(fmt::format(fmt, std::forward<Args>(args)...)) {}

  SPECIALIZE_GET_EXCEPTION_NAME(ParseException)
};

}  // namespace graphbin::utils
