#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling by callers.
 * - Human-readable message and originating component for diagnostics.
 * - Build-time codes abort compilation; query-time codes are recoverable.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace verdict::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  resource_exhausted = 5001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,               /**< rule identity beyond bitset capacity */
  invalid_operator_for_type = 10001, /**< range operator on a discrete attribute */
  type_mismatch = 10002,             /**< literal or value kind does not fit the attribute */
  missing_attribute = 10003,         /**< required attribute absent from a record */
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "classifier.classify" */
};

/** \brief Stable name of an error code, e.g. "missing_attribute". */
auto to_string(error_code code) noexcept -> std::string_view;

} // namespace verdict::core
