/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file errors.hpp
 * @brief Exception hierarchy reported by the identifier generation core.
 *
 * @details
 * Every failure the core can raise derives from `fastuuid::core::Error`, so a
 * caller that does not care about the category can catch a single type.
 * Allocation failure is deliberately absent: it surfaces as `std::bad_alloc`.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fastuuid::core {

/**
 * @class Error
 * @brief Common base for all generator failures.
 */
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class RngError
 * @brief Raised by an `EntropySource` that could not deliver the requested bytes.
 */
class RngError : public Error {
  public:
    using Error::Error;
};

/**
 * @class GeneratorInitError
 * @brief Raised by the `Generator` constructor when the entropy source fails.
 *
 * Construction is all-or-nothing: when this is thrown no generator exists.
 */
class GeneratorInitError : public Error {
  public:
    explicit GeneratorInitError(const std::string& cause);
};

/**
 * @class BufferSizeError
 * @brief Raised when a caller-supplied render buffer is not exactly 36 bytes.
 *
 * Recoverable: nothing has been written and no counter value was consumed, so
 * the caller may retry with a correctly sized buffer.
 */
class BufferSizeError : public Error {
  public:
    BufferSizeError(std::size_t expected, std::size_t actual);

    /// @brief Required buffer length (always 36).
    std::size_t expected() const noexcept { return expected_; }

    /// @brief Length the caller actually supplied.
    std::size_t actual() const noexcept { return actual_; }

  private:
    std::size_t expected_;
    std::size_t actual_;
};

/**
 * @class EncodingError
 * @brief Raised by the checked render paths when the written text contains a
 * byte outside `0-9a-f-`.
 *
 * The core writer cannot produce such a byte, so this signals a broken
 * internal invariant rather than caller misuse.
 */
class EncodingError : public Error {
  public:
    explicit EncodingError(std::size_t offset);

    /// @brief Index of the first offending byte.
    std::size_t offset() const noexcept { return offset_; }

  private:
    std::size_t offset_;
};

} // namespace fastuuid::core
