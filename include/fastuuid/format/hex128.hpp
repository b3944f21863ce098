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
 * @file hex128.hpp
 * @brief Derivation and canonical text rendering of 128-bit identifiers.
 *
 * @details
 * A 128-bit identifier is the last 16 bytes of a 192-bit generator value
 * (low half of the seed followed by the big-endian counter), with the
 * RFC 4122 version and variant bits forced:
 *
 * - byte 6: high nibble set to `0100` (Version 4).
 * - byte 8: top two bits set to `10` (Variant 1).
 *
 * The canonical text is `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` in lower-case
 * hex, where `y` is one of `{8, 9, a, b}`.
 */

#pragma once

#include "fastuuid/core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace fastuuid::format {

/**
 * @brief Slices the 128-bit identifier out of a 192-bit value and applies the
 * RFC 4122 version/variant fix-up.
 *
 * @param id A value returned by `Generator::next()`.
 * @return core::Id128 The fixed-up 16 bytes.
 */
core::Id128 derive_hex128(const core::Id192& id) noexcept;

/**
 * @brief Writes the 36-byte canonical rendering of `derive_hex128(id)`.
 *
 * This is the only routine that produces identifier text. Every byte it
 * writes is drawn from `0123456789abcdef-`; the unchecked render paths rely
 * on that.
 *
 * @param id The 192-bit source value.
 * @param out Destination, at least `kHex128Length` bytes. No terminator is written.
 */
void write_hex128(const core::Id192& id, char* out) noexcept;

/**
 * @brief Text-validity check performed by the checked render paths.
 *
 * @param text The rendered bytes.
 * @param length Number of bytes at `text`.
 * @param bad_offset Receives the index of the first invalid byte, or
 * `length` when the failure is a wrong length.
 * @return true If `text` is exactly 36 bytes, has hyphens at 8/13/18/23 and
 * lower-case hex everywhere else.
 */
bool is_hex128_text(const char* text, std::size_t length, std::size_t& bad_offset) noexcept;

/**
 * @brief Checks the canonical `8-4-4-4-12` shape.
 *
 * Upper-case digits are rejected. The version and variant nibbles are not
 * inspected; use `is_rfc4122_v4` for that.
 *
 * @code
 * fastuuid::format::is_valid_hex128("11febf98-c108-4383-bb1e-739ffcd44341"); // true
 * fastuuid::format::is_valid_hex128("11febf98c1-08-4383-bb1e-739ffcd44341"); // false
 * @endcode
 *
 * @param text Candidate identifier text.
 * @return true If `text` is 36 bytes of lower-case hex with hyphens at 8/13/18/23.
 */
bool is_valid_hex128(std::string_view text) noexcept;

/**
 * @brief `is_valid_hex128` plus the `4` version marker at index 14 and a
 * variant marker in `{8, 9, a, b}` at index 19.
 *
 * @param text Candidate identifier text.
 * @return true If `text` is a canonical RFC 4122 version 4 identifier.
 */
bool is_rfc4122_v4(std::string_view text) noexcept;

/**
 * @brief Plain lower-case hex of a full 192-bit value, used by `--format raw192`.
 *
 * @param id The 192-bit value.
 * @return std::string 48 hex digits, no hyphens.
 * @throws std::bad_alloc If the string cannot be allocated.
 */
std::string to_hex(const core::Id192& id);

} // namespace fastuuid::format
