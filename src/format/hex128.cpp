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
 * @file hex128.cpp
 * @brief Implementation of the 128-bit derivation, writer and validators.
 *
 * @details
 * The writer is table driven: one lookup per nibble and a hyphen emitted in
 * front of bytes 4, 6, 8 and 10.
 */

#include "fastuuid/format/hex128.hpp"

namespace fastuuid::format {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

/// Offset of the 128-bit identifier within the 192-bit value.
constexpr std::size_t kSliceOffset = core::kId192Length - core::kId128Length;

constexpr bool is_hyphen_position(std::size_t i) noexcept
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

constexpr bool is_lower_hex(char c) noexcept
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

core::Id128 derive_hex128(const core::Id192& id) noexcept
{
    core::Id128 out{};
    for (std::size_t i = 0; i < core::kId128Length; ++i) {
        out[i] = id[kSliceOffset + i];
    }

    // Version 4 (random).
    out[6] = static_cast<std::uint8_t>((out[6] & 0x0F) | 0x40);
    // Variant 1 (RFC 4122).
    out[8] = static_cast<std::uint8_t>((out[8] & 0x3F) | 0x80);

    return out;
}

void write_hex128(const core::Id192& id, char* out) noexcept
{
    const core::Id128 bytes = derive_hex128(id);

    char* p = out;
    for (std::size_t i = 0; i < core::kId128Length; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            *p++ = '-';
        }
        *p++ = kHexDigits[bytes[i] >> 4];
        *p++ = kHexDigits[bytes[i] & 0x0F];
    }
}

bool is_hex128_text(const char* text, std::size_t length, std::size_t& bad_offset) noexcept
{
    if (length != core::kHex128Length) {
        bad_offset = length;
        return false;
    }

    for (std::size_t i = 0; i < length; ++i) {
        const bool ok = is_hyphen_position(i) ? text[i] == '-' : is_lower_hex(text[i]);
        if (!ok) {
            bad_offset = i;
            return false;
        }
    }
    return true;
}

bool is_valid_hex128(std::string_view text) noexcept
{
    std::size_t ignored = 0;
    return is_hex128_text(text.data(), text.size(), ignored);
}

bool is_rfc4122_v4(std::string_view text) noexcept
{
    if (!is_valid_hex128(text)) {
        return false;
    }

    const char variant = text[19];
    return text[14] == '4' &&
           (variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
}

std::string to_hex(const core::Id192& id)
{
    std::string out(core::kId192Length * 2, '0');
    for (std::size_t i = 0; i < core::kId192Length; ++i) {
        out[2 * i] = kHexDigits[id[i] >> 4];
        out[2 * i + 1] = kHexDigits[id[i] & 0x0F];
    }
    return out;
}

} // namespace fastuuid::format
