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
 * @file types.hpp
 * @brief Value types and layout constants shared by the generator and formatter.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace fastuuid::core {

inline constexpr std::size_t kSeedLength = 16;    ///< Secret, per-generator prefix.
inline constexpr std::size_t kCounterLength = 8;  ///< Big-endian counter suffix.
inline constexpr std::size_t kId192Length = kSeedLength + kCounterLength;
inline constexpr std::size_t kId128Length = 16;
inline constexpr std::size_t kHex128Length = 36; ///< `8-4-4-4-12` plus four hyphens.

/// @brief Raw output of `Generator::next()`: `seed ++ be64(counter)`.
using Id192 = std::array<std::uint8_t, kId192Length>;

/// @brief RFC-4122 version 4 shaped identifier derived from an `Id192`.
using Id128 = std::array<std::uint8_t, kId128Length>;

/// @brief Caller-owned scratch buffer that always fits one rendered identifier.
using Hex128Buffer = std::array<char, kHex128Length>;

} // namespace fastuuid::core
