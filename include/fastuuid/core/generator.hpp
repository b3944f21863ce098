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
 * @file generator.hpp
 * @brief Lock-free generator of adjacent 192-bit identifiers and their
 * RFC 4122 version 4 text form.
 *
 * @details
 * A `Generator` draws 24 random bytes once: 16 become a fixed seed and 8 the
 * starting value of an atomic counter. Every identifier afterwards costs one
 * `fetch_add` and no entropy reads. Consecutive identifiers differ only in the
 * counter suffix, so they are unique but guessable once any one of them leaks.
 *
 * @code
 * fastuuid::core::Generator generator;
 *
 * fastuuid::core::Id192 raw = generator.next();
 * std::string id = generator.hex128_as_string();
 *
 * fastuuid::core::Hex128Buffer scratch;
 * std::string_view view = generator.hex128_as_str(scratch);
 * @endcode
 */

#pragma once

#include "fastuuid/core/entropy.hpp"
#include "fastuuid/core/errors.hpp"
#include "fastuuid/core/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace fastuuid::core {

/**
 * @class Generator
 * @brief Thread-safe source of unique identifiers for one process.
 *
 * @details
 * **Concurrency Model:**
 * - The seed is immutable after construction and read without synchronization.
 * - The counter is the only shared mutable state and is touched exclusively
 *   through a single atomic `fetch_add`. Every method is non-blocking and may
 *   be called from any number of threads on the same instance.
 *
 * **Uniqueness:** counter suffixes returned by `next()` are pairwise distinct
 * until the counter wraps after 2^64 calls. The 128-bit form overwrites the
 * top two counter bits with the variant marker, so its window is 2^62 calls.
 * Wraparound is not reported.
 *
 * The generator is neither copyable nor movable: a copy would issue the same
 * values as its source.
 */
class Generator {
  public:
    /**
     * @brief Seeds a generator from `std::random_device`.
     *
     * @throws GeneratorInitError If the entropy source is unavailable.
     */
    Generator();

    /**
     * @brief Seeds a generator from a caller-provided entropy source.
     *
     * Exactly one `fill()` call of 24 bytes is made. The first 16 bytes become
     * the seed, the last 8 the initial counter value, read big-endian.
     *
     * @param source The entropy collaborator. Not retained after construction.
     * @throws GeneratorInitError If `source.fill()` throws `RngError`.
     */
    explicit Generator(EntropySource& source);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;
    Generator(Generator&&) = delete;
    Generator& operator=(Generator&&) = delete;

    /**
     * @brief Returns `seed ++ be64(counter + 1)` and advances the counter.
     *
     * Only the last 8 bytes differ from the previous call.
     */
    Id192 next() const noexcept;

    /**
     * @brief Renders the next 128-bit identifier into a newly allocated string.
     *
     * @return std::string A 36-character canonical identifier.
     * @throws std::bad_alloc If the string cannot be allocated.
     * @throws EncodingError If the rendered text fails verification.
     */
    std::string hex128_as_string() const;

    /**
     * @brief Same output as `hex128_as_string()` without the text verification.
     *
     * Relies on `format::write_hex128` emitting only `0-9a-f-`. Debug builds
     * assert that invariant; release builds trust it, and a violation is
     * undefined behaviour.
     *
     * @throws std::bad_alloc If the string cannot be allocated.
     */
    std::string hex128_as_string_unchecked() const;

    /**
     * @brief Renders the next 128-bit identifier into a caller buffer.
     *
     * The size check happens before anything else: on failure the buffer is
     * untouched and no counter value is consumed.
     *
     * @param buffer Destination. A null pointer is reported as a zero-length buffer.
     * @param length Size of `buffer`; must be exactly `kHex128Length`.
     * @return std::string_view A view of the 36 bytes written into `buffer`.
     *
     * @throws BufferSizeError If `length != 36`.
     * @throws EncodingError If the rendered text fails verification.
     */
    std::string_view hex128_as_str(char* buffer, std::size_t length) const;

    /// @brief Fixed-size overload; cannot raise `BufferSizeError`.
    std::string_view hex128_as_str(Hex128Buffer& buffer) const;

    /**
     * @brief `hex128_as_str` without the text verification.
     *
     * The buffer size is still checked. See `hex128_as_string_unchecked` for the
     * contract this variant relies on.
     *
     * @throws BufferSizeError If `length != 36`.
     */
    std::string_view hex128_as_str_unchecked(char* buffer, std::size_t length) const;

    /// @brief Fixed-size overload of the unchecked in-place render. Never throws.
    std::string_view hex128_as_str_unchecked(Hex128Buffer& buffer) const noexcept;

    /// @brief Returns true if `text` has the canonical `8-4-4-4-12` lower-case shape.
    static bool is_valid_hex128(std::string_view text) noexcept;

  private:
    explicit Generator(const Id192& state);

    std::string_view render_checked(char* out) const;
    std::string_view render_unchecked(char* out) const noexcept;

    /// @brief Immutable secret prefix of every identifier.
    std::array<std::uint8_t, kSeedLength> seed_;

    /// @brief Last value handed out; `next()` returns its successor.
    mutable std::atomic<std::uint64_t> counter_;
};

} // namespace fastuuid::core
