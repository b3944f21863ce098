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
 * @file generator.cpp
 * @brief Implementation of the identifier generator.
 *
 * @details
 * Implementation Strategy:
 * 1. **Seeding**: one 24-byte draw from the entropy source at construction.
 * 2. **Counter**: a relaxed `fetch_add`. Only the uniqueness of each returned
 *    value matters; no other memory is published through the counter.
 * 3. **Rendering**: all text paths funnel into `format::write_hex128`. The
 *    checked paths verify its output, the unchecked paths trust it.
 */

#include "fastuuid/core/generator.hpp"

#include "fastuuid/format/hex128.hpp"
#include "fastuuid/infra/logger.hpp"

#include <cassert>

namespace fastuuid::core {

namespace {

Id192 draw_state(EntropySource& source)
{
    Id192 state{};
    try {
        source.fill(state.data(), state.size());
    } catch (const RngError& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Generator: Entropy source failed: " + std::string(e.what()));
        throw GeneratorInitError(e.what());
    }
    return state;
}

Id192 draw_default_state()
{
    RandomDeviceSource source;
    return draw_state(source);
}

std::uint64_t load_be64(const std::uint8_t* p) noexcept
{
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < kCounterLength; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

void store_be64(std::uint64_t v, std::uint8_t* p) noexcept
{
    for (std::size_t i = kCounterLength; i > 0; --i) {
        p[i - 1] = static_cast<std::uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

} // namespace

Generator::Generator() : Generator(draw_default_state()) {}

Generator::Generator(EntropySource& source) : Generator(draw_state(source)) {}

Generator::Generator(const Id192& state)
    : seed_{}, counter_(load_be64(state.data() + kSeedLength))
{
    for (std::size_t i = 0; i < kSeedLength; ++i) {
        seed_[i] = state[i];
    }

    infra::Logger::log(infra::LogLevel::DEBUG, "Generator: Seeded from entropy source.");
}

Id192 Generator::next() const noexcept
{
    // fetch_add returns the previous value; the identifier carries its successor.
    const std::uint64_t value = counter_.fetch_add(1, std::memory_order_relaxed) + 1;

    Id192 id;
    for (std::size_t i = 0; i < kSeedLength; ++i) {
        id[i] = seed_[i];
    }
    store_be64(value, id.data() + kSeedLength);
    return id;
}

std::string Generator::hex128_as_string() const
{
    std::string out(kHex128Length, '\0');
    render_checked(&out[0]);
    return out;
}

std::string Generator::hex128_as_string_unchecked() const
{
    std::string out(kHex128Length, '\0');
    render_unchecked(&out[0]);
    return out;
}

std::string_view Generator::hex128_as_str(char* buffer, std::size_t length) const
{
    if (buffer == nullptr) {
        throw BufferSizeError(kHex128Length, 0);
    }
    if (length != kHex128Length) {
        throw BufferSizeError(kHex128Length, length);
    }
    return render_checked(buffer);
}

std::string_view Generator::hex128_as_str(Hex128Buffer& buffer) const
{
    return render_checked(buffer.data());
}

std::string_view Generator::hex128_as_str_unchecked(char* buffer, std::size_t length) const
{
    if (buffer == nullptr) {
        throw BufferSizeError(kHex128Length, 0);
    }
    if (length != kHex128Length) {
        throw BufferSizeError(kHex128Length, length);
    }
    return render_unchecked(buffer);
}

std::string_view Generator::hex128_as_str_unchecked(Hex128Buffer& buffer) const noexcept
{
    return render_unchecked(buffer.data());
}

bool Generator::is_valid_hex128(std::string_view text) noexcept
{
    return format::is_valid_hex128(text);
}

std::string_view Generator::render_checked(char* out) const
{
    format::write_hex128(next(), out);

    std::size_t bad_offset = 0;
    if (!format::is_hex128_text(out, kHex128Length, bad_offset)) {
        throw EncodingError(bad_offset);
    }
    return std::string_view(out, kHex128Length);
}

std::string_view Generator::render_unchecked(char* out) const noexcept
{
    format::write_hex128(next(), out);

#ifndef NDEBUG
    std::size_t bad_offset = 0;
    assert(format::is_hex128_text(out, kHex128Length, bad_offset) &&
           "write_hex128 emitted a byte outside 0-9a-f-");
#endif

    return std::string_view(out, kHex128Length);
}

} // namespace fastuuid::core
