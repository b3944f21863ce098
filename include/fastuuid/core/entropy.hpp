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
 * @file entropy.hpp
 * @brief Source of secure random bytes consumed once per generator.
 *
 * @details
 * The generator never reads entropy on the hot path. It asks an
 * `EntropySource` for 24 bytes exactly once, at construction. The abstraction
 * exists so that the operating-system source can be replaced by a
 * deterministic one in tests.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace fastuuid::core {

/**
 * @class EntropySource
 * @brief Capability to fill a byte range with secure random data.
 */
class EntropySource {
  public:
    virtual ~EntropySource() = default;

    /**
     * @brief Fills `length` bytes starting at `out`.
     *
     * @param out Destination buffer, at least `length` bytes long.
     * @param length Number of bytes to produce.
     *
     * @throws RngError If the underlying source cannot deliver the bytes.
     */
    virtual void fill(std::uint8_t* out, std::size_t length) = 0;
};

/**
 * @class RandomDeviceSource
 * @brief `EntropySource` backed by `std::random_device`.
 *
 * On Linux toolchains `std::random_device` reads the kernel CSPRNG. Any
 * exception the device raises (for example when no entropy device is
 * available) is reported as `RngError`.
 */
class RandomDeviceSource : public EntropySource {
  public:
    void fill(std::uint8_t* out, std::size_t length) override;
};

} // namespace fastuuid::core
