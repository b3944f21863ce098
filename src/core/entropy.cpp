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
 * @file entropy.cpp
 * @brief `std::random_device` implementation of the entropy collaborator.
 */

#include "fastuuid/core/entropy.hpp"

#include "fastuuid/core/errors.hpp"

#include <exception>
#include <random>
#include <string>

namespace fastuuid::core {

/**
 * @brief Draws 32-bit words from a freshly opened `std::random_device`.
 *
 * The device is opened per call (once per generator). Each word is split
 * low byte first.
 */
void RandomDeviceSource::fill(std::uint8_t* out, std::size_t length)
{
    try {
        std::random_device rd;

        std::size_t i = 0;
        while (i < length) {
            auto word = static_cast<std::uint32_t>(rd());
            for (int b = 0; b < 4 && i < length; ++b, ++i) {
                out[i] = static_cast<std::uint8_t>(word >> (8 * b));
            }
        }
    } catch (const std::exception& e) {
        throw RngError(std::string("random_device unavailable: ") + e.what());
    }
}

} // namespace fastuuid::core
