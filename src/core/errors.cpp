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
 * @file errors.cpp
 * @brief Message construction for the generator exception hierarchy.
 */

#include "fastuuid/core/errors.hpp"

namespace fastuuid::core {

GeneratorInitError::GeneratorInitError(const std::string& cause)
    : Error("Generator initialization failed: " + cause)
{
}

BufferSizeError::BufferSizeError(std::size_t expected, std::size_t actual)
    : Error("Invalid buffer size: expected " + std::to_string(expected) + " bytes, got " +
            std::to_string(actual)),
      expected_(expected), actual_(actual)
{
}

EncodingError::EncodingError(std::size_t offset)
    : Error("Rendered identifier contains a non-hex byte at offset " + std::to_string(offset)),
      offset_(offset)
{
}

} // namespace fastuuid::core
