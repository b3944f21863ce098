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
 * @file harness.hpp
 * @brief Micro-benchmark suite for the generator operations.
 */

#pragma once

#include "fastuuid/core/generator.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fastuuid::bench {

/// @brief Parameters of one suite run.
struct Config {
    std::uint64_t iterations = 1000000; ///< Calls per case (per worker for concurrent cases).
    std::size_t threads = 1;            ///< Workers for `concurrent_next`; 1 disables it.
};

/// @brief Timing of one benchmark case.
struct Result {
    std::string name;
    std::uint64_t ops = 0;  ///< Total calls performed across all workers.
    double ns_per_op = 0.0; ///< Wall-clock nanoseconds divided by `ops`.
};

/**
 * @brief Times every generator operation against `generator`.
 *
 * Cases, in order: `next`, `hex128_as_str`, `hex128_as_str_unchecked`,
 * `hex128_as_string`, `hex128_as_string_unchecked`, and, when
 * `config.threads > 1`, `concurrent_next` (every worker performs
 * `config.iterations` calls on the shared generator).
 *
 * Each case advances the generator's counter by `ops`.
 *
 * @throws std::invalid_argument If `config.iterations` is zero.
 */
std::vector<Result> run_suite(const core::Generator& generator, const Config& config);

} // namespace fastuuid::bench
