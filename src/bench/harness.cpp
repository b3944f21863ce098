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
 * @file harness.cpp
 * @brief Wall-clock timing of the generator operations.
 *
 * @details
 * Every case folds one byte of each result into a volatile sink so the
 * compiler cannot discard the calls being measured.
 */

#include "fastuuid/bench/harness.hpp"

#include "fastuuid/infra/logger.hpp"
#include "fastuuid/infra/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

namespace fastuuid::bench {

namespace {

using Clock = std::chrono::steady_clock;

volatile std::uint8_t g_sink = 0;

template <typename Fn> Result time_case(const char* name, std::uint64_t iterations, Fn&& fn)
{
    std::uint8_t acc = 0;

    const auto start = Clock::now();
    for (std::uint64_t i = 0; i < iterations; ++i) {
        acc ^= fn();
    }
    const auto elapsed = Clock::now() - start;

    g_sink = static_cast<std::uint8_t>(g_sink ^ acc);

    Result r;
    r.name = name;
    r.ops = iterations;
    r.ns_per_op =
        static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()) /
        static_cast<double>(iterations);

    infra::Logger::log(infra::LogLevel::DEBUG,
                       std::string("Bench: ") + name + " " + std::to_string(r.ns_per_op) +
                           " ns/op");
    return r;
}

Result time_concurrent_next(const core::Generator& generator, const Config& config)
{
    infra::WorkerPool pool(config.threads);
    std::atomic<std::uint8_t> acc{0};

    const auto start = Clock::now();
    for (std::size_t t = 0; t < config.threads; ++t) {
        pool.enqueue([&generator, &acc, &config] {
            std::uint8_t local = 0;
            for (std::uint64_t i = 0; i < config.iterations; ++i) {
                local ^= generator.next()[core::kId192Length - 1];
            }
            acc.fetch_xor(local);
        });
    }
    pool.wait_idle();
    const auto elapsed = Clock::now() - start;

    g_sink = static_cast<std::uint8_t>(g_sink ^ acc.load());

    Result r;
    r.name = "concurrent_next";
    r.ops = config.iterations * config.threads;
    r.ns_per_op =
        static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()) /
        static_cast<double>(r.ops);
    return r;
}

} // namespace

std::vector<Result> run_suite(const core::Generator& generator, const Config& config)
{
    if (config.iterations == 0) {
        throw std::invalid_argument("Benchmark iterations must be greater than zero");
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Bench: Running " + std::to_string(config.iterations) +
                           " iterations per case.");

    std::vector<Result> results;

    results.push_back(time_case("next", config.iterations, [&generator] {
        return generator.next()[core::kId192Length - 1];
    }));

    results.push_back(time_case("hex128_as_str", config.iterations, [&generator] {
        core::Hex128Buffer buffer;
        return static_cast<std::uint8_t>(generator.hex128_as_str(buffer).back());
    }));

    results.push_back(time_case("hex128_as_str_unchecked", config.iterations, [&generator] {
        core::Hex128Buffer buffer;
        return static_cast<std::uint8_t>(generator.hex128_as_str_unchecked(buffer).back());
    }));

    results.push_back(time_case("hex128_as_string", config.iterations, [&generator] {
        return static_cast<std::uint8_t>(generator.hex128_as_string().back());
    }));

    results.push_back(time_case("hex128_as_string_unchecked", config.iterations, [&generator] {
        return static_cast<std::uint8_t>(generator.hex128_as_string_unchecked().back());
    }));

    if (config.threads > 1) {
        results.push_back(time_concurrent_next(generator, config));
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Bench: " + std::to_string(results.size()) + " cases completed.");
    return results;
}

} // namespace fastuuid::bench
