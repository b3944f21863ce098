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
 * @file generator_test.cpp
 * @brief Unit and concurrency tests for `fastuuid::core::Generator`.
 *
 * @details
 * Deterministic cases seed the generator through `FixedSource` (seed bytes
 * `00..0F`, chosen counter) so exact byte and text values can be asserted.
 */

#include "fastuuid/core/generator.hpp"
#include "fastuuid/format/hex128.hpp"
#include "framework.hpp"
#include "test_sources.hpp"

#include <algorithm>
#include <cstring>
#include <regex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using fastuuid::core::BufferSizeError;
using fastuuid::core::Generator;
using fastuuid::core::GeneratorInitError;
using fastuuid::core::Hex128Buffer;
using fastuuid::core::Id192;
using fastuuid::test::counter_of;
using fastuuid::test::FailingSource;
using fastuuid::test::FixedSource;
using fastuuid::test::same_seed;

namespace {

const std::regex kV4Pattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

} // namespace

/**
 * @brief Seed `00..0F` with counter 1 yields `00..0F ++ 00..02` on the first call.
 */
void test_generator_example_vector()
{
    FixedSource source(1);
    Generator generator(source);

    const Id192 id = generator.next();
    const Id192 expected = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                            0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F,
                            0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02};
    ASSERT_TRUE(id == expected);
    ASSERT_EQ(counter_of(generator.next()), static_cast<std::uint64_t>(3));
}

/**
 * @brief The first text id of the example state, version and variant applied.
 */
void test_generator_example_text()
{
    FixedSource source(1);
    Generator generator(source);

    ASSERT_EQ(generator.hex128_as_string(), std::string("08090a0b-0c0d-4e0f-8000-000000000002"));
    ASSERT_EQ(generator.hex128_as_string(), std::string("08090a0b-0c0d-4e0f-8000-000000000003"));
}

/**
 * @brief Construction reads the entropy source exactly once, for 24 bytes.
 */
void test_generator_single_entropy_draw()
{
    FixedSource source(0);
    Generator generator(source);
    (void)generator.next();
    (void)generator.hex128_as_string();

    ASSERT_EQ(source.calls, 1);
    ASSERT_EQ(source.requested.front(), fastuuid::core::kId192Length);
}

void test_generator_init_failure()
{
    FailingSource source;
    ASSERT_THROWS(Generator{source}, GeneratorInitError);
}

/**
 * @brief The system entropy source produces a working generator.
 */
void test_generator_default_construction()
{
    Generator generator;

    const Id192 a = generator.next();
    const Id192 b = generator.next();
    ASSERT_TRUE(same_seed(a, b));
    ASSERT_EQ(counter_of(b), counter_of(a) + 1);
}

/**
 * @brief Consecutive values differ only in the counter, which grows by one.
 */
void test_generator_counter_adjacent()
{
    FixedSource source(41);
    Generator generator(source);

    Id192 prev = generator.next();
    ASSERT_EQ(counter_of(prev), static_cast<std::uint64_t>(42));
    for (int i = 0; i < 100; ++i) {
        const Id192 cur = generator.next();
        ASSERT_TRUE(same_seed(prev, cur));
        ASSERT_EQ(counter_of(cur), counter_of(prev) + 1);
        prev = cur;
    }
}

/**
 * @brief Overflow wraps to zero without raising.
 */
void test_generator_counter_wraps()
{
    FixedSource source(0xFFFFFFFFFFFFFFFEULL);
    Generator generator(source);

    ASSERT_EQ(counter_of(generator.next()), static_cast<std::uint64_t>(0xFFFFFFFFFFFFFFFFULL));
    ASSERT_EQ(counter_of(generator.next()), static_cast<std::uint64_t>(0));
    ASSERT_EQ(counter_of(generator.next()), static_cast<std::uint64_t>(1));
}

/**
 * @brief Wrong buffer sizes are rejected before anything is written or consumed.
 */
void test_hex128_as_str_rejects_wrong_size()
{
    FixedSource source(1);
    Generator generator(source);

    char small[35];
    char large[37];
    std::memset(small, 'Z', sizeof(small));
    std::memset(large, 'Z', sizeof(large));

    try {
        (void)generator.hex128_as_str(small, sizeof(small));
        ASSERT_TRUE(false);
    } catch (const BufferSizeError& e) {
        ASSERT_EQ(e.expected(), static_cast<std::size_t>(36));
        ASSERT_EQ(e.actual(), static_cast<std::size_t>(35));
    }

    try {
        (void)generator.hex128_as_str_unchecked(large, sizeof(large));
        ASSERT_TRUE(false);
    } catch (const BufferSizeError& e) {
        ASSERT_EQ(e.actual(), static_cast<std::size_t>(37));
    }

    ASSERT_THROWS(generator.hex128_as_str(nullptr, 36), BufferSizeError);
    ASSERT_THROWS(generator.hex128_as_str(large, 0), BufferSizeError);

    ASSERT_TRUE(std::all_of(small, small + sizeof(small), [](char c) { return c == 'Z'; }));
    ASSERT_TRUE(std::all_of(large, large + sizeof(large), [](char c) { return c == 'Z'; }));

    // No counter value was consumed by the failed calls.
    ASSERT_EQ(counter_of(generator.next()), static_cast<std::uint64_t>(2));
}

/**
 * @brief A 36-byte buffer is filled in place and the view aliases it.
 */
void test_hex128_as_str_writes_in_place()
{
    FixedSource source(1);
    Generator generator(source);

    char raw[36];
    std::string_view view = generator.hex128_as_str(raw, sizeof(raw));
    ASSERT_TRUE(view.data() == raw);
    ASSERT_EQ(view, std::string_view("08090a0b-0c0d-4e0f-8000-000000000002"));

    Hex128Buffer buffer;
    view = generator.hex128_as_str(buffer);
    ASSERT_TRUE(view.data() == buffer.data());
    ASSERT_EQ(view.size(), static_cast<std::size_t>(36));
    ASSERT_EQ(view, std::string_view("08090a0b-0c0d-4e0f-8000-000000000003"));
}

/**
 * @brief Checked and unchecked variants agree byte for byte at equal counter states.
 */
void test_checked_unchecked_equivalence()
{
    FixedSource source_a(0x3FFFFFFFFFFFFFF0ULL);
    FixedSource source_b(0x3FFFFFFFFFFFFFF0ULL);
    Generator checked(source_a);
    Generator unchecked(source_b);

    for (int i = 0; i < 64; ++i) {
        ASSERT_EQ(checked.hex128_as_string(), unchecked.hex128_as_string_unchecked());

        Hex128Buffer a;
        Hex128Buffer b;
        ASSERT_EQ(checked.hex128_as_str(a), unchecked.hex128_as_str_unchecked(b));

        char c[36];
        char d[36];
        ASSERT_EQ(checked.hex128_as_str(c, sizeof(c)),
                  unchecked.hex128_as_str_unchecked(d, sizeof(d)));
    }
}

/**
 * @brief Every variant produces canonical version 4 text.
 */
void test_hex128_format_validity()
{
    Generator generator;
    Hex128Buffer buffer;

    for (int i = 0; i < 2000; ++i) {
        const std::string a = generator.hex128_as_string();
        const std::string b = generator.hex128_as_string_unchecked();
        const std::string c(generator.hex128_as_str(buffer));
        const std::string d(generator.hex128_as_str_unchecked(buffer));

        for (const std::string* s : {&a, &b, &c, &d}) {
            ASSERT_TRUE(std::regex_match(*s, kV4Pattern));
            ASSERT_TRUE(Generator::is_valid_hex128(*s));
        }
    }
}

/**
 * @brief 100k sequential text ids through a reused buffer are all distinct.
 */
void test_hex128_uniqueness()
{
    Generator generator;
    Hex128Buffer buffer;
    std::unordered_set<std::string> seen;

    for (int i = 0; i < 100000; ++i) {
        const bool inserted = seen.emplace(generator.hex128_as_str(buffer)).second;
        ASSERT_TRUE(inserted);
    }
}

/**
 * @brief T threads x C calls to `next()` issue exactly the counters 1..T*C.
 */
void test_next_concurrent_uniqueness()
{
    constexpr std::size_t kThreads = 8;
    constexpr std::size_t kCalls = 20000;

    FixedSource source(0);
    Generator generator(source);

    std::vector<std::vector<std::uint64_t>> per_thread(kThreads);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < kThreads; ++t) {
        threads.emplace_back([&generator, &per_thread, t] {
            per_thread[t].reserve(kCalls);
            for (std::size_t i = 0; i < kCalls; ++i) {
                per_thread[t].push_back(counter_of(generator.next()));
            }
        });
    }
    for (std::thread& t : threads) {
        t.join();
    }

    std::unordered_set<std::uint64_t> all;
    for (const auto& values : per_thread) {
        all.insert(values.begin(), values.end());
    }
    ASSERT_EQ(all.size(), kThreads * kCalls);
    ASSERT_EQ(*std::min_element(all.begin(), all.end()), static_cast<std::uint64_t>(1));
    ASSERT_EQ(*std::max_element(all.begin(), all.end()),
              static_cast<std::uint64_t>(kThreads * kCalls));
}

/**
 * @brief Threads mixing every render variant on one generator never collide.
 */
void test_hex128_concurrent_mixed_variants()
{
    constexpr std::size_t kThreads = 4;
    constexpr std::size_t kCalls = 5000;

    Generator generator;
    std::vector<std::vector<std::string>> per_thread(kThreads);
    std::vector<std::thread> threads;

    for (std::size_t t = 0; t < kThreads; ++t) {
        threads.emplace_back([&generator, &per_thread, t] {
            Hex128Buffer buffer;
            for (std::size_t i = 0; i < kCalls; ++i) {
                switch (t) {
                case 0:
                    per_thread[t].push_back(generator.hex128_as_string());
                    break;
                case 1:
                    per_thread[t].push_back(generator.hex128_as_string_unchecked());
                    break;
                case 2:
                    per_thread[t].emplace_back(generator.hex128_as_str(buffer));
                    break;
                default:
                    per_thread[t].emplace_back(generator.hex128_as_str_unchecked(buffer));
                    break;
                }
            }
        });
    }
    for (std::thread& t : threads) {
        t.join();
    }

    std::unordered_set<std::string> all;
    for (const auto& values : per_thread) {
        all.insert(values.begin(), values.end());
    }
    ASSERT_EQ(all.size(), kThreads * kCalls);
}
