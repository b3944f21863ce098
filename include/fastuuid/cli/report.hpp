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
 * @file report.hpp
 * @brief JSON documents emitted by the `fastuuid` tool when `--json` is given.
 *
 * @details
 * Shapes:
 * - identifiers: `{"format":"hex128","count":2,"ids":["...","..."]}`
 * - benchmark:   `{"iterations":N,"threads":T,"results":[{"name":"next","ops":N,"ns_per_op":7.1}]}`
 */

#pragma once

#include "fastuuid/bench/harness.hpp"
#include "fastuuid/cli/options.hpp"

#include <string>
#include <vector>

struct cJSON;

namespace fastuuid::cli {

/**
 * @brief Appends `item` to `array`, transferring ownership.
 *
 * @param array Destination array node.
 * @param item Node to append. Deleted if it cannot be attached.
 * @throws std::bad_alloc If cJSON refuses the item.
 */
void append_item(cJSON* array, cJSON* item);

/**
 * @brief Serializes a batch of printed identifiers.
 *
 * @throws std::bad_alloc If cJSON cannot allocate the document.
 */
std::string ids_to_json(OutputFormat format, const std::vector<std::string>& ids);

/**
 * @brief Serializes benchmark results.
 *
 * @throws std::bad_alloc If cJSON cannot allocate the document.
 */
std::string bench_to_json(const bench::Config& config, const std::vector<bench::Result>& results);

/// @brief Human-readable benchmark table, one case per line.
std::string bench_to_text(const std::vector<bench::Result>& results);

} // namespace fastuuid::cli
