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
 * @file report.cpp
 * @brief cJSON serialization of tool output.
 *
 * @details
 * cJSON reports allocation failure by returning `nullptr` from its
 * constructors and printers, and `false` from `cJSON_AddItemToArray`; those
 * are translated into `std::bad_alloc`.
 */

#include "fastuuid/cli/report.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <new>
#include <sstream>

namespace fastuuid::cli {

namespace {

struct JsonDeleter {
    void operator()(cJSON* node) const noexcept { cJSON_Delete(node); }
};

using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

cJSON* checked(cJSON* node)
{
    if (node == nullptr) {
        throw std::bad_alloc();
    }
    return node;
}

std::string print(const JsonPtr& root)
{
    char* raw = cJSON_PrintUnformatted(root.get());
    if (raw == nullptr) {
        throw std::bad_alloc();
    }
    std::string out(raw);
    free(raw);
    return out;
}

} // namespace

void append_item(cJSON* array, cJSON* item)
{
    if (!cJSON_AddItemToArray(array, item)) {
        cJSON_Delete(item);
        throw std::bad_alloc();
    }
}

std::string ids_to_json(OutputFormat format, const std::vector<std::string>& ids)
{
    JsonPtr root(checked(cJSON_CreateObject()));

    checked(cJSON_AddStringToObject(root.get(), "format", format_name(format)));
    checked(cJSON_AddNumberToObject(root.get(), "count", static_cast<double>(ids.size())));

    cJSON* arr = checked(cJSON_AddArrayToObject(root.get(), "ids"));
    for (const std::string& id : ids) {
        append_item(arr, checked(cJSON_CreateString(id.c_str())));
    }

    return print(root);
}

std::string bench_to_json(const bench::Config& config, const std::vector<bench::Result>& results)
{
    JsonPtr root(checked(cJSON_CreateObject()));

    checked(cJSON_AddNumberToObject(root.get(), "iterations",
                                    static_cast<double>(config.iterations)));
    checked(cJSON_AddNumberToObject(root.get(), "threads", static_cast<double>(config.threads)));

    cJSON* arr = checked(cJSON_AddArrayToObject(root.get(), "results"));
    for (const bench::Result& r : results) {
        cJSON* item = checked(cJSON_CreateObject());
        append_item(arr, item);
        checked(cJSON_AddStringToObject(item, "name", r.name.c_str()));
        checked(cJSON_AddNumberToObject(item, "ops", static_cast<double>(r.ops)));
        checked(cJSON_AddNumberToObject(item, "ns_per_op", r.ns_per_op));
    }

    return print(root);
}

std::string bench_to_text(const std::vector<bench::Result>& results)
{
    std::ostringstream out;
    out << std::left << std::setw(28) << "case" << std::right << std::setw(14) << "ops"
        << std::setw(12) << "ns/op" << "\n";
    for (const bench::Result& r : results) {
        out << std::left << std::setw(28) << r.name << std::right << std::setw(14) << r.ops
            << std::setw(12) << std::fixed << std::setprecision(2) << r.ns_per_op << "\n";
    }
    return out.str();
}

} // namespace fastuuid::cli
