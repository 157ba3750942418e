/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2026-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <string_view>

namespace worksync {

/// A calendar day (the key of the work time entries)
using Date = std::chrono::year_month_day;

/// ISO-8601 calendar date: "2024-05-10"
std::string to_string(const Date& date);

/**
 * Parse an ISO-8601 calendar date ("YYYY-MM-DD")
 *
 * @throws std::invalid_argument if text isn't a valid date
 */
Date parseDate(std::string_view text);

} // namespace worksync

namespace nlohmann {
template <>
struct adl_serializer<std::chrono::year_month_day> {
    static void to_json(json& j, const std::chrono::year_month_day& date) {
        j = worksync::to_string(date);
    }

    static void from_json(const json& j, std::chrono::year_month_day& date) {
        date = worksync::parseDate(j.get<std::string>());
    }
};
} // namespace nlohmann
