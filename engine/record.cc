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

#include <worksync/record.h>

#include <fmt/format.h>
#include <charconv>
#include <ostream>
#include <stdexcept>

namespace worksync {

std::string to_string(Role role) {
    switch (role) {
    case Role::Producer:
        return "producer";
    case Role::Reviewer:
        return "reviewer";
    }
    throw std::invalid_argument("worksync::to_string(Role): Invalid value: " +
                                std::to_string(int(role)));
}

std::ostream& operator<<(std::ostream& os, Role role) {
    return os << to_string(role);
}

Role parseRole(std::string_view name) {
    if (name == "producer") {
        return Role::Producer;
    }
    if (name == "reviewer") {
        return Role::Reviewer;
    }
    throw std::invalid_argument(
            fmt::format("parseRole: unknown role \"{}\"", name));
}

std::string to_string(const Period& period) {
    if (period.isWholeYear()) {
        return fmt::format("{:04}", period.year);
    }
    return fmt::format("{:04}-{:02}", period.year, period.month);
}

std::ostream& operator<<(std::ostream& os, const Period& period) {
    return os << to_string(period);
}

static int parseNumber(std::string_view text, std::string_view input) {
    int value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || text.empty()) {
        throw std::invalid_argument(
                fmt::format("parsePeriod: invalid period \"{}\"", input));
    }
    return value;
}

Period parsePeriod(std::string_view text) {
    Period period;
    const auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        period.year = parseNumber(text, text);
    } else {
        period.year = parseNumber(text.substr(0, dash), text);
        period.month = parseNumber(text.substr(dash + 1), text);
        if (period.month < 1 || period.month > 12) {
            throw std::invalid_argument(fmt::format(
                    "parsePeriod: month out of range in \"{}\"", text));
        }
    }
    if (period.year < 1) {
        throw std::invalid_argument(
                fmt::format("parsePeriod: year out of range in \"{}\"", text));
    }
    return period;
}

} // namespace worksync
