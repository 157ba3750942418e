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

#include <worksync/date.h>

#include <fmt/format.h>
#include <charconv>
#include <stdexcept>

namespace worksync {

std::string to_string(const Date& date) {
    return fmt::format("{:04}-{:02}-{:02}",
                       int(date.year()),
                       unsigned(date.month()),
                       unsigned(date.day()));
}

Date parseDate(std::string_view text) {
    auto field = [text](std::size_t offset, std::size_t length) {
        int value = 0;
        const auto* begin = text.data() + offset;
        const auto* end = begin + length;
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            throw std::invalid_argument(
                    fmt::format("parseDate: invalid date \"{}\"", text));
        }
        return value;
    };

    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument(
                fmt::format("parseDate: invalid date \"{}\"", text));
    }

    const Date date{std::chrono::year{field(0, 4)},
                    std::chrono::month{unsigned(field(5, 2))},
                    std::chrono::day{unsigned(field(8, 2))}};
    if (!date.ok()) {
        throw std::invalid_argument(
                fmt::format("parseDate: no such day \"{}\"", text));
    }
    return date;
}

} // namespace worksync
