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

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

namespace worksync {

/// The two parties keeping a copy of the same record set
enum class Role : uint8_t {
    /// The owner of the records (the employee)
    Producer,
    /// The supervising role (admin or team lead)
    Reviewer
};

std::string to_string(Role role);
std::ostream& operator<<(std::ostream& os, Role role);

/// @return the role on the other side of the replica pair
constexpr Role opposite(Role role) {
    return role == Role::Producer ? Role::Reviewer : Role::Producer;
}

/**
 * Parse a role name ("producer" / "reviewer")
 *
 * @throws std::invalid_argument for anything else
 */
Role parseRole(std::string_view name);

/**
 * The time span one replica covers: a month (month in [1,12]) or a whole
 * year (month == 0).
 */
struct Period {
    int year = 0;
    int month = 0;

    bool isWholeYear() const {
        return month == 0;
    }

    bool operator==(const Period&) const = default;
};

/// "2024-05" for a month, "2024" for a whole year
std::string to_string(const Period& period);
std::ostream& operator<<(std::ostream& os, const Period& period);

/**
 * Parse "YYYY-MM" or "YYYY".
 *
 * @throws std::invalid_argument if the text isn't a valid period
 */
Period parsePeriod(std::string_view text);

/**
 * One entity instance (a day of work time, a register line, ...).
 *
 * Records are immutable values: an edit creates a new Record, so the two
 * replicas of a record set never share mutable state.
 *
 * @tparam KeyT the identity of the record within a period
 * @tparam PayloadT the domain fields; opaque to the merge engine apart from
 *                  equality
 */
template <typename KeyT, typename PayloadT>
class Record {
public:
    using Key = KeyT;
    using Payload = PayloadT;

    Record(Key key, std::string ownerId, Payload payload, std::string tag)
        : key(std::move(key)),
          ownerId(std::move(ownerId)),
          payload(std::move(payload)),
          tag(std::move(tag)) {
    }

    const Key& getKey() const {
        return key;
    }

    const std::string& getOwnerId() const {
        return ownerId;
    }

    const Payload& getPayload() const {
        return payload;
    }

    /// The wire tag (entity specific, see StatusVocabulary)
    const std::string& getTag() const {
        return tag;
    }

    Record withTag(std::string newTag) const {
        return {key, ownerId, payload, std::move(newTag)};
    }

    Record withPayload(Payload newPayload, std::string newTag) const {
        return {key, ownerId, std::move(newPayload), std::move(newTag)};
    }

    bool operator==(const Record&) const = default;

private:
    Key key;
    std::string ownerId;
    Payload payload;
    std::string tag;
};

} // namespace worksync
