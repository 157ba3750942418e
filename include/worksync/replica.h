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

#include <worksync/record.h>

#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace worksync {

/**
 * One role's copy of the records of an (owner, period) pair.
 *
 * The records are kept in the entity's natural order and a key appears at
 * most once. Like Record, a Replica is a value: the "with" methods return a
 * modified copy.
 *
 * @tparam Entity the entity traits (see worktime_entity.h for an example)
 */
template <typename Entity>
class Replica {
public:
    using RecordType = typename Entity::RecordType;
    using Key = typename RecordType::Key;

    Replica(std::string ownerId, Period period, Role role)
        : ownerId(std::move(ownerId)), period(period), role(role) {
    }

    /**
     * @throws std::invalid_argument if two records share a key
     */
    Replica(std::string ownerId,
            Period period,
            Role role,
            std::vector<RecordType> records)
        : ownerId(std::move(ownerId)),
          period(period),
          role(role),
          records(std::move(records)) {
        std::ranges::sort(this->records, Entity::naturalOrder);
        for (std::size_t ii = 1; ii < this->records.size(); ++ii) {
            if (findIndex(this->records[ii].getKey()) != ii) {
                throw std::invalid_argument(fmt::format(
                        "Replica({}, {}, {}): duplicate key {}",
                        Entity::name,
                        this->ownerId,
                        to_string(role),
                        Entity::keyToString(this->records[ii].getKey())));
            }
        }
    }

    const std::string& getOwnerId() const {
        return ownerId;
    }

    const Period& getPeriod() const {
        return period;
    }

    Role getRole() const {
        return role;
    }

    const std::vector<RecordType>& getRecords() const {
        return records;
    }

    std::size_t size() const {
        return records.size();
    }

    bool empty() const {
        return records.empty();
    }

    /// @return the record with the given key, or nullptr
    const RecordType* find(const Key& key) const {
        const auto idx = findIndex(key);
        return idx == records.size() ? nullptr : &records[idx];
    }

    /// @return a copy where record replaces any record with the same key
    Replica withRecord(RecordType record) const {
        auto copy = records;
        const auto idx = findIndex(record.getKey());
        if (idx == copy.size()) {
            copy.push_back(std::move(record));
        } else {
            copy[idx] = std::move(record);
        }
        return {ownerId, period, role, std::move(copy)};
    }

    /// @return a copy without the record with the given key
    Replica withoutKey(const Key& key) const {
        auto copy = records;
        std::erase_if(copy,
                      [&key](const auto& r) { return r.getKey() == key; });
        return {ownerId, period, role, std::move(copy)};
    }

    /// Same coordinates, different records
    Replica withRecords(std::vector<RecordType> newRecords) const {
        return {ownerId, period, role, std::move(newRecords)};
    }

    /// Equal when the coordinates and the records are equal
    bool operator==(const Replica&) const = default;

private:
    std::size_t findIndex(const Key& key) const {
        const auto iter = std::ranges::find_if(
                records, [&key](const auto& r) { return r.getKey() == key; });
        return std::size_t(std::distance(records.begin(), iter));
    }

    std::string ownerId;
    Period period;
    Role role;
    std::vector<RecordType> records;
};

} // namespace worksync
