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
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace worksync {

/**
 * The rule of the merge table which decided the outcome for a key, in
 * decision order (the first matching rule wins).
 */
enum class MergeRule : uint8_t {
    /// 1. The producer record is in progress and is carried through
    InProgressKept = 1,
    /// 2. A producer edit resurrects a key the reviewer tombstoned
    ProducerResurrects,
    /// 3. A producer edit matches the reviewer; both sides converged
    ProducerAcknowledged,
    /// 4. An unresolved producer edit wins over a differing reviewer copy
    ProducerEditWins,
    /// 5. The reviewer's edit is applied
    ReviewerEditApplied,
    /// 6. The reviewer's tombstone removes the key
    TombstoneDropped,
    /// 7. A record only the producer has is passed through
    ProducerOnly,
    /// 8. A record only the reviewer has is pushed to the producer
    ReviewerIntroduced,
    /// 9. Anything else; normalised to the settled tag
    Fallback
};

std::string to_string(MergeRule rule);
std::ostream& operator<<(std::ostream& os, MergeRule rule);

/// A finite per-owner counter which records may consume
enum class QuotaKind : uint8_t {
    PaidLeaveDay
};

/// "paid_leave_day"
std::string to_string(QuotaKind kind);
std::ostream& operator<<(std::ostream& os, QuotaKind kind);

/**
 * A change of quota consumption caused by a merge outcome. +1 gives a unit
 * back to the owner (a consuming record went away), -1 takes one (a record
 * started consuming).
 */
struct CounterDelta {
    int amount = 0;
    QuotaKind kind = QuotaKind::PaidLeaveDay;

    bool operator==(const CounterDelta&) const = default;
};

std::string to_string(const CounterDelta& delta);
std::ostream& operator<<(std::ostream& os, const CounterDelta& delta);

/**
 * The decision for one key: keep a record (value and winning tag to
 * persist) or drop the key from both replicas. Carries the counter deltas
 * the decision implies.
 */
template <typename RecordT>
class MergeOutcome {
public:
    static MergeOutcome keep(RecordT record, MergeRule rule) {
        return MergeOutcome(std::move(record), rule);
    }

    static MergeOutcome drop(MergeRule rule) {
        return MergeOutcome(std::nullopt, rule);
    }

    bool isDrop() const {
        return !record.has_value();
    }

    /**
     * @return the record to persist
     * @throws std::logic_error if the outcome is a drop
     */
    const RecordT& getRecord() const {
        if (!record) {
            throw std::logic_error(
                    "MergeOutcome::getRecord: outcome is a drop");
        }
        return *record;
    }

    MergeRule getRule() const {
        return rule;
    }

    const std::vector<CounterDelta>& getDeltas() const {
        return deltas;
    }

    void addDelta(CounterDelta delta) {
        deltas.push_back(delta);
    }

private:
    MergeOutcome(std::optional<RecordT> record, MergeRule rule)
        : record(std::move(record)), rule(rule) {
    }

    std::optional<RecordT> record;
    MergeRule rule;
    std::vector<CounterDelta> deltas;
};

} // namespace worksync
