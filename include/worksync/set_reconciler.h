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

#include <worksync/merge_table.h>
#include <worksync/replica.h>
#include <worksync/worksync_error.h>

#include <fmt/format.h>
#include <logger/logger.h>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace worksync {

/// A record left out of a reconciliation because it had a bad tag
struct RejectedRecord {
    /// The printable key
    std::string key;
    /// The side holding the offending record
    Role role;
    std::string tag;
    std::string reason;

    bool operator==(const RejectedRecord&) const = default;
};

/// The replicas which need to be written back after a reconciliation
struct WriteTargets {
    bool producer = false;
    bool reviewer = false;

    bool contains(Role role) const {
        return role == Role::Producer ? producer : reviewer;
    }

    bool operator==(const WriteTargets&) const = default;
};

std::string to_string(const WriteTargets& targets);

/**
 * The result of reconciling a producer and a reviewer replica.
 *
 * producerOut and reviewerOut are the replicas to persist for each side:
 * the merged set plus, for a rejected key, the record that side held
 * before (rejected records are left alone rather than guessed at).
 */
template <typename Entity>
struct ReconcileResult {
    using RecordType = typename Entity::RecordType;
    using Key = typename RecordType::Key;

    /// The converged records in the entity's natural order
    std::vector<RecordType> merged;
    std::vector<CounterDelta> deltas;
    std::vector<RejectedRecord> rejected;
    WriteTargets targets;
    Replica<Entity> producerOut;
    Replica<Entity> reviewerOut;
    /// The rule which decided each merged (or dropped) key
    std::vector<std::pair<Key, MergeRule>> rules;
};

/**
 * The set reconciler: runs the merge rule table over the union of the keys
 * of two replicas of the same (owner, period) and decides which replicas
 * must be written back.
 *
 * The initiator (the side whose access triggered the reconciliation) is
 * always a write target; the other side only when the outcome differs from
 * what it stores.
 */
template <typename Entity>
class SetReconciler {
public:
    using RecordType = typename Entity::RecordType;
    using Key = typename RecordType::Key;
    using Result = ReconcileResult<Entity>;

    /**
     * @param producer the producer replica (may be empty)
     * @param reviewer the reviewer replica (may be empty)
     * @param initiator the role which requested the reconciliation
     * @throws std::invalid_argument if the replicas don't belong to the
     *         same owner and period, or are bound to the wrong roles
     */
    static Result reconcile(const Replica<Entity>& producer,
                            const Replica<Entity>& reviewer,
                            Role initiator) {
        if (producer.getRole() != Role::Producer ||
            reviewer.getRole() != Role::Reviewer) {
            throw std::invalid_argument(fmt::format(
                    "SetReconciler<{}>::reconcile: replicas bound to {} and "
                    "{}",
                    Entity::name,
                    to_string(producer.getRole()),
                    to_string(reviewer.getRole())));
        }
        if (producer.getOwnerId() != reviewer.getOwnerId() ||
            !(producer.getPeriod() == reviewer.getPeriod())) {
            throw std::invalid_argument(fmt::format(
                    "SetReconciler<{}>::reconcile: replica mismatch {}/{} "
                    "and {}/{}",
                    Entity::name,
                    producer.getOwnerId(),
                    to_string(producer.getPeriod()),
                    reviewer.getOwnerId(),
                    to_string(reviewer.getPeriod())));
        }

        // The key union
        std::map<Key, std::pair<const RecordType*, const RecordType*>> keys;
        for (const auto& record : producer.getRecords()) {
            keys[record.getKey()].first = &record;
        }
        for (const auto& record : reviewer.getRecords()) {
            keys[record.getKey()].second = &record;
        }

        std::vector<RecordType> merged;
        std::vector<CounterDelta> deltas;
        std::vector<RejectedRecord> rejected;
        std::vector<std::pair<Key, MergeRule>> rules;
        std::vector<RecordType> producerCarry;
        std::vector<RecordType> reviewerCarry;
        bool producerStale = false;
        bool reviewerStale = false;

        for (const auto& [key, pair] : keys) {
            const auto* p = pair.first;
            const auto* r = pair.second;
            try {
                auto outcome = MergeTable<Entity>::merge(key, p, r);
                LOG_DEBUG("{} {}/{} key {}: {} producer:{} reviewer:{}",
                          Entity::name,
                          producer.getOwnerId(),
                          to_string(producer.getPeriod()),
                          Entity::keyToString(key),
                          to_string(outcome.getRule()),
                          p ? p->getTag() : "-",
                          r ? r->getTag() : "-");
                rules.emplace_back(key, outcome.getRule());
                // An in-progress producer record wins without the reviewer
                // record being classified, but a bad reviewer tag is still
                // reported (the record is replaced by the merged one)
                if (r && !Entity::vocabulary().contains(r->getTag())) {
                    const UnknownTagError error(
                            Entity::vocabulary().getName(), r->getTag());
                    rejected.push_back({Entity::keyToString(key),
                                        Role::Reviewer,
                                        r->getTag(),
                                        error.what()});
                    LOG_WARNING_CTX(
                            "Replacing reviewer record with an unknown tag",
                            {"entity", Entity::name},
                            {"owner", producer.getOwnerId()},
                            {"period", to_string(producer.getPeriod())},
                            {"key", Entity::keyToString(key)},
                            {"error", error.what()});
                }
                deltas.insert(deltas.end(),
                              outcome.getDeltas().begin(),
                              outcome.getDeltas().end());
                if (outcome.isDrop()) {
                    producerStale |= p != nullptr;
                    reviewerStale |= r != nullptr;
                } else {
                    const auto& record = outcome.getRecord();
                    producerStale |= !p || !(*p == record);
                    reviewerStale |= !r || !(*r == record);
                    merged.push_back(record);
                }
            } catch (const UnknownTagError& e) {
                for (const auto* record : {p, r}) {
                    if (record && !Entity::vocabulary().contains(
                                          record->getTag())) {
                        rejected.push_back(
                                {Entity::keyToString(key),
                                 record == p ? Role::Producer
                                             : Role::Reviewer,
                                 record->getTag(),
                                 e.what()});
                    }
                }
                LOG_WARNING_CTX("Excluding key from reconciliation",
                                {"entity", Entity::name},
                                {"owner", producer.getOwnerId()},
                                {"period", to_string(producer.getPeriod())},
                                {"key", Entity::keyToString(key)},
                                {"error", e.what()});
                if (p) {
                    producerCarry.push_back(*p);
                }
                if (r) {
                    reviewerCarry.push_back(*r);
                }
            }
        }

        std::ranges::sort(merged, Entity::naturalOrder);

        WriteTargets targets;
        targets.producer = initiator == Role::Producer || producerStale;
        targets.reviewer = initiator == Role::Reviewer || reviewerStale;

        auto withCarry = [&merged](std::vector<RecordType> carry) {
            carry.insert(carry.end(), merged.begin(), merged.end());
            return carry;
        };
        auto producerOut = producer.withRecords(withCarry(producerCarry));
        auto reviewerOut = reviewer.withRecords(withCarry(reviewerCarry));

        return {std::move(merged),
                std::move(deltas),
                std::move(rejected),
                targets,
                std::move(producerOut),
                std::move(reviewerOut),
                std::move(rules)};
    }
};

} // namespace worksync
