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

#include <worksync/merge_types.h>
#include <worksync/sync_status.h>

#include <fmt/format.h>
#include <optional>
#include <stdexcept>

namespace worksync {

/**
 * The merge rule table: decides the outcome for one key given the producer
 * and the reviewer copy of the record (either may be absent).
 *
 * The decision is a pure function of the two records; the table only looks
 * at the canonical status of the tags and at payload equality. Both records
 * are classified before any rule is tried, so a tag outside the entity's
 * vocabulary fails the key with UnknownTagError even when the rule which
 * would have matched ignores that side.
 *
 * @tparam Entity the entity traits (vocabulary, quota predicate, ...)
 */
template <typename Entity>
class MergeTable {
public:
    using RecordType = typename Entity::RecordType;
    using Key = typename RecordType::Key;
    using Outcome = MergeOutcome<RecordType>;

    /**
     * Merge the two copies of the record identified by key.
     *
     * @param key the key being merged
     * @param producer the producer record or nullptr if the producer
     *                 replica doesn't have the key
     * @param reviewer the reviewer record or nullptr
     * @return the outcome with the counter deltas it implies
     * @throws UnknownTagError if a record carries a tag outside the
     *                         entity's vocabulary
     * @throws std::invalid_argument if both records are absent or a record
     *                               doesn't carry the key
     */
    static Outcome merge(const Key& key,
                         const RecordType* producer,
                         const RecordType* reviewer) {
        if (!producer && !reviewer) {
            throw std::invalid_argument(fmt::format(
                    "MergeTable<{}>::merge: no record for key {}",
                    Entity::name,
                    Entity::keyToString(key)));
        }
        for (const auto* record : {producer, reviewer}) {
            if (record && !(record->getKey() == key)) {
                throw std::invalid_argument(fmt::format(
                        "MergeTable<{}>::merge: record {} passed for key {}",
                        Entity::name,
                        Entity::keyToString(record->getKey()),
                        Entity::keyToString(key)));
            }
        }

        auto outcome = decide(producer, reviewer);
        addQuotaDeltas(outcome, producer ? producer : reviewer);
        return outcome;
    }

private:
    static Outcome decide(const RecordType* producer,
                          const RecordType* reviewer) {
        const auto& vocabulary = Entity::vocabulary();
        std::optional<SyncStatus> p;
        if (producer) {
            p = vocabulary.classify(producer->getTag());
        }
        // The reviewer record isn't looked at while a session is open
        if (p == SyncStatus::InProgress) {
            return Outcome::keep(*producer, MergeRule::InProgressKept);
        }

        std::optional<SyncStatus> r;
        if (reviewer) {
            r = vocabulary.classify(reviewer->getTag());
        }
        const auto& settled = vocabulary.tagFor(SyncStatus::AckDone);

        if (p == SyncStatus::EditedByProducer && reviewer) {
            if (r == SyncStatus::Tombstone) {
                return Outcome::keep(*producer, MergeRule::ProducerResurrects);
            }
            if (producer->getPayload() == reviewer->getPayload()) {
                return Outcome::keep(producer->withTag(settled),
                                     MergeRule::ProducerAcknowledged);
            }
            return Outcome::keep(*producer, MergeRule::ProducerEditWins);
        }

        if (r == SyncStatus::EditedByReviewer) {
            return Outcome::keep(reviewer->withTag(settled),
                                 MergeRule::ReviewerEditApplied);
        }

        if (r == SyncStatus::Tombstone) {
            return Outcome::drop(MergeRule::TombstoneDropped);
        }

        if (!reviewer && (p == SyncStatus::Input ||
                          p == SyncStatus::EditedByProducer)) {
            return Outcome::keep(*producer, MergeRule::ProducerOnly);
        }

        if (!producer && r == SyncStatus::ReviewDone) {
            return Outcome::keep(reviewer->withTag(settled),
                                 MergeRule::ReviewerIntroduced);
        }

        const auto& chosen = producer ? *producer : *reviewer;
        return Outcome::keep(chosen.withTag(settled), MergeRule::Fallback);
    }

    /**
     * Compare the quota consumption of the record as it was (the producer
     * copy, or the reviewer copy for a key the producer doesn't have) with
     * the outcome, and record the difference.
     */
    static void addQuotaDeltas(Outcome& outcome, const RecordType* before) {
        const auto was = Entity::quotaKind(before->getPayload());
        std::optional<QuotaKind> now;
        if (!outcome.isDrop()) {
            now = Entity::quotaKind(outcome.getRecord().getPayload());
        }
        if (was == now) {
            return;
        }
        if (was) {
            outcome.addDelta({+1, *was});
        }
        if (now) {
            outcome.addDelta({-1, *now});
        }
    }
};

} // namespace worksync
