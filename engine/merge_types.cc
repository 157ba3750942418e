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

#include <worksync/merge_types.h>

#include <fmt/format.h>
#include <ostream>

namespace worksync {

std::string to_string(MergeRule rule) {
    switch (rule) {
    case MergeRule::InProgressKept:
        return "in_progress_kept";
    case MergeRule::ProducerResurrects:
        return "producer_resurrects";
    case MergeRule::ProducerAcknowledged:
        return "producer_acknowledged";
    case MergeRule::ProducerEditWins:
        return "producer_edit_wins";
    case MergeRule::ReviewerEditApplied:
        return "reviewer_edit_applied";
    case MergeRule::TombstoneDropped:
        return "tombstone_dropped";
    case MergeRule::ProducerOnly:
        return "producer_only";
    case MergeRule::ReviewerIntroduced:
        return "reviewer_introduced";
    case MergeRule::Fallback:
        return "fallback";
    }
    throw std::invalid_argument("worksync::to_string(MergeRule): Invalid value: " +
                                std::to_string(int(rule)));
}

std::ostream& operator<<(std::ostream& os, MergeRule rule) {
    return os << to_string(rule);
}

std::string to_string(QuotaKind kind) {
    switch (kind) {
    case QuotaKind::PaidLeaveDay:
        return "paid_leave_day";
    }
    throw std::invalid_argument("worksync::to_string(QuotaKind): Invalid value: " +
                                std::to_string(int(kind)));
}

std::ostream& operator<<(std::ostream& os, QuotaKind kind) {
    return os << to_string(kind);
}

std::string to_string(const CounterDelta& delta) {
    return fmt::format("{:+} {}", delta.amount, to_string(delta.kind));
}

std::ostream& operator<<(std::ostream& os, const CounterDelta& delta) {
    return os << to_string(delta);
}

} // namespace worksync
