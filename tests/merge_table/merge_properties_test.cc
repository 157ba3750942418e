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
#include <folly/portability/GTest.h>
#include <worksync/set_reconciler.h>

#include "../mock/test_records.h"

#include <set>

using namespace worksync;
using namespace worksync::test;

using WorktimeReconciler = SetReconciler<WorktimeEntity>;

/*
 * Properties which must hold for any pair of replicas, checked on a pair
 * exercising every rule of the table at once.
 */
class MergePropertiesTest : public ::testing::Test {
protected:
    Replica<WorktimeEntity> producerReplica = producer({
            wt(1, "USER_INPUT", worked(480)),
            wt(2, "USER_IN_PROCESS", openSession()),
            wt(3, "USER_EDITED", worked(420)),
            wt(4, "USER_EDITED", worked(450)),
            wt(5, "USER_EDITED", worked(400)),
            wt(6, "USER_DONE", worked(480)),
            wt(7, "USER_INPUT", paidLeave()),
            wt(8, "USER_INPUT", worked(480)),
            wt(13, "USER_DONE", worked(480)),
    });
    Replica<WorktimeEntity> reviewerReplica = reviewer({
            wt(2, "ADMIN_EDITED", worked(480)),
            wt(3, "ADMIN_BLANK", worked(480)),
            wt(4, "ADMIN_DONE", worked(450)),
            wt(5, "ADMIN_DONE", worked(480)),
            wt(6, "ADMIN_EDITED", worked(360)),
            wt(7, "ADMIN_BLANK", paidLeave()),
            wt(8, "ADMIN_DONE", worked(480)),
            wt(9, "ADMIN_DONE", paidLeave()),
            wt(12, "ADMIN_BLANK", paidLeave()),
    });
};

TEST_F(MergePropertiesTest, Idempotence) {
    const auto first = WorktimeReconciler::reconcile(
            producerReplica, reviewerReplica, Role::Producer);
    const auto second = WorktimeReconciler::reconcile(
            first.producerOut, first.reviewerOut, Role::Producer);
    const auto third = WorktimeReconciler::reconcile(
            second.producerOut, second.reviewerOut, Role::Producer);

    // Only the convergence of the outstanding producer edits differs
    // between the first two passes; after that nothing changes
    EXPECT_EQ(second.merged, third.merged);
    EXPECT_EQ(second.producerOut, third.producerOut);
    EXPECT_EQ(second.reviewerOut, third.reviewerOut);
    EXPECT_EQ(first.merged.size(), second.merged.size());
    EXPECT_TRUE(third.deltas.empty());
    EXPECT_EQ((WriteTargets{true, false}), third.targets);

    for (const auto& record : second.merged) {
        const auto status =
                WorktimeEntity::vocabulary().classify(record.getTag());
        if (record.getKey() == may(2)) {
            EXPECT_EQ(SyncStatus::InProgress, status);
        } else {
            EXPECT_EQ(SyncStatus::AckDone, status)
                    << WorktimeEntity::keyToString(record.getKey());
        }
    }
}

TEST_F(MergePropertiesTest, InProgressProtection) {
    for (auto initiator : {Role::Producer, Role::Reviewer}) {
        const auto result = WorktimeReconciler::reconcile(
                producerReplica, reviewerReplica, initiator);
        const auto* input = producerReplica.find(may(2));
        ASSERT_NE(nullptr, input);
        EXPECT_EQ(*input, *result.producerOut.find(may(2)));
        EXPECT_EQ(*input, *result.reviewerOut.find(may(2)));
    }
}

TEST_F(MergePropertiesTest, InProgressIgnoresUnknownReviewerTag) {
    const auto session = wt(2, "USER_IN_PROCESS", openSession());
    const auto result = WorktimeReconciler::reconcile(
            producer({session}),
            reviewer({wt(2, "ADMIN_GARBAGE", worked(480))}),
            Role::Producer);

    ASSERT_EQ(1u, result.merged.size());
    EXPECT_EQ(session, result.merged.front());
    EXPECT_EQ(session, *result.producerOut.find(may(2)));
    EXPECT_EQ(session, *result.reviewerOut.find(may(2)));
    EXPECT_EQ(1u, result.reviewerOut.getRecords().size());
    EXPECT_EQ((WriteTargets{true, true}), result.targets);

    ASSERT_EQ(1u, result.rejected.size());
    EXPECT_EQ(Role::Reviewer, result.rejected.front().role);
    EXPECT_EQ("ADMIN_GARBAGE", result.rejected.front().tag);
    EXPECT_EQ(WorktimeEntity::keyToString(may(2)),
              result.rejected.front().key);
}

TEST_F(MergePropertiesTest, TombstoneFinality) {
    const auto result = WorktimeReconciler::reconcile(
            producerReplica, reviewerReplica, Role::Reviewer);
    // Key 12 only exists as a tombstoned paid leave day on the reviewer
    EXPECT_EQ(nullptr, result.producerOut.find(may(12)));
    EXPECT_EQ(nullptr, result.reviewerOut.find(may(12)));
    // Key 7 was an unreviewed paid leave day the reviewer deleted
    EXPECT_EQ(nullptr, result.producerOut.find(may(7)));
    EXPECT_EQ(nullptr, result.reviewerOut.find(may(7)));

    // Each of them gives exactly one day back
    EXPECT_EQ(std::vector<CounterDelta>({{+1, QuotaKind::PaidLeaveDay},
                                         {+1, QuotaKind::PaidLeaveDay}}),
              result.deltas);
}

TEST_F(MergePropertiesTest, EditPrecedence) {
    const auto result = WorktimeReconciler::reconcile(
            producerReplica, reviewerReplica, Role::Producer);
    // Resurrected over a tombstone, winning over a different review
    for (const unsigned day : {3u, 5u}) {
        const auto* merged = result.producerOut.find(may(day));
        ASSERT_NE(nullptr, merged) << day;
        EXPECT_EQ(*producerReplica.find(may(day)), *merged) << day;
    }
    // An explicit reviewer edit overrides a settled producer record
    EXPECT_EQ(worked(360), result.producerOut.find(may(6))->getPayload());
}

TEST_F(MergePropertiesTest, KeyUnionCompleteness) {
    const auto result = WorktimeReconciler::reconcile(
            producerReplica, reviewerReplica, Role::Producer);

    std::set<Date> keys;
    for (const auto& record : producerReplica.getRecords()) {
        keys.insert(record.getKey());
    }
    for (const auto& record : reviewerReplica.getRecords()) {
        keys.insert(record.getKey());
    }

    std::set<Date> dropped;
    std::set<Date> decided;
    for (const auto& [key, rule] : result.rules) {
        EXPECT_TRUE(decided.insert(key).second) << "decided twice";
        if (rule == MergeRule::TombstoneDropped) {
            dropped.insert(key);
        }
    }
    EXPECT_EQ(keys, decided);

    std::set<Date> merged;
    for (const auto& record : result.merged) {
        EXPECT_TRUE(merged.insert(record.getKey()).second);
    }
    for (const auto& key : keys) {
        EXPECT_NE(merged.count(key) == 1, dropped.count(key) == 1)
                << WorktimeEntity::keyToString(key);
    }
    EXPECT_EQ(std::set<Date>({may(7), may(12)}), dropped);
}

TEST(MergeScenarioTest, UnreviewedInputReachesTheReviewer) {
    const auto input = wt(10, "USER_INPUT", worked(480));
    const auto result = WorktimeReconciler::reconcile(
            producer({input}), reviewer({}), Role::Producer);
    EXPECT_EQ(std::vector<WorktimeRecord>({input}), result.merged);
    EXPECT_TRUE(result.targets.reviewer);
    EXPECT_EQ(reviewer({input}), result.reviewerOut);
    EXPECT_TRUE(result.deltas.empty());
}

TEST(MergeScenarioTest, OpenSessionSurvivesReviewerEdit) {
    const auto open = wt(11, "USER_IN_PROCESS", openSession());
    auto closed = openSession();
    closed.dayEndTime = "17:00";
    const auto result = WorktimeReconciler::reconcile(
            producer({open}),
            reviewer({wt(11, "ADMIN_EDITED", closed)}),
            Role::Reviewer);
    EXPECT_EQ(std::vector<WorktimeRecord>({open}), result.merged);
    EXPECT_EQ(reviewer({open}), result.reviewerOut);
}

TEST(MergeScenarioTest, DeletedPaidLeaveDayIsRestored) {
    const auto result = WorktimeReconciler::reconcile(
            producer({wt(7, "USER_INPUT", paidLeave())}),
            reviewer({wt(7, "ADMIN_BLANK", paidLeave())}),
            Role::Reviewer);
    EXPECT_TRUE(result.merged.empty());
    EXPECT_EQ(std::vector<CounterDelta>({{+1, QuotaKind::PaidLeaveDay}}),
              result.deltas);
    EXPECT_EQ((WriteTargets{true, true}), result.targets);
}

TEST(MergeScenarioTest, EditedPaidLeaveDayResurrects) {
    const auto edited = wt(7, "USER_EDITED", paidLeave());
    const auto result = WorktimeReconciler::reconcile(
            producer({edited}),
            reviewer({wt(7, "ADMIN_BLANK", paidLeave())}),
            Role::Producer);
    EXPECT_EQ(std::vector<WorktimeRecord>({edited}), result.merged);
    EXPECT_EQ("USER_EDITED", result.merged.front().getTag());
    EXPECT_TRUE(result.deltas.empty());
}
