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
#include <worksync/merge_table.h>
#include <worksync/worksync_error.h>

#include "../mock/test_records.h"

using namespace worksync;
using namespace worksync::test;

using WorktimeTable = MergeTable<WorktimeEntity>;
using RegisterTable = MergeTable<RegisterEntity>;
using CheckTable = MergeTable<CheckRegisterEntity>;

class WorktimeMergeTableTest : public ::testing::Test {
protected:
    static WorktimeTable::Outcome merge(const WorktimeRecord* p,
                                        const WorktimeRecord* r) {
        return WorktimeTable::merge(may(10), p, r);
    }
};

TEST_F(WorktimeMergeTableTest, InProgressIgnoresReviewer) {
    const auto p = wt(10, "USER_IN_PROCESS", openSession());
    for (const auto* tag : {"ADMIN_EDITED", "ADMIN_BLANK", "ADMIN_DONE"}) {
        const auto r = wt(10, tag);
        const auto outcome = merge(&p, &r);
        ASSERT_FALSE(outcome.isDrop()) << tag;
        EXPECT_EQ(p, outcome.getRecord()) << tag;
        EXPECT_EQ(MergeRule::InProgressKept, outcome.getRule()) << tag;
    }
    const auto outcome = merge(&p, nullptr);
    EXPECT_EQ(p, outcome.getRecord());
    EXPECT_EQ(MergeRule::InProgressKept, outcome.getRule());
}

TEST_F(WorktimeMergeTableTest, ProducerEditResurrectsTombstone) {
    const auto p = wt(10, "USER_EDITED", worked(420));
    const auto r = wt(10, "ADMIN_BLANK");
    const auto outcome = merge(&p, &r);
    ASSERT_FALSE(outcome.isDrop());
    EXPECT_EQ(p, outcome.getRecord());
    EXPECT_EQ("USER_EDITED", outcome.getRecord().getTag());
    EXPECT_EQ(MergeRule::ProducerResurrects, outcome.getRule());
}

TEST_F(WorktimeMergeTableTest, ProducerEditEqualToReviewerConverges) {
    const auto p = wt(10, "USER_EDITED", worked(420));
    const auto r = wt(10, "ADMIN_DONE", worked(420));
    const auto outcome = merge(&p, &r);
    EXPECT_EQ(p.withTag("USER_DONE"), outcome.getRecord());
    EXPECT_EQ(MergeRule::ProducerAcknowledged, outcome.getRule());
}

TEST_F(WorktimeMergeTableTest, ProducerEditWinsOverDifferingReviewer) {
    const auto p = wt(10, "USER_EDITED", worked(420));
    for (const auto* tag : {"ADMIN_EDITED", "ADMIN_DONE", "USER_DONE"}) {
        const auto r = wt(10, tag, worked(480));
        const auto outcome = merge(&p, &r);
        EXPECT_EQ(p, outcome.getRecord()) << tag;
        EXPECT_EQ(MergeRule::ProducerEditWins, outcome.getRule()) << tag;
    }
}

TEST_F(WorktimeMergeTableTest, ReviewerEditApplied) {
    const auto r = wt(10, "ADMIN_EDITED", worked(300));
    for (const auto* tag : {"USER_INPUT", "USER_DONE"}) {
        const auto p = wt(10, tag, worked(480));
        const auto outcome = merge(&p, &r);
        EXPECT_EQ(r.withTag("USER_DONE"), outcome.getRecord()) << tag;
        EXPECT_EQ(MergeRule::ReviewerEditApplied, outcome.getRule()) << tag;
    }

    // A reviewer edit of a key the producer doesn't have
    const auto outcome = merge(nullptr, &r);
    EXPECT_EQ(r.withTag("USER_DONE"), outcome.getRecord());
    EXPECT_EQ(MergeRule::ReviewerEditApplied, outcome.getRule());
}

TEST_F(WorktimeMergeTableTest, TombstoneDrops) {
    const auto r = wt(10, "ADMIN_BLANK");
    for (const auto* tag : {"USER_INPUT", "USER_DONE"}) {
        const auto p = wt(10, tag);
        const auto outcome = merge(&p, &r);
        EXPECT_TRUE(outcome.isDrop()) << tag;
        EXPECT_EQ(MergeRule::TombstoneDropped, outcome.getRule()) << tag;
        EXPECT_THROW(outcome.getRecord(), std::logic_error);
    }
    const auto outcome = merge(nullptr, &r);
    EXPECT_TRUE(outcome.isDrop());
    EXPECT_EQ(MergeRule::TombstoneDropped, outcome.getRule());
}

TEST_F(WorktimeMergeTableTest, ProducerOnlyPassesThrough) {
    for (const auto* tag : {"USER_INPUT", "USER_EDITED"}) {
        const auto p = wt(10, tag);
        const auto outcome = merge(&p, nullptr);
        EXPECT_EQ(p, outcome.getRecord()) << tag;
        EXPECT_EQ(MergeRule::ProducerOnly, outcome.getRule()) << tag;
    }
}

TEST_F(WorktimeMergeTableTest, ReviewerIntroducedRecord) {
    const auto r = wt(10, "ADMIN_DONE");
    const auto outcome = merge(nullptr, &r);
    EXPECT_EQ(r.withTag("USER_DONE"), outcome.getRecord());
    EXPECT_EQ(MergeRule::ReviewerIntroduced, outcome.getRule());
}

TEST_F(WorktimeMergeTableTest, FallbackSettlesTheTag) {
    {
        const auto p = wt(10, "USER_INPUT", worked(480));
        const auto r = wt(10, "ADMIN_DONE", worked(300));
        const auto outcome = merge(&p, &r);
        EXPECT_EQ(p.withTag("USER_DONE"), outcome.getRecord());
        EXPECT_EQ(MergeRule::Fallback, outcome.getRule());
    }
    {
        const auto p = wt(10, "USER_DONE");
        const auto outcome = merge(&p, nullptr);
        EXPECT_EQ(p, outcome.getRecord());
        EXPECT_EQ(MergeRule::Fallback, outcome.getRule());
    }
    {
        const auto r = wt(10, "USER_INPUT");
        const auto outcome = merge(nullptr, &r);
        EXPECT_EQ(r.withTag("USER_DONE"), outcome.getRecord());
        EXPECT_EQ(MergeRule::Fallback, outcome.getRule());
    }
}

TEST_F(WorktimeMergeTableTest, DroppedPaidLeaveGivesTheDayBack) {
    const auto p = wt(10, "USER_INPUT", paidLeave());
    const auto r = wt(10, "ADMIN_BLANK", paidLeave());
    const auto outcome = merge(&p, &r);
    EXPECT_TRUE(outcome.isDrop());
    EXPECT_EQ(std::vector<CounterDelta>({{+1, QuotaKind::PaidLeaveDay}}),
              outcome.getDeltas());
}

TEST_F(WorktimeMergeTableTest, ReviewerTurnsDayIntoPaidLeave) {
    const auto p = wt(10, "USER_DONE", worked(480));
    const auto r = wt(10, "ADMIN_EDITED", paidLeave());
    const auto outcome = merge(&p, &r);
    EXPECT_EQ(std::vector<CounterDelta>({{-1, QuotaKind::PaidLeaveDay}}),
              outcome.getDeltas());
}

TEST_F(WorktimeMergeTableTest, ReviewerChangesTimeOffType) {
    const auto p = wt(10, "USER_DONE", paidLeave());
    const auto r = wt(10, "ADMIN_EDITED", timeOff("CM"));
    const auto outcome = merge(&p, &r);
    EXPECT_EQ(std::vector<CounterDelta>({{+1, QuotaKind::PaidLeaveDay}}),
              outcome.getDeltas());
}

TEST_F(WorktimeMergeTableTest, NoDeltaWhileConsumptionIsUnchanged) {
    {
        const auto p = wt(10, "USER_DONE", paidLeave());
        const auto r = wt(10, "ADMIN_DONE", paidLeave());
        EXPECT_TRUE(merge(&p, &r).getDeltas().empty());
    }
    {
        // The reviewer copy is what the owner had consumed
        const auto r = wt(10, "ADMIN_DONE", paidLeave());
        EXPECT_TRUE(merge(nullptr, &r).getDeltas().empty());
    }
    {
        const auto p = wt(10, "USER_INPUT", worked(480));
        const auto r = wt(10, "ADMIN_BLANK", worked(480));
        EXPECT_TRUE(merge(&p, &r).getDeltas().empty());
    }
}

TEST_F(WorktimeMergeTableTest, UnknownTagFailsTheKey) {
    const auto good = wt(10, "ADMIN_DONE");
    const auto bad = wt(10, "USER_GUESSED");
    EXPECT_THROW(merge(&bad, &good), UnknownTagError);
    EXPECT_THROW(merge(&bad, nullptr), UnknownTagError);
    EXPECT_THROW(merge(nullptr, &bad), UnknownTagError);
    EXPECT_THROW(merge(&good, &bad), UnknownTagError);

    // An open session is kept without looking at the reviewer record
    const auto inProgress = wt(10, "USER_IN_PROCESS", openSession());
    const auto outcome = merge(&inProgress, &bad);
    EXPECT_EQ(MergeRule::InProgressKept, outcome.getRule());
    EXPECT_EQ(inProgress, outcome.getRecord());

    const auto untagged = wt(10, "");
    EXPECT_THROW(merge(&untagged, nullptr), UnknownTagError);
}

TEST_F(WorktimeMergeTableTest, InvalidArguments) {
    EXPECT_THROW(merge(nullptr, nullptr), std::invalid_argument);
    const auto other = wt(11, "USER_INPUT");
    EXPECT_THROW(merge(&other, nullptr), std::invalid_argument);
    EXPECT_THROW(merge(nullptr, &other), std::invalid_argument);
}

TEST(RegisterMergeTableTest, NoInProgressTag) {
    const auto p = reg(1, "USER_IN_PROCESS", order(2, "A-1"));
    EXPECT_THROW(RegisterTable::merge(1, &p, nullptr), UnknownTagError);
}

TEST(RegisterMergeTableTest, RulesApply) {
    const auto p = reg(1, "USER_EDITED", order(2, "A-1"));
    const auto r = reg(1, "ADMIN_DONE", order(2, "A-1"));
    const auto outcome = RegisterTable::merge(1, &p, &r);
    EXPECT_EQ(p.withTag("USER_DONE"), outcome.getRecord());
    EXPECT_EQ(MergeRule::ProducerAcknowledged, outcome.getRule());
    EXPECT_TRUE(outcome.getDeltas().empty());
}

TEST(CheckRegisterMergeTableTest, SynonymsAreProducerEdits) {
    const auto r = chk(4, "ADMIN_DONE", check(3, "B-7"));
    for (const auto* tag : {"TL_EDITED", "USER_EDITED"}) {
        const auto p = chk(4, tag, check(3, "B-7"));
        const auto outcome = CheckTable::merge(4, &p, &r);
        EXPECT_EQ(p.withTag("CHECKING_DONE"), outcome.getRecord()) << tag;
        EXPECT_EQ(MergeRule::ProducerAcknowledged, outcome.getRule()) << tag;
    }
}

TEST(CheckRegisterMergeTableTest, ReviewerEditSettlesWithCheckingDone) {
    auto edited = check(3, "B-7");
    edited.errorDescription = "wrong bleed";
    const auto p = chk(4, "CHECKING_INPUT", check(3, "B-7"));
    const auto r = chk(4, "ADMIN_EDITED", edited);
    const auto outcome = CheckTable::merge(4, &p, &r);
    EXPECT_EQ(r.withTag("CHECKING_DONE"), outcome.getRecord());
}

TEST(MergeTypes, to_string) {
    EXPECT_EQ("in_progress_kept", to_string(MergeRule::InProgressKept));
    EXPECT_EQ("producer_edit_wins", to_string(MergeRule::ProducerEditWins));
    EXPECT_EQ("fallback", to_string(MergeRule::Fallback));
    EXPECT_EQ(4, int(MergeRule::ProducerEditWins));
    EXPECT_EQ("paid_leave_day", to_string(QuotaKind::PaidLeaveDay));
    EXPECT_EQ("+1 paid_leave_day",
              to_string(CounterDelta{+1, QuotaKind::PaidLeaveDay}));
    EXPECT_EQ("-1 paid_leave_day",
              to_string(CounterDelta{-1, QuotaKind::PaidLeaveDay}));
}
