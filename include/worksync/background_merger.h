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

#include <worksync/entity_kind.h>
#include <worksync/reconcile_service.h>

#include <folly/SharedMutex.h>
#include <folly/Synchronized.h>
#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/futures/Future.h>
#include <memory>
#include <string>
#include <vector>

namespace worksync {

/// The outcome of one entity's reconciliation within a full merge
struct EntityMergeStatus {
    EntityKind kind;
    ReconcileStatus status;
    std::size_t records = 0;
    std::size_t rejected = 0;
    std::string error;
};

/// The outcome of a full-owner merge
struct FullMergeSummary {
    /// @return true if every selected entity was merged
    bool allMerged() const;

    std::string ownerId;
    Period period;
    Role initiator = Role::Producer;
    std::vector<EntityMergeStatus> entities;
};

/**
 * Runs full-owner merges (every selected entity type for an owner's
 * period) in the background, e.g. when a user logs in.
 *
 * The merges run on a folly::CPUThreadPoolExecutor; they take the same
 * owner locks as the interactive edit path so they never race with it.
 */
class BackgroundMerger {
public:
    BackgroundMerger(std::size_t numThreads,
                     ReconcileService<WorktimeEntity>& worktime,
                     ReconcileService<RegisterEntity>& registry,
                     ReconcileService<CheckRegisterEntity>& checkRegister);

    BackgroundMerger(const BackgroundMerger&) = delete;
    BackgroundMerger& operator=(const BackgroundMerger&) = delete;

    ~BackgroundMerger();

    /**
     * Queue a full merge of the owner's period.
     *
     * A failing entity doesn't stop the others; its status in the summary
     * says why it failed.
     *
     * @param entities the entity types to reconcile
     * @return a future for the summary of the merge
     * @throws std::logic_error if the merger has been joined
     */
    folly::SemiFuture<FullMergeSummary> scheduleFullMerge(
            std::string ownerId,
            Period period,
            Role initiator,
            EntitySet entities = allEntities());

    /**
     * Wait for all queued merges to complete and stop the worker threads.
     * Merges scheduled concurrently with join() are either queued before
     * the pool stops (and complete) or rejected with std::logic_error.
     */
    void join();

private:
    FullMergeSummary runFullMerge(const std::string& ownerId,
                                  const Period& period,
                                  Role initiator,
                                  const EntitySet& entities);

    template <typename Entity>
    EntityMergeStatus runEntityMerge(EntityKind kind,
                                     ReconcileService<Entity>& service,
                                     const std::string& ownerId,
                                     const Period& period,
                                     Role initiator);

    ReconcileService<WorktimeEntity>& worktime;
    ReconcileService<RegisterEntity>& registry;
    ReconcileService<CheckRegisterEntity>& checkRegister;
    /// Set by join(); scheduling holds the read lock while queueing
    folly::Synchronized<bool, folly::SharedMutex> joined{false};
    std::unique_ptr<folly::CPUThreadPoolExecutor> pool;
};

} // namespace worksync
