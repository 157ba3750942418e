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

#include <worksync/background_merger.h>

#include <folly/executors/thread_factory/NamedThreadFactory.h>
#include <logger/logger.h>
#include <algorithm>
#include <stdexcept>

namespace worksync {

bool FullMergeSummary::allMerged() const {
    return std::ranges::all_of(entities, [](const auto& e) {
        return e.status == ReconcileStatus::Merged;
    });
}

BackgroundMerger::BackgroundMerger(
        std::size_t numThreads,
        ReconcileService<WorktimeEntity>& worktime,
        ReconcileService<RegisterEntity>& registry,
        ReconcileService<CheckRegisterEntity>& checkRegister)
    : worktime(worktime), registry(registry), checkRegister(checkRegister) {
    if (numThreads == 0) {
        throw std::invalid_argument(
                "BackgroundMerger(): numThreads must be > 0");
    }
    pool = std::make_unique<folly::CPUThreadPoolExecutor>(
            numThreads, std::make_shared<folly::NamedThreadFactory>("ws:bg:"));
}

BackgroundMerger::~BackgroundMerger() {
    join();
}

void BackgroundMerger::join() {
    {
        auto locked = joined.wlock();
        if (*locked) {
            return;
        }
        *locked = true;
    }
    pool->join();
}

folly::SemiFuture<FullMergeSummary> BackgroundMerger::scheduleFullMerge(
        std::string ownerId, Period period, Role initiator, EntitySet entities) {
    // Held until the task is queued so join() can't stop the pool between
    // the check and the add
    auto locked = joined.rlock();
    if (*locked) {
        throw std::logic_error(
                "BackgroundMerger::scheduleFullMerge: merger has been joined");
    }

    auto [promise, future] = folly::makePromiseContract<FullMergeSummary>();
    pool->add([this,
               ownerId = std::move(ownerId),
               period,
               initiator,
               entities,
               promise = std::move(promise)]() mutable {
        promise.setWith([&] {
            return runFullMerge(ownerId, period, initiator, entities);
        });
    });
    return std::move(future);
}

FullMergeSummary BackgroundMerger::runFullMerge(const std::string& ownerId,
                                                const Period& period,
                                                Role initiator,
                                                const EntitySet& entities) {
    FullMergeSummary summary;
    summary.ownerId = ownerId;
    summary.period = period;
    summary.initiator = initiator;

    if (isSelected(entities, EntityKind::Worktime)) {
        summary.entities.push_back(runEntityMerge(
                EntityKind::Worktime, worktime, ownerId, period, initiator));
    }
    if (isSelected(entities, EntityKind::Register)) {
        summary.entities.push_back(runEntityMerge(
                EntityKind::Register, registry, ownerId, period, initiator));
    }
    if (isSelected(entities, EntityKind::CheckRegister)) {
        summary.entities.push_back(runEntityMerge(EntityKind::CheckRegister,
                                                  checkRegister,
                                                  ownerId,
                                                  period,
                                                  initiator));
    }

    LOG_INFO("Full merge of {} {} by {}: {}",
             ownerId,
             to_string(period),
             to_string(initiator),
             summary.allMerged() ? "merged" : "incomplete");
    return summary;
}

template <typename Entity>
EntityMergeStatus BackgroundMerger::runEntityMerge(
        EntityKind kind,
        ReconcileService<Entity>& service,
        const std::string& ownerId,
        const Period& period,
        Role initiator) {
    EntityMergeStatus status{kind, ReconcileStatus::NotMerged};
    try {
        const auto report = service.reconcile(ownerId, period, initiator);
        status.status = report.status;
        status.records = report.merged.size();
        status.rejected = report.rejected.size();
        status.error = report.error;
    } catch (const std::exception& e) {
        LOG_ERROR_CTX("Background merge failed",
                      {"entity", to_string(kind)},
                      {"owner", ownerId},
                      {"period", to_string(period)},
                      {"error", e.what()});
        status.error = e.what();
    }
    return status;
}

} // namespace worksync
