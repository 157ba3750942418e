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

#include <worksync/check_register_entity.h>
#include <worksync/conflict_tracker.h>
#include <worksync/counter_hook.h>
#include <worksync/owner_lock_registry.h>
#include <worksync/register_entity.h>
#include <worksync/replica_store.h>
#include <worksync/set_reconciler.h>
#include <worksync/worksync_error.h>
#include <worksync/worktime_entity.h>

#include <fmt/format.h>
#include <logger/logger.h>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace worksync {

enum class ReconcileStatus : uint8_t {
    /// The merged set was committed to every write target
    Merged,
    /// Nothing was committed; the caller should retry on next access
    NotMerged
};

std::string to_string(ReconcileStatus status);
std::ostream& operator<<(std::ostream& os, ReconcileStatus status);

/// What a reconciliation of one (owner, period) did
template <typename Entity>
struct ReconcileReport {
    using RecordType = typename Entity::RecordType;

    bool isMerged() const {
        return status == ReconcileStatus::Merged;
    }

    ReconcileStatus status = ReconcileStatus::NotMerged;
    std::vector<RecordType> merged;
    std::vector<CounterDelta> deltas;
    std::vector<RejectedRecord> rejected;
    /// The replicas which were written
    WriteTargets written;
    /// The reason the period wasn't merged
    std::string error;
};

/**
 * The call-site of the reconciliation engine for one entity type: loads
 * the two replicas of an (owner, period) under the owner lock, reconciles
 * them and commits the result.
 *
 * A reconciliation either commits every write target or leaves both
 * replicas as they were. The counter deltas are delivered to the hook, and
 * the conflict tracker is updated, only once everything is committed.
 */
template <typename Entity>
class ReconcileService {
public:
    using RecordType = typename Entity::RecordType;
    using Report = ReconcileReport<Entity>;
    using ModifyFunction = std::function<Replica<Entity>(Replica<Entity>)>;

    ReconcileService(ReplicaStore<Entity>& store,
                     OwnerLockRegistry& locks,
                     CounterAdjustmentHook& hook,
                     ConflictTracker& conflicts)
        : store(store), locks(locks), hook(hook), conflicts(conflicts) {
    }

    /**
     * Load a replica for display (under the shared owner lock)
     *
     * @throws StoreError if the replica can't be loaded
     */
    Replica<Entity> load(const std::string& ownerId,
                         const Period& period,
                         Role role) {
        auto lock = locks.lockShared(ownerId);
        return store.load(ownerId, period, role);
    }

    /**
     * Apply an interactive edit to one replica: load it, pass it to fn and
     * save what fn returns, all under the exclusive owner lock.
     *
     * @return the saved replica
     * @throws StoreError if the replica can't be loaded or saved
     * @throws std::invalid_argument if fn returns a replica of other
     *         coordinates
     */
    Replica<Entity> modify(const std::string& ownerId,
                           const Period& period,
                           Role role,
                           const ModifyFunction& fn) {
        auto lock = locks.lockExclusive(ownerId);
        auto replica = fn(store.load(ownerId, period, role));
        if (replica.getOwnerId() != ownerId ||
            !(replica.getPeriod() == period) || replica.getRole() != role) {
            throw std::invalid_argument(fmt::format(
                    "ReconcileService<{}>::modify: edit of {}/{}/{} returned "
                    "{}/{}/{}",
                    Entity::name,
                    ownerId,
                    to_string(period),
                    to_string(role),
                    replica.getOwnerId(),
                    to_string(replica.getPeriod()),
                    to_string(replica.getRole())));
        }
        store.save(replica);
        return replica;
    }

    /**
     * Reconcile the producer and reviewer replica of the owner's period.
     *
     * StoreError never escapes; a load or save failure is reported as
     * NotMerged with both replicas left as they were.
     *
     * @param initiator the role whose access triggered the reconciliation;
     *                  its replica is always rewritten with the merged set
     */
    Report reconcile(const std::string& ownerId,
                     const Period& period,
                     Role initiator) {
        auto lock = locks.lockExclusive(ownerId);
        return reconcileLocked(lock, ownerId, period, initiator);
    }

    std::string_view getEntityName() const {
        return Entity::name;
    }

private:
    Report reconcileLocked(const OwnerLockRef&,
                           const std::string& ownerId,
                           const Period& period,
                           Role initiator);

    /// Save the replica; returns the error text on failure
    std::optional<std::string> trySave(const Replica<Entity>& replica);

    /// Put a replica back to the state before the reconciliation
    void restore(const Replica<Entity>& original, bool existed);

    Report notMerged(const std::string& ownerId,
                     const Period& period,
                     std::string error) const;

    ReplicaStore<Entity>& store;
    OwnerLockRegistry& locks;
    CounterAdjustmentHook& hook;
    ConflictTracker& conflicts;
};

template <typename Entity>
typename ReconcileService<Entity>::Report
ReconcileService<Entity>::reconcileLocked(const OwnerLockRef&,
                                          const std::string& ownerId,
                                          const Period& period,
                                          Role initiator) {
    std::optional<Replica<Entity>> producer;
    std::optional<Replica<Entity>> reviewer;
    bool producerExisted = false;
    bool reviewerExisted = false;
    try {
        producerExisted = store.exists(ownerId, period, Role::Producer);
        reviewerExisted = store.exists(ownerId, period, Role::Reviewer);
        producer = store.load(ownerId, period, Role::Producer);
        reviewer = store.load(ownerId, period, Role::Reviewer);
    } catch (const StoreError& e) {
        return notMerged(ownerId, period, e.what());
    }

    auto result = SetReconciler<Entity>::reconcile(
            *producer, *reviewer, initiator);

    // Write the initiator first, then the other side if it was stale
    const auto other = opposite(initiator);
    std::vector<Role> order;
    if (result.targets.contains(initiator)) {
        order.push_back(initiator);
    }
    if (result.targets.contains(other)) {
        order.push_back(other);
    }

    auto output = [&result](Role role) -> const Replica<Entity>& {
        return role == Role::Producer ? result.producerOut
                                      : result.reviewerOut;
    };
    auto original = [&producer, &reviewer](Role role) -> const Replica<Entity>& {
        return role == Role::Producer ? *producer : *reviewer;
    };
    auto existed = [producerExisted, reviewerExisted](Role role) {
        return role == Role::Producer ? producerExisted : reviewerExisted;
    };

    std::vector<Role> written;
    for (const auto role : order) {
        auto error = trySave(output(role));
        if (error) {
            // Undo what we've written so far
            for (const auto done : written) {
                restore(original(done), existed(done));
            }
            return notMerged(ownerId, period, *error);
        }
        written.push_back(role);
    }

    // Committed
    for (const auto& delta : result.deltas) {
        try {
            hook.adjust(Entity::name, ownerId, period, delta);
        } catch (const std::exception& e) {
            LOG_ERROR_CTX("Counter adjustment hook failed",
                          {"entity", Entity::name},
                          {"owner", ownerId},
                          {"period", to_string(period)},
                          {"delta", to_string(delta)},
                          {"error", e.what()});
        }
    }
    for (const auto& [key, rule] : result.rules) {
        conflicts.record(Entity::name,
                         ownerId,
                         period,
                         Entity::keyToString(key),
                         rule);
    }

    LOG_INFO_CTX("Reconciled",
                 {"entity", Entity::name},
                 {"owner", ownerId},
                 {"period", to_string(period)},
                 {"initiator", to_string(initiator)},
                 {"records", result.merged.size()},
                 {"deltas", result.deltas.size()},
                 {"rejected", result.rejected.size()},
                 {"written", to_string(result.targets)});

    Report report;
    report.status = ReconcileStatus::Merged;
    report.merged = std::move(result.merged);
    report.deltas = std::move(result.deltas);
    report.rejected = std::move(result.rejected);
    report.written = result.targets;
    return report;
}

template <typename Entity>
std::optional<std::string> ReconcileService<Entity>::trySave(
        const Replica<Entity>& replica) {
    try {
        store.save(replica);
    } catch (const StoreError& e) {
        return std::string{e.what()};
    }
    return {};
}

template <typename Entity>
void ReconcileService<Entity>::restore(const Replica<Entity>& original,
                                       bool existed) {
    try {
        if (existed) {
            store.save(original);
        } else {
            store.erase(original.getOwnerId(),
                        original.getPeriod(),
                        original.getRole());
        }
    } catch (const StoreError& e) {
        LOG_CRITICAL_CTX("Failed to restore replica after a failed "
                         "reconciliation, replicas are inconsistent",
                         {"entity", Entity::name},
                         {"owner", original.getOwnerId()},
                         {"period", to_string(original.getPeriod())},
                         {"role", to_string(original.getRole())},
                         {"error", e.what()});
    }
}

template <typename Entity>
typename ReconcileService<Entity>::Report ReconcileService<Entity>::notMerged(
        const std::string& ownerId,
        const Period& period,
        std::string error) const {
    LOG_WARNING_CTX("Reconciliation not committed",
                    {"entity", Entity::name},
                    {"owner", ownerId},
                    {"period", to_string(period)},
                    {"error", error});
    Report report;
    report.status = ReconcileStatus::NotMerged;
    report.error = std::move(error);
    return report;
}

extern template class ReconcileService<WorktimeEntity>;
extern template class ReconcileService<RegisterEntity>;
extern template class ReconcileService<CheckRegisterEntity>;

} // namespace worksync
