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

#include <worksync/counter_hook.h>
#include <worksync/replica_store.h>
#include <worksync/worksync_error.h>

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace worksync {

/**
 * An in-memory ReplicaStore for the unit tests, with failure injection:
 * a role may be set up to fail its load or its next save(s).
 */
template <typename Entity>
class MockReplicaStore : public ReplicaStore<Entity> {
public:
    Replica<Entity> load(const std::string& ownerId,
                         const Period& period,
                         Role role) override {
        std::lock_guard<std::mutex> guard(mutex);
        ++loads;
        if (failLoad == role) {
            throw StoreError(errc::store_read_failed, "injected load failure");
        }
        const auto iter = replicas.find(makeKey(ownerId, period, role));
        if (iter == replicas.end()) {
            return {ownerId, period, role};
        }
        return iter->second;
    }

    void save(const Replica<Entity>& replica) override {
        std::lock_guard<std::mutex> guard(mutex);
        if (failSave == replica.getRole()) {
            if (failSaveAfter == 0) {
                throw StoreError(errc::store_write_failed,
                                 "injected save failure");
            }
            --failSaveAfter;
        }
        ++saves;
        savedRoles.push_back(replica.getRole());
        const auto key = makeKey(
                replica.getOwnerId(), replica.getPeriod(), replica.getRole());
        replicas.insert_or_assign(key, replica);
    }

    void erase(const std::string& ownerId,
               const Period& period,
               Role role) override {
        std::lock_guard<std::mutex> guard(mutex);
        if (failErase) {
            throw StoreError(errc::store_write_failed,
                             "injected erase failure");
        }
        ++erases;
        replicas.erase(makeKey(ownerId, period, role));
    }

    bool exists(const std::string& ownerId,
                const Period& period,
                Role role) override {
        std::lock_guard<std::mutex> guard(mutex);
        return replicas.count(makeKey(ownerId, period, role)) != 0;
    }

    /// Store a replica directly (bypassing failure injection and counters)
    void put(const Replica<Entity>& replica) {
        std::lock_guard<std::mutex> guard(mutex);
        replicas.insert_or_assign(makeKey(replica.getOwnerId(),
                                          replica.getPeriod(),
                                          replica.getRole()),
                                  replica);
    }

    /// @return the stored replica, if any
    std::optional<Replica<Entity>> get(const std::string& ownerId,
                                       const Period& period,
                                       Role role) {
        std::lock_guard<std::mutex> guard(mutex);
        const auto iter = replicas.find(makeKey(ownerId, period, role));
        if (iter == replicas.end()) {
            return std::nullopt;
        }
        return iter->second;
    }

    std::optional<Role> failLoad;
    std::optional<Role> failSave;
    /// The number of saves of failSave's role to let through first
    int failSaveAfter = 0;
    bool failErase = false;

    int loads = 0;
    int saves = 0;
    int erases = 0;
    std::vector<Role> savedRoles;

private:
    using Key = std::tuple<std::string, int, int, Role>;

    static Key makeKey(const std::string& ownerId,
                       const Period& period,
                       Role role) {
        return {ownerId, period.year, period.month, role};
    }

    std::mutex mutex;
    std::map<Key, Replica<Entity>> replicas;
};

/// A counter hook remembering every delta it was given
class RecordingCounterHook : public CounterAdjustmentHook {
public:
    void adjust(std::string_view entity,
                const std::string& ownerId,
                const Period& period,
                const CounterDelta& delta) override {
        std::lock_guard<std::mutex> guard(mutex);
        calls.push_back({std::string{entity}, ownerId, period, delta});
        if (throwOnAdjust) {
            throw std::runtime_error("injected hook failure");
        }
    }

    struct Call {
        std::string entity;
        std::string ownerId;
        Period period;
        CounterDelta delta;
    };

    std::vector<Call> calls;
    bool throwOnAdjust = false;

private:
    std::mutex mutex;
};

} // namespace worksync
