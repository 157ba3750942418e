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

#include <worksync/record.h>
#include <worksync/replica.h>

#include <string>

namespace worksync {

/**
 * The persistence boundary of the engine: loads and stores one role's
 * replica of an (owner, period) record set.
 *
 * Implementations report failures by throwing StoreError.
 */
template <typename Entity>
class ReplicaStore {
public:
    virtual ~ReplicaStore() = default;

    /**
     * Load a replica.
     *
     * @return the stored replica, or an empty one if nothing is stored
     * @throws StoreError if the replica exists but can't be read
     */
    virtual Replica<Entity> load(const std::string& ownerId,
                                 const Period& period,
                                 Role role) = 0;

    /**
     * Replace the stored replica with the given one. A concurrent reader
     * sees either the old or the new content, never a mix.
     *
     * @throws StoreError if the replica can't be written
     */
    virtual void save(const Replica<Entity>& replica) = 0;

    /**
     * Remove a stored replica (a no-op if there is none)
     *
     * @throws StoreError if the replica can't be removed
     */
    virtual void erase(const std::string& ownerId,
                       const Period& period,
                       Role role) = 0;

    /// @return true if a replica is stored for the coordinates
    virtual bool exists(const std::string& ownerId,
                        const Period& period,
                        Role role) = 0;
};

} // namespace worksync
