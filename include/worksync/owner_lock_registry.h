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

#include <folly/SharedMutex.h>
#include <folly/lang/Hint.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>

namespace worksync {

/**
 * The per-owner read/write locks serialising reconciliation and replica
 * mutation for an owner.
 *
 * The registry holds a fixed number of folly::SharedMutex shards and maps
 * an owner onto one of them by hash, so memory use doesn't grow with the
 * number of owners. Two owners may share a shard; that only costs
 * concurrency, never correctness.
 *
 * The locks are not reentrant: a thread holding the lock of an owner must
 * not request it again (not even in shared mode), and must not hold the
 * locks of two owners at the same time.
 */
class OwnerLockRegistry {
public:
    /**
     * @param shards the number of locks (must be > 0)
     * @throws std::invalid_argument if shards is 0
     */
    explicit OwnerLockRegistry(std::size_t shards);

    /// Lock the owner for reading (e.g. to display a replica)
    std::shared_lock<folly::SharedMutex> lockShared(std::string_view ownerId);

    /// Lock the owner for writing (reconciliation, edits)
    std::unique_lock<folly::SharedMutex> lockExclusive(
            std::string_view ownerId);

    std::size_t getNumShards() const {
        return numShards;
    }

    /// @return the index of the shard protecting the owner
    std::size_t getShard(std::string_view ownerId) const;

private:
    const std::size_t numShards;
    std::unique_ptr<folly::SharedMutex[]> mutexes;
};

/**
 * An opaque reference to a shared or exclusive owner lock.
 *
 * Functions which must only be called with the owner lock held take an
 * OwnerLockRef, which gives the same level of assurance as passing the lock
 * holder by const&. The lock must outlive the reference.
 */
class OwnerLockRef {
public:
    OwnerLockRef(const std::shared_lock<folly::SharedMutex>& rhl) : ptr(&rhl) {
    }

    OwnerLockRef(const std::unique_lock<folly::SharedMutex>& whl) : ptr(&whl) {
    }

    OwnerLockRef(const OwnerLockRef&) = default;
    OwnerLockRef& operator=(const OwnerLockRef&) = default;

    ~OwnerLockRef() noexcept {
        // "Touch" the memory of the lock object so ASan can detect a
        // use-after-free of the lock used to create this instance.
        folly::compiler_must_not_elide(*reinterpret_cast<const char*>(ptr));
    }

private:
    const void* ptr;
};

} // namespace worksync
