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

#include <worksync/owner_lock_registry.h>

#include <functional>
#include <stdexcept>

namespace worksync {

OwnerLockRegistry::OwnerLockRegistry(std::size_t shards)
    : numShards(shards) {
    if (numShards == 0) {
        throw std::invalid_argument(
                "OwnerLockRegistry(): the number of shards must be > 0");
    }
    mutexes = std::make_unique<folly::SharedMutex[]>(numShards);
}

std::size_t OwnerLockRegistry::getShard(std::string_view ownerId) const {
    return std::hash<std::string_view>{}(ownerId) % numShards;
}

std::shared_lock<folly::SharedMutex> OwnerLockRegistry::lockShared(
        std::string_view ownerId) {
    return std::shared_lock<folly::SharedMutex>(mutexes[getShard(ownerId)]);
}

std::unique_lock<folly::SharedMutex> OwnerLockRegistry::lockExclusive(
        std::string_view ownerId) {
    return std::unique_lock<folly::SharedMutex>(mutexes[getShard(ownerId)]);
}

} // namespace worksync
