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

#include <worksync/conflict_tracker.h>

#include <fmt/format.h>
#include <logger/logger.h>
#include <stdexcept>

namespace worksync {

ConflictTracker::ConflictTracker(std::size_t threshold) : threshold(threshold) {
    if (threshold == 0) {
        throw std::invalid_argument(
                "ConflictTracker(): threshold must be > 0");
    }
}

std::string ConflictTracker::makeScope(std::string_view entity,
                                       const std::string& ownerId,
                                       const Period& period,
                                       const std::string& key) {
    return fmt::format("{}:{}:{}:{}", entity, ownerId, to_string(period), key);
}

std::size_t ConflictTracker::record(std::string_view entity,
                                    const std::string& ownerId,
                                    const Period& period,
                                    const std::string& key,
                                    MergeRule rule) {
    const auto scope = makeScope(entity, ownerId, period, key);
    const auto streak = streaks.withWLock([&scope, rule](auto& map) {
        if (rule != MergeRule::ProducerEditWins) {
            map.erase(scope);
            return std::size_t(0);
        }
        return ++map[scope];
    });

    if (streak >= threshold) {
        LOG_WARNING_CTX(
                "Standing conflict: producer edit keeps overriding a "
                "different reviewer copy",
                {"entity", entity},
                {"owner", ownerId},
                {"period", to_string(period)},
                {"key", key},
                {"merges", streak});
    }
    return streak;
}

std::size_t ConflictTracker::getStreak(std::string_view entity,
                                       const std::string& ownerId,
                                       const Period& period,
                                       const std::string& key) const {
    const auto scope = makeScope(entity, ownerId, period, key);
    return streaks.withRLock([&scope](const auto& map) -> std::size_t {
        const auto iter = map.find(scope);
        return iter == map.end() ? 0 : iter->second;
    });
}

std::size_t ConflictTracker::size() const {
    return streaks.rlock()->size();
}

} // namespace worksync
