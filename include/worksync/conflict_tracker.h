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

#include <worksync/merge_types.h>
#include <worksync/record.h>

#include <folly/Synchronized.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace worksync {

/**
 * Tracks standing conflicts: keys where an unresolved producer edit keeps
 * winning over a differing reviewer copy merge after merge.
 *
 * For every (entity, owner, period, key) the tracker counts the consecutive
 * committed merges in which the ProducerEditWins rule decided the key. Any
 * other rule resets the count. Once the count reaches the threshold a
 * warning is logged for that merge and every further one. A standing
 * conflict is never an error; it needs a human to re-review the record.
 *
 * The tracker only holds entries for keys currently in conflict.
 */
class ConflictTracker {
public:
    /**
     * @param threshold the streak length which triggers the warning (> 0)
     * @throws std::invalid_argument if threshold is 0
     */
    explicit ConflictTracker(std::size_t threshold);

    /**
     * Record the rule which decided a key in a committed merge.
     *
     * @return the current streak of the key (0 if the rule wasn't
     *         ProducerEditWins)
     */
    std::size_t record(std::string_view entity,
                       const std::string& ownerId,
                       const Period& period,
                       const std::string& key,
                       MergeRule rule);

    /// @return the current streak of the key
    std::size_t getStreak(std::string_view entity,
                          const std::string& ownerId,
                          const Period& period,
                          const std::string& key) const;

    std::size_t getThreshold() const {
        return threshold;
    }

    /// @return the number of keys currently in conflict
    std::size_t size() const;

private:
    static std::string makeScope(std::string_view entity,
                                 const std::string& ownerId,
                                 const Period& period,
                                 const std::string& key);

    const std::size_t threshold;
    folly::Synchronized<std::unordered_map<std::string, std::size_t>> streaks;
};

} // namespace worksync
