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

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace worksync {

/**
 * The canonical synchronisation states a record may be in. Every entity
 * type has its own vocabulary of wire tags (USER_EDITED, TL_EDITED, ...)
 * which maps onto these values; the merge rules only ever look at the
 * canonical value.
 */
enum class SyncStatus : uint8_t {
    /// Freshly created by the producer, not yet reviewed
    Input,
    /// The producer is still building the record (e.g. an open session)
    InProgress,
    /// The producer changed a record which had been reviewed or converged
    EditedByProducer,
    /// Converged; the producer accepted the reviewer's version
    AckDone,
    /// The reviewer changed the content of the record
    EditedByReviewer,
    /// The reviewer marked the record for deletion
    Tombstone,
    /// The reviewer processed the record without changing it
    ReviewDone
};

std::string to_string(SyncStatus status);
std::ostream& operator<<(std::ostream& os, SyncStatus status);

/**
 * The closed set of wire tags an entity type understands, and the
 * canonical status each of them maps to.
 *
 * More than one tag may map to the same status; the first tag listed for
 * a status is the one the engine writes when it assigns that status.
 * A vocabulary does not need to cover every status (the register entities
 * have no notion of a record in progress).
 */
class StatusVocabulary {
public:
    struct Entry {
        std::string_view tag;
        SyncStatus status;
    };

    StatusVocabulary(std::string name, std::initializer_list<Entry> entries);

    /**
     * Map a wire tag to its canonical status.
     *
     * @throws UnknownTagError if the tag isn't part of the vocabulary
     */
    SyncStatus classify(std::string_view tag) const;

    /// @return true if the tag is part of the vocabulary
    bool contains(std::string_view tag) const;

    /// @return true if some tag of the vocabulary maps to the status
    bool supports(SyncStatus status) const;

    /**
     * Get the tag to write for the given status.
     *
     * @throws std::invalid_argument if the vocabulary has no tag for status
     */
    const std::string& tagFor(SyncStatus status) const;

    const std::string& getName() const {
        return name;
    }

    const std::vector<std::pair<std::string, SyncStatus>>& getEntries()
            const {
        return entries;
    }

private:
    const std::string name;
    std::vector<std::pair<std::string, SyncStatus>> entries;
};

} // namespace worksync
