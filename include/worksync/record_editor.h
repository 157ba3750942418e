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
#include <worksync/sync_status.h>

#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace worksync {

/**
 * The edit operations of the two roles. Every operation returns a new
 * Record carrying the tag the operation implies; the merge rule table is
 * the only other place choosing tags.
 */
template <typename Entity>
class RecordEditor {
public:
    using RecordType = typename Entity::RecordType;
    using Key = typename RecordType::Key;
    using Payload = typename RecordType::Payload;

    explicit RecordEditor(Role role) : role(role) {
    }

    Role getRole() const {
        return role;
    }

    /// Producer: a new record (INPUT)
    RecordType create(Key key, std::string ownerId, Payload payload) const {
        requireRole(Role::Producer, "create");
        return {std::move(key),
                std::move(ownerId),
                std::move(payload),
                tag(SyncStatus::Input)};
    }

    /**
     * Producer: a new record which is still being built (e.g. the work day
     * of an open session)
     *
     * @throws std::invalid_argument if the entity has no in progress tag
     */
    RecordType beginInProgress(Key key,
                               std::string ownerId,
                               Payload payload) const {
        requireRole(Role::Producer, "beginInProgress");
        return {std::move(key),
                std::move(ownerId),
                std::move(payload),
                tag(SyncStatus::InProgress)};
    }

    /// Producer: finish an in progress record, it becomes INPUT
    RecordType complete(const RecordType& record, Payload payload) const {
        requireRole(Role::Producer, "complete");
        if (status(record) != SyncStatus::InProgress) {
            throw std::invalid_argument(fmt::format(
                    "RecordEditor<{}>::complete: record {} is {}, not in "
                    "progress",
                    Entity::name,
                    Entity::keyToString(record.getKey()),
                    record.getTag()));
        }
        return record.withPayload(std::move(payload), tag(SyncStatus::Input));
    }

    /**
     * Change the content of a record.
     *
     * A producer edit of an unreviewed (INPUT) or in progress record keeps
     * its tag; any other record becomes EDITED_BY_PRODUCER. A reviewer edit
     * always becomes EDITED_BY_REVIEWER.
     */
    RecordType edit(const RecordType& record, Payload payload) const {
        if (role == Role::Reviewer) {
            return record.withPayload(std::move(payload),
                                      tag(SyncStatus::EditedByReviewer));
        }
        const auto current = status(record);
        if (current == SyncStatus::Input || current == SyncStatus::InProgress) {
            return record.withPayload(std::move(payload), record.getTag());
        }
        return record.withPayload(std::move(payload),
                                  tag(SyncStatus::EditedByProducer));
    }

    /// Reviewer: mark the record for deletion. The payload is kept so the
    /// quota it consumed can be given back when the key is dropped
    RecordType tombstone(const RecordType& record) const {
        requireRole(Role::Reviewer, "tombstone");
        return record.withTag(tag(SyncStatus::Tombstone));
    }

    /// Reviewer: processed without changing the content
    RecordType signOff(const RecordType& record) const {
        requireRole(Role::Reviewer, "signOff");
        return record.withTag(tag(SyncStatus::ReviewDone));
    }

private:
    void requireRole(Role required, const char* operation) const {
        if (role != required) {
            throw std::invalid_argument(
                    fmt::format("RecordEditor<{}>::{}: not allowed for the {}",
                                Entity::name,
                                operation,
                                to_string(role)));
        }
    }

    static const std::string& tag(SyncStatus status) {
        return Entity::vocabulary().tagFor(status);
    }

    static SyncStatus status(const RecordType& record) {
        return Entity::vocabulary().classify(record.getTag());
    }

    const Role role;
};

} // namespace worksync
