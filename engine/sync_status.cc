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

#include <worksync/sync_status.h>
#include <worksync/worksync_error.h>

#include <fmt/format.h>
#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace worksync {

std::string to_string(SyncStatus status) {
    switch (status) {
    case SyncStatus::Input:
        return "INPUT";
    case SyncStatus::InProgress:
        return "IN_PROGRESS";
    case SyncStatus::EditedByProducer:
        return "EDITED_BY_PRODUCER";
    case SyncStatus::AckDone:
        return "ACK_DONE";
    case SyncStatus::EditedByReviewer:
        return "EDITED_BY_REVIEWER";
    case SyncStatus::Tombstone:
        return "TOMBSTONE";
    case SyncStatus::ReviewDone:
        return "REVIEW_DONE";
    }
    throw std::invalid_argument("worksync::to_string(SyncStatus): Invalid value: " +
                                std::to_string(int(status)));
}

std::ostream& operator<<(std::ostream& os, SyncStatus status) {
    return os << to_string(status);
}

StatusVocabulary::StatusVocabulary(std::string name,
                                   std::initializer_list<Entry> list)
    : name(std::move(name)) {
    entries.reserve(list.size());
    for (const auto& entry : list) {
        if (entry.tag.empty()) {
            throw std::invalid_argument(fmt::format(
                    "StatusVocabulary({}): tags can't be empty", this->name));
        }
        if (contains(entry.tag)) {
            throw std::invalid_argument(
                    fmt::format("StatusVocabulary({}): duplicate tag {}",
                                this->name,
                                entry.tag));
        }
        entries.emplace_back(std::string{entry.tag}, entry.status);
    }
}

SyncStatus StatusVocabulary::classify(std::string_view tag) const {
    const auto iter = std::ranges::find_if(
            entries, [tag](const auto& e) { return e.first == tag; });
    if (iter == entries.end()) {
        throw UnknownTagError(name, std::string{tag});
    }
    return iter->second;
}

bool StatusVocabulary::contains(std::string_view tag) const {
    return std::ranges::any_of(entries,
                               [tag](const auto& e) { return e.first == tag; });
}

bool StatusVocabulary::supports(SyncStatus status) const {
    return std::ranges::any_of(
            entries, [status](const auto& e) { return e.second == status; });
}

const std::string& StatusVocabulary::tagFor(SyncStatus status) const {
    const auto iter = std::ranges::find_if(
            entries, [status](const auto& e) { return e.second == status; });
    if (iter == entries.end()) {
        throw std::invalid_argument(
                fmt::format("StatusVocabulary({})::tagFor: no tag for {}",
                            name,
                            to_string(status)));
    }
    return iter->first;
}

} // namespace worksync
