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

#include <worksync/date.h>
#include <worksync/merge_types.h>
#include <worksync/record.h>
#include <worksync/sync_status.h>

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace worksync {

/// The time-off type of a paid leave day
constexpr std::string_view PaidLeaveTimeOffType = "CO";

/// The domain fields of one day of work time
struct WorktimePayload {
    /// Start of the working day ("HH:MM"), absent for a day off
    std::optional<std::string> dayStartTime;
    /// End of the working day, absent while the session is open
    std::optional<std::string> dayEndTime;
    int temporaryStopCount = 0;
    bool lunchBreakDeducted = false;
    /// "CO" (paid leave), "CM" (medical), "SN" (national holiday), ...
    std::optional<std::string> timeOffType;
    int totalWorkedMinutes = 0;
    int totalTemporaryStopMinutes = 0;
    int totalOvertimeMinutes = 0;

    bool operator==(const WorktimePayload&) const = default;
};

void to_json(nlohmann::json& json, const WorktimePayload& payload);
void from_json(const nlohmann::json& json, WorktimePayload& payload);

/**
 * Entity traits for the work time entries: one record per day, owned by the
 * employee (producer) and reviewed by the admin (reviewer).
 *
 * Every entity traits class provides the same members:
 *
 *   Key, Payload, RecordType  the record types
 *   name                      the entity name used in logs and file names
 *   keyField                  the JSON field holding the key
 *   vocabulary()              the status vocabulary of the entity
 *   quotaKind(payload)        the quota the payload consumes, if any
 *   naturalOrder(a, b)        the order records are stored in
 *   keyToString(key)          printable key
 */
struct WorktimeEntity {
    using Key = Date;
    using Payload = WorktimePayload;
    using RecordType = Record<Key, Payload>;

    static constexpr std::string_view name = "worktime";
    static constexpr std::string_view keyField = "workDate";

    /**
     * USER_INPUT, USER_IN_PROCESS, USER_EDITED, USER_DONE (producer) and
     * ADMIN_EDITED, ADMIN_BLANK, ADMIN_DONE (reviewer)
     */
    static const StatusVocabulary& vocabulary();

    /// A paid leave day consumes one unit of the paid leave quota
    static std::optional<QuotaKind> quotaKind(const Payload& payload);

    /// Date ascending
    static bool naturalOrder(const RecordType& a, const RecordType& b);

    static std::string keyToString(const Key& key);
};

} // namespace worksync
