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

#include <worksync/worktime_entity.h>

#include <worksync/json_utilities.h>

#include <nlohmann/json.hpp>

namespace worksync {

void to_json(nlohmann::json& json, const WorktimePayload& payload) {
    json = {{"temporaryStopCount", payload.temporaryStopCount},
            {"lunchBreakDeducted", payload.lunchBreakDeducted},
            {"totalWorkedMinutes", payload.totalWorkedMinutes},
            {"totalTemporaryStopMinutes", payload.totalTemporaryStopMinutes},
            {"totalOvertimeMinutes", payload.totalOvertimeMinutes}};
    if (payload.dayStartTime) {
        json["dayStartTime"] = *payload.dayStartTime;
    }
    if (payload.dayEndTime) {
        json["dayEndTime"] = *payload.dayEndTime;
    }
    if (payload.timeOffType) {
        json["timeOffType"] = *payload.timeOffType;
    }
}

void from_json(const nlohmann::json& json, WorktimePayload& payload) {
    payload.dayStartTime =
            getOptionalJsonValue<std::string>(json, "dayStartTime");
    payload.dayEndTime = getOptionalJsonValue<std::string>(json, "dayEndTime");
    payload.temporaryStopCount = jsonValueOr(json, "temporaryStopCount", 0);
    payload.lunchBreakDeducted =
            jsonValueOr(json, "lunchBreakDeducted", false);
    payload.timeOffType =
            getOptionalJsonValue<std::string>(json, "timeOffType");
    payload.totalWorkedMinutes = jsonValueOr(json, "totalWorkedMinutes", 0);
    payload.totalTemporaryStopMinutes =
            jsonValueOr(json, "totalTemporaryStopMinutes", 0);
    payload.totalOvertimeMinutes =
            jsonValueOr(json, "totalOvertimeMinutes", 0);
}

const StatusVocabulary& WorktimeEntity::vocabulary() {
    static const StatusVocabulary vocabulary{
            std::string{name},
            {{"USER_INPUT", SyncStatus::Input},
             {"USER_IN_PROCESS", SyncStatus::InProgress},
             {"USER_EDITED", SyncStatus::EditedByProducer},
             {"USER_DONE", SyncStatus::AckDone},
             {"ADMIN_EDITED", SyncStatus::EditedByReviewer},
             {"ADMIN_BLANK", SyncStatus::Tombstone},
             {"ADMIN_DONE", SyncStatus::ReviewDone}}};
    return vocabulary;
}

std::optional<QuotaKind> WorktimeEntity::quotaKind(const Payload& payload) {
    if (payload.timeOffType == PaidLeaveTimeOffType) {
        return QuotaKind::PaidLeaveDay;
    }
    return std::nullopt;
}

bool WorktimeEntity::naturalOrder(const RecordType& a, const RecordType& b) {
    return a.getKey() < b.getKey();
}

std::string WorktimeEntity::keyToString(const Key& key) {
    return to_string(key);
}

} // namespace worksync
