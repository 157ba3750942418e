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

#include <worksync/check_register_entity.h>

#include <worksync/json_utilities.h>

#include <nlohmann/json.hpp>

namespace worksync {

void to_json(nlohmann::json& json, const CheckRegisterPayload& payload) {
    json = {{"orderId", payload.orderId},
            {"productionId", payload.productionId},
            {"omsId", payload.omsId},
            {"designerName", payload.designerName},
            {"checkType", payload.checkType},
            {"articleNumbers", payload.articleNumbers},
            {"filesNumbers", payload.filesNumbers},
            {"approvalStatus", payload.approvalStatus},
            {"orderValue", payload.orderValue}};
    if (payload.date) {
        json["date"] = *payload.date;
    }
    if (payload.errorDescription) {
        json["errorDescription"] = *payload.errorDescription;
    }
}

void from_json(const nlohmann::json& json, CheckRegisterPayload& payload) {
    const auto date = json.find("date");
    if (date != json.end() && date->is_string()) {
        payload.date = date->get<Date>();
    } else {
        payload.date.reset();
    }
    payload.orderId = jsonValueOr(json, "orderId", std::string{});
    payload.productionId = jsonValueOr(json, "productionId", std::string{});
    payload.omsId = jsonValueOr(json, "omsId", std::string{});
    payload.designerName = jsonValueOr(json, "designerName", std::string{});
    payload.checkType = jsonValueOr(json, "checkType", std::string{});
    payload.articleNumbers = jsonValueOr(json, "articleNumbers", 0);
    payload.filesNumbers = jsonValueOr(json, "filesNumbers", 0);
    const auto error = json.find("errorDescription");
    if (error != json.end() && error->is_string()) {
        payload.errorDescription = error->get<std::string>();
    } else {
        payload.errorDescription.reset();
    }
    payload.approvalStatus = jsonValueOr(json, "approvalStatus", std::string{});
    payload.orderValue = jsonValueOr(json, "orderValue", 0.0);
}

const StatusVocabulary& CheckRegisterEntity::vocabulary() {
    static const StatusVocabulary vocabulary{
            std::string{name},
            {{"CHECKING_INPUT", SyncStatus::Input},
             {"TL_EDITED", SyncStatus::EditedByProducer},
             {"USER_EDITED", SyncStatus::EditedByProducer},
             {"CHECKING_DONE", SyncStatus::AckDone},
             {"ADMIN_EDITED", SyncStatus::EditedByReviewer},
             {"ADMIN_BLANK", SyncStatus::Tombstone},
             {"ADMIN_DONE", SyncStatus::ReviewDone}}};
    return vocabulary;
}

bool CheckRegisterEntity::naturalOrder(const RecordType& a,
                                       const RecordType& b) {
    const auto& da = a.getPayload().date;
    const auto& db = b.getPayload().date;
    if (da != db) {
        return da > db;
    }
    return a.getKey() > b.getKey();
}

} // namespace worksync
