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

#include <worksync/register_entity.h>

#include <worksync/json_utilities.h>

#include <nlohmann/json.hpp>

namespace worksync {

void to_json(nlohmann::json& json, const RegisterPayload& payload) {
    json = {{"orderId", payload.orderId},
            {"productionId", payload.productionId},
            {"omsId", payload.omsId},
            {"clientName", payload.clientName},
            {"actionType", payload.actionType},
            {"printPrepTypes", payload.printPrepTypes},
            {"colorsProfile", payload.colorsProfile},
            {"articleNumbers", payload.articleNumbers},
            {"graphicComplexity", payload.graphicComplexity}};
    if (payload.date) {
        json["date"] = *payload.date;
    }
}

void from_json(const nlohmann::json& json, RegisterPayload& payload) {
    const auto date = json.find("date");
    if (date != json.end() && date->is_string()) {
        payload.date = date->get<Date>();
    } else {
        payload.date.reset();
    }
    payload.orderId = jsonValueOr(json, "orderId", std::string{});
    payload.productionId = jsonValueOr(json, "productionId", std::string{});
    payload.omsId = jsonValueOr(json, "omsId", std::string{});
    payload.clientName = jsonValueOr(json, "clientName", std::string{});
    payload.actionType = jsonValueOr(json, "actionType", std::string{});
    payload.printPrepTypes =
            jsonValueOr(json, "printPrepTypes", std::vector<std::string>{});
    payload.colorsProfile = jsonValueOr(json, "colorsProfile", std::string{});
    payload.articleNumbers = jsonValueOr(json, "articleNumbers", 0);
    payload.graphicComplexity = jsonValueOr(json, "graphicComplexity", 0.0);
}

const StatusVocabulary& RegisterEntity::vocabulary() {
    static const StatusVocabulary vocabulary{
            std::string{name},
            {{"USER_INPUT", SyncStatus::Input},
             {"USER_EDITED", SyncStatus::EditedByProducer},
             {"USER_DONE", SyncStatus::AckDone},
             {"ADMIN_EDITED", SyncStatus::EditedByReviewer},
             {"ADMIN_BLANK", SyncStatus::Tombstone},
             {"ADMIN_DONE", SyncStatus::ReviewDone}}};
    return vocabulary;
}

bool RegisterEntity::naturalOrder(const RecordType& a, const RecordType& b) {
    const auto& da = a.getPayload().date;
    const auto& db = b.getPayload().date;
    if (da != db) {
        return da > db;
    }
    return a.getKey() > b.getKey();
}

} // namespace worksync
