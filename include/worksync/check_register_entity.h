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

/// One quality check performed by a checker on a designer's order
struct CheckRegisterPayload {
    std::optional<Date> date;
    std::string orderId;
    std::string productionId;
    std::string omsId;
    std::string designerName;
    std::string checkType;
    int articleNumbers = 0;
    int filesNumbers = 0;
    std::optional<std::string> errorDescription;
    std::string approvalStatus;
    double orderValue = 0.0;

    bool operator==(const CheckRegisterPayload&) const = default;
};

void to_json(nlohmann::json& json, const CheckRegisterPayload& payload);
void from_json(const nlohmann::json& json, CheckRegisterPayload& payload);

/**
 * Entity traits for the check register. The producer is the checker; edits
 * made by a team lead on the checker's behalf count as producer edits.
 */
struct CheckRegisterEntity {
    using Key = int;
    using Payload = CheckRegisterPayload;
    using RecordType = Record<Key, Payload>;

    static constexpr std::string_view name = "check_register";
    static constexpr std::string_view keyField = "entryId";

    static const StatusVocabulary& vocabulary();

    static std::optional<QuotaKind> quotaKind(const Payload&) {
        return std::nullopt;
    }

    /// Date descending, then entry id descending; undated entries last
    static bool naturalOrder(const RecordType& a, const RecordType& b);

    static std::string keyToString(const Key& key) {
        return std::to_string(key);
    }
};

} // namespace worksync
