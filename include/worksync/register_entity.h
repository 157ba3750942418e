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
#include <vector>

namespace worksync {

/// One production order line of the graphic register
struct RegisterPayload {
    std::optional<Date> date;
    std::string orderId;
    std::string productionId;
    std::string omsId;
    std::string clientName;
    std::string actionType;
    std::vector<std::string> printPrepTypes;
    std::string colorsProfile;
    int articleNumbers = 0;
    double graphicComplexity = 0.0;

    bool operator==(const RegisterPayload&) const = default;
};

void to_json(nlohmann::json& json, const RegisterPayload& payload);
void from_json(const nlohmann::json& json, RegisterPayload& payload);

/**
 * Entity traits for the production order register. Entries are identified
 * by a per-owner sequence number and are never in progress.
 */
struct RegisterEntity {
    using Key = int;
    using Payload = RegisterPayload;
    using RecordType = Record<Key, Payload>;

    static constexpr std::string_view name = "register";
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
