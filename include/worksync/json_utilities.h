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

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace worksync {

/**
 * Get the value stored at key, or defaultValue if the key isn't present
 * or holds null. Unlike nlohmann::json::value() an explicit null is
 * treated the same as a missing key.
 *
 * @throws nlohmann::json::type_error if the value is of an incorrect type
 */
template <typename T>
T jsonValueOr(const nlohmann::json& object,
              const std::string& key,
              T defaultValue) {
    const auto iter = object.find(key);
    if (iter == object.end() || iter->is_null()) {
        return defaultValue;
    }
    return iter->get<T>();
}

/**
 * Get the value stored at key, or an empty optional if the key isn't
 * present or holds null.
 *
 * @throws nlohmann::json::type_error if the value is of an incorrect type
 */
template <typename T>
std::optional<T> getOptionalJsonValue(const nlohmann::json& object,
                                      const std::string& key) {
    const auto iter = object.find(key);
    if (iter == object.end() || iter->is_null()) {
        return std::nullopt;
    }
    return iter->get<T>();
}

} // namespace worksync
