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

#include <logger/logger_config.h>
#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace worksync {

/// Settings for the reconciliation engine (and the wsmerge tool)
struct ReconcilerConfig {
    /// Perform validation on the settings
    /// @throws std::invalid_argument naming the offending key
    void validate() const;

    /// The root directory of the file backed replica store
    std::string data_dir = ".";
    /// The number of owner lock shards
    std::size_t owner_lock_shards = 47;
    /// The number of background merge threads
    std::size_t background_threads = 2;
    /// Consecutive producer-edit-wins merges of one key before a standing
    /// conflict is reported
    std::size_t conflict_warning_threshold = 2;
    logger::Config logger;
};

void to_json(nlohmann::json& json, const ReconcilerConfig& config);
void from_json(const nlohmann::json& json, ReconcilerConfig& config);

/**
 * Read and parse a configuration file
 *
 * @throws std::system_error if the file can't be read
 * @throws nlohmann::json::exception if it isn't valid JSON
 * @throws std::invalid_argument if the settings are invalid
 */
ReconcilerConfig loadReconcilerConfig(const std::filesystem::path& path);

} // namespace worksync
