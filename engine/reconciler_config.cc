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
#include <worksync/reconciler_config.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace worksync {

void ReconcilerConfig::validate() const {
    if (data_dir.empty()) {
        throw std::invalid_argument(R"("data_dir" must be specified)");
    }
    if (owner_lock_shards == 0) {
        throw std::invalid_argument(R"("owner_lock_shards" must be > 0)");
    }
    if (background_threads == 0) {
        throw std::invalid_argument(R"("background_threads" must be > 0)");
    }
    if (conflict_warning_threshold == 0) {
        throw std::invalid_argument(
                R"("conflict_warning_threshold" must be > 0)");
    }
}

void to_json(nlohmann::json& json, const ReconcilerConfig& config) {
    json = {{"data_dir", config.data_dir},
            {"owner_lock_shards", config.owner_lock_shards},
            {"background_threads", config.background_threads},
            {"conflict_warning_threshold", config.conflict_warning_threshold},
            {"logger", config.logger}};
}

void from_json(const nlohmann::json& json, ReconcilerConfig& config) {
    config.data_dir = json.value("data_dir", config.data_dir);
    config.owner_lock_shards =
            json.value("owner_lock_shards", config.owner_lock_shards);
    config.background_threads =
            json.value("background_threads", config.background_threads);
    config.conflict_warning_threshold = json.value(
            "conflict_warning_threshold", config.conflict_warning_threshold);
    if (json.contains("logger")) {
        config.logger = json["logger"].get<logger::Config>();
    }
}

ReconcilerConfig loadReconcilerConfig(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw std::system_error(
                std::make_error_code(std::errc::no_such_file_or_directory),
                fmt::format("loadReconcilerConfig: failed to open {}",
                            path.string()));
    }
    std::stringstream content;
    content << stream.rdbuf();

    auto config = nlohmann::json::parse(content.str()).get<ReconcilerConfig>();
    config.validate();
    return config;
}

} // namespace worksync
