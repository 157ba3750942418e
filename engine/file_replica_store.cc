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

#include <worksync/file_replica_store.h>

#include <fmt/format.h>
#include <gsl/gsl-lite.hpp>
#include <fstream>
#include <sstream>

namespace worksync {

void validateOwnerId(const std::string& ownerId) {
    if (ownerId.empty() || ownerId == "." || ownerId == ".." ||
        ownerId.find_first_of("/\\") != std::string::npos ||
        ownerId.find('\0') != std::string::npos) {
        throw StoreError(errc::invalid_owner,
                         fmt::format("validateOwnerId: \"{}\" can't be used "
                                     "as an owner id",
                                     ownerId));
    }
}

std::filesystem::path replicaPath(const std::filesystem::path& dataDir,
                                  std::string_view entity,
                                  const std::string& ownerId,
                                  const Period& period,
                                  Role role) {
    validateOwnerId(ownerId);
    std::string name;
    if (period.isWholeYear()) {
        name = fmt::format("{}_{}_{:04}.json", entity, ownerId, period.year);
    } else {
        name = fmt::format("{}_{}_{:04}_{:02}.json",
                           entity,
                           ownerId,
                           period.year,
                           period.month);
    }
    return dataDir / to_string(role) / ownerId / name;
}

nlohmann::json readJsonFile(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw StoreError(
                errc::store_read_failed,
                fmt::format("readJsonFile({}): failed to open", path.string()));
    }
    std::stringstream content;
    content << stream.rdbuf();
    if (stream.bad()) {
        throw StoreError(
                errc::store_read_failed,
                fmt::format("readJsonFile({}): read error", path.string()));
    }

    try {
        return nlohmann::json::parse(content.str());
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(
                errc::replica_corrupt,
                fmt::format("readJsonFile({}): {}", path.string(), e.what()));
    }
}

void writeJsonFileAtomically(const std::filesystem::path& path,
                             const nlohmann::json& json) {
    Expects(path.has_filename());
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StoreError(errc::store_write_failed,
                         fmt::format("writeJsonFileAtomically({}): failed to "
                                     "create directory: {}",
                                     path.string(),
                                     ec.message()));
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream stream(tmp, std::ios::binary | std::ios::trunc);
        stream << json.dump(2);
        stream.flush();
        if (!stream.good()) {
            stream.close();
            std::filesystem::remove(tmp, ec);
            throw StoreError(errc::store_write_failed,
                             fmt::format("writeJsonFileAtomically({}): failed "
                                         "to write {}",
                                         path.string(),
                                         tmp.string()));
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        const auto message = ec.message();
        std::filesystem::remove(tmp, ec);
        throw StoreError(errc::store_write_failed,
                         fmt::format("writeJsonFileAtomically({}): rename "
                                     "failed: {}",
                                     path.string(),
                                     message));
    }
}

} // namespace worksync
