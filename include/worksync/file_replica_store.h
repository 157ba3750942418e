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

#include <worksync/json_utilities.h>
#include <worksync/replica_store.h>
#include <worksync/worksync_error.h>

#include <fmt/format.h>
#include <logger/logger.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace worksync {

/**
 * Verify that the owner id may be used as a path component
 *
 * @throws StoreError(invalid_owner) if the id is empty, contains a path
 *         separator or is "." or ".."
 */
void validateOwnerId(const std::string& ownerId);

/**
 * Get the location of a replica file:
 * <data_dir>/<role>/<owner>/<entity>_<owner>_<YYYY>_<MM>.json
 * (<entity>_<owner>_<YYYY>.json for a whole year)
 */
std::filesystem::path replicaPath(const std::filesystem::path& dataDir,
                                  std::string_view entity,
                                  const std::string& ownerId,
                                  const Period& period,
                                  Role role);

/**
 * Read and parse a JSON file
 *
 * @throws StoreError(store_read_failed) if the file can't be read
 * @throws StoreError(replica_corrupt) if the content isn't valid JSON
 */
nlohmann::json readJsonFile(const std::filesystem::path& path);

/**
 * Write the JSON document to <path>.tmp and rename it over path, so that a
 * concurrent reader never observes a partially written file.
 *
 * @throws StoreError(store_write_failed) on failure
 */
void writeJsonFileAtomically(const std::filesystem::path& path,
                             const nlohmann::json& json);

/**
 * Encode a record the way it is stored: the payload fields plus the key
 * (under Entity::keyField), "ownerId" and the tag as "adminSync"
 */
template <typename Entity>
nlohmann::json encodeRecord(const typename Entity::RecordType& record) {
    nlohmann::json object = record.getPayload();
    object[std::string{Entity::keyField}] = record.getKey();
    object["ownerId"] = record.getOwnerId();
    object["adminSync"] = record.getTag();
    return object;
}

/**
 * A ReplicaStore keeping every replica as a JSON list of objects in a
 * directory tree below data_dir (see encodeRecord for the format).
 */
template <typename Entity>
class FileReplicaStore : public ReplicaStore<Entity> {
public:
    using RecordType = typename Entity::RecordType;
    using Key = typename RecordType::Key;
    using Payload = typename RecordType::Payload;

    explicit FileReplicaStore(std::filesystem::path dataDir)
        : dataDir(std::move(dataDir)) {
    }

    Replica<Entity> load(const std::string& ownerId,
                         const Period& period,
                         Role role) override {
        const auto path = getPath(ownerId, period, role);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                throw StoreError(errc::store_read_failed,
                                 fmt::format("FileReplicaStore::load({}): {}",
                                             path.string(),
                                             ec.message()));
            }
            return {ownerId, period, role};
        }

        const auto json = readJsonFile(path);
        if (!json.is_array()) {
            throw StoreError(
                    errc::replica_corrupt,
                    fmt::format("FileReplicaStore::load({}): not a JSON list",
                                path.string()));
        }

        std::vector<RecordType> records;
        std::map<Key, std::size_t> index;
        for (const auto& object : json) {
            auto record = decode(path, ownerId, object);
            const auto iter = index.find(record.getKey());
            if (iter == index.end()) {
                index.emplace(record.getKey(), records.size());
                records.push_back(std::move(record));
            } else {
                LOG_WARNING_CTX("Duplicate key in replica, keeping the last",
                                {"entity", Entity::name},
                                {"file", path.string()},
                                {"key", Entity::keyToString(record.getKey())});
                records[iter->second] = std::move(record);
            }
        }
        return {ownerId, period, role, std::move(records)};
    }

    void save(const Replica<Entity>& replica) override {
        const auto path = getPath(
                replica.getOwnerId(), replica.getPeriod(), replica.getRole());
        auto json = nlohmann::json::array();
        for (const auto& record : replica.getRecords()) {
            json.push_back(encodeRecord<Entity>(record));
        }
        writeJsonFileAtomically(path, json);
    }

    void erase(const std::string& ownerId,
               const Period& period,
               Role role) override {
        const auto path = getPath(ownerId, period, role);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            throw StoreError(errc::store_write_failed,
                             fmt::format("FileReplicaStore::erase({}): {}",
                                         path.string(),
                                         ec.message()));
        }
    }

    bool exists(const std::string& ownerId,
                const Period& period,
                Role role) override {
        const auto path = getPath(ownerId, period, role);
        std::error_code ec;
        const auto ret = std::filesystem::exists(path, ec);
        if (ec) {
            throw StoreError(errc::store_read_failed,
                             fmt::format("FileReplicaStore::exists({}): {}",
                                         path.string(),
                                         ec.message()));
        }
        return ret;
    }

    /// The file a replica is stored in
    std::filesystem::path getPath(const std::string& ownerId,
                                  const Period& period,
                                  Role role) const {
        return replicaPath(dataDir, Entity::name, ownerId, period, role);
    }

private:
    static RecordType decode(const std::filesystem::path& path,
                             const std::string& ownerId,
                             const nlohmann::json& object) {
        try {
            if (!object.is_object()) {
                throw std::invalid_argument("entry is not an object");
            }
            auto key = object.at(std::string{Entity::keyField}).get<Key>();
            auto payload = object.get<Payload>();
            return {std::move(key),
                    jsonValueOr(object, "ownerId", ownerId),
                    std::move(payload),
                    jsonValueOr(object, "adminSync", std::string{})};
        } catch (const nlohmann::json::exception& e) {
            throw StoreError(errc::replica_corrupt,
                             fmt::format("FileReplicaStore::load({}): {}",
                                         path.string(),
                                         e.what()));
        } catch (const std::invalid_argument& e) {
            throw StoreError(errc::replica_corrupt,
                             fmt::format("FileReplicaStore::load({}): {}",
                                         path.string(),
                                         e.what()));
        }
    }

    const std::filesystem::path dataDir;
};

} // namespace worksync
