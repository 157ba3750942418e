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

#include <getopt.h>
#include <logger/logger.h>
#include <worksync/entity_kind.h>
#include <worksync/file_replica_store.h>
#include <worksync/reconcile_service.h>
#include <worksync/reconciler_config.h>

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace worksync;

/// Exit status for usage and configuration errors
static constexpr int EXIT_USAGE = 2;

static void usage() {
    using std::endl;
    std::cerr << "usage: wsmerge [options]" << endl
              << "\t--config filename    The configuration file (required)"
              << endl
              << "\t--owner id           The owner to reconcile (required)"
              << endl
              << "\t--period YYYY-MM     The period to reconcile, YYYY for a "
                 "whole year (required)"
              << endl
              << "\t--entity name        worktime (default), register or "
                 "check_register"
              << endl
              << "\t--initiator role     producer (default) or reviewer"
              << endl
              << "\t--verbose            Log to the console" << endl;
    exit(EXIT_USAGE);
}

/**
 * The tool has no balance tracker; the deltas are collected and printed
 * with the report.
 */
class CollectingHook : public CounterAdjustmentHook {
public:
    void adjust(std::string_view entity,
                const std::string& ownerId,
                const Period& period,
                const CounterDelta& delta) override {
        deltas.push_back({{"entity", entity},
                          {"owner", ownerId},
                          {"period", to_string(period)},
                          {"amount", delta.amount},
                          {"kind", to_string(delta.kind)}});
    }

    nlohmann::json deltas = nlohmann::json::array();
};

template <typename Entity>
static int runMerge(const ReconcilerConfig& config,
                    const std::string& owner,
                    const Period& period,
                    Role initiator) {
    FileReplicaStore<Entity> store(config.data_dir);
    OwnerLockRegistry locks(config.owner_lock_shards);
    ConflictTracker conflicts(config.conflict_warning_threshold);
    CollectingHook hook;
    ReconcileService<Entity> service(store, locks, hook, conflicts);

    const auto report = service.reconcile(owner, period, initiator);

    nlohmann::json json = {{"entity", Entity::name},
                           {"owner", owner},
                           {"period", to_string(period)},
                           {"initiator", to_string(initiator)},
                           {"status", to_string(report.status)}};
    if (report.isMerged()) {
        auto records = nlohmann::json::array();
        for (const auto& record : report.merged) {
            records.push_back(encodeRecord<Entity>(record));
        }
        auto rejected = nlohmann::json::array();
        for (const auto& r : report.rejected) {
            rejected.push_back({{"key", r.key},
                                {"role", to_string(r.role)},
                                {"tag", r.tag},
                                {"reason", r.reason}});
        }
        json["written"] = to_string(report.written);
        json["records"] = std::move(records);
        json["deltas"] = hook.deltas;
        json["rejected"] = std::move(rejected);
    } else {
        json["error"] = report.error;
    }
    std::cout << json.dump(2) << std::endl;
    return report.isMerged() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char** argv) {
    std::vector<option> long_options = {
            {"config", required_argument, nullptr, 'c'},
            {"owner", required_argument, nullptr, 'o'},
            {"period", required_argument, nullptr, 'p'},
            {"entity", required_argument, nullptr, 'e'},
            {"initiator", required_argument, nullptr, 'i'},
            {"verbose", no_argument, nullptr, 'v'},
            {nullptr, 0, nullptr, 0}};

    std::string configFile;
    std::string owner;
    std::string periodText;
    std::string entityName{"worktime"};
    std::string initiatorName{"producer"};
    bool verbose = false;

    int cmd;
    while ((cmd = getopt_long(argc, argv, "", long_options.data(), nullptr)) !=
           EOF) {
        switch (cmd) {
        case 'c':
            configFile = optarg;
            break;
        case 'o':
            owner = optarg;
            break;
        case 'p':
            periodText = optarg;
            break;
        case 'e':
            entityName = optarg;
            break;
        case 'i':
            initiatorName = optarg;
            break;
        case 'v':
            verbose = true;
            break;
        default:
            usage();
        }
    }

    if (configFile.empty() || owner.empty() || periodText.empty() ||
        optind != argc) {
        usage();
    }

    ReconcilerConfig config;
    Period period;
    EntityKind entity = EntityKind::Worktime;
    Role initiator = Role::Producer;
    try {
        config = loadReconcilerConfig(configFile);
        period = parsePeriod(periodText);
        entity = parseEntityKind(entityName);
        initiator = parseRole(initiatorName);
    } catch (const std::exception& exception) {
        std::cerr << exception.what() << std::endl;
        return EXIT_USAGE;
    }

    if (verbose) {
        logger::createConsoleLogger();
    } else {
        auto error = logger::initialize(config.logger);
        if (error) {
            std::cerr << *error << std::endl;
            return EXIT_USAGE;
        }
    }

    int ret = EXIT_FAILURE;
    try {
        switch (entity) {
        case EntityKind::Worktime:
            ret = runMerge<WorktimeEntity>(config, owner, period, initiator);
            break;
        case EntityKind::Register:
            ret = runMerge<RegisterEntity>(config, owner, period, initiator);
            break;
        case EntityKind::CheckRegister:
            ret = runMerge<CheckRegisterEntity>(
                    config, owner, period, initiator);
            break;
        }
    } catch (const std::exception& exception) {
        std::cerr << exception.what() << std::endl;
        ret = EXIT_FAILURE;
    }

    logger::shutdown();
    return ret;
}
