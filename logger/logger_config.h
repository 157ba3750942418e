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

#include <nlohmann/json_fwd.hpp>
#include <spdlog/common.h>

#include <cstddef>
#include <string>

namespace worksync::logger {

struct Config {
    bool operator==(const Config& other) const = default;

    /// The name of the log file. Rotated files get a sequence number
    /// appended (the higher the older). Empty means no file logging
    std::string filename;
    /// 8192 item size for the logging queue
    size_t buffersize = 8192;
    /// 100 MB per cycled file
    size_t cyclesize = 100 * 1024 * 1024;
    /// if running in a unit test or not
    bool unit_test = false;
    /// Should messages be passed on to the console via stderr
    bool console = true;
    /// The default log level to initialize the logger to
    spdlog::level::level_enum log_level = spdlog::level::level_enum::info;
};

void to_json(nlohmann::json& json, const Config& config);
void from_json(const nlohmann::json& json, Config& config);

} // namespace worksync::logger
