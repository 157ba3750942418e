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

#include "logger_config.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace worksync::logger {

void to_json(nlohmann::json& json, const Config& config) {
    const auto level = spdlog::level::to_string_view(config.log_level);
    json = {{"filename", config.filename},
            {"buffersize", config.buffersize},
            {"cyclesize", config.cyclesize},
            {"unit_test", config.unit_test},
            {"console", config.console},
            {"log_level", std::string{level.data(), level.size()}}};
}

void from_json(const nlohmann::json& json, Config& config) {
    config.filename = json.value("filename", config.filename);
    config.buffersize = json.value("buffersize", config.buffersize);
    config.cyclesize = json.value("cyclesize", config.cyclesize);
    config.unit_test = json.value("unit_test", config.unit_test);
    config.console = json.value("console", config.console);
    if (json.contains("log_level")) {
        const auto name = json["log_level"].get<std::string>();
        const auto level = spdlog::level::from_str(name);
        // from_str maps anything it doesn't know to "off"
        if (level == spdlog::level::off && name != "off") {
            throw std::invalid_argument(fmt::format(
                    R"(worksync::logger::Config: "log_level" unknown level "{}")",
                    name));
        }
        config.log_level = level;
    }
}

} // namespace worksync::logger
