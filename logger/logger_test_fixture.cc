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

#include "logger_test_fixture.h"

#include <gsl/gsl-lite.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

SpdloggerTest::SpdloggerTest() {
    // Use default values from worksync::logger::Config, apart from:
    config.log_level = spdlog::level::level_enum::debug;
    config.filename = "spdlogger_test";
    config.unit_test = true; // Enable unit test mode (synchronous logging)
    config.console = false; // Don't print to stderr
}

void SpdloggerTest::SetUp() {
    setUpLogger();
}

void SpdloggerTest::TearDown() {
    shutdownLoggerAndRemoveFiles();
}

std::vector<std::string> SpdloggerTest::findFilesWithPrefix(
        const std::string& prefix) {
    std::vector<std::string> ret;
    for (const auto& entry : std::filesystem::directory_iterator(".")) {
        const auto name = entry.path().filename().string();
        if (entry.is_regular_file() && name.rfind(prefix, 0) == 0) {
            ret.push_back(name);
        }
    }
    std::ranges::sort(ret);
    return ret;
}

void SpdloggerTest::RemoveFiles() {
    Expects(!config.filename.empty());
    files = findFilesWithPrefix(config.filename);
    for (const auto& file : files) {
        std::filesystem::remove(file);
    }
}

void SpdloggerTest::setUpLogger() {
    shutdownLoggerAndRemoveFiles();

    const auto ret = worksync::logger::initialize(config);
    EXPECT_FALSE(ret) << ret.value();
}

void SpdloggerTest::shutdownLoggerAndRemoveFiles() {
    // Helps to detect if the logger is being referenced elsewhere, as we
    // can't reliably remove the files of a logger which is still alive
    std::vector<std::weak_ptr<spdlog::logger>> weakLoggers;
    spdlog::details::registry::instance().apply_all(
            [&weakLoggers](const auto& l) { weakLoggers.push_back(l); });

    worksync::logger::shutdown();

    for (const auto& l : weakLoggers) {
        auto logger = l.lock();
        if (!logger) {
            continue;
        }
        FAIL() << "Logger '" << logger->name()
               << "' still exists with use count: " << (l.use_count() - 1);
    }

    RemoveFiles();
}

int SpdloggerTest::countInFile(const std::string& file,
                               const std::string& msg) {
    std::ifstream stream(file, std::ios::binary);
    std::stringstream ss;
    ss << stream.rdbuf();
    const auto content = ss.str();

    int count = 0;
    auto pos = content.find(msg);
    while (pos != std::string::npos) {
        ++count;
        pos = content.find(msg, pos + msg.size());
    }
    return count;
}

std::string SpdloggerTest::getLogContents() {
    files = findFilesWithPrefix(config.filename);
    std::string ret;

    for (const auto& file : files) {
        std::ifstream stream(file, std::ios::binary);
        std::stringstream ss;
        ss << stream.rdbuf();
        ret.append(ss.str());
    }

    return ret;
}
