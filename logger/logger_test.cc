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

#include <spdlog/spdlog.h>

/**
 * Test that the new fmt-style formatting works
 */
TEST_F(SpdloggerTest, FmtStyleFormatting) {
    const uint32_t value = 0xdeadbeef;
    LOG_INFO("FmtStyleFormatting {:x}", value);
    worksync::logger::shutdown();
    files = findFilesWithPrefix(config.filename);
    ASSERT_EQ(1, files.size()) << "We should only have a single logfile";
    EXPECT_EQ(1,
              countInFile(files.front(), "info FmtStyleFormatting deadbeef"));
}

TEST_F(SpdloggerTest, ContextIsAppendedAsJson) {
    LOG_WARNING_CTX("Standing conflict", {"owner", "jdoe"}, {"streak", 3});
    worksync::logger::shutdown();
    files = findFilesWithPrefix(config.filename);
    ASSERT_EQ(1, files.size());
    EXPECT_EQ(1,
              countInFile(files.front(),
                          R"(warning Standing conflict {"owner":"jdoe","streak":3})"))
            << getLogContents();
}

TEST_F(SpdloggerTest, BracesInContextMessageAreReplaced) {
    worksync::logger::logWithContext(*worksync::logger::get(),
                                     spdlog::level::info,
                                     "Message with {} ",
                                     {{"key", "value"}});
    worksync::logger::shutdown();
    files = findFilesWithPrefix(config.filename);
    ASSERT_EQ(1, files.size());
    EXPECT_EQ(1,
              countInFile(files.front(),
                          R"(info Message with [] {"key":"value"})"))
            << getLogContents();
}

TEST_F(SpdloggerTest, NonObjectContextIsWrapped) {
    worksync::logger::logWithContext(*worksync::logger::get(),
                                     spdlog::level::info,
                                     "Wrapped",
                                     worksync::logger::Json::array({1, 2}));
    worksync::logger::shutdown();
    files = findFilesWithPrefix(config.filename);
    ASSERT_EQ(1, files.size());
    EXPECT_EQ(1,
              countInFile(files.front(), R"(info Wrapped {"context":[1,2]})"))
            << getLogContents();
}

TEST_F(SpdloggerTest, LevelFiltering) {
    worksync::logger::setLogLevel(spdlog::level::warn);
    LOG_INFO_RAW("This should not be logged");
    LOG_WARNING_RAW("This should be logged");
    worksync::logger::shutdown();
    files = findFilesWithPrefix(config.filename);
    ASSERT_EQ(1, files.size());
    EXPECT_EQ(0, countInFile(files.front(), "This should not be logged"));
    EXPECT_EQ(1, countInFile(files.front(), "warning This should be logged"));
}

/// The macros must be safe to use when no logger exists
TEST_F(SpdloggerTest, MacrosAreNoopsWithoutLogger) {
    worksync::logger::shutdown();
    EXPECT_FALSE(worksync::logger::isInitialized());
    LOG_INFO("No logger {}", 1);
    LOG_INFO_RAW("No logger");
    LOG_INFO_CTX("No logger", {"key", 1});
    EXPECT_FALSE(worksync::logger::get());
}

/**
 * Test class for tests which wants to operate on multiple log files
 *
 * Initialize the logger with a 2k file rotation threshold
 */
class FileRotationTest : public SpdloggerTest {
protected:
    void SetUp() override {
        RemoveFiles();
        // Use a 2 k file size to make sure that we rotate :)
        config.log_level = spdlog::level::level_enum::debug;
        config.cyclesize = 2048;
        setUpLogger();
    }
};

/**
 * Log multiple messages, which will causes the files to rotate a few times.
 */
TEST_F(FileRotationTest, MultipleFilesTest) {
    for (auto ii = 0; ii < 100; ii++) {
        LOG_DEBUG_RAW(
                "This is a textual log message that we want to repeat a "
                "number of times");
    }
    worksync::logger::shutdown();

    files = findFilesWithPrefix(config.filename);
    EXPECT_LT(1, files.size());
}

/**
 * Test that everything we attempt to log before we call shutdown is actually
 * flushed to a file.
 */
TEST_F(SpdloggerTest, ShutdownRace) {
    // We need the async logger for this test, shutdown the existing one and
    // create it.
    worksync::logger::shutdown();
    RemoveFiles();
    config.unit_test = false;
    setUpLogger();

    // Back the file logger up with messages and flush commands.
    for (int i = 0; i < 100; i++) {
        // Post messages to the async logger - doesn't actually perform a flush,
        // but queues one on the async logger
        LOG_CRITICAL_RAW("a message");
        worksync::logger::flush();
    }

    LOG_CRITICAL_RAW("We should see this msg");
    LOG_CRITICAL_RAW("and this one");
    // And this very long one
    auto str = std::string(50000, 'a');
    LOG_CRITICAL("{}", str);

    // Shutdown, process all messages in the queue, then return.
    worksync::logger::shutdown();
    files = findFilesWithPrefix(config.filename);
    ASSERT_EQ(1, files.size()) << "We should only have a single logfile";
    EXPECT_EQ(1, countInFile(files.front(), "critical We should see this msg"));
    EXPECT_EQ(1, countInFile(files.front(), "critical and this one"));
    EXPECT_EQ(1, countInFile(files.front(), "critical " + str));
}
