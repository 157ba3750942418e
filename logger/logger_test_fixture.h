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

// Spdlog includes it's own portability code (details/os.h) to allow it to run
// on multiple platforms, notably it includes <io.h>. This leads to ambiguous
// symbol declarations when we come to include folly's GTest.h as it includes
// it's own portability header Unistd.h. Include folly's portability code before
// anything else to fix this.
#include <folly/portability/GTest.h>

#include "logger.h"
#include "logger_config.h"

#include <string>
#include <vector>

class SpdloggerTest : virtual public ::testing::Test {
protected:
    SpdloggerTest();

    void SetUp() override;
    void TearDown() override;

    /**
     * Helper function - initializes a worksync logger object using the
     * 'config' member variable.
     */
    virtual void setUpLogger();

    /**
     * Helper function - shut down the logger, verify that nobody holds on
     * to it and remove the log files
     */
    void shutdownLoggerAndRemoveFiles();

    /**
     * Helper function - removes the files in the test working directory that
     * are prefixed with the given filename
     */
    void RemoveFiles();

    /// @return the files in the working directory starting with prefix
    static std::vector<std::string> findFilesWithPrefix(
            const std::string& prefix);

    /**
     * Helper function - counts how many times a string appears in a file.
     *
     * @param file the name of the file
     * @param msg the message to search for
     * @return the number of times we found the message in the file
     */
    static int countInFile(const std::string& file, const std::string& msg);

    std::string getLogContents();

    std::vector<std::string> files;

    worksync::logger::Config config;
};
