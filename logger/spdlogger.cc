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

#include "logger.h"
#include "logger_config.h"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <iterator>

static const std::string logger_name{"worksync_file_logger"};

/**
 * Custom log pattern which the loggers will use.
 * This pattern is duplicated in the logger tests. If you need to update it,
 * please also update it there.
 */
static const std::string log_pattern{"%^%Y-%m-%dT%T.%f%z %l %v%$"};

/// The number of rotated files kept next to the current log file
static constexpr std::size_t max_rotated_files = 10;

/**
 * Instance of the spdlog (async) file logger.
 * The logger acts as a handle to the sinks. It does the processing of log
 * messages and sends them to the sinks, which do the actual writing (to file,
 * to stream etc.)
 */
static std::shared_ptr<spdlog::logger> file_logger;

void worksync::logger::flush() {
    if (file_logger) {
        file_logger->flush();
    }
}

void worksync::logger::shutdown() {
    // Force a flush (posts a message to the async logger if we are not in unit
    // test mode)
    flush();

    /**
     * This will drop all spdlog instances from the registry, and destruct the
     * thread pool which will post terminate message(s) (one per thread) to the
     * thread pool message queue. The calling thread will then block until all
     * thread pool workers have joined. This ensures that any messages queued
     * before shutdown is called will be flushed to disk. Any messages that are
     * queued after the final terminate message will not be logged.
     *
     * If the logger is running in unit test mode (synchronous) then this is a
     * no-op.
     */
    file_logger.reset();
    spdlog::details::registry::instance().shutdown();
}

bool worksync::logger::isInitialized() {
    return file_logger != nullptr;
}

std::optional<std::string> worksync::logger::initialize(
        const Config& logger_settings) {
    const auto& fname = logger_settings.filename;

    try {
        // Initialise the logger.
        //
        // The structure is as follows:
        //
        // file_logger = sends log messages to sink
        //   |__dist_sink_mt = Distribute log messages to multiple sinks
        //       |     |__rotating_file_sink_mt = cycles the file when it
        //       |                                reaches cyclesize
        //       |__ (color)__stderr_sink_mt = Send log messages to console
        //
        // The file sink logs everything the file_logger lets through. The
        // console sink drops everything below ERROR unless we're running
        // unit tests, so interactive use of wsmerge isn't drowned in the
        // per key merge decisions.

        auto sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
        sink->set_level(spdlog::level::trace);

        if (!fname.empty()) {
            auto fsink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    fname, logger_settings.cyclesize, max_rotated_files);
            fsink->set_level(spdlog::level::trace);
            sink->add_sink(fsink);
        }

        if (logger_settings.console) {
            auto stderrsink =
                    std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            if (logger_settings.unit_test) {
                stderrsink->set_level(spdlog::level::trace);
            } else {
                stderrsink->set_level(spdlog::level::err);
            }
            sink->add_sink(stderrsink);
        }

        spdlog::drop(logger_name);

        if (logger_settings.unit_test) {
            file_logger = std::make_shared<spdlog::logger>(logger_name, sink);
        } else {
            // Create the default thread pool for async logging
            spdlog::init_thread_pool(logger_settings.buffersize, 1);

            // Get the thread pool so that we can actually construct the
            // object with already created sinks...
            auto tp = spdlog::thread_pool();
            file_logger = std::make_shared<spdlog::async_logger>(
                    logger_name,
                    sink,
                    tp,
                    spdlog::async_overflow_policy::block);
        }

        file_logger->set_pattern(log_pattern);
        file_logger->set_level(logger_settings.log_level);

        // Set the flushing interval policy
        spdlog::flush_every(std::chrono::seconds(1));

        spdlog::register_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::string msg =
                std::string{"Log initialization failed: "} + ex.what();
        return std::optional<std::string>{msg};
    }
    return {};
}

const std::shared_ptr<spdlog::logger>& worksync::logger::get() {
    return file_logger;
}

void worksync::logger::reset() {
    spdlog::drop(logger_name);
    file_logger.reset();
}

void worksync::logger::createBlackholeLogger() {
    // delete if already exists
    spdlog::drop(logger_name);

    file_logger = std::make_shared<spdlog::logger>(
            logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());

    file_logger->set_level(spdlog::level::off);
    file_logger->set_pattern(log_pattern);

    spdlog::register_logger(file_logger);
}

void worksync::logger::createConsoleLogger() {
    // delete if already exists
    spdlog::drop(logger_name);

    auto stderrsink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    file_logger = std::make_shared<spdlog::logger>(logger_name, stderrsink);
    file_logger->set_level(spdlog::level::info);
    file_logger->set_pattern(log_pattern);

    spdlog::register_logger(file_logger);
}

void worksync::logger::setLogLevel(spdlog::level::level_enum level) {
    if (file_logger) {
        file_logger->set_level(level);
    }
    flush();
}

void worksync::logger::logWithContext(spdlog::logger& logger,
                                      spdlog::level::level_enum lvl,
                                      std::string_view msg,
                                      Json ctx) {
    if (!logger.should_log(lvl)) {
        return;
    }

    if (ctx.is_null()) {
        ctx = Json::object();
    } else if (!ctx.is_object()) {
        ctx = Json{{"context", std::move(ctx)}};
    }

    std::string sanitized;
    if (msg.find_first_of("{}") != std::string::npos) {
        sanitized = msg;
        std::ranges::replace(sanitized, '{', '[');
        std::ranges::replace(sanitized, '}', ']');
        msg = sanitized;
    }

    // Remove trailing spaces from the message
    while (!msg.empty() && msg.back() == ' ') {
        msg.remove_suffix(1);
    }

    // We build up the log string here then pass the already-formatted
    // string down to spdlog directly, not using spdlog's formatting
    // functions.
    std::string formatted{msg};
    if (!ctx.empty()) {
        formatted.push_back(' ');
        formatted.append(ctx.dump());
    }

    logger.log(lvl, formatted);
}
