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

/*
 *   A note on the thread safety of the logger API:
 *
 *   The API is thread safe unless the underlying logger object is changed
 * during runtime. This means some methods can only be safely called if the
 * caller guarantees no other threads exist and/or are calling the logging
 * functions.
 *
 *   The only place we change the underlying logger object is during program
 * startup (wsmerge switching from console to file logging) and between unit
 * tests.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/fmt/ostr.h>
#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace worksync::logger {

struct Config;

/// The type of the context object passed to the _CTX macros
using Json = nlohmann::json;

/**
 * Initialize the logger.
 *
 * See note about thread safety at the top of the file
 *
 * @param logger_settings the configuration for the logger
 * @return optional error message if something goes wrong
 */
std::optional<std::string> initialize(const Config& logger_settings);

/**
 * Initialize the logger with the blackhole logger object
 *
 * This method is intended to be used by unit tests which
 * don't need any output (but may call methods who tries
 * to fetch the logger)
 *
 * See note about thread safety at the top of the file
 *
 * @throws std::bad_alloc
 * @throws spdlog::spdlog_ex if an error occurs creating the logger
 */
void createBlackholeLogger();

/**
 * Initialize the logger with the logger which logs to the console
 *
 * See note about thread safety at the top of the file
 *
 * @throws std::bad_alloc
 * @throws spdlog::spdlog_ex if an error occurs creating the logger
 */
void createConsoleLogger();

/**
 * Get the underlying logger object
 *
 * See note about thread safety at the top of the file.
 *
 * This will return null if a logger has not been
 * initialized through one of the following:
 *
 * - initialize()
 * - createBlackholeLogger()
 * - createConsoleLogger()
 */
const std::shared_ptr<spdlog::logger>& get();

/**
 * Reset the underlying logger object
 *
 * See note about thread safety at the top of the file
 */
void reset();

/**
 * Set the log level of the logger
 */
void setLogLevel(spdlog::level::level_enum level);

/**
 * Tell the logger to flush its buffers
 */
void flush();

/**
 * Tell the logger to shut down (flush buffers) and release _ALL_
 * loggers (you'd need to create new loggers after this method)
 */
void shutdown();

/**
 * @return whether or not the logger has been initialized
 */
bool isInitialized();

/**
 * Record a log message with additional context.
 * Format: <MSG> <JSON>
 *
 * NOTE: If present, the characters {} in the message are replaced by [].
 * A context which isn't an object is logged as {"context": ctx}.
 *
 * @param lvl The log level to report at
 * @param msg The message to log
 * @param ctx The context object
 */
void logWithContext(spdlog::logger& logger,
                    spdlog::level::level_enum lvl,
                    std::string_view msg,
                    Json ctx);

} // namespace worksync::logger

#define WORKSYNC_LOG_ENTRY(severity, fmt, ...)                           \
    do {                                                                 \
        auto& _logger_ = worksync::logger::get();                        \
        if (_logger_ && _logger_->should_log(severity)) {                \
            _logger_->log(severity, FMT_STRING(fmt), __VA_ARGS__);       \
        }                                                                \
    } while (false)

#define WORKSYNC_LOG_ENTRY_CTX(severity, msg, ...)            \
    do {                                                      \
        auto& _logger_ = worksync::logger::get();             \
        if (_logger_ && _logger_->should_log(severity)) {     \
            ::worksync::logger::logWithContext(               \
                    *_logger_, severity, msg, {__VA_ARGS__}); \
        }                                                     \
    } while (false)

#define WORKSYNC_LOG_RAW(severity, msg)                   \
    do {                                                  \
        auto& _logger_ = worksync::logger::get();         \
        if (_logger_ && _logger_->should_log(severity)) { \
            _logger_->log(severity, msg);                 \
        }                                                 \
    } while (false)

#define LOG_TRACE(...) \
    WORKSYNC_LOG_ENTRY(spdlog::level::level_enum::trace, __VA_ARGS__)
#define LOG_DEBUG(...) \
    WORKSYNC_LOG_ENTRY(spdlog::level::level_enum::debug, __VA_ARGS__)
#define LOG_INFO(...) \
    WORKSYNC_LOG_ENTRY(spdlog::level::level_enum::info, __VA_ARGS__)
#define LOG_WARNING(...) \
    WORKSYNC_LOG_ENTRY(spdlog::level::level_enum::warn, __VA_ARGS__)
#define LOG_ERROR(...) \
    WORKSYNC_LOG_ENTRY(spdlog::level::level_enum::err, __VA_ARGS__)
#define LOG_CRITICAL(...) \
    WORKSYNC_LOG_ENTRY(spdlog::level::level_enum::critical, __VA_ARGS__)

#define LOG_TRACE_CTX(msg, ...) \
    WORKSYNC_LOG_ENTRY_CTX(spdlog::level::level_enum::trace, msg, __VA_ARGS__)
#define LOG_DEBUG_CTX(msg, ...) \
    WORKSYNC_LOG_ENTRY_CTX(spdlog::level::level_enum::debug, msg, __VA_ARGS__)
#define LOG_INFO_CTX(msg, ...) \
    WORKSYNC_LOG_ENTRY_CTX(spdlog::level::level_enum::info, msg, __VA_ARGS__)
#define LOG_WARNING_CTX(msg, ...) \
    WORKSYNC_LOG_ENTRY_CTX(spdlog::level::level_enum::warn, msg, __VA_ARGS__)
#define LOG_ERROR_CTX(msg, ...) \
    WORKSYNC_LOG_ENTRY_CTX(spdlog::level::level_enum::err, msg, __VA_ARGS__)
#define LOG_CRITICAL_CTX(msg, ...)                                 \
    WORKSYNC_LOG_ENTRY_CTX(                                        \
            spdlog::level::level_enum::critical, msg, __VA_ARGS__)

// Convenience macros which log with the given level, and message, if the given
// level is currently enabled.
// @param msg Fixed string (implicitly convertible to `const char*`), or type
//            which supports operator<<.
//
// For example:
//
//     LOG_INFO_RAW("Starting background merger");
//     LOG_INFO_RAW(std:string{...});
//
#define LOG_TRACE_RAW(msg) \
    WORKSYNC_LOG_RAW(spdlog::level::level_enum::trace, msg)
#define LOG_DEBUG_RAW(msg) \
    WORKSYNC_LOG_RAW(spdlog::level::level_enum::debug, msg)
#define LOG_INFO_RAW(msg) WORKSYNC_LOG_RAW(spdlog::level::level_enum::info, msg)
#define LOG_WARNING_RAW(msg) \
    WORKSYNC_LOG_RAW(spdlog::level::level_enum::warn, msg)
#define LOG_ERROR_RAW(msg) WORKSYNC_LOG_RAW(spdlog::level::level_enum::err, msg)
#define LOG_CRITICAL_RAW(msg) \
    WORKSYNC_LOG_RAW(spdlog::level::level_enum::critical, msg)
