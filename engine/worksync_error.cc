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
#include <worksync/worksync_error.h>

#include <fmt/format.h>
#include <ostream>

/**
 * worksync_category provides the mapping from the worksync error codes to
 * a textual mapping and is used together with the std::system_error.
 */
class worksync_category : public std::error_category {
public:
    const char* name() const noexcept override {
        return "worksync error codes";
    }

    std::string message(int code) const override {
        return to_string(worksync::errc(code));
    }

    std::error_condition default_error_condition(
            int code) const noexcept override {
        return std::error_condition(code, *this);
    }
};

const std::error_category& worksync::error_category() noexcept {
    static worksync_category category_instance;
    return category_instance;
}

std::string worksync::to_string(worksync::errc code) {
    switch (code) {
    case errc::success:
        return "success";
    case errc::unknown_tag:
        return "unknown tag";
    case errc::replica_not_found:
        return "replica not found";
    case errc::replica_corrupt:
        return "replica corrupt";
    case errc::store_read_failed:
        return "store read failed";
    case errc::store_write_failed:
        return "store write failed";
    case errc::invalid_owner:
        return "invalid owner";
    };
    throw std::invalid_argument(
            "worksync::error_category::message: code does not represent a "
            "legal error code: " +
            std::to_string(int(code)));
}

void worksync::PrintTo(worksync::errc ev, ::std::ostream* os) {
    *os << worksync::to_string(ev);
}

std::ostream& worksync::operator<<(std::ostream& os, worksync::errc ev) {
    return os << worksync::to_string(ev);
}

worksync::UnknownTagError::UnknownTagError(std::string vocabulary,
                                           std::string tag)
    : std::invalid_argument(
              fmt::format("UnknownTagError: tag \"{}\" is not part of the {} "
                          "status vocabulary",
                          tag,
                          vocabulary)),
      vocabulary(std::move(vocabulary)),
      tag(std::move(tag)) {
}
