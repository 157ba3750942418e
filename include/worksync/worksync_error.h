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

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <system_error>

namespace worksync {
/**
 * The error codes reported by the reconciliation engine and the replica
 * store. They may be used together with worksync::error_category() in
 * std::system_error exceptions (where you can fetch the code, and the
 * textual description for the given error).
 */
enum class errc {
    /// The operation executed successfully
    success,

    /// A record carried a tag outside its entity's vocabulary
    unknown_tag,

    /// No replica exists for the requested coordinates
    replica_not_found,

    /// The stored replica could not be decoded
    replica_corrupt,

    /// The replica could not be read from the underlying storage
    store_read_failed,

    /// The replica could not be written to the underlying storage
    store_write_failed,

    /// The owner id can't be used to address a replica
    invalid_owner
};

/**
 * Get the error category object used to map from numeric values to
 * a textual representation of the error code.
 *
 * @return The one and only instance of the error object
 */
const std::error_category& error_category() noexcept;

std::string to_string(errc ev);

// GoogleTest printing function.
void PrintTo(errc ev, ::std::ostream* os);
std::ostream& operator<<(std::ostream& os, errc ev);

inline std::error_code make_error_code(errc e) {
    return {static_cast<int>(e), error_category()};
}

/**
 * Failure to load, save or erase a replica. Thrown by the ReplicaStore
 * implementations and recovered by the caller of the reconciliation (the
 * period is then reported as not merged).
 */
class StoreError : public std::system_error {
public:
    StoreError(errc ev, const std::string& what_arg)
        : system_error(static_cast<int>(ev), error_category(), what_arg) {
    }

    StoreError(errc ev, const char* what_arg)
        : system_error(static_cast<int>(ev), error_category(), what_arg) {
    }

    errc store_code() const {
        return static_cast<errc>(code().value());
    }
};

/**
 * A record presented a tag which isn't part of its entity's status
 * vocabulary. The merge of that single key is aborted; no precedence is
 * ever guessed for an unknown tag.
 */
class UnknownTagError : public std::invalid_argument {
public:
    UnknownTagError(std::string vocabulary, std::string tag);

    const std::string& getVocabulary() const {
        return vocabulary;
    }

    const std::string& getTag() const {
        return tag;
    }

private:
    std::string vocabulary;
    std::string tag;
};

} // namespace worksync

namespace std {

template <>
struct is_error_code_enum<worksync::errc> : public true_type {};

} // namespace std
