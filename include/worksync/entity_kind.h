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

#include <bitset>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace worksync {

/// The entity types the engine is instantiated for
enum class EntityKind : uint8_t { Worktime, Register, CheckRegister };

/// "worktime", "register", "check_register"
std::string to_string(EntityKind kind);
std::ostream& operator<<(std::ostream& os, EntityKind kind);

/**
 * @throws std::invalid_argument if name isn't an entity name
 */
EntityKind parseEntityKind(std::string_view name);

/// A selection of entity types, indexed by EntityKind
using EntitySet = std::bitset<3>;

inline EntitySet allEntities() {
    return EntitySet{}.set();
}

inline EntitySet& select(EntitySet& set, EntityKind kind) {
    set.set(static_cast<std::size_t>(kind));
    return set;
}

inline bool isSelected(const EntitySet& set, EntityKind kind) {
    return set.test(static_cast<std::size_t>(kind));
}

} // namespace worksync
