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

#include <worksync/check_register_entity.h>
#include <worksync/entity_kind.h>
#include <worksync/register_entity.h>
#include <worksync/worktime_entity.h>

#include <fmt/format.h>
#include <ostream>
#include <stdexcept>

namespace worksync {

std::string to_string(EntityKind kind) {
    switch (kind) {
    case EntityKind::Worktime:
        return std::string{WorktimeEntity::name};
    case EntityKind::Register:
        return std::string{RegisterEntity::name};
    case EntityKind::CheckRegister:
        return std::string{CheckRegisterEntity::name};
    }
    throw std::invalid_argument(
            "worksync::to_string(EntityKind): Invalid value: " +
            std::to_string(int(kind)));
}

std::ostream& operator<<(std::ostream& os, EntityKind kind) {
    return os << to_string(kind);
}

EntityKind parseEntityKind(std::string_view name) {
    for (const auto kind : {EntityKind::Worktime,
                            EntityKind::Register,
                            EntityKind::CheckRegister}) {
        if (name == to_string(kind)) {
            return kind;
        }
    }
    throw std::invalid_argument(
            fmt::format("parseEntityKind: unknown entity \"{}\"", name));
}

} // namespace worksync
