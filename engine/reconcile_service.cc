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

#include <worksync/reconcile_service.h>

#include <ostream>

namespace worksync {

std::string to_string(ReconcileStatus status) {
    switch (status) {
    case ReconcileStatus::Merged:
        return "merged";
    case ReconcileStatus::NotMerged:
        return "not_merged";
    }
    throw std::invalid_argument(
            "worksync::to_string(ReconcileStatus): Invalid value: " +
            std::to_string(int(status)));
}

std::ostream& operator<<(std::ostream& os, ReconcileStatus status) {
    return os << to_string(status);
}

template class ReconcileService<WorktimeEntity>;
template class ReconcileService<RegisterEntity>;
template class ReconcileService<CheckRegisterEntity>;

} // namespace worksync
