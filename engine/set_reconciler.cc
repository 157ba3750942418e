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

#include <worksync/set_reconciler.h>

namespace worksync {

std::string to_string(const WriteTargets& targets) {
    if (targets.producer && targets.reviewer) {
        return "producer,reviewer";
    }
    if (targets.producer) {
        return "producer";
    }
    if (targets.reviewer) {
        return "reviewer";
    }
    return "none";
}

} // namespace worksync
