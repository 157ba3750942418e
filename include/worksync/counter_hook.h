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

#include <worksync/merge_types.h>
#include <worksync/record.h>

#include <string>
#include <string_view>

namespace worksync {

/**
 * The interface to the external balance tracker. The reconcile service
 * calls adjust() once per counter delta of a committed reconciliation.
 *
 * Delivery is not exactly-once: a reconciliation which is retried after a
 * failure may deliver the same change again, so implementations must be
 * idempotent (or tolerate it).
 */
class CounterAdjustmentHook {
public:
    virtual ~CounterAdjustmentHook() = default;

    /**
     * @param entity the entity whose reconciliation produced the delta
     * @param ownerId the owner of the quota
     * @param period the period which was reconciled
     * @param delta the change of quota consumption
     */
    virtual void adjust(std::string_view entity,
                        const std::string& ownerId,
                        const Period& period,
                        const CounterDelta& delta) = 0;
};

} // namespace worksync
