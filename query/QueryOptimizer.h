// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_QUERYOPTIMIZER_H
#define FSINDEX_QUERY_QUERYOPTIMIZER_H

#include "QueryExpression.h"

namespace FsIndex {
    /**
     * Rewrites a query tree into a cheaper equivalent. Idempotent.
     *
     * Nested And/Or nodes are flattened and single-child And/Or nodes collapse to the child.
     * And operands are stably ordered by cost: scope filters (infolder:, parent:) first, then
     * free text, then other filters, then tag: last. Or operands keep their order.
     */
    [[nodiscard]] QueryExpression optimizeQueryExpression(QueryExpression expression);
}

#endif //FSINDEX_QUERY_QUERYOPTIMIZER_H
