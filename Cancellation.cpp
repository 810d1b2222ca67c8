// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Cancellation.h"

#include <utility>

namespace FsIndex {
    CancellationToken::CancellationToken(std::shared_ptr<const std::atomic<std::uint64_t>> active,
                                         std::uint64_t version)
        : m_active(std::move(active)), m_version(version) {}

    bool CancellationToken::isCancelled() const noexcept {
        if (!m_active) return false;
        return m_active->load(std::memory_order_acquire) != m_version;
    }

    SearchVersionTracker::SearchVersionTracker()
        : m_active(std::make_shared<std::atomic<std::uint64_t>>(0)) {}

    std::uint64_t SearchVersionTracker::nextVersion() {
        return m_active->fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    std::uint64_t SearchVersionTracker::currentVersion() const {
        return m_active->load(std::memory_order_acquire);
    }

    CancellationToken SearchVersionTracker::tokenForVersion(std::uint64_t version) const {
        return CancellationToken(m_active, version);
    }

    CancellationToken SearchVersionTracker::nextToken() {
        return tokenForVersion(nextVersion());
    }
}
