// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_CANCELLATION_H
#define FSINDEX_CANCELLATION_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace FsIndex {
    // Loops poll their token once every this many iterations.
    inline constexpr std::size_t kCancelCheckInterval = 0x10000;

    /**
     * Cooperative cancellation handle.
     *
     * A token remembers the version it was issued for. It reports cancelled as soon as
     * the shared active version moves on, which happens whenever a newer search (or build)
     * is started through the owning SearchVersionTracker.
     * A default-constructed token is never cancelled.
     */
    class CancellationToken {
    public:
        CancellationToken() = default;
        CancellationToken(std::shared_ptr<const std::atomic<std::uint64_t>> active, std::uint64_t version);

        [[nodiscard]] static CancellationToken noop() { return {}; }

        [[nodiscard]] bool isCancelled() const noexcept;

        /**
         * Cheap variant for hot loops: only consults the shared counter when
         * (counter % kCancelCheckInterval) == 0.
         *
         * @param counter The loop iteration number.
         * @return true if the token was found cancelled on this iteration.
         */
        [[nodiscard]] bool isCancelledSparse(std::size_t counter) const noexcept {
            if ((counter & (kCancelCheckInterval - 1)) != 0) return false;
            return isCancelled();
        }

        [[nodiscard]] std::uint64_t version() const noexcept { return m_version; }

    private:
        std::shared_ptr<const std::atomic<std::uint64_t>> m_active;
        std::uint64_t m_version = 0;
    };

    /**
     * Hands out monotonically increasing versions. Starting a new version cancels
     * every token issued for an older one.
     */
    class SearchVersionTracker {
    public:
        SearchVersionTracker();

        std::uint64_t nextVersion();
        [[nodiscard]] std::uint64_t currentVersion() const;

        [[nodiscard]] CancellationToken tokenForVersion(std::uint64_t version) const;

        // Convenience: nextVersion() followed by tokenForVersion().
        [[nodiscard]] CancellationToken nextToken();

    private:
        std::shared_ptr<std::atomic<std::uint64_t>> m_active;
    };
}

#endif //FSINDEX_CANCELLATION_H
