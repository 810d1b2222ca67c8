// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_WATCHER_EVENTCHANNEL_H
#define FSINDEX_WATCHER_EVENTCHANNEL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace FsIndex {
    /**
     * Unbounded FIFO between any number of producers and one consumer.
     * After close(), send() is refused and receive() drains what is left, then yields nullopt.
     */
    template<typename T>
    class EventChannel {
    public:
        // @return false if the channel is closed.
        bool send(T value) {
            {
                std::lock_guard lock(m_mutex);
                if (m_closed) return false;
                m_queue.push_back(std::move(value));
            }
            m_cv.notify_one();
            return true;
        }

        std::optional<T> receive() {
            std::unique_lock lock(m_mutex);
            m_cv.wait(lock, [this] { return m_closed || !m_queue.empty(); });
            return popLocked();
        }

        template<typename Rep, typename Period>
        std::optional<T> receiveFor(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock lock(m_mutex);
            m_cv.wait_for(lock, timeout, [this] { return m_closed || !m_queue.empty(); });
            return popLocked();
        }

        std::optional<T> tryReceive() {
            std::lock_guard lock(m_mutex);
            return popLocked();
        }

        void close() {
            {
                std::lock_guard lock(m_mutex);
                m_closed = true;
            }
            m_cv.notify_all();
        }

        [[nodiscard]] bool isClosed() const {
            std::lock_guard lock(m_mutex);
            return m_closed;
        }

    private:
        std::optional<T> popLocked() {
            if (m_queue.empty()) return std::nullopt;
            std::optional<T> out(std::move(m_queue.front()));
            m_queue.pop_front();
            return out;
        }

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::deque<T> m_queue;
        bool m_closed = false;
    };
}

#endif //FSINDEX_WATCHER_EVENTCHANNEL_H
