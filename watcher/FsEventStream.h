// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_WATCHER_FSEVENTSTREAM_H
#define FSINDEX_WATCHER_FSEVENTSTREAM_H

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include <CoreServices/CoreServices.h>

#include "WatcherEvent.h"

namespace FsIndex {
    /**
     * macOS notification backend: one FSEventStream scheduled on a private CFRunLoop thread.
     *
     * The raw stream handle never leaves this class. Every callback payload is copied into
     * FsEvent values, translated, and pushed into the sink. Destruction stops the run loop,
     * joins the thread and releases the stream.
     */
    class FsEventStream final {
    public:
        struct Status {
            std::string state; // "watching" | "error"
            std::string error; // empty if OK
        };

        /**
         * @param root Watched directory.
         * @param ignoredPaths Excluded from delivery (FSEvents accepts at most 8 of them).
         * @param sinceEventId Resume point; kFSEventStreamEventIdSinceNow for a fresh start.
         * @param sink Receives translated events on the run-loop thread.
         */
        FsEventStream(std::string root, std::vector<std::string> ignoredPaths,
                      std::uint64_t sinceEventId, WatcherSink sink);
        ~FsEventStream();

        FsEventStream(const FsEventStream&) = delete;
        FsEventStream& operator=(const FsEventStream&) = delete;

        // @return false if the stream could not be created or started; see status().
        bool start();
        void stop();

        [[nodiscard]] Status status() const { return m_status; }
        [[nodiscard]] std::uint64_t lastEventId() const noexcept { return m_lastEventId.load(); }

        [[nodiscard]] static std::uint64_t currentEventId();

    private:
        static void onEvents(ConstFSEventStreamRef stream, void* info, size_t numEvents, void* eventPaths,
                             const FSEventStreamEventFlags eventFlags[], const FSEventStreamEventId eventIds[]);

        void handleBatch(size_t numEvents, char** paths,
                         const FSEventStreamEventFlags flags[], const FSEventStreamEventId ids[]);

        std::string m_root;
        std::vector<std::string> m_ignoredPaths;
        std::uint64_t m_sinceEventId;
        WatcherSink m_sink;

        FSEventStreamRef m_stream = nullptr;
        std::atomic<CFRunLoopRef> m_runLoop{nullptr};
        std::thread m_thread;
        std::atomic<bool> m_stopRequested{false};
        std::atomic<std::uint64_t> m_lastEventId{0};
        Status m_status{"error", "Not started"};
    };
}

#endif //FSINDEX_WATCHER_FSEVENTSTREAM_H
