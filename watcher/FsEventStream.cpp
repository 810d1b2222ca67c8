// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FsEventStream.h"
#include "FsEvent.h"

#include <future>
#include <utility>

namespace FsIndex {
    static constexpr CFTimeInterval kLatencySeconds = 0.05;
    static constexpr size_t kMaxExclusionPaths = 8;

    static CFStringRef makeCfString(const std::string& s) {
        return CFStringCreateWithBytes(kCFAllocatorDefault,
                                       reinterpret_cast<const UInt8*>(s.data()),
                                       static_cast<CFIndex>(s.size()),
                                       kCFStringEncodingUTF8,
                                       false);
    }

    FsEventStream::FsEventStream(std::string root, std::vector<std::string> ignoredPaths,
                                 std::uint64_t sinceEventId, WatcherSink sink)
        : m_root(std::move(root)),
          m_ignoredPaths(std::move(ignoredPaths)),
          m_sinceEventId(sinceEventId),
          m_sink(std::move(sink)),
          m_lastEventId(sinceEventId == kFSEventStreamEventIdSinceNow ? 0 : sinceEventId) {}

    FsEventStream::~FsEventStream() {
        stop();
    }

    std::uint64_t FsEventStream::currentEventId() {
        return static_cast<std::uint64_t>(FSEventsGetCurrentEventId());
    }

    bool FsEventStream::start() {
        if (m_stream) return true;
        m_stopRequested.store(false);

        CFStringRef cfRoot = makeCfString(m_root);
        CFArrayRef pathsToWatch = CFArrayCreate(kCFAllocatorDefault,
                                                reinterpret_cast<const void**>(&cfRoot),
                                                1,
                                                &kCFTypeArrayCallBacks);
        CFRelease(cfRoot);

        FSEventStreamContext context{};
        context.info = this;

        m_stream = FSEventStreamCreate(kCFAllocatorDefault,
                                       &FsEventStream::onEvents,
                                       &context,
                                       pathsToWatch,
                                       static_cast<FSEventStreamEventId>(m_sinceEventId),
                                       kLatencySeconds,
                                       kFSEventStreamCreateFlagNoDefer |
                                       kFSEventStreamCreateFlagWatchRoot |
                                       kFSEventStreamCreateFlagFileEvents);
        CFRelease(pathsToWatch);

        if (!m_stream) {
            m_status = Status{"error", "FSEventStreamCreate failed for " + m_root};
            return false;
        }

        if (!m_ignoredPaths.empty()) {
            CFMutableArrayRef exclusions = CFArrayCreateMutable(kCFAllocatorDefault, 0, &kCFTypeArrayCallBacks);
            for (size_t i = 0; i < m_ignoredPaths.size() && i < kMaxExclusionPaths; ++i) {
                CFStringRef s = makeCfString(m_ignoredPaths[i]);
                CFArrayAppendValue(exclusions, s);
                CFRelease(s);
            }
            FSEventStreamSetExclusionPaths(m_stream, exclusions);
            CFRelease(exclusions);
        }

        std::promise<bool> started;
        auto startedFuture = started.get_future();

        m_thread = std::thread([this, &started]() {
            CFRunLoopRef loop = CFRunLoopGetCurrent();
            m_runLoop.store(loop);
            FSEventStreamScheduleWithRunLoop(m_stream, loop, kCFRunLoopDefaultMode);
            const bool ok = FSEventStreamStart(m_stream);
            started.set_value(ok);
            if (!ok) return;

            // Short slices so a stop() racing with startup is still noticed.
            while (!m_stopRequested.load()) {
                CFRunLoopRunInMode(kCFRunLoopDefaultMode, 0.25, false);
            }

            FSEventStreamStop(m_stream);
            FSEventStreamInvalidate(m_stream);
        });

        if (!startedFuture.get()) {
            m_thread.join();
            FSEventStreamInvalidate(m_stream);
            FSEventStreamRelease(m_stream);
            m_stream = nullptr;
            m_runLoop.store(nullptr);
            m_status = Status{"error", "FSEventStreamStart failed for " + m_root};
            return false;
        }

        m_status = Status{"watching", {}};
        return true;
    }

    void FsEventStream::stop() {
        if (!m_stream) return;

        m_stopRequested.store(true);
        if (CFRunLoopRef loop = m_runLoop.load()) {
            CFRunLoopStop(loop);
        }
        if (m_thread.joinable()) m_thread.join();

        FSEventStreamRelease(m_stream);
        m_stream = nullptr;
        m_runLoop.store(nullptr);
        m_status = Status{"error", "Stopped"};
    }

    void FsEventStream::onEvents(ConstFSEventStreamRef, void* info, size_t numEvents, void* eventPaths,
                                 const FSEventStreamEventFlags eventFlags[], const FSEventStreamEventId eventIds[]) {
        auto* self = static_cast<FsEventStream*>(info);
        self->handleBatch(numEvents, static_cast<char**>(eventPaths), eventFlags, eventIds);
    }

    void FsEventStream::handleBatch(size_t numEvents, char** paths,
                                    const FSEventStreamEventFlags flags[], const FSEventStreamEventId ids[]) {
        std::vector<FsEvent> batch;
        batch.reserve(numEvents);
        for (size_t i = 0; i < numEvents; ++i) {
            batch.push_back(FsEvent{paths[i] ? std::string(paths[i]) : std::string(),
                                    static_cast<std::uint32_t>(flags[i]),
                                    static_cast<std::uint64_t>(ids[i])});
        }

        std::uint64_t lastId = m_lastEventId.load();
        auto events = translateFsEventBatch(batch, m_root, lastId);
        m_lastEventId.store(lastId);

        for (auto& event : events) {
            m_sink(std::move(event));
        }
    }
}
