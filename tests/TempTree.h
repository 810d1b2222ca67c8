// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_TESTS_TEMPTREE_H
#define FSINDEX_TESTS_TEMPTREE_H

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "../index/Construction.h"
#include "../index/FsPath.h"
#include "../index/RootIndexData.h"
#include "../index/Walker.h"

namespace FsIndex::Test {
    // Fixture owning a fresh directory under the system temp dir, removed after each test.
    class TempTreeTest : public ::testing::Test {
    protected:
        void SetUp() override {
            static std::atomic<int> counter{0};
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            const std::string unique = std::string("fsindex_") + info->test_suite_name() + "_" + info->name() + "_"
                                       + std::to_string(::getpid()) + "_" + std::to_string(counter++);

            const auto dir = std::filesystem::temp_directory_path() / unique;
            std::filesystem::remove_all(dir);
            std::filesystem::create_directories(dir);
            // /tmp is a symlink on some systems; the index stores real paths.
            m_root = std::filesystem::canonical(dir);
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove_all(m_root, ec);
        }

        [[nodiscard]] std::string rootPath() const { return m_root.string(); }

        [[nodiscard]] std::string path(const std::string& relative) const {
            return FsPath::join(rootPath(), relative);
        }

        void makeDir(const std::string& relative) const {
            std::filesystem::create_directories(m_root / relative);
        }

        void writeFile(const std::string& relative, const std::string& content) const {
            const auto target = m_root / relative;
            std::filesystem::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            out << content;
        }

        void writeFileOfSize(const std::string& relative, std::size_t bytes) const {
            writeFile(relative, std::string(bytes, 'x'));
        }

        void removePath(const std::string& relative) const {
            std::filesystem::remove_all(m_root / relative);
        }

        [[nodiscard]] std::unique_ptr<RootIndexData> buildIndex(std::vector<std::string> ignored = {},
                                                                std::string root = {}) const {
            if (root.empty()) root = rootPath();
            WalkData walk(root, std::move(ignored));
            auto tree = walkIt(walk);
            if (!tree) return nullptr;

            RootIndexData::Counters counters;
            counters.scannedFiles = walk.numFiles.load();
            counters.scannedDirs = walk.numDirs.load();
            counters.errors = walk.numErrors.load();
            return std::make_unique<RootIndexData>(construct(*tree), root, counters);
        }

    private:
        std::filesystem::path m_root;
    };
}

#endif //FSINDEX_TESTS_TEMPTREE_H
