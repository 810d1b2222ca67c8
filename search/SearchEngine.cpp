// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SearchEngine.h"
#include "FileTags.h"
#include "../index/FsPath.h"
#include "../index/NodeView.h"
#include "../query/ContentSearch.h"
#include "../query/QueryMatcher.h"
#include "../query/TextMatch.h"

#include <algorithm>
#include <atomic>
#include <execution>
#include <iterator>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>

namespace FsIndex {
    std::optional<KindFilter> parseKindFilter(std::string_view value) {
        const std::string kind = asciiLower(value);
        if (kind.empty() || kind == "all") return KindFilter::All;
        if (kind == "files" || kind == "file") return KindFilter::Files;
        if (kind == "directories" || kind == "directory" || kind == "folders" || kind == "folder")
            return KindFilter::Directories;
        return std::nullopt;
    }

    void SearchResult::applyIndexStatus(const IndexStatus& status) {
        indexState = status.state;
        indexScannedFiles = status.scannedFiles;
        indexScannedDirs = status.scannedDirs;
        indexStartedAt = status.startedAt;
        indexLastUpdateAt = status.lastUpdateAt;
        indexFinishedAt = status.finishedAt;
    }

    namespace {
        // Node ids in ascending order, without duplicates.
        using IdSet = std::vector<SlabIndex>;

        struct SearchCandidate {
            SlabIndex id;
            std::string path;
        };

        // Grain for per-file I/O; one file is already a lot of work.
        constexpr std::size_t kIoGrain = 16;

        FileType toFileType(NodeFileType type) {
            switch (type) {
                case NodeFileType::File: return FileType::File;
                case NodeFileType::Dir: return FileType::Directory;
                case NodeFileType::Symlink: return FileType::Symlink;
                case NodeFileType::Unknown: return FileType::Other;
            }
            return FileType::Other;
        }

        bool contains(const IdSet& set, SlabIndex id) {
            return std::binary_search(set.begin(), set.end(), id);
        }

        void normalize(IdSet& ids) {
            std::sort(ids.begin(), ids.end());
            ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        }

        IdSet intersect(const IdSet& a, const IdSet& b) {
            IdSet out;
            std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
            return out;
        }

        class Evaluator {
        public:
            Evaluator(const RootIndexData& data, const QueryMatcher& matcher,
                      const std::vector<SearchCandidate>& candidates, const CancellationToken& token)
                : m_data(data), m_matcher(matcher), m_candidates(candidates), m_token(token) {}

            // Ids in universe that satisfy expression, or nullopt when cancelled.
            std::optional<IdSet> evaluate(const QueryExpression& expression, const IdSet& universe) {
                if (m_token.isCancelled()) return std::nullopt;

                switch (expression.kind) {
                    case QueryExpression::Kind::Term:
                        return evaluateTerm(*expression.term, universe);

                    case QueryExpression::Kind::Not: {
                        auto inner = evaluate(expression.children.front(), universe);
                        if (!inner) return std::nullopt;
                        IdSet out;
                        std::set_difference(universe.begin(), universe.end(), inner->begin(), inner->end(),
                                            std::back_inserter(out));
                        return out;
                    }

                    case QueryExpression::Kind::And: {
                        // Each operand only has to look at what survived the previous ones.
                        IdSet running = universe;
                        for (const auto& part : expression.children) {
                            auto matched = evaluate(part, running);
                            if (!matched) return std::nullopt;
                            running = intersect(running, *matched);
                            if (running.empty()) break;
                        }
                        return running;
                    }

                    case QueryExpression::Kind::Or: {
                        IdSet out;
                        for (const auto& part : expression.children) {
                            auto matched = evaluate(part, universe);
                            if (!matched) return std::nullopt;
                            IdSet merged;
                            std::set_union(out.begin(), out.end(), matched->begin(), matched->end(),
                                           std::back_inserter(merged));
                            out = std::move(merged);
                        }
                        return out;
                    }
                }
                return IdSet{};
            }

        private:
            std::optional<IdSet> evaluateTerm(const QueryTerm& term, const IdSet& universe) {
                const QueryFilter* filter = term.asFilter();
                if (filter) {
                    if (const auto* content = std::get_if<ContentFilter>(filter))
                        return evaluateContent(content->needle, universe);
                    if (const auto* tag = std::get_if<TagFilter>(filter))
                        return evaluateTags(tag->tags, universe);

                    if (auto structural = structuralSet(*filter, universe)) return structural;

                    if (auto prefilter = prefilterSet(*filter)) {
                        IdSet narrowed = intersect(*prefilter, universe);
                        if (isExactPrefilter(*filter)) return narrowed;
                        return evaluatePerNode(term, narrowed);
                    }
                }
                return evaluatePerNode(term, universe);
            }

            // Walks candidates and the sorted id set side by side.
            template<typename Fn>
            bool forEachCandidateIn(const IdSet& ids, Fn&& fn) const {
                auto it = ids.begin();
                std::size_t counter = 0;
                for (const auto& candidate : m_candidates) {
                    if (m_token.isCancelledSparse(counter++)) return false;
                    while (it != ids.end() && *it < candidate.id) ++it;
                    if (it == ids.end()) break;
                    if (*it == candidate.id) fn(candidate);
                }
                return true;
            }

            std::optional<IdSet> evaluatePerNode(const QueryTerm& term, const IdSet& universe) const {
                IdSet out;
                const bool finished = forEachCandidateIn(universe, [&](const SearchCandidate& candidate) {
                    const SlabNode* node = m_data.getNode(candidate.id);
                    if (node && m_matcher.matchesNodeTerm(term, *node, candidate.path)) out.push_back(candidate.id);
                });
                if (!finished) return std::nullopt;
                return out;
            }

            std::optional<IdSet> structuralSet(const QueryFilter& filter, const IdSet& universe) const {
                if (const auto* parent = std::get_if<ParentFilter>(&filter)) {
                    const auto folder = m_data.nodeIdForPath(parent->path, m_matcher.caseSensitive());
                    const SlabNode* node = folder ? m_data.getNode(*folder) : nullptr;
                    if (!node) return std::nullopt;

                    IdSet out;
                    for (const SlabIndex child : node->children()) {
                        if (contains(universe, child)) out.push_back(child);
                    }
                    normalize(out);
                    return out;
                }

                if (const auto* inFolder = std::get_if<InFolderFilter>(&filter)) {
                    const auto folder = m_data.nodeIdForPath(inFolder->path, m_matcher.caseSensitive());
                    if (!folder || !m_data.getNode(*folder)) return std::nullopt;

                    IdSet out;
                    std::vector<SlabIndex> stack{*folder};
                    std::size_t counter = 0;
                    while (!stack.empty()) {
                        if (m_token.isCancelledSparse(counter++)) break;
                        const SlabIndex current = stack.back();
                        stack.pop_back();
                        const SlabNode* node = m_data.getNode(current);
                        if (!node) continue;
                        for (const SlabIndex child : node->children()) {
                            if (contains(universe, child)) out.push_back(child);
                            stack.push_back(child);
                        }
                    }
                    normalize(out);
                    return out;
                }

                if (const auto* noSub = std::get_if<NoSubfoldersFilter>(&filter)) {
                    const auto folder = m_data.nodeIdForPath(noSub->path, m_matcher.caseSensitive());
                    const SlabNode* node = folder ? m_data.getNode(*folder) : nullptr;
                    if (!node) return std::nullopt;

                    IdSet out;
                    if (contains(universe, *folder)) out.push_back(*folder);
                    for (const SlabIndex child : node->children()) {
                        const SlabNode* childNode = m_data.getNode(child);
                        if (childNode && childNode->isFile() && contains(universe, child)) out.push_back(child);
                    }
                    normalize(out);
                    return out;
                }

                return std::nullopt;
            }

            IdSet extensionIds(std::span<const std::string_view> extensions) const {
                IdSet out;
                for (const auto& ext : extensions) {
                    const auto ids = m_data.indicesForExtension(ext);
                    out.insert(out.end(), ids.begin(), ids.end());
                }
                normalize(out);
                return out;
            }

            IdSet targetIds(const TypeFilterTarget& target) const {
                switch (target.kind) {
                    case TypeFilterTarget::Kind::File: return m_data.fileIds();
                    case TypeFilterTarget::Kind::Directory: return m_data.directoryIds();
                    case TypeFilterTarget::Kind::Extensions: return extensionIds(target.extensions);
                }
                return {};
            }

            // Index-backed superset of the filter's matches, where the index can provide one.
            std::optional<IdSet> prefilterSet(const QueryFilter& filter) const {
                return std::visit([this](const auto& f) -> std::optional<IdSet> {
                    using T = std::decay_t<decltype(f)>;
                    if constexpr (std::is_same_v<T, ExtensionFilter>) {
                        IdSet out;
                        for (const auto& ext : f.extensions) {
                            const auto ids = m_data.indicesForExtension(ext);
                            out.insert(out.end(), ids.begin(), ids.end());
                        }
                        normalize(out);
                        return out;
                    } else if constexpr (std::is_same_v<T, TypeFilter> || std::is_same_v<T, TypeMacroFilter>) {
                        return targetIds(f.target);
                    } else if constexpr (std::is_same_v<T, FileFilter>) {
                        return m_data.fileIds();
                    } else if constexpr (std::is_same_v<T, FolderFilter>) {
                        return m_data.directoryIds();
                    } else {
                        return std::nullopt;
                    }
                }, filter);
            }

            // True when the prefilter set is the exact answer and no per-node check is needed.
            static bool isExactPrefilter(const QueryFilter& filter) {
                if (std::holds_alternative<ExtensionFilter>(filter) || std::holds_alternative<TypeFilter>(filter))
                    return true;
                if (const auto* f = std::get_if<TypeMacroFilter>(&filter)) return !f->argument;
                if (const auto* f = std::get_if<FileFilter>(&filter)) return !f->argument;
                if (const auto* f = std::get_if<FolderFilter>(&filter)) return !f->argument;
                return false;
            }

            template<typename Predicate>
            std::optional<IdSet> evaluateInParallel(const std::vector<const SearchCandidate*>& targets, Predicate&& predicate) const {
                tbb::enumerable_thread_specific<std::vector<SlabIndex>> tlsHits;
                std::atomic<bool> cancelled{false};

                tbb::parallel_for(
                    tbb::blocked_range<size_t>(0, targets.size(), kIoGrain),
                    [&](const tbb::blocked_range<size_t>& r) {
                        auto& local = tlsHits.local();
                        for (size_t i = r.begin(); i != r.end(); ++i) {
                            if (cancelled.load(std::memory_order_relaxed)) return;
                            const std::optional<bool> hit = predicate(*targets[i]);
                            if (!hit) {
                                cancelled.store(true, std::memory_order_relaxed);
                                return;
                            }
                            if (*hit) local.push_back(targets[i]->id);
                        }
                    }
                );

                if (cancelled.load() || m_token.isCancelled()) return std::nullopt;

                IdSet out;
                for (auto& v : tlsHits) out.insert(out.end(), v.begin(), v.end());
                normalize(out);
                return out;
            }

            std::optional<IdSet> evaluateContent(const std::string& needle, const IdSet& universe) const {
                if (m_token.isCancelled()) return std::nullopt;
                if (needle.empty()) return IdSet{};

                std::vector<const SearchCandidate*> files;
                const bool finished = forEachCandidateIn(universe, [&](const SearchCandidate& candidate) {
                    const SlabNode* node = m_data.getNode(candidate.id);
                    if (node && node->fileType() == NodeFileType::File) files.push_back(&candidate);
                });
                if (!finished) return std::nullopt;

                const bool caseInsensitive = !m_matcher.caseSensitive();
                return evaluateInParallel(files, [&](const SearchCandidate& candidate) {
                    return fileContentMatches(candidate.path, needle, caseInsensitive, m_token);
                });
            }

            std::optional<IdSet> evaluateTags(const std::vector<std::string>& tags, const IdSet& universe) const {
                if (m_token.isCancelled()) return std::nullopt;
                if (tags.empty()) return IdSet{};

                std::vector<const SearchCandidate*> nodes;
                const bool finished = forEachCandidateIn(universe, [&](const SearchCandidate& candidate) {
                    nodes.push_back(&candidate);
                });
                if (!finished) return std::nullopt;

                const bool caseInsensitive = !m_matcher.caseSensitive();
                return evaluateInParallel(nodes, [&](const SearchCandidate& candidate) -> std::optional<bool> {
                    if (m_token.isCancelled()) return std::nullopt;
                    return fileHasAnyTag(candidate.path, tags, caseInsensitive);
                });
            }

            const RootIndexData& m_data;
            const QueryMatcher& m_matcher;
            const std::vector<SearchCandidate>& m_candidates;
            const CancellationToken& m_token;
        };

        // Ids whose name contains every required term, or nullopt when there is nothing to prefilter on.
        std::optional<IdSet> candidateIdsForTerms(const RootIndexData& data, const std::vector<std::string>& terms,
                                                  bool caseSensitive, const CancellationToken& token) {
            if (terms.empty()) return std::nullopt;

            std::optional<IdSet> intersection;
            for (const std::string& term : terms) {
                IdSet matched;
                std::size_t counter = 0;
                for (const auto& [name, ids] : data.nameIndex()) {
                    if (token.isCancelledSparse(counter++)) return IdSet{};
                    const bool hit = caseSensitive ? name.find(term) != std::string_view::npos
                                                   : asciiLower(name).find(term) != std::string::npos;
                    if (hit) matched.insert(matched.end(), ids.begin(), ids.end());
                }
                normalize(matched);
                if (matched.empty()) return IdSet{};

                intersection = intersection ? intersect(*intersection, matched) : std::move(matched);
            }
            return intersection;
        }
    }

    std::optional<SearchResult> searchIndexData(const std::string& root, const RootIndexData& data,
                                                const SearchRequest& request, const CancellationToken& token) {
        const QueryMatcher matcher = QueryMatcher::compile(request.query, request.caseSensitive);

        const auto prefiltered = candidateIdsForTerms(data, matcher.requiredNameTerms(), request.caseSensitive, token);
        if (token.isCancelled()) return std::nullopt;

        const std::size_t rootDepth = FsPath::componentDepth(root);
        const auto& slab = data.fileNodes().slab();

        std::vector<SearchCandidate> candidates;
        std::size_t counter = 0;
        bool cancelled = false;
        data.forEachNode([&](SlabIndex id, const SlabNode&) {
            if (cancelled) return;
            if (token.isCancelledSparse(counter++)) {
                cancelled = true;
                return;
            }
            if (prefiltered && !contains(*prefiltered, id)) return;

            const NodeView view(slab, id);
            const std::size_t absoluteDepth = view.computeDepth().value_or(0);
            // Ancestors of the indexed root.
            if (absoluteDepth < rootDepth) return;

            const std::size_t relativeDepth = absoluteDepth - rootDepth;
            if (relativeDepth > request.maxDepth) return;

            // Only names below the indexed root count; a hidden root stays searchable.
            if (!request.includeHidden && relativeDepth > 0
                && view.isHiddenWithinDepth(relativeDepth - 1).value_or(false))
                return;

            auto path = view.computePath();
            if (!path) return;
            candidates.push_back(SearchCandidate{id, std::move(*path)});
        });
        if (cancelled || token.isCancelled()) return std::nullopt;

        IdSet universe;
        universe.reserve(candidates.size());
        for (const auto& candidate : candidates) universe.push_back(candidate.id);

        Evaluator evaluator(data, matcher, candidates, token);
        const auto matched = evaluator.evaluate(matcher.expression(), universe);
        if (!matched || token.isCancelled()) return std::nullopt;

        SearchResult result;
        result.query = request.query;
        result.root = root;
        result.scanned = candidates.size();
        result.errors = data.errors();
        result.highlightTerms = matcher.highlightTerms();

        counter = 0;
        auto it = matched->begin();
        for (auto& candidate : candidates) {
            if (token.isCancelledSparse(counter++)) return std::nullopt;
            while (it != matched->end() && *it < candidate.id) ++it;
            if (it == matched->end()) break;
            if (*it != candidate.id) continue;

            const SlabNode* node = data.getNode(candidate.id);
            if (!node) continue;
            const FileType type = toFileType(node->fileType());
            if (!kindFilterMatches(request.kind, type)) continue;

            FileEntry entry;
            entry.path = std::move(candidate.path);
            entry.name = std::string(node->name());
            entry.type = type;
            entry.size = node->size();
            entry.modifiedAt = node->modifiedAt();
            result.entries.push_back(std::move(entry));
        }

        auto byName = [](const FileEntry& a, const FileEntry& b) { return a.name < b.name; };
        if (result.entries.size() >= 200'000) {
            std::stable_sort(std::execution::par, result.entries.begin(), result.entries.end(), byName);
        } else {
            std::stable_sort(result.entries.begin(), result.entries.end(), byName);
        }

        result.truncated = result.entries.size() > request.maxResults;
        if (result.truncated) result.entries.resize(request.maxResults);
        result.count = result.entries.size();
        return result;
    }
}
