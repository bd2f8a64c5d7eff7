/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */
/**
 * @file PathEnumerator.cpp
 * @brief Lazy shortest-simple-path enumeration (Yen's algorithm).
 *
 * Implementation notes (concise):
 *  - Edges have unit weight, so every shortest path query is a plain BFS.
 *  - After a path is returned, spur paths are computed from each of its
 *    prefixes with the edges used by previously returned paths sharing that
 *    prefix removed, and the root prefix nodes blocked. Candidates are kept
 *    in a buffer ordered by (length, insertion counter).
 *  - Nothing is computed until `next()` is called, and each call computes
 *    only the spur paths of the previously returned path.
 */

#include <algorithm>
#include <deque>

#include "StationGraph.hpp"

PathEnumerator::PathEnumerator(const StationGraph &graph, const NodeId &source,
                               const NodeId &destination)
    : graph(graph)
{
    long from = graph.nodeIndexOf(source);
    long to = graph.nodeIndexOf(destination);
    if (from >= 0 && to >= 0) {
        sourceIndex = static_cast<std::size_t>(from);
        destinationIndex = static_cast<std::size_t>(to);
        valid = true;
    }
}

bool PathEnumerator::next(Path &path)
{
    if (!valid) return false;

    if (!started) {
        started = true;
        std::vector<bool> noBlockedNodes(graph.storage->nodes.size(), false);
        IndexPath first = shortestPath(sourceIndex, noBlockedNodes, {});
        if (first.empty()) {
            valid = false;
            return false;
        }
        accepted.push_back(first);
        path = toPath(first);
        return true;
    }

    addSpurCandidates(accepted.back());
    if (candidates.empty()) {
        valid = false;
        return false;
    }

    auto best = std::min_element(
        candidates.begin(), candidates.end(),
        [](const std::pair<std::size_t, IndexPath> &a,
           const std::pair<std::size_t, IndexPath> &b) {
            if (a.second.size() != b.second.size())
                return a.second.size() < b.second.size();
            return a.first < b.first;
        });
    IndexPath chosen = best->second;
    candidates.erase(best);
    accepted.push_back(chosen);
    path = toPath(chosen);
    return true;
}

PathEnumerator::IndexPath PathEnumerator::shortestPath(
    std::size_t from, const std::vector<bool> &blockedNodes,
    const std::vector<std::pair<std::size_t, std::size_t>> &blockedEdges) const
{
    if (from == destinationIndex) return {from};

    const std::size_t count = graph.storage->nodes.size();
    const std::size_t unset = count;
    std::vector<std::size_t> parent(count, unset);
    std::deque<std::size_t> queue;
    parent[from] = from;
    queue.push_back(from);

    while (!queue.empty()) {
        std::size_t current = queue.front();
        queue.pop_front();
        for (std::size_t next : graph.adjacentIndices(current, false)) {
            if (parent[next] != unset || blockedNodes[next]) continue;
            if (std::find(blockedEdges.begin(), blockedEdges.end(),
                          std::make_pair(current, next)) != blockedEdges.end())
                continue;
            parent[next] = current;
            if (next == destinationIndex) {
                IndexPath reversed = {next};
                while (reversed.back() != from)
                    reversed.push_back(parent[reversed.back()]);
                return IndexPath(reversed.rbegin(), reversed.rend());
            }
            queue.push_back(next);
        }
    }
    return {};
}

void PathEnumerator::addSpurCandidates(const IndexPath &previous)
{
    for (std::size_t i = 0; i + 1 < previous.size(); ++i) {
        std::size_t spur = previous[i];
        IndexPath root(previous.begin(), previous.begin() + i + 1);

        // Remove the next hop of every returned path sharing this root.
        std::vector<std::pair<std::size_t, std::size_t>> blockedEdges;
        for (const auto &done : accepted) {
            if (done.size() > i + 1 &&
                std::equal(root.begin(), root.end(), done.begin()))
                blockedEdges.emplace_back(done[i], done[i + 1]);
        }

        // Root nodes other than the spur node keep the path simple.
        std::vector<bool> blockedNodes(graph.storage->nodes.size(), false);
        for (std::size_t j = 0; j < i; ++j) blockedNodes[root[j]] = true;

        IndexPath spurPath = shortestPath(spur, blockedNodes, blockedEdges);
        if (spurPath.empty()) continue;

        IndexPath total(root.begin(), root.end() - 1);
        total.insert(total.end(), spurPath.begin(), spurPath.end());

        bool known =
            std::find(accepted.begin(), accepted.end(), total) != accepted.end();
        for (const auto &candidate : candidates) {
            if (known) break;
            known = candidate.second == total;
        }
        if (!known) candidates.emplace_back(candidateCounter++, total);
    }
}

Path PathEnumerator::toPath(const IndexPath &indices) const
{
    Path path;
    path.reserve(indices.size());
    for (std::size_t index : indices)
        path.push_back(graph.storage->nodes[index].id);
    return path;
}
