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
 * @file RouteFinder.cpp
 * @brief Lazy search for node-disjoint path combinations.
 *
 * Implementation notes (concise):
 *  - Nothing is enumerated up front: path sequences, their per-group
 *    products and the final product are all pulled on demand, so the first
 *    disjoint combination is found without materializing the whole space.
 *  - Disjointness is checked between merged parts only; paths of one part
 *    share their common terminals by construction.
 */

#include "RouteFinder.hpp"

#include <set>
#include <string>

#include "DisjointPartition.hpp"

static bool pathGroupsAreDisjoint(const std::vector<PathGroup> &pathGroups)
{
    std::set<NodeId> seen;
    for (const auto &paths : pathGroups) {
        std::set<NodeId> nodes;
        for (const auto &path : paths) nodes.insert(path.begin(), path.end());
        for (const auto &node : nodes)
            if (!seen.insert(node).second) return false;
    }
    return true;
}

RouteFinder::RouteFinder(const RoutingGraphAdapter &graph, int maxPathsPerPair)
    : adapter(graph), maxPathsPerPair(maxPathsPerPair)
{
}

RoutingResult RouteFinder::findPathsFor(
    const std::vector<SourceGroup> &sourceGroups,
    const std::vector<TerminalGroup> &terminalGroups,
    std::vector<Path> &paths) const
{
    paths.clear();
    for (const auto &sources : sourceGroups) {
        if (sources.size() != terminalGroups.size())
            return RoutingResult::failure(
                RoutingErrorKind::MalformedRequest,
                "Source group has " + std::to_string(sources.size()) +
                    " sources for " + std::to_string(terminalGroups.size()) +
                    " terminal group(s).");
        if (disjointPathsAmong(terminalGroups, sources, paths))
            return RoutingResult::success();
    }
    return RoutingResult::failure(RoutingErrorKind::NoDisjointPath,
                                  "No available routes between " +
                                      describeGroups(sourceGroups) + " and " +
                                      describeGroups(terminalGroups) + ".");
}

std::vector<std::vector<std::size_t>> RouteFinder::mergedGroupIndices(
    const std::vector<TerminalGroup> &terminalGroups)
{
    DisjointPartition<std::size_t, NodeId> partition;
    for (std::size_t index = 0; index < terminalGroups.size(); ++index) {
        std::set<NodeId> elements(terminalGroups[index].begin(),
                                  terminalGroups[index].end());
        partition.insert(elements, index);
    }
    return partition.keys();
}

bool RouteFinder::disjointPathsAmong(
    const std::vector<TerminalGroup> &terminalGroups, const SourceGroup &sources,
    std::vector<Path> &paths) const
{
    std::vector<std::shared_ptr<PathGroupSequence>> pairGroups;
    for (std::size_t i = 0; i < sources.size(); ++i)
        pairGroups.push_back(shortestPathsBetween(sources[i], terminalGroups[i]));

    std::vector<std::shared_ptr<PathGroupSequence>> merged;
    for (const auto &indices : mergedGroupIndices(terminalGroups)) {
        if (indices.size() == 1) {
            merged.push_back(pairGroups[indices.front()]);
            continue;
        }
        std::vector<std::shared_ptr<PathGroupSequence>> members;
        for (std::size_t index : indices) members.push_back(pairGroups[index]);
        auto product = std::make_shared<LazyProduct<PathGroup>>(members);
        merged.push_back(std::make_shared<PathGroupSequence>(
            [product](PathGroup &flat) {
                std::vector<PathGroup> folded;
                if (!product->next(folded)) return false;
                flat.clear();
                for (const auto &group : folded)
                    flat.insert(flat.end(), group.begin(), group.end());
                return true;
            }));
    }

    LazyProduct<PathGroup> combinations(merged);
    std::vector<PathGroup> combination;
    while (combinations.next(combination)) {
        if (!pathGroupsAreDisjoint(combination)) continue;
        paths.clear();
        for (const auto &group : combination)
            paths.insert(paths.end(), group.begin(), group.end());
        return true;
    }
    return false;
}

std::shared_ptr<RouteFinder::PathGroupSequence> RouteFinder::shortestPathsBetween(
    const NodeId &source, const TerminalGroup &terminals) const
{
    StationGraph searchGraph = adapter.makeSearchGraphFor(terminals);

    std::vector<std::shared_ptr<LazySequence<Path>>> perTerminal;
    for (const NodeId &terminal : terminals) {
        auto enumerator = std::make_shared<PathEnumerator>(
            searchGraph.shortestPathsBetween(source, terminal));
        auto drawn = std::make_shared<int>(0);
        int limit = maxPathsPerPair;
        perTerminal.push_back(std::make_shared<LazySequence<Path>>(
            [enumerator, drawn, limit](Path &path) {
                if (limit > 0 && *drawn >= limit) return false;
                if (!enumerator->next(path)) return false;
                ++*drawn;
                return true;
            }));
    }
    return lazyProductOf(perTerminal);
}
