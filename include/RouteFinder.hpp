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
 * @file RouteFinder.hpp
 * @brief Disjoint path search for chosen source groups.
 */

#pragma once

#include <memory>
#include <vector>

#include "LazySequence.hpp"
#include "RoutingGraphAdapter.hpp"
#include "RoutingResult.hpp"
#include "SourceFinder.hpp"

/** @brief One path per terminal of a terminal group. */
using PathGroup = std::vector<Path>;

/**
 * @class RouteFinder
 * @brief Finds node-disjoint paths from sources to terminal groups.
 *
 * Source groups are tried in the order given. For one source group, every
 * (source, terminal group) pair yields a lazy sequence of path groups: the
 * product of the shortest simple paths from the source to each terminal of
 * the group, drawn from the search graph of that group. Terminal groups
 * sharing a terminal are merged first (they meet at that terminal and can
 * never be disjoint from each other); the merged sequences are combined by
 * product and the first combination whose merged parts have no node in
 * common is returned.
 */
class RouteFinder
{
   public:
    /**
     * @param graph Adapter providing the search graphs.
     * @param maxPathsPerPair Paths drawn per (source, terminal) pair; 0
     * draws every simple path.
     */
    explicit RouteFinder(const RoutingGraphAdapter &graph,
                         int maxPathsPerPair = 0);

    /**
     * @brief Find disjoint paths for the first feasible source group.
     *
     * @param sourceGroups Candidate source groups, best first; each holds
     * one source per terminal group.
     * @param terminalGroups Terminal groups of the request.
     * @param paths Output; every path of the accepted combination.
     * @return `NoDisjointPath` when no source group admits disjoint paths.
     */
    RoutingResult findPathsFor(const std::vector<SourceGroup> &sourceGroups,
                               const std::vector<TerminalGroup> &terminalGroups,
                               std::vector<Path> &paths) const;

    /**
     * @brief Indices of terminal groups merged by shared terminals.
     *
     * Each entry lists the indices of one part; the first index of a merged
     * part is the group inserted last.
     */
    static std::vector<std::vector<std::size_t>> mergedGroupIndices(
        const std::vector<TerminalGroup> &terminalGroups);

   private:
    using PathGroupSequence = LazySequence<PathGroup>;

    const RoutingGraphAdapter &adapter;
    int maxPathsPerPair;

    /** @brief Disjoint paths among the pairs of one source group. */
    bool disjointPathsAmong(const std::vector<TerminalGroup> &terminalGroups,
                            const SourceGroup &sources,
                            std::vector<Path> &paths) const;

    /** @brief Path groups from `source` to every terminal of a group. */
    std::shared_ptr<PathGroupSequence> shortestPathsBetween(
        const NodeId &source, const TerminalGroup &terminals) const;
};
