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
 * @file SourceFinder.hpp
 * @brief Ranking of candidate source combinations for a routing request.
 */

#pragma once

#include <string>
#include <vector>

#include "Appraisal.hpp"
#include "RoutingGraphAdapter.hpp"
#include "RoutingResult.hpp"

/** @brief Terminals that must be driven by one common source. */
using TerminalGroup = std::vector<NodeId>;

/** @brief One source per terminal group, aligned positionally. */
using SourceGroup = std::vector<NodeId>;

/**
 * @class SourceFinder
 * @brief Finds the sources reachable by each terminal group and ranks their
 * combinations with an appraiser.
 *
 * For every terminal group a reverse breadth-first search over the search
 * graph of that group collects the nearest sources. A group with several
 * terminals keeps only the sources common to all of them, ordered by the
 * summed distance to every terminal. The Cartesian product of the per-group
 * candidates is then appraised; combinations with a positive score are
 * returned best first (ties go to the shorter total distance, then to
 * product order).
 *
 * The search has no side effects on the graph or the claim table.
 */
class SourceFinder
{
   public:
    SourceFinder(const RoutingGraphAdapter &graph, NodeAppraiser appraiser);

    /**
     * @brief Rank the candidate source combinations for `terminalGroups`.
     *
     * @param terminalGroups Terminal groups of the request.
     * @param ranked Output; one source group per positively scored
     * combination, best first.
     * @return `NoEligibleSource` when no combination scores positive.
     */
    RoutingResult findEligibleSourceGroups(
        const std::vector<TerminalGroup> &terminalGroups,
        std::vector<SourceGroup> &ranked) const;

    /**
     * @brief Nearest sources of a terminal group in ascending distance.
     *
     * @param distances Output; summed distance of each returned source to
     * the terminals of the group (node count of the shortest path).
     */
    std::vector<NodeId> nearestSourcesAvailableTo(
        const TerminalGroup &terminals, std::vector<int> &distances) const;

   private:
    const RoutingGraphAdapter &adapter;
    NodeAppraiser appraiser;
};
