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
 * @file SourceFinder.cpp
 * @brief Breadth-first source search and appraisal of source combinations.
 *
 * Implementation notes:
 *  - A node met by the reverse search counts as a source when it is flagged
 *    as an eligible source, or when all of its predecessors are nodes that
 *    the same search already rejected (nothing further upstream can feed
 *    it).
 *  - Distances of the candidates of a group are kept in an Eigen matrix
 *    (terminal x candidate); the column sums give the summed distance used
 *    for ordering.
 */

#include "SourceFinder.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <limits>
#include <numeric>
#include <set>
#include <utility>

#include "LazySequence.hpp"

static std::vector<NodeId> ascendingDistanceSourcesOf(const StationGraph &graph,
                                                      const NodeId &terminal)
{
    std::vector<NodeId> sources;
    std::set<NodeId> visitedNonSources;
    for (const NodeId &id : graph.breadthFirstNodesFrom(terminal, true)) {
        NodePtr node = graph.node(id);
        bool eligible = node && node->isEligibleSource();

        bool fedBySource = true;
        for (const NodeId &predecessor : graph.predecessorsOf(id)) {
            if (visitedNonSources.count(predecessor) == 0) {
                fedBySource = false;
                break;
            }
        }

        if (eligible || fedBySource)
            sources.push_back(id);
        else
            visitedNonSources.insert(id);
    }
    return sources;
}

// Node count of the shortest path; unreachable pairs sort last.
static int distanceBetween(const StationGraph &graph, const NodeId &source,
                           const NodeId &terminal)
{
    PathEnumerator paths = graph.shortestPathsBetween(source, terminal);
    Path shortest;
    if (!paths.next(shortest)) return std::numeric_limits<int>::max() / 4;
    return static_cast<int>(shortest.size());
}

SourceFinder::SourceFinder(const RoutingGraphAdapter &graph,
                           NodeAppraiser appraiser)
    : adapter(graph), appraiser(std::move(appraiser))
{
}

std::vector<NodeId> SourceFinder::nearestSourcesAvailableTo(
    const TerminalGroup &terminals, std::vector<int> &distances) const
{
    distances.clear();
    if (terminals.empty()) return {};

    StationGraph searchGraph = adapter.makeSearchGraphFor(terminals);

    std::vector<std::vector<NodeId>> perTerminal;
    for (const NodeId &terminal : terminals)
        perTerminal.push_back(ascendingDistanceSourcesOf(searchGraph, terminal));

    std::vector<NodeId> candidates;
    for (const NodeId &candidate : perTerminal.front()) {
        bool common = true;
        for (std::size_t t = 1; t < perTerminal.size() && common; ++t)
            common = std::find(perTerminal[t].begin(), perTerminal[t].end(),
                               candidate) != perTerminal[t].end();
        if (common) candidates.push_back(candidate);
    }

    const Eigen::Index rows = static_cast<Eigen::Index>(terminals.size());
    const Eigen::Index cols = static_cast<Eigen::Index>(candidates.size());
    Eigen::MatrixXi table(rows, cols);
    for (Eigen::Index c = 0; c < cols; ++c)
        for (Eigen::Index t = 0; t < rows; ++t)
            table(t, c) = distanceBetween(searchGraph, candidates[c],
                                          terminals[t]);
    Eigen::VectorXi totals = table.colwise().sum().transpose();

    // A single terminal keeps breadth-first order as is.
    std::vector<std::size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), 0);
    if (terminals.size() > 1)
        std::stable_sort(order.begin(), order.end(),
                         [&totals](std::size_t a, std::size_t b) {
                             return totals(a) < totals(b);
                         });

    std::vector<NodeId> sorted;
    for (std::size_t index : order) {
        sorted.push_back(candidates[index]);
        distances.push_back(totals(static_cast<Eigen::Index>(index)));
    }
    return sorted;
}

RoutingResult SourceFinder::findEligibleSourceGroups(
    const std::vector<TerminalGroup> &terminalGroups,
    std::vector<SourceGroup> &ranked) const
{
    ranked.clear();

    std::vector<std::shared_ptr<LazySequence<std::size_t>>> dimensions;
    std::vector<std::vector<NodeId>> candidates;
    std::vector<std::vector<int>> distances;
    for (const auto &group : terminalGroups) {
        std::vector<int> groupDistances;
        candidates.push_back(nearestSourcesAvailableTo(group, groupDistances));
        distances.push_back(groupDistances);

        std::vector<std::size_t> positions(candidates.back().size());
        std::iota(positions.begin(), positions.end(), 0);
        dimensions.push_back(LazySequence<std::size_t>::fromVector(positions));
    }

    struct Appraisal
    {
        int score;
        long distance;
        SourceGroup sources;
    };
    std::vector<Appraisal> eligible;

    LazyProduct<std::size_t> product(dimensions);
    std::vector<std::size_t> combination;
    while (product.next(combination)) {
        SourceGroup sources;
        std::vector<NodePtr> nodes;
        long distance = 0;
        for (std::size_t g = 0; g < combination.size(); ++g) {
            sources.push_back(candidates[g][combination[g]]);
            nodes.push_back(adapter.graph().node(sources.back()));
            distance += distances[g][combination[g]];
        }
        int score = appraiser(nodes);
        if (score > 0) eligible.push_back({score, distance, sources});
    }

    std::stable_sort(eligible.begin(), eligible.end(),
                     [](const Appraisal &a, const Appraisal &b) {
                         if (a.score != b.score) return a.score > b.score;
                         return a.distance < b.distance;
                     });
    for (const auto &appraisal : eligible) ranked.push_back(appraisal.sources);

    if (ranked.empty())
        return RoutingResult::failure(
            RoutingErrorKind::NoEligibleSource,
            "No eligible sources found for " + describeGroups(terminalGroups) +
                ".");
    return RoutingResult::success();
}
