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
 * @file Router.cpp
 * @brief Router facade: request validation, search and commit.
 *
 * Commit order (connect):
 *  - each path becomes a sequence of edges, all tagged with the terminal the
 *    path ends at;
 *  - round k activates the k-th edge of every path that has one, each edge
 *    followed by a claim on its origin node;
 *  - finally every terminal claims itself.
 *
 * Release order (vacate) mirrors it: nodes first, in reverse breadth-first
 * order from the terminal, then the edges that fed them.
 */

#include "Router.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <utility>

Router::Router(const StationGraph &graph, const RouterOptions &options)
    : routerOptions(options), adapter(graph)
{
    if (routerOptions.diagVerbose) {
        diag = std::make_unique<std::ofstream>(routerOptions.diagFile,
                                               std::ios::app);
        if (*diag) {
            adapter.setDiagnostics(diag.get());
        }
        else {
            std::cerr << "Warning: Could not open " << routerOptions.diagFile
                      << " for writing. Diagnostic trace disabled."
                      << std::endl;
            diag.reset();
        }
    }

    initializeActiveEdges();
    activateDynamicEdges();
}

void Router::initializeActiveEdges()
{
    for (const EdgeId &edge : adapter.graph().edges()) {
        EdgePtr value = adapter.graph().edge(edge);
        if (!value || value->status() != EdgeStatus::ACTIVE_ELECTRICAL_CONNECTION)
            continue;
        RoutingResult result =
            adapter.activateEdge(edge, RoutingGraphAdapter::staticClaim);
        if (result.ok())
            result = adapter.activateNode(edge.first,
                                          RoutingGraphAdapter::staticClaim);
        if (!result.ok())
            std::cerr << "Warning: Could not take over active edge "
                      << edge.first << " -> " << edge.second << ": "
                      << result.message << std::endl;
    }
}

void Router::activateDynamicEdges()
{
    for (const NodeId &id : adapter.graph().nodes()) {
        NodePtr node = adapter.graph().node(id);
        if (!node || !node->activatesToSource()) continue;

        std::vector<NodeId> sources;
        if (!eligibleSourcesOf(id, sources).ok()) continue;
        for (const NodeId &source : sources) {
            RoutingResult result = connectSources({{source}}, {{id}});
            if (!result.ok())
                std::cerr << "Warning: Could not connect " << id
                          << " to source " << source << ": " << result.message
                          << std::endl;
        }
    }

    // Links made so far stay in place and are never vacated.
    adapter.makeClaimsStatic();
}

RoutingResult Router::report(const RoutingResult &result)
{
    if (!result.ok()) std::cerr << "Error: " << result.message << std::endl;
    return result;
}

RoutingResult Router::connect(const NodeId &source, const NodeId &terminal)
{
    return report(connectSources({{source}}, {{terminal}}));
}

RoutingResult Router::connect(const SourceGroup &sources,
                              const std::vector<TerminalGroup> &terminalGroups)
{
    return report(connectSources({sources}, terminalGroups));
}

RoutingResult Router::connectGroups(
    const std::vector<SourceGroup> &sourceGroups,
    const std::vector<TerminalGroup> &terminalGroups)
{
    if (sourceGroups.size() != 1)
        return report(RoutingResult::failure(
            RoutingErrorKind::MalformedRequest,
            sourceGroups.empty()
                ? "No source group supplied to connect."
                : "More than one source group supplied to connect."));
    return report(connectSources(sourceGroups, terminalGroups));
}

RoutingResult Router::connectByMap(
    const std::map<NodeId, TerminalGroup> &connections)
{
    SourceGroup sources;
    std::vector<TerminalGroup> terminalGroups;
    for (const auto &connection : connections) {
        sources.push_back(connection.first);
        terminalGroups.push_back(connection.second);
    }
    return connect(sources, terminalGroups);
}

RoutingResult Router::connectSources(
    const std::vector<SourceGroup> &sourceGroups,
    const std::vector<TerminalGroup> &terminalGroups)
{
    for (const auto &sources : sourceGroups) {
        if (sources.size() == terminalGroups.size()) continue;
        std::string counts;
        for (const auto &group : sourceGroups)
            counts += (counts.empty() ? "" : ", ") +
                      std::to_string(group.size());
        return RoutingResult::failure(
            RoutingErrorKind::MalformedRequest,
            "Trying to route source groups with the following number of "
            "sources each: [" +
                counts + "] to " + std::to_string(terminalGroups.size()) +
                " terminal group(s). Each source group must have as many "
                "sources as there are terminal groups.");
    }

    for (const auto &groups : {sourceGroups, terminalGroups}) {
        RoutingResult known = checkKnownIds(groups);
        if (!known.ok()) return known;
    }

    if (diag) {
        for (std::size_t i = 0; i < terminalGroups.size(); ++i) {
            std::vector<NodeId> candidates;
            for (const auto &sources : sourceGroups)
                candidates.push_back(sources[i]);
            *diag << "Connecting terminals: " << describeIds(terminalGroups[i])
                  << " to one of the sources: " << describeIds(candidates)
                  << "\n";
        }
    }

    RouteFinder finder(adapter, routerOptions.maxPathsPerPair);
    std::vector<Path> paths;
    RoutingResult found = finder.findPathsFor(sourceGroups, terminalGroups, paths);
    if (!found.ok()) return found;

    if (diag) *diag << "Found the following paths: " << describeGroups(paths)
                    << "\n";

    RoutingResult activated = activatePaths(paths);
    if (!activated.ok()) return activated;

    std::set<NodeId> terminals;
    for (const auto &group : terminalGroups)
        terminals.insert(group.begin(), group.end());
    for (const NodeId &terminal : terminals) {
        RoutingResult claimed = adapter.activateNode(terminal, terminal);
        if (!claimed.ok()) return claimed;
    }
    return RoutingResult::success();
}

RoutingResult Router::checkKnownIds(
    const std::vector<std::vector<NodeId>> &groups) const
{
    for (const auto &group : groups) {
        for (const NodeId &id : group) {
            if (!adapter.graph().node(id))
                return RoutingResult::failure(RoutingErrorKind::UnknownNode,
                                              "Unknown node " + id);
        }
    }
    return RoutingResult::success();
}

RoutingResult Router::activatePaths(const std::vector<Path> &paths)
{
    std::size_t rounds = 0;
    for (const auto &path : paths)
        if (path.size() > 1) rounds = std::max(rounds, path.size() - 1);

    for (std::size_t k = 0; k < rounds; ++k) {
        for (const auto &path : paths) {
            if (k + 1 >= path.size()) continue;
            const NodeId &terminal = path.back();
            EdgeId edge(path[k], path[k + 1]);

            RoutingResult result = adapter.activateEdge(edge, terminal);
            if (!result.ok()) return result;
            result = adapter.activateNode(edge.first, terminal);
            if (!result.ok()) return result;
        }
    }
    return RoutingResult::success();
}

RoutingResult Router::rankSources(
    const std::vector<TerminalGroup> &terminalGroups,
    const NodeAppraiser &appraiser, std::vector<SourceGroup> &ranked)
{
    SourceFinder finder(adapter, appraiser);
    RoutingResult result = finder.findEligibleSourceGroups(terminalGroups, ranked);
    if (diag && result.ok())
        *diag << "Found the following eligible sources for "
              << describeGroups(terminalGroups) << ": "
              << describeGroups(ranked) << "\n";
    return result;
}

RoutingResult Router::route(const std::vector<TerminalGroup> &terminalGroups,
                            const NodeAppraiser &appraiser)
{
    RoutingResult known = checkKnownIds(terminalGroups);
    if (!known.ok()) return report(known);

    std::vector<SourceGroup> ranked;
    RoutingResult result = rankSources(terminalGroups, appraiser, ranked);
    if (!result.ok()) return report(result);
    return report(connectSources(ranked, terminalGroups));
}

RoutingResult Router::routeToSource(const TerminalGroup &terminals,
                                    const std::string &unit)
{
    NodePredicate inUnit = nodeHasUnit({unit});
    return route({terminals}, appraiseAll([inUnit](const Node &node) {
                     return nodeIsSource(node) && !nodeIsConstantSource(node) &&
                            inUnit(node);
                 }));
}

RoutingResult Router::routeToMeter(const TerminalGroup &terminals,
                                   const std::string &unit)
{
    NodePredicate inUnit = nodeHasUnit({unit});
    return route({terminals}, appraiseAll([inUnit](const Node &node) {
                     return nodeIsMeter(node) && !nodeIsConstantMeter(node) &&
                            inUnit(node);
                 }));
}

RoutingResult Router::routeToGround(const TerminalGroup &terminals,
                                    const std::string &unit)
{
    return route({terminals}, appraiseAll(nodeIsGeneralGround(unit)));
}

RoutingResult Router::routeToFloat(const TerminalGroup &terminals,
                                   const std::string &unit)
{
    return route({terminals}, appraiseAll(nodeIsSourceWithName("float", unit)));
}

RoutingResult Router::routeToHighZ(const TerminalGroup &terminals,
                                   const std::string &unit)
{
    return route({terminals}, appraiseAll(nodeIsSourceWithName("highz", unit)));
}

RoutingResult Router::jointRoutePerSameEligibleSources(
    const std::vector<NodeId> &terminals, const NodeAppraiser &appraiser)
{
    // Distinct eligible-source sets in order of first appearance.
    std::vector<std::pair<std::set<NodeId>, TerminalGroup>> groups;
    for (const NodeId &terminal : terminals) {
        std::vector<NodeId> sources;
        RoutingResult result = eligibleSourcesOf(terminal, sources, appraiser);
        if (!result.ok()) return report(result);

        std::set<NodeId> eligible(sources.begin(), sources.end());
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&eligible](const auto &group) {
                                   return group.first == eligible;
                               });
        if (it == groups.end())
            groups.emplace_back(eligible, TerminalGroup{terminal});
        else
            it->second.push_back(terminal);
    }

    std::set<NodeId> shared;
    for (std::size_t i = 0; i < groups.size(); ++i)
        for (std::size_t j = i + 1; j < groups.size(); ++j)
            for (const NodeId &source : groups[i].first)
                if (groups[j].first.count(source)) shared.insert(source);
    if (!shared.empty())
        std::cerr << "Warning: " << describeIds(terminals)
                  << " found to have overlapping unique sources that they can "
                     "be routed to, hence the routing may not be successful: "
                  << describeIds(std::vector<NodeId>(shared.begin(), shared.end()))
                  << std::endl;

    for (const auto &group : groups) {
        RoutingResult result = route({group.second}, appraiser);
        if (!result.ok()) return result;
    }
    return RoutingResult::success();
}

RoutingResult Router::eligibleSourcesOf(const NodeId &terminal,
                                        std::vector<NodeId> &sources,
                                        const NodeAppraiser &appraiser)
{
    sources.clear();
    if (!adapter.graph().node(terminal))
        return RoutingResult::failure(RoutingErrorKind::UnknownNode,
                                      "Unknown node " + terminal);

    std::vector<SourceGroup> ranked;
    RoutingResult result = rankSources({{terminal}}, appraiser, ranked);
    if (!result.ok()) return result;
    for (const auto &group : ranked) sources.push_back(group.front());
    return RoutingResult::success();
}

RoutingResult Router::vacate(const NodeId &terminal)
{
    if (!adapter.graph().node(terminal))
        return report(RoutingResult::failure(RoutingErrorKind::UnknownNode,
                                             "Unknown node " + terminal));

    StationGraph vacation = adapter.routedSubgraphOf(terminal);
    std::vector<NodeId> nodes = vacation.breadthFirstNodesFrom(terminal, true);

    for (const NodeId &node : nodes) {
        RoutingResult result = adapter.deactivateNode(node, terminal);
        if (!result.ok()) return report(result);
    }
    for (const NodeId &node : nodes) {
        for (const NodeId &predecessor : vacation.predecessorsOf(node)) {
            RoutingResult result =
                adapter.deactivateEdge(EdgeId(predecessor, node), terminal);
            if (!result.ok()) return report(result);
        }
    }
    return RoutingResult::success();
}
