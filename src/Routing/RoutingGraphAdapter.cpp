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
 * @file RoutingGraphAdapter.cpp
 * @brief Claim-set table and activation bookkeeping.
 *
 * Every activation change goes through this class so that the claim table
 * and the node/edge activation flags stay consistent: a node or edge is
 * active exactly when its claim set is non-empty. Links that were active
 * before the router took over are claimed by `staticClaim`, which is shared
 * by every search and never released.
 */

#include "RoutingGraphAdapter.hpp"

#include <algorithm>

const NodeId RoutingGraphAdapter::staticClaim = "";

RoutingGraphAdapter::RoutingGraphAdapter(const StationGraph &graph)
    : stationGraph(graph), claims(std::make_shared<ClaimTable>())
{
}

std::size_t RoutingGraphAdapter::indexOf(const NodeId &node) const
{
    return static_cast<std::size_t>(stationGraph.nodeIndexOf(node));
}

std::size_t RoutingGraphAdapter::indexOf(const EdgeId &edge) const
{
    return static_cast<std::size_t>(stationGraph.edgeIndexOf(edge));
}

ClaimSet &RoutingGraphAdapter::claimSetFor(
    std::map<std::size_t, ClaimSet> &table, std::size_t index)
{
    auto it = table.find(index);
    if (it == table.end()) it = table.emplace(index, ClaimSet()).first;
    return it->second;
}

const ClaimSet &RoutingGraphAdapter::lookupClaims(
    const std::map<std::size_t, ClaimSet> &table, long index)
{
    static const ClaimSet unclaimed;
    if (index < 0) return unclaimed;
    auto it = table.find(static_cast<std::size_t>(index));
    return it == table.end() ? unclaimed : it->second;
}

bool RoutingGraphAdapter::isAvailable(const ClaimSet &claimSet,
                                      const std::vector<NodeId> &terminals)
{
    if (claimSet.empty() || claimSet.count(staticClaim) > 0) return true;
    return std::any_of(terminals.begin(), terminals.end(),
                       [&claimSet](const NodeId &terminal) {
                           return claimSet.count(terminal) > 0;
                       });
}

RoutingResult RoutingGraphAdapter::activateNode(const NodeId &node,
                                                const NodeId &terminal)
{
    NodePtr value = stationGraph.node(node);
    if (!value)
        return RoutingResult::failure(RoutingErrorKind::UnknownNode,
                                      "Unknown node " + node);

    value->activate();
    claimSetFor(claims->nodes, indexOf(node)).insert(terminal);
    if (diag) *diag << "activate node " << node << " for " << terminal << "\n";
    return RoutingResult::success();
}

RoutingResult RoutingGraphAdapter::deactivateNode(const NodeId &node,
                                                  const NodeId &terminal)
{
    NodePtr value = stationGraph.node(node);
    if (!value)
        return RoutingResult::failure(RoutingErrorKind::UnknownNode,
                                      "Unknown node " + node);

    ClaimSet &claimSet = claimSetFor(claims->nodes, indexOf(node));
    if (claimSet.erase(terminal) == 0)
        return RoutingResult::failure(
            RoutingErrorKind::ClaimUnderflow,
            "Node " + node + " is not claimed by " + terminal);

    if (claimSet.empty()) {
        value->deactivate();
        if (diag) *diag << "deactivate node " << node << "\n";
    }
    return RoutingResult::success();
}

RoutingResult RoutingGraphAdapter::activateEdge(const EdgeId &edge,
                                                const NodeId &terminal)
{
    NodePtr origin = stationGraph.node(edge.first);
    NodePtr destination = stationGraph.node(edge.second);
    EdgePtr value = stationGraph.edge(edge);
    if (!origin || !destination || !value)
        return RoutingResult::failure(
            RoutingErrorKind::UnknownNode,
            "Unknown edge " + edge.first + " -> " + edge.second);

    // A fixed edge is refused before the source link or claim is made.
    if (!value->canTransition()) return value->activate();

    RoutingResult linked = destination->addSource(origin);
    if (!linked.ok()) return linked;

    RoutingResult activated = value->activate();
    if (!activated.ok()) return activated;

    claimSetFor(claims->edges, indexOf(edge)).insert(terminal);

    if (diag)
        *diag << "activate edge " << edge.first << " -> " << edge.second
              << " for " << terminal << "\n";
    return RoutingResult::success();
}

RoutingResult RoutingGraphAdapter::deactivateEdge(const EdgeId &edge,
                                                  const NodeId &terminal)
{
    NodePtr origin = stationGraph.node(edge.first);
    NodePtr destination = stationGraph.node(edge.second);
    EdgePtr value = stationGraph.edge(edge);
    if (!origin || !destination || !value)
        return RoutingResult::failure(
            RoutingErrorKind::UnknownNode,
            "Unknown edge " + edge.first + " -> " + edge.second);

    ClaimSet &claimSet = claimSetFor(claims->edges, indexOf(edge));
    if (claimSet.erase(terminal) == 0)
        return RoutingResult::failure(RoutingErrorKind::ClaimUnderflow,
                                      "Edge " + edge.first + " -> " +
                                          edge.second + " is not claimed by " +
                                          terminal);
    if (!claimSet.empty()) return RoutingResult::success();

    RoutingResult unlinked = destination->removeSource(origin);
    if (!unlinked.ok()) return unlinked;

    RoutingResult deactivated = value->deactivate();
    if (!deactivated.ok()) return deactivated;

    if (diag)
        *diag << "deactivate edge " << edge.first << " -> " << edge.second
              << "\n";
    return RoutingResult::success();
}

StationGraph RoutingGraphAdapter::routedSubgraphOf(const NodeId &terminal) const
{
    std::shared_ptr<ClaimTable> table = claims;
    StationGraph graph = stationGraph;
    return StationGraph::subgraphOf(
        stationGraph, nullptr, [table, graph, terminal](const EdgeId &edge) {
            return lookupClaims(table->edges, graph.edgeIndexOf(edge))
                       .count(terminal) > 0;
        });
}

StationGraph RoutingGraphAdapter::makeSearchGraphFor(
    const std::vector<NodeId> &terminals) const
{
    std::shared_ptr<ClaimTable> table = claims;
    StationGraph graph = stationGraph;

    auto isNodeIncluded = [table, graph, terminals](const NodeId &node) {
        return isAvailable(lookupClaims(table->nodes, graph.nodeIndexOf(node)),
                           terminals);
    };
    auto isEdgeIncluded = [table, graph, terminals](const EdgeId &edge) {
        EdgePtr value = graph.edge(edge);
        if (!value || !value->canTransition()) return false;
        return isAvailable(lookupClaims(table->edges, graph.edgeIndexOf(edge)),
                           terminals);
    };
    return StationGraph::subgraphOf(stationGraph, isNodeIncluded,
                                    isEdgeIncluded);
}

ClaimSet RoutingGraphAdapter::claimsOf(const NodeId &node) const
{
    return lookupClaims(claims->nodes, stationGraph.nodeIndexOf(node));
}

ClaimSet RoutingGraphAdapter::claimsOf(const EdgeId &edge) const
{
    return lookupClaims(claims->edges, stationGraph.edgeIndexOf(edge));
}

void RoutingGraphAdapter::makeClaimsStatic()
{
    for (auto *table : {&claims->nodes, &claims->edges}) {
        for (auto &entry : *table) {
            if (entry.second.empty()) continue;
            entry.second = ClaimSet{staticClaim};
        }
    }
}
