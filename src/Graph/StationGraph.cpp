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
 * @file StationGraph.cpp
 * @brief Arena storage, views, traversal and composition of station graphs.
 *
 * Keep API-level documentation in the header (`StationGraph.hpp`). Shortest
 * simple path enumeration lives in `PathEnumerator.cpp`.
 */

#include "StationGraph.hpp"

#include <algorithm>
#include <deque>
#include <iostream>

StationGraph::StationGraph() : storage(std::make_shared<Storage>()) {}

StationGraph StationGraph::compose(const std::vector<StationGraph> &graphs)
{
    MutableStationGraph composition;

    for (const auto &graph : graphs) {
        for (std::size_t i = 0; i < graph.storage->nodes.size(); ++i) {
            if (!graph.nodeVisible(i)) continue;
            const NodeSlot &slot = graph.storage->nodes[i];
            std::size_t index = composition.ensureNodeSlot(slot.id);
            // A later graph only overrides when it actually carries a value.
            if (slot.value) composition.storage->nodes[index].value = slot.value;
        }
        for (std::size_t e = 0; e < graph.storage->edges.size(); ++e) {
            if (!graph.edgeVisible(e)) continue;
            const EdgeSlot &slot = graph.storage->edges[e];
            std::size_t from =
                composition.ensureNodeSlot(graph.storage->nodes[slot.from].id);
            std::size_t to =
                composition.ensureNodeSlot(graph.storage->nodes[slot.to].id);
            std::size_t index = composition.ensureEdgeSlot(from, to);
            if (slot.value) composition.storage->edges[index].value = slot.value;
        }
    }

    // Re-establish source links for every closed connection.
    for (const auto &slot : composition.storage->edges) {
        if (!slot.value || !slot.value->isActive()) continue;
        const NodePtr &origin = composition.storage->nodes[slot.from].value;
        const NodePtr &destination = composition.storage->nodes[slot.to].value;
        if (origin && destination) {
            RoutingResult added = destination->addSource(origin);
            if (!added.ok()) {
                std::cerr << "Warning: " << added.message << std::endl;
            }
        }
    }

    return composition.asStationGraph();
}

StationGraph StationGraph::prune(const StationGraph &graph)
{
    MutableStationGraph pruned;
    for (std::size_t i = 0; i < graph.storage->nodes.size(); ++i) {
        const NodeSlot &slot = graph.storage->nodes[i];
        if (graph.nodeVisible(i) && slot.value) pruned.setNode(slot.id, slot.value);
    }
    for (std::size_t e = 0; e < graph.storage->edges.size(); ++e) {
        if (!graph.edgeVisible(e)) continue;
        const EdgeSlot &slot = graph.storage->edges[e];
        const NodeSlot &from = graph.storage->nodes[slot.from];
        const NodeSlot &to = graph.storage->nodes[slot.to];
        if (!from.value || !to.value) continue;
        pruned.setEdge(EdgeId(from.id, to.id), slot.value);
    }
    return pruned.asStationGraph();
}

StationGraph StationGraph::subgraphOf(const StationGraph &graph,
                                      NodePredicate isNodeIncluded,
                                      EdgePredicate isEdgeIncluded)
{
    StationGraph view(graph);

    NodePredicate outerNode = graph.nodeFilter;
    if (isNodeIncluded && outerNode) {
        view.nodeFilter = [outerNode, isNodeIncluded](const NodeId &id) {
            return outerNode(id) && isNodeIncluded(id);
        };
    } else if (isNodeIncluded) {
        view.nodeFilter = isNodeIncluded;
    }

    EdgePredicate outerEdge = graph.edgeFilter;
    if (isEdgeIncluded && outerEdge) {
        view.edgeFilter = [outerEdge, isEdgeIncluded](const EdgeId &id) {
            return outerEdge(id) && isEdgeIncluded(id);
        };
    } else if (isEdgeIncluded) {
        view.edgeFilter = isEdgeIncluded;
    }
    return view;
}

NodePtr StationGraph::node(const NodeId &id) const
{
    long index = nodeIndexOf(id);
    if (index < 0) return nullptr;
    return storage->nodes[index].value;
}

EdgePtr StationGraph::edge(const EdgeId &id) const
{
    long index = edgeIndexOf(id);
    if (index < 0) return nullptr;
    return storage->edges[index].value;
}

bool StationGraph::setNode(const NodeId &id, const NodePtr &value)
{
    long index = nodeIndexOf(id);
    if (index < 0) return false;
    storage->nodes[index].value = value;
    return true;
}

bool StationGraph::setEdge(const EdgeId &id, const EdgePtr &value)
{
    long index = edgeIndexOf(id);
    if (index < 0) return false;
    storage->edges[index].value = value;
    return true;
}

bool StationGraph::hasNode(const NodeId &id) const
{
    return nodeIndexOf(id) >= 0;
}

bool StationGraph::hasEdge(const EdgeId &id) const
{
    return edgeIndexOf(id) >= 0;
}

std::vector<NodeId> StationGraph::nodes() const
{
    std::vector<NodeId> ids;
    for (std::size_t i = 0; i < storage->nodes.size(); ++i) {
        if (nodeVisible(i)) ids.push_back(storage->nodes[i].id);
    }
    return ids;
}

std::vector<EdgeId> StationGraph::edges() const
{
    std::vector<EdgeId> ids;
    for (std::size_t e = 0; e < storage->edges.size(); ++e) {
        if (edgeVisible(e)) ids.push_back(edgeIdAt(e));
    }
    return ids;
}

std::size_t StationGraph::nodeCount() const { return nodes().size(); }

std::size_t StationGraph::edgeCount() const { return edges().size(); }

std::vector<NodeId> StationGraph::successorsOf(const NodeId &id) const
{
    std::vector<NodeId> ids;
    long index = nodeIndexOf(id);
    if (index < 0) return ids;
    for (std::size_t next : adjacentIndices(index, false))
        ids.push_back(storage->nodes[next].id);
    return ids;
}

std::vector<NodeId> StationGraph::predecessorsOf(const NodeId &id) const
{
    std::vector<NodeId> ids;
    long index = nodeIndexOf(id);
    if (index < 0) return ids;
    for (std::size_t previous : adjacentIndices(index, true))
        ids.push_back(storage->nodes[previous].id);
    return ids;
}

std::vector<NodeId> StationGraph::neighborsOf(const NodeId &id) const
{
    std::vector<NodeId> ids = predecessorsOf(id);
    for (const auto &successor : successorsOf(id)) {
        if (std::find(ids.begin(), ids.end(), successor) == ids.end())
            ids.push_back(successor);
    }
    return ids;
}

std::vector<NodeId> StationGraph::breadthFirstNodesFrom(const NodeId &id,
                                                        bool reverse) const
{
    std::vector<NodeId> order;
    if (!hasNode(id)) return order;
    order.push_back(id);
    for (const auto &treeEdge : breadthFirstEdgesFrom(id, reverse))
        order.push_back(treeEdge.second);
    return order;
}

std::vector<EdgeId> StationGraph::breadthFirstEdgesFrom(const NodeId &id,
                                                        bool reverse) const
{
    std::vector<EdgeId> treeEdges;
    long start = nodeIndexOf(id);
    if (start < 0) return treeEdges;

    std::vector<bool> seen(storage->nodes.size(), false);
    std::deque<std::size_t> queue;
    seen[start] = true;
    queue.push_back(start);

    while (!queue.empty()) {
        std::size_t current = queue.front();
        queue.pop_front();
        for (std::size_t next : adjacentIndices(current, reverse)) {
            if (seen[next]) continue;
            seen[next] = true;
            treeEdges.emplace_back(storage->nodes[current].id,
                                   storage->nodes[next].id);
            queue.push_back(next);
        }
    }
    return treeEdges;
}

PathEnumerator StationGraph::shortestPathsBetween(
    const NodeId &source, const NodeId &destination) const
{
    return PathEnumerator(*this, source, destination);
}

Eigen::MatrixXi StationGraph::adjacencyMatrix() const
{
    std::vector<long> position(storage->nodes.size(), -1);
    long count = 0;
    for (std::size_t i = 0; i < storage->nodes.size(); ++i) {
        if (nodeVisible(i)) position[i] = count++;
    }

    Eigen::MatrixXi adjacency = Eigen::MatrixXi::Zero(count, count);
    for (std::size_t e = 0; e < storage->edges.size(); ++e) {
        if (!edgeVisible(e)) continue;
        const EdgeSlot &slot = storage->edges[e];
        adjacency(position[slot.from], position[slot.to]) = 1;
    }
    return adjacency;
}

long StationGraph::nodeIndexOf(const NodeId &id) const
{
    auto it = storage->nodeIndex.find(id);
    if (it == storage->nodeIndex.end() || !nodeVisible(it->second)) return -1;
    return static_cast<long>(it->second);
}

long StationGraph::edgeIndexOf(const EdgeId &id) const
{
    auto from = storage->nodeIndex.find(id.first);
    auto to = storage->nodeIndex.find(id.second);
    if (from == storage->nodeIndex.end() || to == storage->nodeIndex.end())
        return -1;
    auto it = storage->edgeIndex.find({from->second, to->second});
    if (it == storage->edgeIndex.end() || !edgeVisible(it->second)) return -1;
    return static_cast<long>(it->second);
}

bool StationGraph::nodeVisible(std::size_t index) const
{
    if (index >= storage->nodes.size()) return false;
    return !nodeFilter || nodeFilter(storage->nodes[index].id);
}

bool StationGraph::edgeVisible(std::size_t index) const
{
    if (index >= storage->edges.size()) return false;
    const EdgeSlot &slot = storage->edges[index];
    if (!nodeVisible(slot.from) || !nodeVisible(slot.to)) return false;
    return !edgeFilter || edgeFilter(edgeIdAt(index));
}

EdgeId StationGraph::edgeIdAt(std::size_t index) const
{
    const EdgeSlot &slot = storage->edges[index];
    return EdgeId(storage->nodes[slot.from].id, storage->nodes[slot.to].id);
}

std::vector<std::size_t> StationGraph::adjacentIndices(std::size_t index,
                                                       bool reverse) const
{
    std::vector<std::size_t> adjacent;
    const NodeSlot &slot = storage->nodes[index];
    const std::vector<std::size_t> &incident =
        reverse ? slot.inEdges : slot.outEdges;
    for (std::size_t e : incident) {
        if (!edgeVisible(e)) continue;
        const EdgeSlot &edgeSlot = storage->edges[e];
        adjacent.push_back(reverse ? edgeSlot.from : edgeSlot.to);
    }
    return adjacent;
}

std::size_t StationGraph::ensureNodeSlot(const NodeId &id)
{
    auto it = storage->nodeIndex.find(id);
    if (it != storage->nodeIndex.end()) return it->second;

    NodeSlot slot;
    slot.id = id;
    storage->nodes.push_back(slot);
    std::size_t index = storage->nodes.size() - 1;
    storage->nodeIndex[id] = index;
    return index;
}

std::size_t StationGraph::ensureEdgeSlot(std::size_t from, std::size_t to)
{
    auto key = std::make_pair(from, to);
    auto it = storage->edgeIndex.find(key);
    if (it != storage->edgeIndex.end()) return it->second;

    EdgeSlot slot;
    slot.from = from;
    slot.to = to;
    storage->edges.push_back(slot);
    std::size_t index = storage->edges.size() - 1;
    storage->edgeIndex[key] = index;
    storage->nodes[from].outEdges.push_back(index);
    storage->nodes[to].inEdges.push_back(index);
    return index;
}

bool MutableStationGraph::setNode(const NodeId &id, const NodePtr &value)
{
    std::size_t index = ensureNodeSlot(id);
    storage->nodes[index].value = value;
    return true;
}

bool MutableStationGraph::setEdge(const EdgeId &id, const EdgePtr &value)
{
    std::size_t from = ensureNodeSlot(id.first);
    std::size_t to = ensureNodeSlot(id.second);
    std::size_t index = ensureEdgeSlot(from, to);
    storage->edges[index].value = value;
    return true;
}

StationGraph MutableStationGraph::asStationGraph() const
{
    return StationGraph(*this);
}
