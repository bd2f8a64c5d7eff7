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
 * @file StationGraph.hpp
 * @brief Directed graph of station nodes and edges.
 *
 * `StationGraph` stores one `Node` value per node identifier and one `Edge`
 * value per ordered pair of node identifiers. Internally nodes and edges live
 * in an arena of index-addressed slots with a string -> index lookup at the
 * boundary; adjacency lists hold edge slot indices.
 *
 * Copies of a `StationGraph` share the arena, exactly like the filtered
 * views returned by `subgraphOf`: setting the value of an existing id
 * through any of them is visible through all of them. Only
 * `MutableStationGraph` can add new ids. `compose` and `prune` build new
 * arenas but share the node and edge values.
 *
 * Design notes:
 *  - A view hides a node when its node predicate rejects it, and hides an
 *    edge when either endpoint is hidden or its edge predicate rejects it.
 *  - Iteration order of `nodes()`, `edges()`, successors and predecessors is
 *    insertion order, which makes breadth-first search and path enumeration
 *    deterministic.
 *  - Node slots may exist without a value (created implicitly when an edge
 *    refers to an unknown id); `prune` drops them.
 */

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "Edge.hpp"
#include "Node.hpp"

/** @brief Unique node identifier (a dotted port name). */
using NodeId = std::string;

/** @brief Directed edge identifier `(from, to)`. */
using EdgeId = std::pair<NodeId, NodeId>;

/** @brief Sequence of node identifiers from a source to a terminal. */
using Path = std::vector<NodeId>;

/** @brief Shared owning pointer to an edge. */
using EdgePtr = std::shared_ptr<Edge>;

class PathEnumerator;

/**
 * @class StationGraph
 * @brief Read API of the station topology plus value replacement.
 */
class StationGraph
{
   public:
    /** @brief Node filter used by `subgraphOf`. */
    using NodePredicate = std::function<bool(const NodeId &)>;

    /** @brief Edge filter used by `subgraphOf`. */
    using EdgePredicate = std::function<bool(const EdgeId &)>;

    /** @brief Construct an empty graph. */
    StationGraph();

    virtual ~StationGraph() = default;

    /**
     * @brief Union of several graphs.
     *
     * Nodes and edges of all visible ids are copied into a new arena; when
     * an id appears in several graphs the value of the later graph wins
     * (unless it carries no value). Afterwards, for every edge that is an
     * active electrical connection, the origin node is added as a source of
     * the destination node.
     */
    static StationGraph compose(const std::vector<StationGraph> &graphs);

    /** @brief Copy of `graph` without the nodes that carry no value. */
    static StationGraph prune(const StationGraph &graph);

    /**
     * @brief Filtered view of `graph` sharing its arena.
     *
     * Filters of nested views compose: a node/edge is visible only if every
     * view in the chain accepts it. Empty predicates accept everything.
     */
    static StationGraph subgraphOf(const StationGraph &graph,
                                   NodePredicate isNodeIncluded = nullptr,
                                   EdgePredicate isEdgeIncluded = nullptr);

    /** @brief Value attached to `id`, or nullptr if absent or hidden. */
    NodePtr node(const NodeId &id) const;

    /** @brief Value attached to `id`, or nullptr if absent or hidden. */
    EdgePtr edge(const EdgeId &id) const;

    /**
     * @brief Replace the value attached to an existing visible node.
     * @return false if the node does not exist in this graph.
     */
    virtual bool setNode(const NodeId &id, const NodePtr &value);

    /**
     * @brief Replace the value attached to an existing visible edge.
     * @return false if the edge does not exist in this graph.
     */
    virtual bool setEdge(const EdgeId &id, const EdgePtr &value);

    bool hasNode(const NodeId &id) const;
    bool hasEdge(const EdgeId &id) const;

    /** @brief Visible node ids in insertion order. */
    std::vector<NodeId> nodes() const;

    /** @brief Visible edge ids in insertion order. */
    std::vector<EdgeId> edges() const;

    std::size_t nodeCount() const;
    std::size_t edgeCount() const;

    std::vector<NodeId> successorsOf(const NodeId &id) const;
    std::vector<NodeId> predecessorsOf(const NodeId &id) const;

    /** @brief Union of predecessors and successors, without duplicates. */
    std::vector<NodeId> neighborsOf(const NodeId &id) const;

    /**
     * @brief Breadth-first node order starting with `id` itself.
     *
     * @param id Start node; an unknown id yields an empty sequence.
     * @param reverse Follow edges backwards (towards predecessors).
     */
    std::vector<NodeId> breadthFirstNodesFrom(const NodeId &id,
                                              bool reverse = false) const;

    /**
     * @brief Tree edges traversed by `breadthFirstNodesFrom`.
     *
     * Each pair is `(visited node, newly discovered node)`; for a reverse
     * search the actual graph edge is the swapped pair.
     */
    std::vector<EdgeId> breadthFirstEdgesFrom(const NodeId &id,
                                              bool reverse = false) const;

    /**
     * @brief Simple paths from `source` to `destination` in non-decreasing
     * length order, produced lazily. The caller bounds consumption.
     */
    PathEnumerator shortestPathsBetween(const NodeId &source,
                                        const NodeId &destination) const;

    /**
     * @brief Dense adjacency matrix of the visible edges.
     *
     * Row/column order follows `nodes()`; entry (i, j) is 1 when the edge
     * nodes()[i] -> nodes()[j] exists.
     */
    Eigen::MatrixXi adjacencyMatrix() const;

    /** @brief Arena index of a visible node, or -1. */
    long nodeIndexOf(const NodeId &id) const;

    /** @brief Arena index of a visible edge, or -1. */
    long edgeIndexOf(const EdgeId &id) const;

   protected:
    struct NodeSlot
    {
        NodeId id;
        NodePtr value;
        std::vector<std::size_t> outEdges; /**< edge slot indices */
        std::vector<std::size_t> inEdges;  /**< edge slot indices */
    };

    struct EdgeSlot
    {
        std::size_t from;
        std::size_t to;
        EdgePtr value;
    };

    struct Storage
    {
        std::vector<NodeSlot> nodes;
        std::vector<EdgeSlot> edges;
        std::map<NodeId, std::size_t> nodeIndex;
        std::map<std::pair<std::size_t, std::size_t>, std::size_t> edgeIndex;
    };

    std::shared_ptr<Storage> storage;
    NodePredicate nodeFilter;
    EdgePredicate edgeFilter;

    bool nodeVisible(std::size_t index) const;
    bool edgeVisible(std::size_t index) const;
    EdgeId edgeIdAt(std::size_t index) const;

    /** @brief Visible neighbour node indices through out- or in-edges. */
    std::vector<std::size_t> adjacentIndices(std::size_t index,
                                             bool reverse) const;

    /** @brief Find or create the slot for `id` (no visibility check). */
    std::size_t ensureNodeSlot(const NodeId &id);

    /** @brief Find or create the slot for `(from, to)`. */
    std::size_t ensureEdgeSlot(std::size_t from, std::size_t to);

    friend class PathEnumerator;
};

/**
 * @class MutableStationGraph
 * @brief Station graph that can grow while a topology is being declared.
 */
class MutableStationGraph : public StationGraph
{
   public:
    /** @brief Insert or replace a node value. Always succeeds. */
    bool setNode(const NodeId &id, const NodePtr &value) override;

    /**
     * @brief Insert or replace an edge value; missing endpoint slots are
     * created without a value.
     */
    bool setEdge(const EdgeId &id, const EdgePtr &value) override;

    /** @brief Read-only handle sharing this graph's arena. */
    StationGraph asStationGraph() const;
};

/**
 * @class PathEnumerator
 * @brief Lazy enumeration of simple paths in ascending length (Yen's
 * algorithm over unit edge weights).
 *
 * The enumerator holds a handle to the graph view it was created from, so
 * the view's filters are evaluated while paths are produced.
 */
class PathEnumerator
{
   public:
    PathEnumerator(const StationGraph &graph, const NodeId &source,
                   const NodeId &destination);

    /**
     * @brief Produce the next path.
     * @return false when no further simple path exists.
     */
    bool next(Path &path);

   private:
    using IndexPath = std::vector<std::size_t>;

    StationGraph graph;
    std::size_t sourceIndex = 0;
    std::size_t destinationIndex = 0;
    bool valid = false;
    bool started = false;

    /** @brief Paths already returned, in order. */
    std::vector<IndexPath> accepted;

    /** @brief Candidate paths with their insertion counter. */
    std::vector<std::pair<std::size_t, IndexPath>> candidates;
    std::size_t candidateCounter = 0;

    /** @brief Unit-weight shortest path avoiding blocked nodes/edges. */
    IndexPath shortestPath(
        std::size_t from, const std::vector<bool> &blockedNodes,
        const std::vector<std::pair<std::size_t, std::size_t>> &blockedEdges)
        const;

    void addSpurCandidates(const IndexPath &previous);
    Path toPath(const IndexPath &indices) const;
};
