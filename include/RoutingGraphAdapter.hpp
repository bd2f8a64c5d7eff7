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
 * @file RoutingGraphAdapter.hpp
 * @brief Station graph wrapper that tracks which terminals claim which
 * nodes and edges.
 *
 * The claim table is the reference count behind shared routes: a node or edge
 * is activated when its first claim is added and deactivated when its last
 * claim is removed. Claim sets are keyed by arena index and are created
 * explicitly (empty) the first time an id is touched.
 */

#pragma once

#include <map>
#include <memory>
#include <ostream>
#include <set>
#include <vector>

#include "RoutingResult.hpp"
#include "StationGraph.hpp"

/** @brief Terminals currently claiming a node or an edge. */
using ClaimSet = std::set<NodeId>;

/**
 * @class RoutingGraphAdapter
 * @brief Claim-set bookkeeping plus node/edge activation.
 */
class RoutingGraphAdapter
{
   public:
    explicit RoutingGraphAdapter(const StationGraph &graph);

    /** @brief The wrapped (unfiltered) graph. */
    const StationGraph &graph() const { return stationGraph; }

    /**
     * @brief Attach a diagnostic stream receiving one line per activation
     * change. Pass nullptr to detach.
     */
    void setDiagnostics(std::ostream *stream) { diag = stream; }

    /** @brief Activate `node` and add `terminal` to its claim set. */
    RoutingResult activateNode(const NodeId &node, const NodeId &terminal);

    /**
     * @brief Remove `terminal` from the claim set of `node`; deactivate the
     * node when no claim is left.
     *
     * @return `ClaimUnderflow` if `terminal` does not claim `node`.
     */
    RoutingResult deactivateNode(const NodeId &node, const NodeId &terminal);

    /**
     * @brief Register the origin as a source of the destination, add the
     * claim and activate the edge.
     */
    RoutingResult activateEdge(const EdgeId &edge, const NodeId &terminal);

    /**
     * @brief Remove the claim; when no claim is left, unlink the source and
     * deactivate the edge.
     */
    RoutingResult deactivateEdge(const EdgeId &edge, const NodeId &terminal);

    /** @brief View holding only the edges claimed by `terminal`. */
    StationGraph routedSubgraphOf(const NodeId &terminal) const;

    /**
     * @brief View of the resources available to `terminals`.
     *
     * A node or edge is included when its claim set is empty, is claimed
     * statically or shares a terminal with `terminals`. Edges that can never be switched are left
     * out.
     */
    StationGraph makeSearchGraphFor(const std::vector<NodeId> &terminals) const;

    /** @brief Terminals claiming `node` (empty when unclaimed or unknown). */
    ClaimSet claimsOf(const NodeId &node) const;

    /** @brief Terminals claiming `edge` (empty when unclaimed or unknown). */
    ClaimSet claimsOf(const EdgeId &edge) const;

    /**
     * @brief Hand every current claim over to `staticClaim`, keeping the
     * activation state.
     *
     * Statically claimed nodes and edges stay available to every search and
     * no vacate ever releases them. Routes through them add their own claim
     * beside the static one.
     */
    void makeClaimsStatic();

    /**
     * @brief Owner of links that were in place when the router took over.
     * The empty id, which no station node can have.
     */
    static const NodeId staticClaim;

   private:
    /** @brief Claim tables, shared with the views handed out. */
    struct ClaimTable
    {
        std::map<std::size_t, ClaimSet> nodes;
        std::map<std::size_t, ClaimSet> edges;
    };

    StationGraph stationGraph;
    std::shared_ptr<ClaimTable> claims;
    std::ostream *diag = nullptr;

    /** @brief Arena index of a node/edge known to exist. */
    std::size_t indexOf(const NodeId &node) const;
    std::size_t indexOf(const EdgeId &edge) const;

    /** @brief Claim set of a slot, inserted empty if absent. */
    static ClaimSet &claimSetFor(std::map<std::size_t, ClaimSet> &table,
                                 std::size_t index);

    static const ClaimSet &lookupClaims(
        const std::map<std::size_t, ClaimSet> &table, long index);

    static bool isAvailable(const ClaimSet &claims,
                            const std::vector<NodeId> &terminals);
};
