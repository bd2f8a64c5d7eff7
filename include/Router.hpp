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
 * @file Router.hpp
 * @brief Public routing API of a measurement station.
 *
 * The router allocates node-disjoint signal paths between sources (grounds,
 * floats, high-impedance switches, voltage outputs, meters) and terminals,
 * and remembers which terminal claims which node and edge so that a route
 * can be torn down later without disturbing routes of other terminals.
 *
 * Routing errors are returned as `RoutingResult` values and also printed to
 * std::cerr as "Error: ..." lines. When `RouterOptions::diagVerbose` is set,
 * requested connections, ranked candidates, found paths and every activation
 * change are appended to `RouterOptions::diagFile`.
 *
 * Typical usage:
 * @code
 * Router router(station, options);
 * RoutingResult result = router.routeToGround({"sample.gate"});
 * ...
 * router.vacate("sample.gate");
 * @endcode
 */

#pragma once

#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Appraisal.hpp"
#include "RouteFinder.hpp"
#include "RouterOptions.hpp"
#include "RoutingGraphAdapter.hpp"
#include "RoutingResult.hpp"
#include "SourceFinder.hpp"
#include "StationGraph.hpp"

/**
 * @class Router
 * @brief Disjoint-path router with per-terminal claim tracking.
 *
 * Single-threaded and non-reentrant; callers serialize `connect`, `route`
 * and `vacate`. A failure while committing paths leaves the already
 * activated part in place (there is no rollback); validation and the path
 * search itself never modify the graph.
 */
class Router
{
   public:
    /**
     * @brief Take over routing of `graph`.
     *
     * Edges that are already active are activated through the claim table
     * (linking their endpoints) and every node that activates to source is
     * connected to each of its eligible sources. The claims made here are
     * then cleared so that these links are never vacated.
     *
     * @param graph Station topology (usually a composed graph).
     * @param options Validated router options.
     */
    explicit Router(const StationGraph &graph,
                    const RouterOptions &options = RouterOptions());

    Router(const Router &) = delete;
    Router &operator=(const Router &) = delete;

    /** @brief Routed station graph. */
    const StationGraph &graph() const { return adapter.graph(); }

    const RouterOptions &options() const { return routerOptions; }

    /** @brief Connect a single source to a single terminal. */
    RoutingResult connect(const NodeId &source, const NodeId &terminal);

    /**
     * @brief Connect the i-th source to every terminal of the i-th group.
     *
     * @return `MalformedRequest` when the number of sources differs from the
     * number of terminal groups (nothing is activated in that case),
     * `NoDisjointPath` when no node-disjoint set of paths exists.
     */
    RoutingResult connect(const SourceGroup &sources,
                          const std::vector<TerminalGroup> &terminalGroups);

    /**
     * @brief Group-of-groups form of `connect`.
     *
     * Exactly one source group is accepted; any other count is a
     * `MalformedRequest`.
     */
    RoutingResult connectGroups(const std::vector<SourceGroup> &sourceGroups,
                                const std::vector<TerminalGroup> &terminalGroups);

    /** @brief Connect each source (key) to its terminals (value). */
    RoutingResult connectByMap(
        const std::map<NodeId, TerminalGroup> &connections);

    /**
     * @brief Route terminal groups to the best appraised sources.
     *
     * Every terminal of a group is routed to the same source. Candidate
     * source combinations are ranked by `appraiser` and the best one that
     * admits disjoint paths is committed.
     *
     * @return `NoEligibleSource` if no combination scores positive,
     * `NoDisjointPath` if none of them can be routed.
     */
    RoutingResult route(const std::vector<TerminalGroup> &terminalGroups,
                        const NodeAppraiser &appraiser);

    /** @brief Route to a settable, non-constant source in `unit`. */
    RoutingResult routeToSource(const TerminalGroup &terminals,
                                const std::string &unit = "");

    /** @brief Route to a read-only, non-constant meter in `unit`. */
    RoutingResult routeToMeter(const TerminalGroup &terminals,
                               const std::string &unit = "");

    RoutingResult routeToGround(const TerminalGroup &terminals,
                                const std::string &unit = "V");
    RoutingResult routeToFloat(const TerminalGroup &terminals,
                               const std::string &unit = "V");
    RoutingResult routeToHighZ(const TerminalGroup &terminals,
                               const std::string &unit = "V");

    /**
     * @brief Route terminals jointly per identical set of eligible sources.
     *
     * Terminals whose eligible sources are the same set are routed as one
     * group. If two different sets share a source a warning is printed and
     * routing proceeds.
     */
    RoutingResult jointRoutePerSameEligibleSources(
        const std::vector<NodeId> &terminals, const NodeAppraiser &appraiser);

    /**
     * @brief Sources `terminal` could currently be routed to, best first.
     * @param sources Output.
     */
    RoutingResult eligibleSourcesOf(const NodeId &terminal,
                                    std::vector<NodeId> &sources,
                                    const NodeAppraiser &appraiser = alwaysTrue);

    /**
     * @brief Release every claim of `terminal`.
     *
     * Node claims are released first, in reverse breadth-first order from
     * the terminal over its routed subgraph, then the claims of the edges
     * feeding each of those nodes.
     *
     * @return `ClaimUnderflow` when `terminal` holds no route.
     */
    RoutingResult vacate(const NodeId &terminal);

    /** @brief Terminals claiming `node`. */
    ClaimSet claimsOf(const NodeId &node) const { return adapter.claimsOf(node); }

    /** @brief Terminals claiming `edge`. */
    ClaimSet claimsOf(const EdgeId &edge) const { return adapter.claimsOf(edge); }

   private:
    RouterOptions routerOptions;
    RoutingGraphAdapter adapter;
    std::unique_ptr<std::ofstream> diag;

    void initializeActiveEdges();
    void activateDynamicEdges();

    /** @brief Validate, search and commit (no error printing). */
    RoutingResult connectSources(const std::vector<SourceGroup> &sourceGroups,
                                 const std::vector<TerminalGroup> &terminalGroups);

    /** @brief `UnknownNode` for the first id that is not in the graph. */
    RoutingResult checkKnownIds(
        const std::vector<std::vector<NodeId>> &groups) const;

    /** @brief Activate paths round-robin, one edge per path per round. */
    RoutingResult activatePaths(const std::vector<Path> &paths);

    RoutingResult rankSources(const std::vector<TerminalGroup> &terminalGroups,
                              const NodeAppraiser &appraiser,
                              std::vector<SourceGroup> &ranked);

    /** @brief Print a failed result to std::cerr and pass it on. */
    static RoutingResult report(const RoutingResult &result);
};
