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
 * @file Connector.hpp
 * @brief Static interconnect (cable, daughterboard) building its own graph.
 *
 * A connector has any number of connections (a 32-pin cable has 32). Each
 * connection becomes a `ConnectorNode` named `<connector>[<connection>]`
 * with a bidirectional pair of inactive electrical edges to every endpoint:
 *
 *     X --- O --- X      O connection node, X endpoints
 *
 * Connectors can be chained: endpoints towards a neighbouring connector may
 * be omitted on one side since the other side already declares them.
 */

#pragma once

#include <string>
#include <vector>

#include "RoutingResult.hpp"
#include "StationGraph.hpp"

/**
 * @struct ConnectorMapping
 * @brief One connection of a connector.
 */
struct ConnectorMapping
{
    /** @brief Unique connection name; empty means "use the index". */
    std::string name;

    /** @brief Node ids this connection is wired to. */
    std::vector<NodeId> endpoints;
};

/**
 * @class Connector
 * @brief Builds the subgraph of a static connector.
 */
class Connector
{
   public:
    explicit Connector(const std::string &name) : connectorName(name) {}

    const std::string &name() const { return connectorName; }

    /**
     * @brief Add connections to the connector graph.
     *
     * A connection without a name is named after its position in
     * `connections`.
     *
     * @return `MalformedRequest` if two connections end up with the same
     * name; nothing is added in that case.
     */
    RoutingResult addConnections(const std::vector<ConnectorMapping> &connections);

    /** @brief Node id of the connection called `connection`. */
    NodeId connectionNode(const std::string &connection) const;

    /** @brief The connector subgraph, for composition into a station. */
    StationGraph graph() const { return connectorGraph.asStationGraph(); }

   private:
    std::string connectorName;
    std::vector<std::string> connectionNames;
    MutableStationGraph connectorGraph;
};
