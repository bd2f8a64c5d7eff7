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
 * @file Connector.cpp
 * @brief Connector subgraph construction.
 */

#include "Connector.hpp"

#include <memory>
#include <set>
#include <string>

#include "ConnectorNode.hpp"
#include "Edge.hpp"

NodeId Connector::connectionNode(const std::string &connection) const
{
    return connectorName + "[" + connection + "]";
}

RoutingResult Connector::addConnections(
    const std::vector<ConnectorMapping> &connections)
{
    std::vector<std::string> names;
    std::set<std::string> unique(connectionNames.begin(), connectionNames.end());
    for (std::size_t index = 0; index < connections.size(); ++index) {
        const ConnectorMapping &mapping = connections[index];
        std::string name =
            mapping.name.empty() ? std::to_string(index) : mapping.name;
        if (!unique.insert(name).second)
            return RoutingResult::failure(
                RoutingErrorKind::MalformedRequest,
                "Connection names of " + connectorName +
                    " must be unique: " + name);
        names.push_back(name);
    }

    for (std::size_t index = 0; index < connections.size(); ++index) {
        NodeId node = connectionNode(names[index]);
        connectorGraph.setNode(node, std::make_shared<ConnectorNode>(node));
        for (const NodeId &endpoint : connections[index].endpoints) {
            connectorGraph.setEdge(
                EdgeId(endpoint, node),
                std::make_shared<BasicEdge>(
                    EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION));
            connectorGraph.setEdge(
                EdgeId(node, endpoint),
                std::make_shared<BasicEdge>(
                    EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION));
        }
        connectionNames.push_back(names[index]);
    }
    return RoutingResult::success();
}
