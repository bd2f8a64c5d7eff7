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
 * @file Node.cpp
 * @brief Implementation of the source bookkeeping shared by all nodes.
 *
 * Keep API-level documentation in the header (`Node.hpp`).
 */

#include "Node.hpp"

#include <algorithm>
#include <set>

RoutingResult Node::addSource(const std::shared_ptr<Node> &source)
{
    if (!hasSource(source)) sourceNodes.push_back(source);
    return RoutingResult::success();
}

RoutingResult Node::removeSource(const std::shared_ptr<Node> &source)
{
    auto it = std::find(sourceNodes.begin(), sourceNodes.end(), source);
    if (it == sourceNodes.end()) {
        std::string sourceName = source ? source->fullName() : "<null>";
        return RoutingResult::failure(
            RoutingErrorKind::SourceError,
            sourceName + " is not a source of " + name);
    }
    sourceNodes.erase(it);
    return RoutingResult::success();
}

void Node::activate() { nodeStatus = NodeStatus::ACTIVE; }

void Node::deactivate() { nodeStatus = NodeStatus::INACTIVE; }

bool Node::hasSource(const std::shared_ptr<Node> &source) const
{
    return std::find(sourceNodes.begin(), sourceNodes.end(), source) !=
           sourceNodes.end();
}

std::vector<std::shared_ptr<Node>> Node::upstreamNodes() const
{
    std::vector<std::shared_ptr<Node>> upstream;
    std::set<const Node *> visited;
    std::vector<const Node *> stack = {this};

    // Depth-first walk; `visited` guards against cyclic source links.
    while (!stack.empty()) {
        const Node *current = stack.back();
        stack.pop_back();
        if (!visited.insert(current).second) continue;

        if (current->originatesSignal()) {
            upstream.push_back(
                std::const_pointer_cast<Node>(current->shared_from_this()));
            continue;
        }
        // Push in reverse so sources are reported in insertion order.
        for (auto it = current->sourceNodes.rbegin();
             it != current->sourceNodes.rend(); ++it) {
            if (*it) stack.push_back(it->get());
        }
    }
    return upstream;
}
