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
 * @file ConnectorNode.hpp
 * @brief Passive junction node used for cable conductors and breakout pins.
 *
 * A connector node has no quantities of its own. While it is routed it
 * exposes the parameters of whatever currently drives it, which lets an
 * appraiser look "through" a cable at the instrument behind it.
 */

#pragma once

#include <string>
#include <vector>

#include "Node.hpp"

/**
 * @class ConnectorNode
 * @brief Concrete junction node forwarding its sources' parameters.
 */
class ConnectorNode : public Node
{
   public:
    /** @brief Construct a connector junction named `fullName`. */
    explicit ConnectorNode(const std::string &fullName) : Node(fullName) {}

    /**
     * @brief Parameters of the modules that currently drive this junction,
     * in upstream order (see `Node::upstreamNodes`).
     */
    std::vector<Parameter> parameters() const override;
};
