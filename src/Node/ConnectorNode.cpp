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
 * @file ConnectorNode.cpp
 * @brief Parameter forwarding for connector junctions.
 */

#include "ConnectorNode.hpp"

std::vector<Parameter> ConnectorNode::parameters() const
{
    // Resolve through chains of passive nodes to the driving modules; the
    // upstream walk is cycle-safe, a direct recursion over sources is not.
    std::vector<Parameter> forwarded;
    for (const auto &origin : upstreamNodes()) {
        std::vector<Parameter> originParameters = origin->parameters();
        forwarded.insert(forwarded.end(), originParameters.begin(),
                         originParameters.end());
    }
    return forwarded;
}
