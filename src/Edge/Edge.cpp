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
 * @file Edge.cpp
 * @brief Status transitions of `BasicEdge`.
 */

#include "Edge.hpp"

#include <sstream>

static EdgeType typeForStatus(EdgeStatus status)
{
    switch (status) {
        case EdgeStatus::PART_OF:
            return EdgeType::PART_OF;
        case EdgeStatus::CAPACITIVE_COUPLING:
            return EdgeType::CAPACITIVE_COUPLING;
        default:
            return EdgeType::ELECTRICAL_CONNECTION;
    }
}

static RoutingResult invalidTransition(const char *verb, EdgeType type,
                                       EdgeStatus status)
{
    std::ostringstream message;
    message << "Cannot " << verb << " an edge of type " << type
            << " with status " << status;
    return RoutingResult::failure(RoutingErrorKind::InvalidEdgeTransition,
                                  message.str());
}

BasicEdge::BasicEdge(EdgeStatus status)
    : edgeType(typeForStatus(status)), edgeStatus(status)
{
}

RoutingResult BasicEdge::activate()
{
    if (!canTransition())
        return invalidTransition("activate", edgeType, edgeStatus);
    edgeStatus = EdgeStatus::ACTIVE_ELECTRICAL_CONNECTION;
    return RoutingResult::success();
}

RoutingResult BasicEdge::deactivate()
{
    if (!canTransition())
        return invalidTransition("deactivate", edgeType, edgeStatus);
    edgeStatus = EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION;
    return RoutingResult::success();
}
