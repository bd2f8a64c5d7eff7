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
 * @file Edge.hpp
 * @brief Graph edge representing a link between two station nodes.
 *
 * This header declares the abstract `Edge` type used by the station graph
 * and the `BasicEdge` implementation used for cables, switch matrices and
 * structural relations. An edge is directed; a bidirectional cable is two
 * edges.
 *
 * Only electrical connections can be switched. Structural relations
 * (`PART_OF`, an instrument owning its modules) and parasitic couplings
 * (`CAPACITIVE_COUPLING`) are part of the topology for rendering and
 * bookkeeping but can never be activated by the router.
 */

#pragma once

#include <iostream>

#include "RoutingResult.hpp"

/**
 * @enum EdgeType
 * @brief Physical nature of an edge.
 */
enum class EdgeType
{
    ELECTRICAL_CONNECTION, /**< Switchable galvanic connection */
    PART_OF,               /**< Structural containment relation */
    CAPACITIVE_COUPLING    /**< Parasitic coupling, never switched */
};

/**
 * @enum EdgeStatus
 * @brief Current state of an edge.
 */
enum class EdgeStatus
{
    ACTIVE_ELECTRICAL_CONNECTION,   /**< Connection is closed */
    INACTIVE_ELECTRICAL_CONNECTION, /**< Connection is open */
    PART_OF,                        /**< Structural relation */
    CAPACITIVE_COUPLING             /**< Parasitic coupling */
};

inline std::ostream& operator<<(std::ostream& os, EdgeType type)
{
    switch (type) {
        case EdgeType::ELECTRICAL_CONNECTION:
            os << "electrical_connection";
            break;
        case EdgeType::PART_OF:
            os << "part_of";
            break;
        case EdgeType::CAPACITIVE_COUPLING:
            os << "capacitive_coupling";
            break;
        default:
            os << "UnknownEdgeType";
            break;
    }
    return os;
}

inline std::ostream& operator<<(std::ostream& os, EdgeStatus status)
{
    switch (status) {
        case EdgeStatus::ACTIVE_ELECTRICAL_CONNECTION:
            os << "active_electrical_connection";
            break;
        case EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION:
            os << "inactive_electrical_connection";
            break;
        case EdgeStatus::PART_OF:
            os << "part_of";
            break;
        case EdgeStatus::CAPACITIVE_COUPLING:
            os << "capacitive_coupling";
            break;
        default:
            os << "UnknownEdgeStatus";
            break;
    }
    return os;
}

/**
 * @class Edge
 * @brief Abstract directed link between two nodes.
 */
class Edge
{
   public:
    virtual ~Edge() = default;

    /** @brief Current status of the edge. */
    virtual EdgeStatus status() const = 0;

    /** @brief Physical nature of the edge. */
    virtual EdgeType type() const = 0;

    /**
     * @brief Close the connection.
     * @return `InvalidEdgeTransition` when `canTransition()` is false.
     */
    virtual RoutingResult activate() = 0;

    /**
     * @brief Open the connection.
     * @return `InvalidEdgeTransition` when `canTransition()` is false.
     */
    virtual RoutingResult deactivate() = 0;

    /** @brief True when the status is ACTIVE_ELECTRICAL_CONNECTION. */
    bool isActive() const
    {
        return status() == EdgeStatus::ACTIVE_ELECTRICAL_CONNECTION;
    }

    /**
     * @brief True when the edge may switch between the active and inactive
     * electrical-connection states.
     */
    bool canTransition() const
    {
        EdgeStatus current = status();
        return type() == EdgeType::ELECTRICAL_CONNECTION &&
               (current == EdgeStatus::ACTIVE_ELECTRICAL_CONNECTION ||
                current == EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION);
    }
};

/**
 * @class BasicEdge
 * @brief Edge whose status is held in memory.
 *
 * Activation is idempotent. The type is derived from the initial status
 * unless given explicitly.
 */
class BasicEdge : public Edge
{
   protected:
    EdgeType edgeType;
    EdgeStatus edgeStatus;

   public:
    /**
     * @brief Construct an edge with the given initial status; the type
     * follows from the status (electrical statuses give an electrical edge).
     */
    explicit BasicEdge(
        EdgeStatus status = EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION);

    /** @brief Construct an edge with an explicit type and status. */
    BasicEdge(EdgeType type, EdgeStatus status)
        : edgeType(type), edgeStatus(status)
    {
    }

    EdgeStatus status() const override { return edgeStatus; }

    EdgeType type() const override { return edgeType; }

    RoutingResult activate() override;

    RoutingResult deactivate() override;
};
