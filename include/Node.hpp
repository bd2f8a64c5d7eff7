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
 * @file Node.hpp
 * @brief Node representation used by the station routing graph.
 *
 * This header declares the abstract `Node` class. A node is an addressable
 * hardware endpoint (an instrument module output, a cable junction, a device
 * pin) identified by a unique dotted name. It exposes the quantities it can
 * control, an activation state, and the set of upstream sources it currently
 * draws its signal from.
 *
 * Concrete variants live in `InstrumentModuleNode.hpp`, `ConnectorNode.hpp`
 * and `EndpointNode.hpp`. The router only talks to nodes through this
 * interface; translating activation into hardware state is left to derived
 * classes provided by instrument drivers.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "Parameter.hpp"
#include "RoutingResult.hpp"

/**
 * @enum NodeStatus
 * @brief Activation state of a node.
 */
enum class NodeStatus
{
    ACTIVE,  /**< Node has been activated */
    INACTIVE /**< Node is idle */
};

inline std::ostream &operator<<(std::ostream &os, NodeStatus status)
{
    switch (status) {
        case NodeStatus::ACTIVE:
            os << "active";
            break;
        case NodeStatus::INACTIVE:
            os << "inactive";
            break;
        default:
            os << "UnknownNodeStatus";
            break;
    }
    return os;
}

/**
 * @class Node
 * @brief Abstract graph vertex representing a station endpoint.
 *
 * Nodes are owned by `std::shared_ptr` so that the same node value can be
 * shared by composed graphs, filtered views and the source sets of other
 * nodes. Create nodes with `std::make_shared`.
 *
 * Invariant: `status()` is ACTIVE iff `activate()` has been called and
 * `deactivate()` has not been called since. Both calls are idempotent.
 */
class Node : public std::enable_shared_from_this<Node>
{
   protected:
    /** @brief Unique dotted name, e.g. "dmm.ch1". */
    std::string name;

    /** @brief Current activation state. */
    NodeStatus nodeStatus = NodeStatus::INACTIVE;

    /** @brief Nodes this node currently draws from (set semantics). */
    std::vector<std::shared_ptr<Node>> sourceNodes;

   public:
    /**
     * @brief Construct a node.
     * @param fullName Unique dotted name of the node.
     */
    explicit Node(const std::string &fullName) : name(fullName) {}

    virtual ~Node() = default;

    /** @brief Unique dotted name of the node. */
    const std::string &fullName() const { return name; }

    /**
     * @brief Quantities controllable through this node.
     *
     * The router inspects these to decide whether the node can serve as a
     * source or meter for a terminal (see `Appraisal.hpp`).
     */
    virtual std::vector<Parameter> parameters() const = 0;

    /**
     * @brief Register `source` as an upstream source of this node.
     *
     * Adding a node that is already a source has no effect.
     *
     * @return Always a success for the built-in node variants.
     */
    virtual RoutingResult addSource(const std::shared_ptr<Node> &source);

    /**
     * @brief Remove `source` from the upstream source set.
     *
     * @return `SourceError` if `source` is not currently a source of this
     * node; the source set is left unchanged in that case.
     */
    virtual RoutingResult removeSource(const std::shared_ptr<Node> &source);

    /** @brief Mark the node ACTIVE (idempotent). */
    virtual void activate();

    /** @brief Mark the node INACTIVE (idempotent). */
    virtual void deactivate();

    /** @brief Current activation state. */
    NodeStatus status() const { return nodeStatus; }

    /** @brief True when `status()` is ACTIVE. */
    bool isActive() const { return nodeStatus == NodeStatus::ACTIVE; }

    /** @brief Direct upstream sources, in insertion order. */
    const std::vector<std::shared_ptr<Node>> &sources() const
    {
        return sourceNodes;
    }

    /** @brief True when `source` is a direct upstream source. */
    bool hasSource(const std::shared_ptr<Node> &source) const;

    /**
     * @brief Nodes that ultimately drive this node.
     *
     * Passive nodes forward the question to their sources; instrument
     * modules answer with themselves. The walk tolerates cyclic source links
     * and reports each node once.
     */
    std::vector<std::shared_ptr<Node>> upstreamNodes() const;

    /**
     * @brief True when breadth-first source search must treat this node as
     * a source regardless of its position in the graph (grounds, floats,
     * voltage outputs).
     */
    virtual bool isEligibleSource() const { return false; }

    /**
     * @brief True when the router connects this node to every eligible
     * source at construction time (dynamically sourced nodes).
     */
    virtual bool activatesToSource() const { return false; }

   protected:
    /**
     * @brief Whether `upstreamNodes()` should stop at this node.
     *
     * Instrument modules originate signals and therefore terminate the
     * upstream walk; passive nodes continue through their sources.
     */
    virtual bool originatesSignal() const { return false; }
};

/** @brief Shared owning pointer to a node. */
using NodePtr = std::shared_ptr<Node>;
