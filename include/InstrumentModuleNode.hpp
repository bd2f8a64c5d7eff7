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
 * @file InstrumentModuleNode.hpp
 * @brief Node backed by an instrument module (a channel, an output, a
 * ground switch).
 *
 * Instrument modules own their parameters and originate signals, so the
 * upstream walk stops at them. A module may be flagged as an eligible source
 * (grounds, floats, voltage outputs) and/or as dynamically sourced, in which
 * case the router connects it to all of its eligible sources when the router
 * is created.
 */

#pragma once

#include <string>
#include <vector>

#include "Node.hpp"

/**
 * @class InstrumentModuleNode
 * @brief Concrete node owning a fixed list of parameters.
 */
class InstrumentModuleNode : public Node
{
   protected:
    /** @brief Quantities owned by this module. */
    std::vector<Parameter> moduleParameters;

    /** @brief Recognized as a source by breadth-first source search. */
    bool eligibleSource = false;

    /** @brief Connected to its eligible sources on router construction. */
    bool autoSource = false;

   public:
    /**
     * @brief Construct an instrument module node.
     *
     * @param fullName Unique dotted name, e.g. "smu.ch1".
     * @param parameters Quantities owned by the module.
     * @param eligibleSource True for grounds, floats and outputs that the
     *        source search must always offer.
     * @param activatesToSource True when the router should connect the node
     *        to every eligible source at construction.
     */
    InstrumentModuleNode(const std::string &fullName,
                         const std::vector<Parameter> &parameters,
                         bool eligibleSource = false,
                         bool activatesToSource = false)
        : Node(fullName),
          moduleParameters(parameters),
          eligibleSource(eligibleSource),
          autoSource(activatesToSource)
    {
    }

    std::vector<Parameter> parameters() const override
    {
        return moduleParameters;
    }

    bool isEligibleSource() const override { return eligibleSource; }

    bool activatesToSource() const override { return autoSource; }

   protected:
    bool originatesSignal() const override { return true; }
};
