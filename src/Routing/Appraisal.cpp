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
 * @file Appraisal.cpp
 * @brief Parameter-based node predicates.
 */

#include "Appraisal.hpp"

#include <algorithm>

static bool hasName(const Parameter &parameter,
                    const std::vector<std::string> &names)
{
    return std::find(names.begin(), names.end(), parameter.name) !=
           names.end();
}

int alwaysTrue(const std::vector<NodePtr> &) { return 1; }

int sourceCountOf(const Node &node)
{
    int count = 0;
    for (const auto &parameter : node.parameters())
        if (parameter.settable) ++count;
    return count;
}

int meterCountOf(const Node &node)
{
    int count = 0;
    for (const auto &parameter : node.parameters()) {
        if (parameter.settable) return 0;
        if (parameter.gettable) ++count;
    }
    return count;
}

bool nodeIsSource(const Node &node) { return sourceCountOf(node) > 0; }

bool nodeIsMeter(const Node &node) { return meterCountOf(node) > 0; }

bool nodeIsConstantSource(const Node &node)
{
    static const std::vector<std::string> constantSources = {
        "ground", "ground_force", "highz", "float"};
    for (const auto &parameter : node.parameters())
        if (hasName(parameter, constantSources)) return true;
    return false;
}

bool nodeIsConstantMeter(const Node &node)
{
    static const std::vector<std::string> constantMeters = {"ground_sense"};
    for (const auto &parameter : node.parameters())
        if (hasName(parameter, constantMeters)) return true;
    return false;
}

NodePredicate nodeHasUnit(const std::vector<std::string> &units)
{
    bool anyUnit = std::find(units.begin(), units.end(), "") != units.end();
    return [units, anyUnit](const Node &node) {
        for (const auto &parameter : node.parameters()) {
            if (anyUnit) return true;
            if (std::find(units.begin(), units.end(), parameter.unit) !=
                units.end())
                return true;
        }
        return false;
    };
}

NodePredicate nodeHasParameterName(const std::vector<std::string> &names)
{
    return [names](const Node &node) {
        for (const auto &parameter : node.parameters())
            if (hasName(parameter, names)) return true;
        return false;
    };
}

NodePredicate nodeHasParameterFromInstrument(const std::string &instrument)
{
    return [instrument](const Node &node) {
        for (const auto &parameter : node.parameters())
            if (!parameter.instrument.empty() &&
                parameter.instrument == instrument)
                return true;
        return false;
    };
}

NodePredicate nodeIsSourceWithName(const std::string &name,
                                   const std::string &unit)
{
    NodePredicate named = nodeHasParameterName({name});
    NodePredicate inUnit = nodeHasUnit({unit});
    return [named, inUnit](const Node &node) {
        return named(node) && nodeIsSource(node) && inUnit(node);
    };
}

NodePredicate nodeIsMeterWithName(const std::string &name,
                                  const std::string &unit)
{
    NodePredicate named = nodeHasParameterName({name});
    NodePredicate inUnit = nodeHasUnit({unit});
    return [named, inUnit](const Node &node) {
        return named(node) && nodeIsMeter(node) && inUnit(node);
    };
}

NodePredicate nodeIsGeneralGround(const std::string &unit)
{
    return nodeIsSourceWithName("ground", unit);
}

NodeAppraiser appraiseAll(const NodePredicate &predicate)
{
    return [predicate](const std::vector<NodePtr> &nodes) {
        for (const auto &node : nodes)
            if (!node || !predicate(*node)) return 0;
        return 1;
    };
}
