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
 * @file Appraisal.hpp
 * @brief Node predicates and appraisers used to pick routing sources.
 *
 * An appraiser receives one candidate node per terminal group and returns an
 * integer score: positive means the combination may be routed, higher is
 * preferred, zero or negative rejects it. Most callers start from a single
 * node predicate built with the helpers below and lift it with
 * `appraiseAll`.
 *
 * Example:
 * @code
 * NodeAppraiser grounds = appraiseAll(nodeIsGeneralGround("V"));
 * router.route({{"sample.gate"}}, grounds);
 * @endcode
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "Node.hpp"

/** @brief Predicate over a single node. */
using NodePredicate = std::function<bool(const Node &)>;

/** @brief Score for a combination of candidate sources (one per group). */
using NodeAppraiser = std::function<int(const std::vector<NodePtr> &)>;

/** @brief Appraiser accepting every combination with score 1. */
int alwaysTrue(const std::vector<NodePtr> &nodes);

/** @brief Number of settable parameters of `node`. */
int sourceCountOf(const Node &node);

/**
 * @brief Number of readable parameters of `node`, or 0 when any parameter
 * is settable (a node that can be set is a source, not a meter).
 */
int meterCountOf(const Node &node);

bool nodeIsSource(const Node &node);
bool nodeIsMeter(const Node &node);

/**
 * @brief True when any parameter of `node` is one of the constant source
 * switches: ground, ground_force, highz, float.
 */
bool nodeIsConstantSource(const Node &node);

/** @brief True when any parameter of `node` is named ground_sense. */
bool nodeIsConstantMeter(const Node &node);

/**
 * @brief Node has a parameter whose unit is in `units`. An empty unit in
 * `units` matches any parameter.
 */
NodePredicate nodeHasUnit(const std::vector<std::string> &units);

/** @brief Node has a parameter named one of `names`. */
NodePredicate nodeHasParameterName(const std::vector<std::string> &names);

/** @brief Node has a parameter owned by the instrument `instrument`. */
NodePredicate nodeHasParameterFromInstrument(const std::string &instrument);

/** @brief Source node with a parameter `name` in unit `unit`. */
NodePredicate nodeIsSourceWithName(const std::string &name,
                                   const std::string &unit = "");

/** @brief Meter node with a parameter `name` in unit `unit`. */
NodePredicate nodeIsMeterWithName(const std::string &name,
                                  const std::string &unit = "");

/** @brief Ground switch of any instrument, in unit `unit`. */
NodePredicate nodeIsGeneralGround(const std::string &unit = "V");

/**
 * @brief Lift a single-node predicate to an appraiser: 1 when every
 * candidate satisfies it, 0 otherwise.
 */
NodeAppraiser appraiseAll(const NodePredicate &predicate);
