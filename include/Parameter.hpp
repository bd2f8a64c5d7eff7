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
 * @file Parameter.hpp
 * @brief Controllable quantity exposed by a station node.
 *
 * The router never reads or writes parameter values; it only inspects their
 * names, units and access modes to decide whether a node can act as a
 * source (something settable, e.g. a voltage output or a ground switch) or a
 * meter (something readable only).
 */

#pragma once

#include <string>

/**
 * @struct Parameter
 * @brief Descriptor of a quantity owned by an instrument module.
 */
struct Parameter
{
    /** @brief Short name, e.g. "voltage", "ground", "highz". */
    std::string name;

    /** @brief Physical unit, e.g. "V" or "A" (may be empty). */
    std::string unit;

    /** @brief True when the quantity can be set. */
    bool settable = false;

    /** @brief True when the quantity can be read back. */
    bool gettable = true;

    /** @brief Full name of the owning instrument (may be empty). */
    std::string instrument;
};
