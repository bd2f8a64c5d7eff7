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
#pragma once

#include <stdexcept>
#include <string>

/*
 * RouterOptions.hpp
 *
 * Lightweight configuration container for runtime router options.
 *
 * This header declares `RouterOptions`, a simple POD-style struct that
 * carries router configuration knobs from the command-line driver (or tests)
 * into the router. The options bound the path search and control the
 * diagnostic trace.
 *
 * Design goals:
 *  - Keep options small and trivial to copy (no heavy ownership semantics).
 *  - Provide a `validate()` method that checks for obviously invalid values
 *    and throws `std::invalid_argument` for fatal misconfiguration.
 */
/**
 * @struct RouterOptions
 * @brief Runtime options controlling path search bounds and diagnostics.
 *
 * Fields are public to allow easy construction at the call-site (e.g.,
 * parsing CLI flags). Callers should invoke `validate()` after setting
 * options.
 */
struct RouterOptions
{
    /**
     * @brief Maximum number of simple paths drawn per (source, terminal)
     * pair during route search.
     *
     * Shortest simple path enumeration is exponential on dense topologies;
     * a positive bound caps the work spent on a request that cannot be
     * satisfied. 0 means unbounded (exhaustive search).
     */
    int maxPathsPerPair = 0;

    /** @brief Path to the diagnostic trace appended to by the router. */
    std::string diagFile = "routing.log";

    /**
     * @brief Write the diagnostic trace.
     *
     * When true the router appends one line per requested connection,
     * ranked source candidate list, found path set and node/edge activation
     * change to `diagFile`.
     */
    bool diagVerbose = false;

    /**
     * @brief Validate option values.
     *
     * Throws:
     *   - std::invalid_argument if `maxPathsPerPair` is negative or the
     *     trace is enabled without a file name.
     */
    void validate() const
    {
        if (maxPathsPerPair < 0)
            throw std::invalid_argument("maxPathsPerPair must be >= 0");
        if (diagVerbose && diagFile.empty())
            throw std::invalid_argument(
                "diagFile must be set when diagVerbose is enabled");
    }
};
