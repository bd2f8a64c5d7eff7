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
 * @file RoutingResult.hpp
 * @brief Error kinds and the result value returned by routing operations.
 *
 * Routing failures are ordinary outcomes (a request may simply have no
 * eligible source or no disjoint path and be retried with a different
 * appraiser), so they are returned as values rather than thrown. Programming
 * errors such as removing a claim that was never made use distinct kinds so
 * callers can tell them apart from "no route".
 */

#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

/**
 * @enum RoutingErrorKind
 * @brief Classification of a failed graph or routing operation.
 */
enum class RoutingErrorKind
{
    None,                  /**< Operation succeeded */
    NoEligibleSource,      /**< No positively appraised source combination */
    NoDisjointPath,        /**< Search space exhausted without a route */
    MalformedRequest,      /**< Request shape is invalid (group counts etc.) */
    InvalidEdgeTransition, /**< Edge type/status forbids (de)activation */
    ClaimUnderflow,        /**< Terminal never claimed the node/edge */
    SourceError,           /**< Removing a source that is not a member */
    UnknownNode            /**< Identifier is not present in the graph */
};

inline std::ostream& operator<<(std::ostream& os, RoutingErrorKind kind)
{
    switch (kind) {
        case RoutingErrorKind::None:
            os << "None";
            break;
        case RoutingErrorKind::NoEligibleSource:
            os << "NoEligibleSource";
            break;
        case RoutingErrorKind::NoDisjointPath:
            os << "NoDisjointPath";
            break;
        case RoutingErrorKind::MalformedRequest:
            os << "MalformedRequest";
            break;
        case RoutingErrorKind::InvalidEdgeTransition:
            os << "InvalidEdgeTransition";
            break;
        case RoutingErrorKind::ClaimUnderflow:
            os << "ClaimUnderflow";
            break;
        case RoutingErrorKind::SourceError:
            os << "SourceError";
            break;
        case RoutingErrorKind::UnknownNode:
            os << "UnknownNode";
            break;
        default:
            os << "UnknownRoutingErrorKind";
            break;
    }
    return os;
}

/**
 * @struct RoutingResult
 * @brief Outcome of a graph mutation or routing request.
 *
 * A default-constructed result is a success. Failures carry a kind and a
 * human readable message; the message is what the router prints to stderr.
 */
struct RoutingResult
{
    /** @brief Failure classification, `None` on success. */
    RoutingErrorKind kind = RoutingErrorKind::None;

    /** @brief Diagnostic message (empty on success). */
    std::string message;

    /** @brief True when the operation succeeded. */
    bool ok() const { return kind == RoutingErrorKind::None; }

    /**
     * @brief True for the failures a caller may retry with a different
     * appraiser or topology (the routing error family).
     */
    bool isRoutingError() const
    {
        return kind == RoutingErrorKind::NoEligibleSource ||
               kind == RoutingErrorKind::NoDisjointPath ||
               kind == RoutingErrorKind::MalformedRequest;
    }

    static RoutingResult success() { return RoutingResult(); }

    static RoutingResult failure(RoutingErrorKind kind,
                                 const std::string& message)
    {
        RoutingResult result;
        result.kind = kind;
        result.message = message;
        return result;
    }
};

inline std::ostream& operator<<(std::ostream& os, const RoutingResult& result)
{
    if (result.ok()) {
        os << "ok";
    } else {
        os << result.kind << ": " << result.message;
    }
    return os;
}

/** @brief Render ids as "[a, b]" for messages. */
inline std::string describeIds(const std::vector<std::string>& ids)
{
    std::string text = "[";
    for (std::size_t i = 0; i < ids.size(); ++i)
        text += (i ? ", " : "") + ids[i];
    return text + "]";
}

/** @brief Render groups of ids as "[[a, b], [c]]" for messages. */
inline std::string describeGroups(
    const std::vector<std::vector<std::string>>& groups)
{
    std::string text = "[";
    for (std::size_t g = 0; g < groups.size(); ++g)
        text += (g ? ", " : "") + describeIds(groups[g]);
    return text + "]";
}
