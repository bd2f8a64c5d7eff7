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
 * @file StationParser.hpp
 * @brief Parser for textual station descriptions.
 *
 * A station description declares the routing topology of a measurement
 * station (instrument modules, connector junctions, device endpoints,
 * switchable links and cables) followed by routing commands.
 *
 * Format (one statement per line, keywords case-insensitive, ids
 * case-sensitive, `*` or `;` starts a comment, `.END` stops parsing):
 * @code
 * MODULE    <id> [SOURCE] [AUTOSOURCE] <param>:<unit>:<flags> ...
 * CONNECTOR <id>
 * ENDPOINT  <id>
 * EDGE      <from> <to> [ACTIVE|INACTIVE|PART_OF|CAPACITIVE]
 * LINK      <a> <b>
 * CABLE     <name> <connection>=<endpoint>,<endpoint>,... ...
 * .CONNECT  <source> <terminal>
 * .ROUTE    <GROUND|FLOAT|HIGHZ|SOURCE|METER> <terminal> [unit]
 * .VACATE   <terminal>
 * @endcode
 *
 * Parameter flags are a subset of `s` (settable) and `g` (gettable); the
 * instrument of a parameter is the part of the module id before the first
 * dot. `LINK` declares a bidirectional pair of inactive electrical edges.
 * Every id used by an edge, link or cable must be declared first.
 *
 * Example usage:
 * @code
 * StationParser parser;
 * int errors = parser.parse("station.txt");
 * if (errors == 0) {
 *   Router router(parser.station(), options);
 *   parser.runCommands(router);
 * }
 * @endcode
 */

#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "Connector.hpp"
#include "RouterOptions.hpp"
#include "StationGraph.hpp"

class Router;

/**
 * @enum RoutingCommandType
 * @brief Routing commands of a station description.
 */
enum class RoutingCommandType
{
    CONNECT, /**< .CONNECT source terminal */
    ROUTE,   /**< .ROUTE kind terminal [unit] */
    VACATE   /**< .VACATE terminal */
};

inline std::ostream& operator<<(std::ostream& os, RoutingCommandType type)
{
    switch (type) {
        case RoutingCommandType::CONNECT:
            os << ".CONNECT";
            break;
        case RoutingCommandType::ROUTE:
            os << ".ROUTE";
            break;
        case RoutingCommandType::VACATE:
            os << ".VACATE";
            break;
        default:
            os << "UnknownCommand";
            break;
    }
    return os;
}

/**
 * @struct RoutingCommand
 * @brief One parsed routing command, kept in file order.
 */
struct RoutingCommand
{
    RoutingCommandType type = RoutingCommandType::CONNECT;

    /** @brief Route kind for ROUTE (GROUND, FLOAT, HIGHZ, SOURCE, METER). */
    std::string kind;

    /** @brief Source id (CONNECT only). */
    NodeId source;

    NodeId terminal;

    /** @brief Unit for ROUTE; empty selects the kind's default. */
    std::string unit;

    /** @brief Line of the command in the description. */
    int line = 0;
};

/**
 * @class StationParser
 * @brief Reads a station description into a graph and a command list.
 *
 * Errors are reported to `std::cerr` as "Line N: ..." and counted; `parse()`
 * returns the number of errors. Statements with errors are skipped.
 */
class StationParser
{
   public:
    /** @brief Routing commands in file order. */
    std::vector<RoutingCommand> commands;

    /**
     * @brief Parse a station description file.
     * @return Number of errors (0 for a clean parse).
     */
    int parse(const std::string& fileName);

    /** @brief Parse a station description from a stream. */
    int parseStream(std::istream& input);

    /**
     * @brief Composed station graph: declared modules, nodes and edges plus
     * every cable subgraph.
     */
    StationGraph station() const;

    /**
     * @brief Execute the parsed commands on `router` in file order.
     *
     * Failing commands are reported by the router and do not stop the
     * remaining commands.
     *
     * @return Number of failed commands.
     */
    int runCommands(Router& router) const;

   private:
    MutableStationGraph declared;
    std::vector<Connector> cables;

    bool parseModule(const std::vector<std::string>& tokens, int lineNumber);
    bool parseEdge(const std::vector<std::string>& tokens, int lineNumber);
    bool parseLink(const std::vector<std::string>& tokens, int lineNumber);
    bool parseCable(const std::vector<std::string>& tokens, int lineNumber);
    bool parseCommand(const std::vector<std::string>& tokens, int lineNumber);

    /** @brief Report an undeclared id; true when `id` is declared. */
    bool requireDeclared(const NodeId& id, int lineNumber) const;
};

/**
 * @brief Print active nodes and edges with their claims.
 *
 * One line per active node (`node <id> [claims]`) followed by one line per
 * active edge (`edge <from> -> <to> [claims]`), in graph order. Links held
 * since start-up are listed as claimed by `static`.
 */
void printRoutingState(const Router& router, std::ostream& out);

/**
 * @brief Parse a station file, run its commands and print the final state.
 *
 * @param fileName Station description.
 * @param options Validated router options.
 * @param out Stream receiving the routing state.
 * @return 0 on success, 1 when parsing or any command failed.
 */
int runStation(const std::string& fileName, const RouterOptions& options,
               std::ostream& out);
