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
 * @file StationParser.cpp
 * @brief Implementation of the station description parser and driver.
 *
 * Implementation notes:
 *  - Lines are tokenized on whitespace; `*` or `;` ends the line.
 *  - Keywords are compared after uppercasing, ids are kept verbatim.
 *  - Declarations are checked in a single pass, so an id must be declared
 *    before an edge, link, cable or command refers to it.
 *
 * Keep API-level documentation in the header (`StationParser.hpp`).
 */

#include "StationParser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "ConnectorNode.hpp"
#include "Edge.hpp"
#include "EndpointNode.hpp"
#include "InstrumentModuleNode.hpp"
#include "Router.hpp"

static std::vector<std::string> tokenizeLine(const std::string& line)
{
    std::vector<std::string> tokens;
    std::string cur;
    for (char c : line) {
        if (c == '*' || c == ';') break;
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

static std::string upper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), ::toupper);
    return text;
}

static std::vector<std::string> split(const std::string& text, char separator)
{
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, separator)) parts.push_back(part);
    if (!text.empty() && text.back() == separator) parts.push_back("");
    return parts;
}

int StationParser::parse(const std::string& fileName)
{
    std::ifstream fileStream(fileName);
    if (!fileStream) {
        std::cerr << "Error: Station description " << fileName
                  << " could not be opened" << std::endl;
        return 1;
    }
    return parseStream(fileStream);
}

int StationParser::parseStream(std::istream& input)
{
    commands.clear();
    declared = MutableStationGraph();
    cables.clear();

    std::string line;
    int lineNumber = 0;
    int errorCount = 0;

    while (std::getline(input, line)) {
        lineNumber++;

        std::vector<std::string> tokens = tokenizeLine(line);
        if (tokens.empty()) continue;

        std::string keyword = upper(tokens[0]);
        if (keyword == ".END") break;

        bool ok = true;
        if (keyword == "MODULE") {
            ok = parseModule(tokens, lineNumber);
        }
        else if (keyword == "CONNECTOR" || keyword == "ENDPOINT") {
            if (tokens.size() != 2) {
                std::cerr << "Line " << lineNumber << ": " << keyword
                          << " expects exactly one id" << std::endl;
                ok = false;
            }
            else if (declared.hasNode(tokens[1])) {
                std::cerr << "Line " << lineNumber << ": Duplicate node '"
                          << tokens[1] << "'" << std::endl;
                ok = false;
            }
            else if (keyword == "CONNECTOR") {
                declared.setNode(tokens[1],
                                 std::make_shared<ConnectorNode>(tokens[1]));
            }
            else {
                declared.setNode(tokens[1],
                                 std::make_shared<EndpointNode>(tokens[1]));
            }
        }
        else if (keyword == "EDGE") {
            ok = parseEdge(tokens, lineNumber);
        }
        else if (keyword == "LINK") {
            ok = parseLink(tokens, lineNumber);
        }
        else if (keyword == "CABLE") {
            ok = parseCable(tokens, lineNumber);
        }
        else if (keyword == ".CONNECT" || keyword == ".ROUTE" ||
                 keyword == ".VACATE") {
            ok = parseCommand(tokens, lineNumber);
        }
        else {
            std::cerr << "Line " << lineNumber << ": Unknown statement '"
                      << tokens[0] << "'" << std::endl;
            ok = false;
        }

        if (!ok) errorCount++;
    }

    return errorCount;
}

bool StationParser::requireDeclared(const NodeId& id, int lineNumber) const
{
    if (declared.hasNode(id)) return true;
    for (const auto& cable : cables)
        if (cable.graph().hasNode(id)) return true;
    std::cerr << "Line " << lineNumber << ": Undeclared node '" << id << "'"
              << std::endl;
    return false;
}

bool StationParser::parseModule(const std::vector<std::string>& tokens,
                                int lineNumber)
{
    if (tokens.size() < 2) {
        std::cerr << "Line " << lineNumber << ": MODULE expects an id"
                  << std::endl;
        return false;
    }
    const NodeId& id = tokens[1];
    if (declared.hasNode(id)) {
        std::cerr << "Line " << lineNumber << ": Duplicate node '" << id << "'"
                  << std::endl;
        return false;
    }

    std::string instrument = id.substr(0, id.find('.'));
    bool eligibleSource = false;
    bool activatesToSource = false;
    std::vector<Parameter> parameters;

    for (std::size_t i = 2; i < tokens.size(); ++i) {
        std::string flag = upper(tokens[i]);
        if (flag == "SOURCE") {
            eligibleSource = true;
            continue;
        }
        if (flag == "AUTOSOURCE") {
            activatesToSource = true;
            continue;
        }

        std::vector<std::string> fields = split(tokens[i], ':');
        if (fields.size() != 3 || fields[0].empty()) {
            std::cerr << "Line " << lineNumber << ": Invalid parameter '"
                      << tokens[i] << "', expected name:unit:flags"
                      << std::endl;
            return false;
        }

        Parameter parameter;
        parameter.name = fields[0];
        parameter.unit = fields[1];
        parameter.instrument = instrument;
        parameter.settable = false;
        parameter.gettable = false;
        for (char c : fields[2]) {
            if (c == 's' || c == 'S')
                parameter.settable = true;
            else if (c == 'g' || c == 'G')
                parameter.gettable = true;
            else {
                std::cerr << "Line " << lineNumber
                          << ": Unknown parameter flag '" << c << "' in '"
                          << tokens[i] << "'" << std::endl;
                return false;
            }
        }
        parameters.push_back(parameter);
    }

    declared.setNode(id, std::make_shared<InstrumentModuleNode>(
                             id, parameters, eligibleSource, activatesToSource));
    return true;
}

bool StationParser::parseEdge(const std::vector<std::string>& tokens,
                              int lineNumber)
{
    if (tokens.size() != 3 && tokens.size() != 4) {
        std::cerr << "Line " << lineNumber
                  << ": EDGE expects <from> <to> [status]" << std::endl;
        return false;
    }
    if (!requireDeclared(tokens[1], lineNumber) ||
        !requireDeclared(tokens[2], lineNumber))
        return false;

    EdgeStatus status = EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION;
    if (tokens.size() == 4) {
        std::string word = upper(tokens[3]);
        if (word == "ACTIVE")
            status = EdgeStatus::ACTIVE_ELECTRICAL_CONNECTION;
        else if (word == "INACTIVE")
            status = EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION;
        else if (word == "PART_OF")
            status = EdgeStatus::PART_OF;
        else if (word == "CAPACITIVE")
            status = EdgeStatus::CAPACITIVE_COUPLING;
        else {
            std::cerr << "Line " << lineNumber << ": Unknown edge status '"
                      << tokens[3] << "'" << std::endl;
            return false;
        }
    }

    declared.setEdge(EdgeId(tokens[1], tokens[2]),
                     std::make_shared<BasicEdge>(status));
    return true;
}

bool StationParser::parseLink(const std::vector<std::string>& tokens,
                              int lineNumber)
{
    if (tokens.size() != 3) {
        std::cerr << "Line " << lineNumber << ": LINK expects <a> <b>"
                  << std::endl;
        return false;
    }
    if (!requireDeclared(tokens[1], lineNumber) ||
        !requireDeclared(tokens[2], lineNumber))
        return false;
    if (tokens[1] == tokens[2]) {
        std::cerr << "Line " << lineNumber << ": LINK endpoints must differ"
                  << std::endl;
        return false;
    }

    declared.setEdge(EdgeId(tokens[1], tokens[2]), std::make_shared<BasicEdge>());
    declared.setEdge(EdgeId(tokens[2], tokens[1]), std::make_shared<BasicEdge>());
    return true;
}

bool StationParser::parseCable(const std::vector<std::string>& tokens,
                               int lineNumber)
{
    if (tokens.size() < 3) {
        std::cerr << "Line " << lineNumber
                  << ": CABLE expects <name> <connection>=<endpoints>..."
                  << std::endl;
        return false;
    }

    std::vector<ConnectorMapping> connections;
    for (std::size_t i = 2; i < tokens.size(); ++i) {
        std::size_t eq = tokens[i].find('=');
        if (eq == std::string::npos) {
            std::cerr << "Line " << lineNumber << ": Invalid connection '"
                      << tokens[i] << "', expected name=endpoint,..."
                      << std::endl;
            return false;
        }
        ConnectorMapping mapping;
        mapping.name = tokens[i].substr(0, eq);
        for (const auto& endpoint : split(tokens[i].substr(eq + 1), ',')) {
            if (endpoint.empty()) continue;
            if (!requireDeclared(endpoint, lineNumber)) return false;
            mapping.endpoints.push_back(endpoint);
        }
        connections.push_back(mapping);
    }

    Connector cable(tokens[1]);
    RoutingResult result = cable.addConnections(connections);
    if (!result.ok()) {
        std::cerr << "Line " << lineNumber << ": " << result.message
                  << std::endl;
        return false;
    }
    cables.push_back(cable);
    return true;
}

bool StationParser::parseCommand(const std::vector<std::string>& tokens,
                                 int lineNumber)
{
    RoutingCommand command;
    command.line = lineNumber;
    std::string keyword = upper(tokens[0]);

    if (keyword == ".CONNECT") {
        if (tokens.size() != 3) {
            std::cerr << "Line " << lineNumber
                      << ": .CONNECT expects <source> <terminal>" << std::endl;
            return false;
        }
        command.type = RoutingCommandType::CONNECT;
        command.source = tokens[1];
        command.terminal = tokens[2];
        if (!requireDeclared(command.source, lineNumber)) return false;
    }
    else if (keyword == ".ROUTE") {
        if (tokens.size() != 3 && tokens.size() != 4) {
            std::cerr << "Line " << lineNumber
                      << ": .ROUTE expects <kind> <terminal> [unit]"
                      << std::endl;
            return false;
        }
        command.type = RoutingCommandType::ROUTE;
        command.kind = upper(tokens[1]);
        command.terminal = tokens[2];
        if (tokens.size() == 4) command.unit = tokens[3];
        static const std::vector<std::string> kinds = {
            "GROUND", "FLOAT", "HIGHZ", "SOURCE", "METER"};
        if (std::find(kinds.begin(), kinds.end(), command.kind) ==
            kinds.end()) {
            std::cerr << "Line " << lineNumber << ": Unknown route kind '"
                      << tokens[1] << "'" << std::endl;
            return false;
        }
    }
    else {
        if (tokens.size() != 2) {
            std::cerr << "Line " << lineNumber
                      << ": .VACATE expects <terminal>" << std::endl;
            return false;
        }
        command.type = RoutingCommandType::VACATE;
        command.terminal = tokens[1];
    }

    if (!requireDeclared(command.terminal, lineNumber)) return false;
    commands.push_back(command);
    return true;
}

StationGraph StationParser::station() const
{
    std::vector<StationGraph> parts = {declared.asStationGraph()};
    for (const auto& cable : cables) parts.push_back(cable.graph());
    return StationGraph::prune(StationGraph::compose(parts));
}

int StationParser::runCommands(Router& router) const
{
    int failures = 0;
    for (const auto& command : commands) {
        RoutingResult result;
        switch (command.type) {
            case RoutingCommandType::CONNECT:
                result = router.connect(command.source, command.terminal);
                break;
            case RoutingCommandType::ROUTE: {
                TerminalGroup terminals = {command.terminal};
                std::string unit = command.unit.empty() ? "V" : command.unit;
                if (command.kind == "GROUND")
                    result = router.routeToGround(terminals, unit);
                else if (command.kind == "FLOAT")
                    result = router.routeToFloat(terminals, unit);
                else if (command.kind == "HIGHZ")
                    result = router.routeToHighZ(terminals, unit);
                else if (command.kind == "SOURCE")
                    result = router.routeToSource(terminals, command.unit);
                else
                    result = router.routeToMeter(terminals, command.unit);
                break;
            }
            case RoutingCommandType::VACATE:
                result = router.vacate(command.terminal);
                break;
        }
        if (!result.ok()) {
            std::cerr << "Line " << command.line << ": " << command.type
                      << " failed (" << result.kind << ")" << std::endl;
            failures++;
        }
    }
    return failures;
}

static std::string describeClaims(const ClaimSet& claims)
{
    std::vector<NodeId> owners;
    for (const NodeId& owner : claims)
        owners.push_back(owner == RoutingGraphAdapter::staticClaim ? "static"
                                                                   : owner);
    return describeIds(owners);
}

void printRoutingState(const Router& router, std::ostream& out)
{
    const StationGraph& graph = router.graph();
    for (const NodeId& id : graph.nodes()) {
        NodePtr node = graph.node(id);
        if (!node || !node->isActive()) continue;
        ClaimSet claims = router.claimsOf(id);
        out << "node " << id << " " << describeClaims(claims) << "\n";
    }
    for (const EdgeId& id : graph.edges()) {
        EdgePtr edge = graph.edge(id);
        if (!edge || !edge->isActive()) continue;
        ClaimSet claims = router.claimsOf(id);
        out << "edge " << id.first << " -> " << id.second << " "
            << describeClaims(claims) << "\n";
    }
}

int runStation(const std::string& fileName, const RouterOptions& options,
               std::ostream& out)
{
    StationParser parser;
    int errors = parser.parse(fileName);
    if (errors != 0) {
        std::cerr << "Error: Failed to parse file: " << fileName << std::endl;
        return 1;
    }

    Router router(parser.station(), options);
    int failures = parser.runCommands(router);
    printRoutingState(router, out);
    return failures == 0 ? 0 : 1;
}
