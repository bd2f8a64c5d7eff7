#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ConnectorNode.hpp"
#include "Edge.hpp"
#include "EndpointNode.hpp"
#include "InstrumentModuleNode.hpp"
#include "StationGraph.hpp"

/*
 * station_fixtures.hpp
 *
 * Small builders shared by the routing tests. Node ids follow the
 * "<instrument>.<port>" convention, the instrument of a parameter is the id
 * prefix.
 */

inline Parameter makeParameter(const std::string& name, const std::string& unit,
                               bool settable, bool gettable = true)
{
  Parameter parameter;
  parameter.name = name;
  parameter.unit = unit;
  parameter.settable = settable;
  parameter.gettable = gettable;
  return parameter;
}

inline std::string instrumentOf(const std::string& id)
{
  return id.substr(0, id.find('.'));
}

// Eligible ground switch ("ground" settable in V).
inline void addGround(MutableStationGraph& graph, const std::string& id)
{
  Parameter ground = makeParameter("ground", "V", true);
  ground.instrument = instrumentOf(id);
  graph.setNode(id, std::make_shared<InstrumentModuleNode>(
                        id, std::vector<Parameter>{ground}, true));
}

// Eligible named constant source ("float", "highz", ...) in V.
inline void addConstant(MutableStationGraph& graph, const std::string& id,
                        const std::string& name)
{
  Parameter constant = makeParameter(name, "V", true);
  constant.instrument = instrumentOf(id);
  graph.setNode(id, std::make_shared<InstrumentModuleNode>(
                        id, std::vector<Parameter>{constant}, true));
}

// Eligible voltage output ("voltage" settable in V).
inline void addVoltageSource(MutableStationGraph& graph, const std::string& id)
{
  Parameter voltage = makeParameter("voltage", "V", true);
  voltage.instrument = instrumentOf(id);
  graph.setNode(id, std::make_shared<InstrumentModuleNode>(
                        id, std::vector<Parameter>{voltage}, true));
}

// Eligible read-only meter ("current" gettable in A).
inline void addMeter(MutableStationGraph& graph, const std::string& id)
{
  Parameter current = makeParameter("current", "A", false);
  current.instrument = instrumentOf(id);
  graph.setNode(id, std::make_shared<InstrumentModuleNode>(
                        id, std::vector<Parameter>{current}, true));
}

inline void addConnector(MutableStationGraph& graph, const std::string& id)
{
  graph.setNode(id, std::make_shared<ConnectorNode>(id));
}

inline void addEndpoint(MutableStationGraph& graph, const std::string& id)
{
  graph.setNode(id, std::make_shared<EndpointNode>(id));
}

inline void addEdge(MutableStationGraph& graph, const std::string& from,
                    const std::string& to,
                    EdgeStatus status = EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION)
{
  graph.setEdge(EdgeId(from, to), std::make_shared<BasicEdge>(status));
}

// Ground G -> connector C -> terminal T, both edges inactive.
inline MutableStationGraph groundConnectorTerminal()
{
  MutableStationGraph graph;
  addGround(graph, "G");
  addConnector(graph, "C");
  addEndpoint(graph, "T");
  addEdge(graph, "G", "C");
  addEdge(graph, "C", "T");
  return graph;
}
