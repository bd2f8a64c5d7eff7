#include <gtest/gtest.h>

#include "Connector.hpp"
#include "Router.hpp"
#include "station_fixtures.hpp"

/*
 * connector_test.cpp
 *
 * Tests for cable/connector subgraphs.
 *
 * Behavior:
 *   - Each connection becomes a connector node "<name>[<connection>]" with
 *     a pair of opposite inactive edges to every endpoint it joins.
 *   - Unnamed connections are named by their position.
 *   - Duplicate connection names are rejected and nothing is added.
 *   - Composed with the station, a connector carries routes.
 */

TEST(Connector, BuildsConnectionNodesAndEdges)
{
  Connector cable("cable1");
  ASSERT_TRUE(cable.addConnections({{"a", {"smu.ch1", "dev.pin1"}}}).ok());

  StationGraph graph = cable.graph();
  EXPECT_EQ(cable.connectionNode("a"), "cable1[a]");
  ASSERT_NE(graph.node("cable1[a]"), nullptr);
  EXPECT_TRUE(graph.hasEdge(EdgeId("smu.ch1", "cable1[a]")));
  EXPECT_TRUE(graph.hasEdge(EdgeId("cable1[a]", "smu.ch1")));
  EXPECT_TRUE(graph.hasEdge(EdgeId("dev.pin1", "cable1[a]")));
  EXPECT_TRUE(graph.hasEdge(EdgeId("cable1[a]", "dev.pin1")));
  EXPECT_EQ(graph.edgeCount(), 4u);
  for (const EdgeId& id : graph.edges())
    EXPECT_EQ(graph.edge(id)->status(),
              EdgeStatus::INACTIVE_ELECTRICAL_CONNECTION);

  // Endpoints are placeholders until composed with the station.
  EXPECT_EQ(graph.node("smu.ch1"), nullptr);
}

TEST(Connector, UnnamedConnectionsUsePosition)
{
  Connector cable("bnc");
  ASSERT_TRUE(cable.addConnections({{"", {"x"}}, {"", {"y"}}}).ok());
  EXPECT_TRUE(cable.graph().hasNode("bnc[0]"));
  EXPECT_TRUE(cable.graph().hasNode("bnc[1]"));
}

TEST(Connector, DuplicateNamesAreRejected)
{
  Connector cable("cable1");
  RoutingResult result =
      cable.addConnections({{"a", {"x"}}, {"a", {"y"}}});
  EXPECT_EQ(result.kind, RoutingErrorKind::MalformedRequest);
  EXPECT_EQ(result.message, "Connection names of cable1 must be unique: a");
  EXPECT_EQ(cable.graph().nodeCount(), 0u);

  ASSERT_TRUE(cable.addConnections({{"a", {"x"}}}).ok());
  EXPECT_FALSE(cable.addConnections({{"a", {"y"}}}).ok());
}

TEST(Connector, ComposedConnectorCarriesRoute)
{
  MutableStationGraph declared;
  addGround(declared, "gnd.out");
  addEndpoint(declared, "dev.pin1");

  Connector cable("cable1");
  ASSERT_TRUE(cable.addConnections({{"0", {"gnd.out", "dev.pin1"}}}).ok());

  StationGraph station = StationGraph::prune(
      StationGraph::compose({declared, cable.graph()}));
  Router router(station);

  ASSERT_TRUE(router.routeToGround({"dev.pin1"}).ok());
  EXPECT_EQ(router.claimsOf(NodeId("cable1[0]")), (ClaimSet{"dev.pin1"}));
  EXPECT_TRUE(station.edge(EdgeId("gnd.out", "cable1[0]"))->isActive());
  EXPECT_TRUE(station.edge(EdgeId("cable1[0]", "dev.pin1"))->isActive());
  EXPECT_FALSE(station.edge(EdgeId("cable1[0]", "gnd.out"))->isActive());

  ASSERT_TRUE(router.vacate("dev.pin1").ok());
  EXPECT_FALSE(station.node("cable1[0]")->isActive());
}

// No main(): test binary links with gtest_main which supplies main().
