#include <gtest/gtest.h>

#include <sstream>

#include "RoutingGraphAdapter.hpp"
#include "station_fixtures.hpp"

/*
 * routing_graph_adapter_test.cpp
 *
 * Tests for claim bookkeeping and the derived graph views.
 *
 * Behavior:
 *   - activateNode/activateEdge add the terminal to the claim set and
 *     switch the element on; an edge also links destination to origin.
 *   - Deactivation removes one claim; the element switches off only when
 *     the claim set becomes empty. Releasing a missing claim is a
 *     ClaimUnderflow.
 *   - The search graph hides elements claimed only by other terminals and
 *     edges that cannot switch. Views follow later claim changes.
 *   - Statically claimed elements are visible to every search and stay
 *     active when routes through them are released.
 */

class RoutingGraphAdapterTest : public ::testing::Test
{
 protected:
  StationGraph graph = groundConnectorTerminal();
  RoutingGraphAdapter adapter{graph};
};

TEST_F(RoutingGraphAdapterTest, NodeClaimsAccumulate)
{
  ASSERT_TRUE(adapter.activateNode("C", "T1").ok());
  ASSERT_TRUE(adapter.activateNode("C", "T2").ok());
  EXPECT_TRUE(graph.node("C")->isActive());
  EXPECT_EQ(adapter.claimsOf("C"), (ClaimSet{"T1", "T2"}));

  ASSERT_TRUE(adapter.deactivateNode("C", "T1").ok());
  EXPECT_TRUE(graph.node("C")->isActive());
  ASSERT_TRUE(adapter.deactivateNode("C", "T2").ok());
  EXPECT_FALSE(graph.node("C")->isActive());
  EXPECT_TRUE(adapter.claimsOf("C").empty());
}

TEST_F(RoutingGraphAdapterTest, DeactivateUnclaimedNodeIsUnderflow)
{
  ASSERT_TRUE(adapter.activateNode("C", "T1").ok());
  RoutingResult result = adapter.deactivateNode("C", "T2");
  EXPECT_EQ(result.kind, RoutingErrorKind::ClaimUnderflow);
  EXPECT_EQ(result.message, "Node C is not claimed by T2");
  EXPECT_TRUE(graph.node("C")->isActive());
}

TEST_F(RoutingGraphAdapterTest, UnknownIdsAreReported)
{
  EXPECT_EQ(adapter.activateNode("missing", "T").kind,
            RoutingErrorKind::UnknownNode);
  EXPECT_EQ(adapter.activateEdge(EdgeId("T", "G"), "T").kind,
            RoutingErrorKind::UnknownNode);
  EXPECT_TRUE(adapter.claimsOf("missing").empty());
  EXPECT_TRUE(adapter.claimsOf(EdgeId("T", "G")).empty());
}

TEST_F(RoutingGraphAdapterTest, EdgeActivationLinksSource)
{
  EdgeId edge("G", "C");
  ASSERT_TRUE(adapter.activateEdge(edge, "T").ok());
  EXPECT_TRUE(graph.edge(edge)->isActive());
  EXPECT_TRUE(graph.node("C")->hasSource(graph.node("G")));
  EXPECT_EQ(adapter.claimsOf(edge), (ClaimSet{"T"}));

  ASSERT_TRUE(adapter.deactivateEdge(edge, "T").ok());
  EXPECT_FALSE(graph.edge(edge)->isActive());
  EXPECT_FALSE(graph.node("C")->hasSource(graph.node("G")));
}

TEST_F(RoutingGraphAdapterTest, SharedEdgeStaysActiveUntilLastClaim)
{
  EdgeId edge("G", "C");
  ASSERT_TRUE(adapter.activateEdge(edge, "T1").ok());
  ASSERT_TRUE(adapter.activateEdge(edge, "T2").ok());
  EXPECT_EQ(graph.node("C")->sources().size(), 1u);

  ASSERT_TRUE(adapter.deactivateEdge(edge, "T1").ok());
  EXPECT_TRUE(graph.edge(edge)->isActive());
  EXPECT_TRUE(graph.node("C")->hasSource(graph.node("G")));

  EXPECT_EQ(adapter.deactivateEdge(edge, "T1").kind,
            RoutingErrorKind::ClaimUnderflow);
}

TEST(RoutingGraphAdapter, StructuralEdgeCannotBeActivated)
{
  MutableStationGraph declared;
  addEndpoint(declared, "A");
  addEndpoint(declared, "B");
  addEdge(declared, "A", "B", EdgeStatus::PART_OF);
  RoutingGraphAdapter adapter(declared);

  RoutingResult result = adapter.activateEdge(EdgeId("A", "B"), "B");
  EXPECT_EQ(result.kind, RoutingErrorKind::InvalidEdgeTransition);
  EXPECT_FALSE(declared.edge(EdgeId("A", "B"))->isActive());

  // The refused edge leaves neither a claim nor a source link behind.
  EXPECT_TRUE(adapter.claimsOf(EdgeId("A", "B")).empty());
  EXPECT_FALSE(declared.node("B")->hasSource(declared.node("A")));
}

TEST_F(RoutingGraphAdapterTest, SearchGraphHidesForeignClaims)
{
  ASSERT_TRUE(adapter.activateNode("C", "T1").ok());
  ASSERT_TRUE(adapter.activateEdge(EdgeId("C", "T"), "T1").ok());

  StationGraph forOther = adapter.makeSearchGraphFor({"T2"});
  EXPECT_FALSE(forOther.hasNode("C"));
  EXPECT_TRUE(forOther.hasNode("G"));
  EXPECT_EQ(forOther.edgeCount(), 0u);

  StationGraph forOwner = adapter.makeSearchGraphFor({"T1"});
  EXPECT_TRUE(forOwner.hasNode("C"));
  EXPECT_EQ(forOwner.edgeCount(), 2u);

  StationGraph forGroup = adapter.makeSearchGraphFor({"T2", "T1"});
  EXPECT_TRUE(forGroup.hasNode("C"));
}

TEST_F(RoutingGraphAdapterTest, SearchGraphFollowsLaterClaims)
{
  StationGraph view = adapter.makeSearchGraphFor({"T2"});
  EXPECT_TRUE(view.hasNode("C"));

  ASSERT_TRUE(adapter.activateNode("C", "T1").ok());
  EXPECT_FALSE(view.hasNode("C"));

  ASSERT_TRUE(adapter.deactivateNode("C", "T1").ok());
  EXPECT_TRUE(view.hasNode("C"));
}

TEST(RoutingGraphAdapter, SearchGraphExcludesStructuralEdges)
{
  MutableStationGraph declared;
  addEndpoint(declared, "A");
  addEndpoint(declared, "B");
  addEndpoint(declared, "C");
  addEdge(declared, "A", "B", EdgeStatus::PART_OF);
  addEdge(declared, "B", "C");
  RoutingGraphAdapter adapter(declared);

  StationGraph view = adapter.makeSearchGraphFor({"C"});
  EXPECT_EQ(view.edges(), (std::vector<EdgeId>{EdgeId("B", "C")}));
}

TEST_F(RoutingGraphAdapterTest, RoutedSubgraphHoldsOwnEdgesOnly)
{
  ASSERT_TRUE(adapter.activateEdge(EdgeId("G", "C"), "T").ok());
  ASSERT_TRUE(adapter.activateEdge(EdgeId("C", "T"), "T").ok());
  ASSERT_TRUE(adapter.activateEdge(EdgeId("G", "C"), "X").ok());

  StationGraph routed = adapter.routedSubgraphOf("T");
  EXPECT_EQ(routed.edgeCount(), 2u);
  EXPECT_EQ(routed.breadthFirstNodesFrom("T", true),
            (std::vector<NodeId>{"T", "C", "G"}));
  EXPECT_EQ(adapter.routedSubgraphOf("X").edgeCount(), 1u);
}

TEST_F(RoutingGraphAdapterTest, StaticClaimsKeepActivation)
{
  ASSERT_TRUE(adapter.activateNode("G", "T1").ok());
  ASSERT_TRUE(adapter.activateEdge(EdgeId("G", "C"), "T1").ok());
  adapter.makeClaimsStatic();

  const ClaimSet statically{RoutingGraphAdapter::staticClaim};
  EXPECT_EQ(adapter.claimsOf("G"), statically);
  EXPECT_EQ(adapter.claimsOf(EdgeId("G", "C")), statically);
  EXPECT_TRUE(adapter.claimsOf("C").empty());
  EXPECT_TRUE(graph.node("G")->isActive());
  EXPECT_TRUE(graph.edge(EdgeId("G", "C"))->isActive());

  // The former owner no longer holds a claim.
  EXPECT_EQ(adapter.deactivateNode("G", "T1").kind,
            RoutingErrorKind::ClaimUnderflow);
}

TEST_F(RoutingGraphAdapterTest, StaticLinksAreSharedAndNeverReleased)
{
  ASSERT_TRUE(adapter.activateEdge(EdgeId("G", "C"), "T1").ok());
  adapter.makeClaimsStatic();

  StationGraph view = adapter.makeSearchGraphFor({"T2"});
  EXPECT_TRUE(view.hasNode("G"));
  EXPECT_EQ(view.edgeCount(), 2u);

  ASSERT_TRUE(adapter.activateEdge(EdgeId("G", "C"), "T2").ok());
  EXPECT_EQ(adapter.claimsOf(EdgeId("G", "C")),
            (ClaimSet{RoutingGraphAdapter::staticClaim, "T2"}));

  ASSERT_TRUE(adapter.deactivateEdge(EdgeId("G", "C"), "T2").ok());
  EXPECT_TRUE(graph.edge(EdgeId("G", "C"))->isActive());
  EXPECT_TRUE(graph.node("C")->hasSource(graph.node("G")));
}

TEST_F(RoutingGraphAdapterTest, WritesDiagnosticTrace)
{
  std::ostringstream trace;
  adapter.setDiagnostics(&trace);
  ASSERT_TRUE(adapter.activateNode("C", "T").ok());
  ASSERT_TRUE(adapter.activateEdge(EdgeId("C", "T"), "T").ok());
  ASSERT_TRUE(adapter.deactivateEdge(EdgeId("C", "T"), "T").ok());
  ASSERT_TRUE(adapter.deactivateNode("C", "T").ok());

  EXPECT_EQ(trace.str(),
            "activate node C for T\n"
            "activate edge C -> T for T\n"
            "deactivate edge C -> T\n"
            "deactivate node C\n");
}

// No main(): test binary links with gtest_main which supplies main().
