#include <gtest/gtest.h>

#include "SourceFinder.hpp"
#include "station_fixtures.hpp"

/*
 * source_finder_test.cpp
 *
 * Tests for the reverse breadth-first source search and the ranking of
 * source combinations.
 *
 * Behavior:
 *   - Candidates of a single terminal come in breadth-first order.
 *   - Candidates of a multi-terminal group are those common to all of its
 *     terminals, ordered by summed path length.
 *   - Combinations are ranked by appraisal score (descending), then by
 *     summed distance; zero scores are discarded.
 *   - Sources claimed by other terminals are invisible.
 */

// B->T1, B->X->Y->T2, A->Z->T1, A->T2 with grounds A and B.
static StationGraph twoTerminalStation()
{
  MutableStationGraph graph;
  addGround(graph, "B");
  addGround(graph, "A");
  for (const char* id : {"X", "Y", "Z"}) addConnector(graph, id);
  addEndpoint(graph, "T1");
  addEndpoint(graph, "T2");
  addEdge(graph, "B", "T1");
  addEdge(graph, "B", "X");
  addEdge(graph, "X", "Y");
  addEdge(graph, "Y", "T2");
  addEdge(graph, "A", "Z");
  addEdge(graph, "Z", "T1");
  addEdge(graph, "A", "T2");
  return graph;
}

TEST(SourceFinder, SingleTerminalKeepsBreadthFirstOrder)
{
  StationGraph graph = twoTerminalStation();
  RoutingGraphAdapter adapter(graph);
  SourceFinder finder(adapter, alwaysTrue);

  std::vector<int> distances;
  EXPECT_EQ(finder.nearestSourcesAvailableTo({"T1"}, distances),
            (std::vector<NodeId>{"B", "A"}));
  EXPECT_EQ(distances, (std::vector<int>{2, 3}));
}

TEST(SourceFinder, GroupCandidatesSortBySummedDistance)
{
  StationGraph graph = twoTerminalStation();
  RoutingGraphAdapter adapter(graph);
  SourceFinder finder(adapter, alwaysTrue);

  std::vector<int> distances;
  EXPECT_EQ(finder.nearestSourcesAvailableTo({"T1", "T2"}, distances),
            (std::vector<NodeId>{"A", "B"}));
  EXPECT_EQ(distances, (std::vector<int>{5, 6}));
}

TEST(SourceFinder, GroupCandidatesMustReachEveryTerminal)
{
  MutableStationGraph graph;
  addGround(graph, "G1");
  addGround(graph, "G2");
  addEndpoint(graph, "T1");
  addEndpoint(graph, "T2");
  addEdge(graph, "G1", "T1");
  addEdge(graph, "G1", "T2");
  addEdge(graph, "G2", "T2");
  RoutingGraphAdapter adapter(graph);
  SourceFinder finder(adapter, alwaysTrue);

  std::vector<int> distances;
  EXPECT_EQ(finder.nearestSourcesAvailableTo({"T1", "T2"}, distances),
            (std::vector<NodeId>{"G1"}));
}

TEST(SourceFinder, NodeWithoutPredecessorsCountsAsSource)
{
  MutableStationGraph graph;
  addEndpoint(graph, "dangling");
  addEndpoint(graph, "T");
  addEdge(graph, "dangling", "T");
  RoutingGraphAdapter adapter(graph);
  SourceFinder finder(adapter, alwaysTrue);

  std::vector<int> distances;
  EXPECT_EQ(finder.nearestSourcesAvailableTo({"T"}, distances),
            (std::vector<NodeId>{"dangling"}));
}

TEST(SourceFinder, ClaimedSourcesAreHidden)
{
  StationGraph graph = twoTerminalStation();
  RoutingGraphAdapter adapter(graph);
  ASSERT_TRUE(adapter.activateNode("B", "other").ok());
  SourceFinder finder(adapter, alwaysTrue);

  std::vector<int> distances;
  EXPECT_EQ(finder.nearestSourcesAvailableTo({"T1"}, distances),
            (std::vector<NodeId>{"A"}));
}

TEST(SourceFinder, HigherScoreWinsOverDistance)
{
  MutableStationGraph graph;
  addGround(graph, "A");
  addGround(graph, "B");
  addConnector(graph, "C");
  addEndpoint(graph, "T");
  addEdge(graph, "A", "T");
  addEdge(graph, "B", "C");
  addEdge(graph, "C", "T");
  RoutingGraphAdapter adapter(graph);

  NodeAppraiser preferB = [](const std::vector<NodePtr>& nodes) {
    return nodes.front()->fullName() == "B" ? 5 : 3;
  };
  SourceFinder finder(adapter, preferB);

  std::vector<SourceGroup> ranked;
  ASSERT_TRUE(finder.findEligibleSourceGroups({{"T"}}, ranked).ok());
  EXPECT_EQ(ranked,
            (std::vector<SourceGroup>{SourceGroup{"B"}, SourceGroup{"A"}}));
}

TEST(SourceFinder, EqualScoresRankByDistance)
{
  StationGraph graph = twoTerminalStation();
  RoutingGraphAdapter adapter(graph);
  SourceFinder finder(adapter, alwaysTrue);

  std::vector<SourceGroup> ranked;
  ASSERT_TRUE(finder.findEligibleSourceGroups({{"T1"}, {"T2"}}, ranked).ok());
  // T1: B(2), A(3); T2: A(2), B(4).
  ASSERT_EQ(ranked.size(), 4u);
  EXPECT_EQ(ranked[0], (SourceGroup{"B", "A"}));
  EXPECT_EQ(ranked[3], (SourceGroup{"A", "B"}));
}

TEST(SourceFinder, NoEligibleSource)
{
  MutableStationGraph graph;
  addConnector(graph, "C");
  addVoltageSource(graph, "smu.ch1");
  addEndpoint(graph, "T");
  addEdge(graph, "smu.ch1", "C");
  addEdge(graph, "C", "T");
  RoutingGraphAdapter adapter(graph);
  SourceFinder finder(adapter, appraiseAll(nodeIsGeneralGround()));

  std::vector<SourceGroup> ranked;
  RoutingResult result = finder.findEligibleSourceGroups({{"T"}}, ranked);
  EXPECT_EQ(result.kind, RoutingErrorKind::NoEligibleSource);
  EXPECT_EQ(result.message, "No eligible sources found for [[T]].");
  EXPECT_TRUE(ranked.empty());
}

// No main(): test binary links with gtest_main which supplies main().
