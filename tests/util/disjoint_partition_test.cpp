#include <gtest/gtest.h>

#include <string>

#include "DisjointPartition.hpp"

/*
 * disjoint_partition_test.cpp
 *
 * Tests for the keyed disjoint partition used to merge terminal groups.
 *
 * Behavior:
 *   - Inserting a set that intersects existing parts merges them.
 *   - insert() returns the new key first, then the merged keys in part
 *     creation order.
 *   - keys()/values() list parts in creation order.
 */

TEST(DisjointPartition, DisjointSetsStaySeparate)
{
  DisjointPartition<int, std::string> partition;
  EXPECT_EQ(partition.insert({"a", "b"}, 0), (std::vector<int>{0}));
  EXPECT_EQ(partition.insert({"c"}, 1), (std::vector<int>{1}));

  EXPECT_EQ(partition.size(), 2u);
  EXPECT_EQ(partition.keys(), (std::vector<std::vector<int>>{{0}, {1}}));
}

TEST(DisjointPartition, IntersectingSetMergesParts)
{
  DisjointPartition<int, std::string> partition;
  partition.insert({"T1"}, 0);
  partition.insert({"T2"}, 1);
  EXPECT_EQ(partition.insert({"T1", "T3"}, 2), (std::vector<int>{2, 0}));

  EXPECT_EQ(partition.keys(),
            (std::vector<std::vector<int>>{{1}, {2, 0}}));
  auto values = partition.values();
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[1], (std::set<std::string>{"T1", "T3"}));
}

TEST(DisjointPartition, BridgingSetMergesSeveralParts)
{
  DisjointPartition<int, std::string> partition;
  partition.insert({"a"}, 0);
  partition.insert({"b"}, 1);
  partition.insert({"c"}, 2);

  EXPECT_EQ(partition.insert({"c", "a"}, 3), (std::vector<int>{3, 0, 2}));
  EXPECT_EQ(partition.size(), 2u);

  // A later set touching the merged part joins it.
  EXPECT_EQ(partition.insert({"c"}, 4), (std::vector<int>{4, 3, 0, 2}));
  EXPECT_EQ(partition.keys(),
            (std::vector<std::vector<int>>{{1}, {4, 3, 0, 2}}));
}

TEST(DisjointPartition, EmptySetIsItsOwnPart)
{
  DisjointPartition<int, std::string> partition;
  partition.insert({"a"}, 0);
  EXPECT_EQ(partition.insert({}, 1), (std::vector<int>{1}));
  EXPECT_EQ(partition.size(), 2u);
}

// No main(): test binary links with gtest_main which supplies main().
