#include <gtest/gtest.h>

#include <memory>

#include "LazySequence.hpp"

/*
 * lazy_product_test.cpp
 *
 * Tests for LazySequence and LazyProduct.
 *
 * Behavior:
 *   - Items are pulled from the generator only when requested and cached.
 *   - The product walks combinations with the last dimension varying
 *     fastest.
 *   - Zero dimensions yield one empty combination; an empty dimension yields
 *     nothing.
 */

// Counting generator producing 0, 1, ..., limit - 1.
static std::shared_ptr<LazySequence<int>> countingSequence(int limit,
                                                           int* pulls)
{
  auto counter = std::make_shared<int>(0);
  return std::make_shared<LazySequence<int>>(
      [counter, limit, pulls](int& out) {
        if (*counter >= limit) return false;
        ++*pulls;
        out = (*counter)++;
        return true;
      });
}

TEST(LazySequence, PullsOnlyWhatIsRequested)
{
  int pulls = 0;
  auto sequence = countingSequence(100, &pulls);

  int value = -1;
  ASSERT_TRUE(sequence->get(2, value));
  EXPECT_EQ(value, 2);
  EXPECT_EQ(pulls, 3);
  EXPECT_EQ(sequence->materialized(), 3u);

  // Cached items are not pulled again.
  ASSERT_TRUE(sequence->get(0, value));
  EXPECT_EQ(value, 0);
  EXPECT_EQ(pulls, 3);
}

TEST(LazySequence, ReportsEnd)
{
  int pulls = 0;
  auto sequence = countingSequence(2, &pulls);
  int value = 0;
  EXPECT_TRUE(sequence->get(1, value));
  EXPECT_FALSE(sequence->get(2, value));
  EXPECT_FALSE(sequence->get(5, value));
  EXPECT_EQ(pulls, 2);
}

TEST(LazySequence, FromVector)
{
  auto sequence = LazySequence<int>::fromVector({7, 8});
  int value = 0;
  ASSERT_TRUE(sequence->get(1, value));
  EXPECT_EQ(value, 8);
  EXPECT_FALSE(sequence->get(2, value));
}

TEST(LazyProduct, LastDimensionVariesFastest)
{
  LazyProduct<int> product({LazySequence<int>::fromVector({1, 2}),
                            LazySequence<int>::fromVector({10, 20, 30})});

  std::vector<std::vector<int>> combinations;
  std::vector<int> combination;
  while (product.next(combination)) combinations.push_back(combination);

  std::vector<std::vector<int>> expected = {{1, 10}, {1, 20}, {1, 30},
                                            {2, 10}, {2, 20}, {2, 30}};
  EXPECT_EQ(combinations, expected);
  EXPECT_FALSE(product.next(combination));
}

TEST(LazyProduct, ZeroDimensionsYieldOneEmptyCombination)
{
  std::vector<std::shared_ptr<LazySequence<int>>> none;
  LazyProduct<int> product(none);
  std::vector<int> combination = {42};
  ASSERT_TRUE(product.next(combination));
  EXPECT_TRUE(combination.empty());
  EXPECT_FALSE(product.next(combination));
}

TEST(LazyProduct, EmptyDimensionYieldsNothing)
{
  LazyProduct<int> product({LazySequence<int>::fromVector({1, 2}),
                            LazySequence<int>::fromVector(std::vector<int>())});
  std::vector<int> combination;
  EXPECT_FALSE(product.next(combination));
}

TEST(LazyProduct, FirstCombinationNeedsOnlyFirstItems)
{
  int pulls = 0;
  LazyProduct<int> product(
      {countingSequence(1000, &pulls), countingSequence(1000, &pulls)});

  std::vector<int> combination;
  ASSERT_TRUE(product.next(combination));
  EXPECT_EQ(combination, (std::vector<int>{0, 0}));
  EXPECT_EQ(pulls, 2);
}

TEST(LazyProduct, NestedProductsCompose)
{
  auto inner = lazyProductOf<int>({LazySequence<int>::fromVector({1, 2}),
                                   LazySequence<int>::fromVector({3})});
  LazyProduct<std::vector<int>> outer(
      {inner, LazySequence<std::vector<int>>::fromVector(
                  std::vector<std::vector<int>>{std::vector<int>{9}})});

  std::vector<std::vector<int>> combination;
  ASSERT_TRUE(outer.next(combination));
  EXPECT_EQ(combination,
            (std::vector<std::vector<int>>{{1, 3}, {9}}));
  ASSERT_TRUE(outer.next(combination));
  EXPECT_EQ(combination[0], (std::vector<int>{2, 3}));
  EXPECT_FALSE(outer.next(combination));
}

// No main(): test binary links with gtest_main which supplies main().
