#include <gtest/gtest.h>

#include <stdexcept>

#include "RouterOptions.hpp"

/*
 * router_options_test.cpp
 *
 * Validation of RouterOptions.
 *
 * Behavior:
 *   - Defaults are valid: unbounded search, trace off.
 *   - A negative path bound is rejected.
 *   - Enabling the trace requires a file name.
 */

TEST(RouterOptions, DefaultsAreValid)
{
  RouterOptions options;
  EXPECT_EQ(options.maxPathsPerPair, 0);
  EXPECT_FALSE(options.diagVerbose);
  EXPECT_EQ(options.diagFile, "routing.log");
  EXPECT_NO_THROW(options.validate());
}

TEST(RouterOptions, NegativePathBoundThrows)
{
  RouterOptions options;
  options.maxPathsPerPair = -1;
  try {
    options.validate();
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    EXPECT_STREQ(e.what(), "maxPathsPerPair must be >= 0");
  }
}

TEST(RouterOptions, VerboseTraceNeedsFile)
{
  RouterOptions options;
  options.diagVerbose = true;
  options.diagFile.clear();
  EXPECT_THROW(options.validate(), std::invalid_argument);

  // An empty file name is fine while the trace is off.
  options.diagVerbose = false;
  EXPECT_NO_THROW(options.validate());
}

// No main(): test binary links with gtest_main which supplies main().
