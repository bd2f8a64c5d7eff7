#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "Router.hpp"
#include "StationParser.hpp"

/*
 * station_parser_test.cpp
 *
 * Tests for the station description parser and the command driver.
 *
 * Behavior:
 *   - Declarations build the station graph; cables are composed in and
 *     nodes without a value are pruned.
 *   - Keywords are case-insensitive, comments start with '*' or ';' and
 *     parsing stops at .END.
 *   - Every malformed statement is reported as "Line N: ..." on stderr and
 *     counted; the remaining lines are still parsed.
 *   - Commands run in file order; a failing command is reported and the
 *     rest still run.
 */

static const char* kStation =
    "* demo station\n"
    "MODULE gnd.out SOURCE ground:V:s\n"
    "MODULE smu.ch1 SOURCE voltage:V:sg current:A:g\n"
    "endpoint dev.pin1   ; lower-case keyword\n"
    "ENDPOINT dev.pin2\n"
    "CABLE cable1 0=gnd.out,dev.pin1 1=smu.ch1,dev.pin2\n"
    "\n"
    ".ROUTE GROUND dev.pin1\n"
    ".route source dev.pin2\n"
    ".END\n"
    "this line is never read\n";

static int parseText(StationParser& parser, const std::string& text)
{
  std::istringstream input(text);
  return parser.parseStream(input);
}

TEST(StationParser, ParsesDeclarationsAndCommands)
{
  StationParser parser;
  ASSERT_EQ(parseText(parser, kStation), 0);

  StationGraph station = parser.station();
  EXPECT_EQ(station.nodes(),
            (std::vector<NodeId>{"gnd.out", "smu.ch1", "dev.pin1", "dev.pin2",
                                 "cable1[0]", "cable1[1]"}));
  EXPECT_EQ(station.edgeCount(), 8u);

  NodePtr smu = station.node("smu.ch1");
  ASSERT_NE(smu, nullptr);
  EXPECT_TRUE(smu->isEligibleSource());
  std::vector<Parameter> parameters = smu->parameters();
  ASSERT_EQ(parameters.size(), 2u);
  EXPECT_EQ(parameters[0].name, "voltage");
  EXPECT_TRUE(parameters[0].settable);
  EXPECT_TRUE(parameters[0].gettable);
  EXPECT_EQ(parameters[1].unit, "A");
  EXPECT_FALSE(parameters[1].settable);
  EXPECT_EQ(parameters[1].instrument, "smu");

  ASSERT_EQ(parser.commands.size(), 2u);
  EXPECT_EQ(parser.commands[0].type, RoutingCommandType::ROUTE);
  EXPECT_EQ(parser.commands[0].kind, "GROUND");
  EXPECT_EQ(parser.commands[0].line, 8);
  EXPECT_EQ(parser.commands[1].kind, "SOURCE");
  EXPECT_EQ(parser.commands[1].terminal, "dev.pin2");
}

TEST(StationParser, RunsCommandsAndPrintsState)
{
  StationParser parser;
  ASSERT_EQ(parseText(parser, kStation), 0);
  Router router(parser.station());

  EXPECT_EQ(parser.runCommands(router), 0);

  std::ostringstream state;
  printRoutingState(router, state);
  EXPECT_EQ(state.str(),
            "node gnd.out [dev.pin1]\n"
            "node smu.ch1 [dev.pin2]\n"
            "node dev.pin1 [dev.pin1]\n"
            "node dev.pin2 [dev.pin2]\n"
            "node cable1[0] [dev.pin1]\n"
            "node cable1[1] [dev.pin2]\n"
            "edge gnd.out -> cable1[0] [dev.pin1]\n"
            "edge cable1[0] -> dev.pin1 [dev.pin1]\n"
            "edge smu.ch1 -> cable1[1] [dev.pin2]\n"
            "edge cable1[1] -> dev.pin2 [dev.pin2]\n");
}

TEST(StationParser, EdgesLinksAndVacate)
{
  StationParser parser;
  ASSERT_EQ(parseText(parser,
                      "MODULE g.out SOURCE ground:V:s\n"
                      "CONNECTOR sw.a\n"
                      "ENDPOINT dut.x\n"
                      "EDGE g.out sw.a\n"
                      "LINK sw.a dut.x\n"
                      "EDGE dut.x g.out part_of\n"
                      ".CONNECT g.out dut.x\n"
                      ".VACATE dut.x\n"),
            0);

  StationGraph station = parser.station();
  EXPECT_TRUE(station.hasEdge(EdgeId("sw.a", "dut.x")));
  EXPECT_TRUE(station.hasEdge(EdgeId("dut.x", "sw.a")));
  EXPECT_EQ(station.edge(EdgeId("dut.x", "g.out"))->status(),
            EdgeStatus::PART_OF);

  Router router(station);
  EXPECT_EQ(parser.runCommands(router), 0);
  std::ostringstream state;
  printRoutingState(router, state);
  EXPECT_TRUE(state.str().empty());
}

TEST(StationParser, ActiveEdgeIsTakenOverByRouter)
{
  StationParser parser;
  ASSERT_EQ(parseText(parser,
                      "MODULE g.out SOURCE ground:V:s\n"
                      "CONNECTOR sw.a\n"
                      "EDGE g.out sw.a ACTIVE\n"),
            0);

  StationGraph station = parser.station();
  EXPECT_TRUE(station.node("sw.a")->hasSource(station.node("g.out")));

  Router router(station);
  std::ostringstream state;
  printRoutingState(router, state);
  EXPECT_EQ(state.str(),
            "node g.out [static]\n"
            "edge g.out -> sw.a [static]\n");
}

TEST(StationParser, ReportsAndCountsErrors)
{
  StationParser parser;
  testing::internal::CaptureStderr();
  int errors = parseText(parser,
                         "MODULE a.x SOURCE ground:V:s\n"
                         "MODULE a.x SOURCE ground:V:s\n"
                         "EDGE a.x missing\n"
                         "FROB a.x\n"
                         "MODULE b.x voltage:V\n"
                         "MODULE c.x voltage:V:q\n"
                         "ENDPOINT t\n"
                         "EDGE a.x t SHORT\n"
                         "LINK t t\n"
                         ".ROUTE SIDEWAYS t\n"
                         ".ROUTE GROUND t\n");
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(errors, 8);
  EXPECT_NE(err.find("Line 2: Duplicate node 'a.x'"), std::string::npos);
  EXPECT_NE(err.find("Line 3: Undeclared node 'missing'"), std::string::npos);
  EXPECT_NE(err.find("Line 4: Unknown statement 'FROB'"), std::string::npos);
  EXPECT_NE(err.find("Line 5: Invalid parameter 'voltage:V', expected "
                     "name:unit:flags"),
            std::string::npos);
  EXPECT_NE(err.find("Line 6: Unknown parameter flag 'q'"), std::string::npos);
  EXPECT_NE(err.find("Line 8: Unknown edge status 'SHORT'"), std::string::npos);
  EXPECT_NE(err.find("Line 9: LINK endpoints must differ"), std::string::npos);
  EXPECT_NE(err.find("Line 10: Unknown route kind 'SIDEWAYS'"),
            std::string::npos);

  // Valid statements around the errors are kept.
  ASSERT_EQ(parser.commands.size(), 1u);
  EXPECT_EQ(parser.commands[0].line, 11);
  EXPECT_TRUE(parser.station().hasNode("t"));
  EXPECT_FALSE(parser.station().hasNode("b.x"));
}

TEST(StationParser, DuplicateCableConnectionIsReported)
{
  StationParser parser;
  testing::internal::CaptureStderr();
  int errors = parseText(parser,
                         "ENDPOINT p\n"
                         "CABLE c1 a=p a=p\n");
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(errors, 1);
  EXPECT_NE(err.find("Line 2: Connection names of c1 must be unique: a"),
            std::string::npos);
}

TEST(StationParser, FailingCommandDoesNotStopTheRest)
{
  StationParser parser;
  ASSERT_EQ(parseText(parser,
                      "MODULE g.out SOURCE ground:V:s\n"
                      "ENDPOINT t1\n"
                      "ENDPOINT t2\n"
                      "EDGE g.out t1\n"
                      ".ROUTE GROUND t2\n"
                      ".ROUTE GROUND t1\n"),
            0);
  Router router(parser.station());

  testing::internal::CaptureStderr();
  int failures = parser.runCommands(router);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(failures, 1);
  EXPECT_NE(err.find("Error: No eligible sources found for [[t2]]."),
            std::string::npos);
  EXPECT_NE(err.find("Line 5: .ROUTE failed (NoEligibleSource)"),
            std::string::npos);
  EXPECT_EQ(router.claimsOf(NodeId("g.out")), (ClaimSet{"t1"}));
}

TEST(StationParser, MissingFile)
{
  StationParser parser;
  testing::internal::CaptureStderr();
  int errors = parser.parse("/nonexistent/station.txt");
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(errors, 1);
  EXPECT_NE(err.find("Error: Station description /nonexistent/station.txt "
                     "could not be opened"),
            std::string::npos);
}

TEST(RunStation, ParsesRunsAndPrints)
{
  std::string path = testing::TempDir() + "station_parser_test.txt";
  {
    std::ofstream file(path);
    file << kStation;
  }

  std::ostringstream out;
  EXPECT_EQ(runStation(path, RouterOptions(), out), 0);
  EXPECT_NE(out.str().find("node cable1[0] [dev.pin1]"), std::string::npos);
  std::remove(path.c_str());
}

TEST(RunStation, ParseErrorsFailTheRun)
{
  std::string path = testing::TempDir() + "station_parser_bad.txt";
  {
    std::ofstream file(path);
    file << "EDGE a b\n";
  }

  std::ostringstream out;
  testing::internal::CaptureStderr();
  int status = runStation(path, RouterOptions(), out);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(status, 1);
  EXPECT_NE(err.find("Error: Failed to parse file: " + path),
            std::string::npos);
  EXPECT_TRUE(out.str().empty());
  std::remove(path.c_str());
}

// No main(): test binary links with gtest_main which supplies main().
