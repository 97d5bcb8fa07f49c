#include <doctest/doctest.h>

#include "options.hpp"

#include <string>
#include <vector>

using namespace exprcc;

TEST_SUITE_BEGIN("exprcc.options");

TEST_CASE("single expression compiles to stdout") {
  auto options = parseOptions({" 12 + 34 - 5 "});
  CHECK(options.mode == Mode::Compile);
  CHECK(options.expression == " 12 + 34 - 5 ");
  CHECK_FALSE(options.outputPath.has_value());
}

TEST_CASE("output file") {
  auto options = parseOptions({"-o", "out.s", "1+1"});
  REQUIRE(options.outputPath.has_value());
  CHECK(*options.outputPath == "out.s");
  CHECK(options.expression == "1+1");
}

TEST_CASE("dump modes") {
  CHECK(parseOptions({"--tokens", "1"}).mode == Mode::Tokens);
  CHECK(parseOptions({"--ast", "1"}).mode == Mode::Ast);
  CHECK(parseOptions({"--eval", "1"}).mode == Mode::Eval);
  CHECK(parseOptions({"--help"}).mode == Mode::Help);
}

TEST_CASE("negative-looking expressions are not options") {
  CHECK(parseOptions({"-7/2"}).expression == "-7/2");
  CHECK(parseOptions({"--", "--5"}).expression == "--5");
  CHECK(parseOptions({"--5"}).expression == "--5");
  CHECK(parseOptions({"--1+2"}).expression == "--1+2");
  CHECK(parseOptions({"--eval", "--(3)"}).expression == "--(3)");
}

TEST_CASE("wrong argument count is a usage error") {
  CHECK_THROWS_AS(parseOptions({}), UsageError);
  CHECK_THROWS_AS(parseOptions({"1", "2"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"-o"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"--bogus", "1"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"--ast", "-o", "x.s", "1"}), UsageError);
}

TEST_CASE("batch options") {
  auto options = parseOptions({"batch", "in.txt", "-o", "report.csv", "-d", "out", "-j", "3"});
  CHECK(options.mode == Mode::Batch);
  CHECK(options.inputPath == "in.txt");
  REQUIRE(options.reportPath.has_value());
  CHECK(*options.reportPath == "report.csv");
  REQUIRE(options.listingsDir.has_value());
  CHECK(*options.listingsDir == "out");
  CHECK(options.threadCount == 3);

  CHECK(parseOptions({"batch", "in.txt"}).threadCount >= 1);
  CHECK_THROWS_AS(parseOptions({"batch"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"batch", "in.txt", "-j", "0"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"batch", "in.txt", "-x"}), UsageError);
}

TEST_CASE("generate options") {
  auto options = parseOptions({"generate", "100", "gen.txt", "--seed", "0", "--depth", "4",
                               "--errors", "0.25"});
  CHECK(options.mode == Mode::Generate);
  CHECK(options.expressionCount == 100);
  CHECK(options.generatedPath == "gen.txt");
  REQUIRE(options.seed.has_value());
  CHECK(*options.seed == 0);
  CHECK(options.maxDepth == 4);
  CHECK(options.errorProbability == doctest::Approx(0.25));

  CHECK_THROWS_AS(parseOptions({"generate", "100"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"generate", "x", "gen.txt"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"generate", "1", "g.txt", "--errors", "1.5"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"generate", "1", "g.txt", "--seed", "-1"}), UsageError);
  CHECK_THROWS_AS(parseOptions({"generate", "1", "g.txt", "--depth", "60"}), UsageError);
  CHECK(parseOptions({"generate", "1", "g.txt", "--depth", std::to_string(kMaxGeneratorDepth)})
            .maxDepth == kMaxGeneratorDepth);
}

TEST_CASE("parseNumber") {
  CHECK(parseNumber("12") == 12);
  CHECK_THROWS_AS(parseNumber("0"), UsageError);
  CHECK_THROWS_AS(parseNumber("abc"), UsageError);
  CHECK_THROWS_AS(parseNumber("12abc"), UsageError);
  CHECK_THROWS_AS(parseNumber("-5"), UsageError);
}

TEST_SUITE_END();
