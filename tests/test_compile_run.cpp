#include <doctest/doctest.h>

#include "codegen.hpp"
#include "compiler.hpp"
#include "evaluator.hpp"
#include "expression_generator.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <sys/wait.h>

#ifndef EXPRCC_BINARY
#define EXPRCC_BINARY "./exprcc"
#endif

using namespace exprcc;

namespace {
std::filesystem::path tempDir() {
  auto dir = std::filesystem::temp_directory_path() / "exprcc_run_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

int runCommand(const std::string& command) {
  int code = std::system(command.c_str());
  if (code == -1) {
    return -1;
  }
  if (WIFEXITED(code)) {
    return WEXITSTATUS(code);
  }
  return -1;
}

std::string readFile(const std::filesystem::path& path) {
  std::ifstream file(path);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

bool ccAvailable() {
  static const bool available = runCommand("cc --version > /dev/null 2>&1") == 0;
  return available;
}

std::string quote(const std::string& text) {
  return "'" + text + "'";
}

// Как во внешнем тестовом скрипте: компилятор -> cc -> запуск, результат = код завершения
int compileAndRun(const std::string& expression, const std::string& name) {
  auto asmPath = (tempDir() / (name + ".s")).string();
  auto exePath = (tempDir() / name).string();

  REQUIRE(runCommand(std::string(EXPRCC_BINARY) + " " + quote(expression) + " > " + asmPath) == 0);
  REQUIRE(runCommand("cc -o " + exePath + " " + asmPath) == 0);
  return runCommand(exePath + " 2> " + exePath + ".err");
}
} // namespace

TEST_SUITE_BEGIN("exprcc.compile.run");

TEST_CASE("harness expressions exit with their value") {
  if (!ccAvailable()) {
    MESSAGE("cc not found, skipping");
    return;
  }
  CHECK(compileAndRun("0", "zero") == 0);
  CHECK(compileAndRun("42", "literal") == 42);
  CHECK(compileAndRun("1+1", "add") == 2);
  CHECK(compileAndRun("20-9+10", "left_assoc") == 21);
  CHECK(compileAndRun("5+20-4", "add_sub") == 21);
  CHECK(compileAndRun(" 12 + 34 - 5 ", "whitespace") == 41);
  CHECK(compileAndRun("5+6*7", "precedence") == 47);
  CHECK(compileAndRun("5*(9-6)", "grouping") == 15);
  CHECK(compileAndRun("(3+5)/2", "divide") == 4);
}

TEST_CASE("truncating division and negative results") {
  if (!ccAvailable()) {
    MESSAGE("cc not found, skipping");
    return;
  }
  CHECK(compileAndRun("-7/2", "neg_div") == 253);
  CHECK(compileAndRun("7/-2", "div_neg") == 253);
  CHECK(compileAndRun("-7/-2", "neg_div_neg") == 3);
  CHECK(compileAndRun("-(-3)", "double_neg") == 3);
  CHECK(compileAndRun("(-9223372036854775807-1)/-1", "min_div") == 0);
}

TEST_CASE("results wrap to the low byte") {
  if (!ccAvailable()) {
    MESSAGE("cc not found, skipping");
    return;
  }
  CHECK(compileAndRun("256", "wrap_256") == 0);
  CHECK(compileAndRun("200+100", "wrap_300") == 44);
  CHECK(compileAndRun("4294967296+7", "large_literal") == 7);
}

TEST_CASE("comparisons") {
  if (!ccAvailable()) {
    MESSAGE("cc not found, skipping");
    return;
  }
  CHECK(compileAndRun("1<2", "lt") == 1);
  CHECK(compileAndRun("2==3", "eq") == 0);
  CHECK(compileAndRun("(3>=3)+(4!=4)*5+(2>1)", "mixed_cmp") == 2);
}

TEST_CASE("division by zero is reported at run time") {
  if (!ccAvailable()) {
    MESSAGE("cc not found, skipping");
    return;
  }
  CHECK(compileAndRun("1/(2-2)", "div_zero") == kDivisionByZeroExitStatus);
  auto errPath = tempDir() / "div_zero.err";
  CHECK(readFile(errPath) == std::string(kDivisionByZeroMessage) + "\n");
}

TEST_CASE("malformed input fails without a listing") {
  auto asmPath = (tempDir() / "malformed.s").string();
  auto errPath = (tempDir() / "malformed.err").string();
  std::string binary = EXPRCC_BINARY;

  CHECK(runCommand(binary + " '1+' > " + asmPath + " 2> " + errPath) == 3);
  CHECK(readFile(asmPath).empty());
  CHECK(runCommand(binary + " '(1+1' > " + asmPath + " 2> " + errPath) == 3);
  CHECK(readFile(asmPath).empty());
  CHECK(runCommand(binary + " '1 1' > " + asmPath + " 2> " + errPath) == 3);
  CHECK(readFile(asmPath).empty());
  CHECK(runCommand(binary + " '1 & 1' > " + asmPath + " 2> " + errPath) == 2);
  CHECK(readFile(asmPath).empty());
  CHECK(readFile(errPath).find("1 & 1\n  ^ ") != std::string::npos);
  CHECK(runCommand(binary + " > " + asmPath + " 2> " + errPath) == 1);
}

TEST_CASE("failed compile leaves no output file") {
  auto outPath = tempDir() / "never_written.s";
  std::filesystem::remove(outPath);
  CHECK(runCommand(std::string(EXPRCC_BINARY) + " -o " + outPath.string() + " '1+' 2> /dev/null") == 3);
  CHECK_FALSE(std::filesystem::exists(outPath));
}

TEST_CASE("random expressions agree with the reference evaluator") {
  if (!ccAvailable()) {
    MESSAGE("cc not found, skipping");
    return;
  }
  GeneratorSettings settings;
  settings.seed = 2024;
  settings.errorProbability = 0.0;
  ExpressionGenerator generator(settings);
  ExpressionCompiler compiler;
  ExpressionEvaluator evaluator;

  for (int i = 0; i < 20; ++i) {
    std::string expression = generator.generate(2 + i % 5);
    CAPTURE(expression);
    std::string name = "random_" + std::to_string(i);
    auto asmPath = tempDir() / (name + ".s");
    auto exePath = tempDir() / name;
    {
      std::ofstream output(asmPath, std::ios::trunc);
      writeListing(output, compiler.compile(expression));
    }
    REQUIRE(runCommand("cc -o " + exePath.string() + " " + asmPath.string()) == 0);
    CHECK(runCommand(exePath.string()) == exitStatusOf(evaluator.evaluate(expression)));
  }
}

TEST_SUITE_END();
