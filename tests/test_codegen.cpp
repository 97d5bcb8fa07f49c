#include <doctest/doctest.h>

#include "codegen.hpp"
#include "compiler.hpp"
#include "errors.hpp"
#include "parser.hpp"

#include <algorithm>
#include <sstream>
#include <string>

using namespace exprcc;

namespace {
bool contains(const AssemblyListing& listing, const std::string& line) {
  return std::find(listing.begin(), listing.end(), line) != listing.end();
}
} // namespace

TEST_SUITE_BEGIN("exprcc.codegen");

TEST_CASE("single literal listing") {
  ExpressionCompiler compiler;
  AssemblyListing expected = {
      ".intel_syntax noprefix",
      ".globl main",
      "main:",
      "  push 42",
      "  pop rax",
      "  ret",
      ".section .note.GNU-stack,\"\",@progbits",
  };
  CHECK(compiler.compile("42") == expected);
}

TEST_CASE("binary operation is emitted in post-order") {
  ExpressionCompiler compiler;
  AssemblyListing expected = {
      ".intel_syntax noprefix",
      ".globl main",
      "main:",
      "  push 20",
      "  push 9",
      "  pop rdi",
      "  pop rax",
      "  sub rax, rdi",
      "  push rax",
      "  push 10",
      "  pop rdi",
      "  pop rax",
      "  add rax, rdi",
      "  push rax",
      "  pop rax",
      "  ret",
      ".section .note.GNU-stack,\"\",@progbits",
  };
  CHECK(compiler.compile("20-9+10") == expected);
}

TEST_CASE("multiplication and negation") {
  ExpressionCompiler compiler;
  auto listing = compiler.compile("-(2*3)");
  CHECK(contains(listing, "  imul rax, rdi"));
  CHECK(contains(listing, "  neg rax"));
}

TEST_CASE("unary plus emits nothing") {
  ExpressionCompiler compiler;
  CHECK(compiler.compile("+7") == compiler.compile("7"));
}

TEST_CASE("large literals go through rax") {
  ExpressionCompiler compiler;
  auto listing = compiler.compile("2147483648");
  CHECK(contains(listing, "  mov rax, 2147483648"));
  CHECK(contains(listing, "  push rax"));
  CHECK(contains(compiler.compile("2147483647"), "  push 2147483647"));
}

TEST_CASE("comparisons use setcc") {
  ExpressionCompiler compiler;
  auto listing = compiler.compile("1<=2");
  CHECK(contains(listing, "  cmp rax, rdi"));
  CHECK(contains(listing, "  setle al"));
  CHECK(contains(listing, "  movzx rax, al"));
  CHECK(contains(compiler.compile("1!=2"), "  setne al"));
  CHECK(contains(compiler.compile("1>2"), "  setg al"));
}

TEST_CASE("division guards against zero and -1") {
  ExpressionCompiler compiler;
  auto listing = compiler.compile("(3+5)/2");
  CHECK(contains(listing, "  test rdi, rdi"));
  CHECK(contains(listing, "  je .L.div_by_zero"));
  CHECK(contains(listing, "  cmp rdi, -1"));
  CHECK(contains(listing, "  cqo"));
  CHECK(contains(listing, "  idiv rdi"));
  CHECK(contains(listing, ".L.div_by_zero:"));
  CHECK(contains(listing, "  mov rdi, " + std::to_string(kDivisionByZeroExitStatus)));
  CHECK(contains(listing, "  .ascii \"ArithmeticError: division by zero\\n\""));
}

TEST_CASE("division handler is only emitted when needed") {
  ExpressionCompiler compiler;
  CHECK_FALSE(contains(compiler.compile("1+2*3"), ".L.div_by_zero:"));
}

TEST_CASE("each division gets its own labels") {
  ExpressionCompiler compiler;
  auto listing = compiler.compile("100/5/2");
  CHECK(contains(listing, ".L.idiv.0:"));
  CHECK(contains(listing, ".L.div_end.1:"));
  CHECK(contains(listing, ".L.idiv.2:"));
  CHECK(contains(listing, ".L.div_end.3:"));
  CHECK(std::count(listing.begin(), listing.end(), ".L.div_by_zero:") == 1);
}

TEST_CASE("compilation is deterministic") {
  ExpressionCompiler compiler;
  CHECK(compiler.compile("5*(9-6)/2") == compiler.compile("5*(9-6)/2"));

  auto ast = parseSource("8/2/2");
  CodeGenerator generator;
  CHECK(generator.generate(*ast) == generator.generate(*ast));
}

TEST_CASE("malformed input produces no listing") {
  ExpressionCompiler compiler;
  CHECK_THROWS_AS(compiler.compile("1+"), ParseError);
  CHECK_THROWS_AS(compiler.compile("(1+1"), ParseError);
  CHECK_THROWS_AS(compiler.compile("1 1"), ParseError);
  CHECK_THROWS_AS(compiler.compile("1 # 1"), LexError);
}

TEST_CASE("listing is written one line each") {
  std::ostringstream out;
  writeListing(out, {"a", "  b"});
  CHECK(out.str() == "a\n  b\n");
}

TEST_SUITE_END();
