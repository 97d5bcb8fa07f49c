#pragma once

#include <string>

#include "ast.hpp"

namespace exprcc {

// Текстовое представление дерева для режима --ast, по узлу на строку:
//
//   Binary +
//     Number 1
//     Binary *
//       Number 2
//       Number 3
std::string dumpTree(const AstNode& root);

} // namespace exprcc
