//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.cpp
/// @brief Operator spellings for AST nodes.
///
//===----------------------------------------------------------------------===//

#include "frontends/nikl/AST.hpp"

namespace nikl::frontends
{

const char *binaryOpSpelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::And:
            return "and";
        case BinaryOp::Or:
            return "or";
    }
    return "?";
}

const char *unaryOpSpelling(UnaryOp op)
{
    switch (op)
    {
        case UnaryOp::Neg:
            return "-";
        case UnaryOp::Not:
            return "not";
    }
    return "?";
}

} // namespace nikl::frontends
