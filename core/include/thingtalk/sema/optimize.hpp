// thingtalk/sema/optimize.hpp - Structural simplification of programs
//
// optimize_filter() is pure: it never modifies its argument and returns
// either a node of the argument (when nothing changed) or a new tree. The
// table, stream and program passes reuse the nodes of their argument, so
// the caller must own the tree exclusively (clone() first otherwise).
//
#pragma once

#include "thingtalk/ast/program.hpp"

namespace thingtalk
{

/**
 * Simplify a boolean expression bottom-up.
 *
 * Flattens nested And/Or, drops neutral operands, short-circuits on an
 * absorbing operand and collapses empty or single-operand connectives.
 * Not, External, Compute, DontCare and Atom are only rebuilt around their
 * optimized children. The truth table of the expression never changes.
 */
[[nodiscard]] BooleanExpressionPtr optimize_filter(const BooleanExpressionPtr & expr);

/**
 * Simplify a table.
 * @param allow_projection when false, projections are removed
 * @return the simplified table, or null when the table is statically empty
 */
[[nodiscard]] TablePtr optimize_table(TablePtr table, bool allow_projection = true);

/// Stream counterpart of optimize_table()
[[nodiscard]] StreamPtr optimize_stream(StreamPtr stream, bool allow_projection = true);

/**
 * Simplify every statement of a program, dropping the statements that can
 * never produce a result.
 * @return the program, or null when nothing is left
 */
[[nodiscard]] ProgramPtr optimize_program(ProgramPtr program);

}  // namespace thingtalk
