#pragma once
#include "normalizer.hpp"
#include "problem.hpp"
#include "settings.hpp"
#include "types.hpp"

// Which cost row set_objective_row writes.
enum class objective_kind {
    real,       // -c in the decision columns
    penalized,  // -c in the decision columns, +M in the artificial columns
    artificial, // +1 in the artificial columns (Two-Phase, phase 1)
};

/**
 * Allocates the (m + 1) x cols tableau and fills the constraint rows of p as
 * described by the layout. Row 0 is left at zero.
 *
 * basis: set to the slack of each row, or its artificial when it has no slack.
 */
mat build_tableau(const Problem& p, const tableau_layout& l, idx& basis);

/**
 * Overwrites row 0 (rhs included) with the requested cost row. big_m is only
 * read for objective_kind::penalized.
 */
void set_objective_row(mat& T, const tableau_layout& l, objective_kind kind, double big_m);

/**
 * Eliminates every basic column from row 0 by subtracting multiples of its
 * constraint row, so that row 0 is expressed in the non basic variables only.
 */
void canonicalize_objective(mat& T, const idx& basis);

/**
 * True if every basic column is the unit vector of its row (row 0 included),
 * within tol.
 */
bool is_canonical(const mat& T, const idx& basis, double tol);
