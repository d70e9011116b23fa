#pragma once
#include <string>
#include <vector>

#include "normalizer.hpp"
#include "settings.hpp"
#include "solver.hpp"
#include "types.hpp"

struct phase_result {
    solve_status status; // optimal or unbounded
    bool iteration_limit_reached;
    mat tableau;
    idx basis;
};

/**
 * Entering variable: the column in [0, eligible_cols) with the most negative
 * row 0 entry, first one on ties. Returns -1 if no entry is below -tol.
 */
int select_entering(const mat& T, int eligible_cols, double tol);

/**
 * Leaving row: minimum rhs / T[i][col] over rows i in 1..m with T[i][col] > tol,
 * lowest row on ties. Returns -1 if no row qualifies (unbounded direction).
 */
int ratio_test(const mat& T, int col, double tol);

/**
 * Gauss-Jordan pivot on T[row][col] and basis[row - 1] = col.
 */
void pivot(mat& T, idx& basis, int row, int col);

/**
 * Appends the step for a pivot on (row, col) that is about to be applied.
 */
void record_step(vector<step>& steps,
                 const mat& T,
                 const idx& basis,
                 int row,
                 int col,
                 int phase,
                 const vector<std::string>& names);

/**
 * Runs simplex iterations on T until optimal, unbounded or
 * settings.iteration_limit pivots. Only columns below eligible_cols may enter.
 *
 * T and basis are taken over and returned in the phase_result.
 */
phase_result run_phase(mat T,
                       idx basis,
                       int eligible_cols,
                       int phase,
                       const vector<std::string>& names,
                       const solver_settings& settings,
                       vector<step>& steps);

/**
 * Pivots every artificial still basic after phase 1 out of the basis.
 *
 * The pivot column is the non artificial column with the largest absolute
 * entry in the artificial's row. When the row's rhs is positive (an artificial
 * left within feasibility_tol) only positive entries qualify, so the rhs stays
 * non negative. Rows without a qualifying column keep their artificial; pivots
 * are recorded as phase 1 steps.
 */
void drive_out_artificials(mat& T,
                           idx& basis,
                           const tableau_layout& l,
                           const solver_settings& settings,
                           vector<step>& steps);
