#pragma once
#include <string>
#include <vector>

#include "problem.hpp"
#include "settings.hpp"
#include "types.hpp"
using std::vector;

/**
 * One pivot of the simplex trace.
 *
 * tableau and basis are copies taken before the pivot was applied.
 * pivot_row is a tableau row (1..m), entering and leaving are variable indices.
 */
struct step {
    mat tableau;
    int pivot_row;
    int pivot_col;
    int entering;
    int leaving;
    idx basis;
    int phase; // 1, or 2 for the second phase of the Two-Phase method
    std::string description;
};

struct result {
    solve_status status;
    vector<step> steps;
    mat final_tableau;
    idx final_basis;
    vec solution; // n entries when optimal, empty otherwise
    double optimal_value;
    vector<std::string> variable_names;
    bool iteration_limit_reached; // a phase stopped at the limit and was taken as optimal
};

/**
 * Tableau Simplex Solver.
 *
 * max / min c^T x
 * a_i^T x (<=, >=, =) b_i   for every constraint i
 * x >= 0
 *
 * method selects how the initial basis is obtained:
 *   standard:  slack basis only, valid when every row is (or flips to) <= with b_i >= 0.
 *   big_m:     artificial variables penalized by settings.big_m.
 *   two_phase: phase 1 minimizes the sum of artificials, phase 2 the real cost.
 *
 * Throws std::invalid_argument if p breaks the caller contract (see validate_problem)
 * or if the standard method cannot start from a slack basis.
 */
struct result solver(const Problem& p, init_method method, const solver_settings& settings);
