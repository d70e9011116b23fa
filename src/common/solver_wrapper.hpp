#pragma once
#include <vector>

#include "settings.hpp"
#include "solver.hpp"
#include "types.hpp"
using std::vector;

/**
 * Simplex Solver over flat arguments.
 *
 * max / min c^T x
 * A x <= b
 * x >= 0
 *
 * n: number of decision variables.
 * m: number of constraints.
 *
 * c: n objective coefficients.
 * rows: m rows, each n coefficients followed by the right hand side b_i.
 *
 * Solved with the standard method (slack basis), so b >= 0 is required.
 */
struct result solver_wrapper(objective_sense sense, int n, int m, const vec& c, const mat& rows);

/**
 * As above, with a relation (<=, >=, =) per row and an explicit method.
 *
 * Throws std::invalid_argument if the sizes do not match n and m.
 */
struct result solver_wrapper(objective_sense sense,
                             int n,
                             int m,
                             const vec& c,
                             const mat& rows,
                             const vector<relation>& relations,
                             init_method method,
                             const solver_settings& settings = solver_settings());
