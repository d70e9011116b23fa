#pragma once
#include "../common/problem.hpp"
#include "../common/solver.hpp"

/**
 * Reference solver backed by the cuOpt C API.
 *
 * max / min c^T x
 * a_i^T x (<=, >=, =) b_i
 * x >= 0
 *
 * Only status, solution and optimal_value of the result are filled; there is
 * no tableau trace. Throws std::runtime_error if a cuOpt call fails.
 */
struct result base_solver(const Problem& p);
