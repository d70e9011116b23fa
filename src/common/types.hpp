#pragma once
#include <vector>
using std::vector;
typedef vector<int> idx;
typedef vector<double> vec;

/**
 * Dense matrix in row major order, one vec per row.
 * [0, 1]
 * [2, 3]
 *
 * Is stored as {{0, 1}, {2, 3}}.
 *
 * The tableau uses this layout: row 0 is the objective row, rows 1..m are the
 * constraints and the last column holds the right hand side.
 */
typedef vector<vec> mat;

enum class objective_sense { maximize, minimize };

enum class relation { less_equal, greater_equal, equal };

// How the initial basic feasible solution is obtained.
enum class init_method { standard, big_m, two_phase };

enum class solve_status { optimal, unbounded, infeasible };
