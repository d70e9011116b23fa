#pragma once
#include <string>
#include <vector>

#include "problem.hpp"
#include "types.hpp"

/**
 * Column assignment of a problem in maximize form.
 *
 * Columns: x_0..x_{n-1}, s_0..s_{s-1}, a_0..a_{a-1}, rhs.
 */
struct tableau_layout {
    int n;
    int m;
    int s; // slack / surplus columns
    int a; // artificial columns, 0 for the standard method

    vec row_sign;       // +1 or -1, applied to the whole constraint row
    vector<relation> rel; // relation of each row after the sign was applied
    idx slack_col;      // column of the slack / surplus of each row, -1 if none
    vec slack_coeff;    // +1 slack, -1 surplus
    idx artificial_col; // column of the artificial of each row, -1 if none

    vec cost; // maximize form objective, -c for minimization
    vector<std::string> variable_names;

    int rhs_col() const { return n + s + a; }
    int cols() const { return n + s + a + 1; }
    bool is_artificial(int j) const { return j >= n + s && j < n + s + a; }
};

/**
 * Builds the layout for the given method.
 *
 * big_m / two_phase: rows with a negative right hand side are negated first.
 * standard: >= rows are negated into <= rows. Throws std::invalid_argument if
 * a row is = or ends up with a negative right hand side, since no slack basis
 * exists then.
 */
tableau_layout normalize(const Problem& p, init_method method);
