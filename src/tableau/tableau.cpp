#include "tableau.hpp"

#include <algorithm>
#include <cmath>

mat build_tableau(const Problem& p, const tableau_layout& l, idx& basis) {
    int n = l.n;
    int m = l.m;
    int rhs = l.rhs_col();

    mat T(m + 1, vec(l.cols(), 0.0));
    basis.assign(m, -1);

    for (int i = 0; i < m; i++) {
        const constraint& row = p.constraints[i];
        vec& t = T[i + 1];
        double sign = l.row_sign[i];

        for (int j = 0; j < n; j++) {
            t[j] = sign * row.coefficients[j];
        }
        t[rhs] = sign * row.rhs;

        if (l.slack_col[i] >= 0) {
            t[l.slack_col[i]] = l.slack_coeff[i];
        }
        if (l.artificial_col[i] >= 0) {
            t[l.artificial_col[i]] = 1.0;
        }

        // A surplus (-1) cannot be basic, its artificial is.
        if (l.slack_col[i] >= 0 && l.slack_coeff[i] > 0) {
            basis[i] = l.slack_col[i];
        } else {
            basis[i] = l.artificial_col[i];
        }
    }

    return T;
}

void set_objective_row(mat& T, const tableau_layout& l, objective_kind kind, double big_m) {
    vec& z = T[0];
    std::fill(z.begin(), z.end(), 0.0);

    if (kind != objective_kind::artificial) {
        for (int j = 0; j < l.n; j++) {
            z[j] = -l.cost[j];
        }
    }
    if (kind == objective_kind::penalized || kind == objective_kind::artificial) {
        double weight = (kind == objective_kind::penalized) ? big_m : 1.0;
        for (int j = l.n + l.s; j < l.n + l.s + l.a; j++) {
            z[j] = weight;
        }
    }
}

void canonicalize_objective(mat& T, const idx& basis) {
    vec& z = T[0];
    for (int i = 0; i < basis.size(); i++) {
        double factor = z[basis[i]];
        if (factor == 0.0)
            continue;
        const vec& row = T[i + 1];
        for (int j = 0; j < z.size(); j++) {
            z[j] -= factor * row[j];
        }
    }
}

bool is_canonical(const mat& T, const idx& basis, double tol) {
    for (int i = 0; i < basis.size(); i++) {
        int col = basis[i];
        for (int r = 0; r < T.size(); r++) {
            double expected = (r == i + 1) ? 1.0 : 0.0;
            if (std::abs(T[r][col] - expected) > tol)
                return false;
        }
    }
    return true;
}
