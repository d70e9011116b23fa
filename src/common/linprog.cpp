#include "linprog.hpp"

#include <cmath>

static double dot(int n, const vec& a, const vec& x) {
    double s = 0;
    for (int j = 0; j < n; ++j) {
        s += a[j] * x[j];
    }
    return s;
}

bool feasible(const Problem& p, const vec& x, double eps) {
    if (x.size() != p.n)
        return false;

    // 1. Check x >= 0
    for (int i = 0; i < p.n; i++) {
        if (x[i] < -eps)
            return false;
    }

    // 2. Check every row against its relation
    for (int i = 0; i < p.m; i++) {
        const constraint& row = p.constraints[i];
        double lhs = dot(p.n, row.coefficients, x);
        switch (row.rel) {
            case relation::less_equal:
                if (lhs > row.rhs + eps)
                    return false;
                break;
            case relation::greater_equal:
                if (lhs < row.rhs - eps)
                    return false;
                break;
            case relation::equal:
                if (std::abs(lhs - row.rhs) > eps)
                    return false;
                break;
        }
    }

    return true;
}

double score(int n, const vec& x, const vec& c) {
    return dot(n, c, x);
}
