#include "normalizer.hpp"

#include <stdexcept>

static relation mirror(relation r) {
    if (r == relation::less_equal)
        return relation::greater_equal;
    if (r == relation::greater_equal)
        return relation::less_equal;
    return r;
}

tableau_layout normalize(const Problem& p, init_method method) {
    int n = p.n;
    int m = p.m;

    tableau_layout l;
    l.n = n;
    l.m = m;
    l.row_sign.assign(m, 1.0);
    l.rel.resize(m);
    l.slack_col.assign(m, -1);
    l.slack_coeff.assign(m, 0.0);
    l.artificial_col.assign(m, -1);

    bool use_artificials = method != init_method::standard;

    for (int i = 0; i < m; i++) {
        const constraint& row = p.constraints[i];
        relation r = row.rel;

        if (use_artificials) {
            // Slacks and artificials must start at a non-negative value.
            if (row.rhs < 0) {
                l.row_sign[i] = -1.0;
                r = mirror(r);
            }
        } else {
            if (r == relation::equal) {
                throw std::invalid_argument("Constraint " + std::to_string(i + 1) +
                                            " is an equality, which the standard method "
                                            "cannot start from; use big_m or two_phase");
            }
            if (r == relation::greater_equal) {
                l.row_sign[i] = -1.0;
                r = relation::less_equal;
            }
            if (l.row_sign[i] * row.rhs < 0) {
                throw std::invalid_argument("Constraint " + std::to_string(i + 1) +
                                            " has a negative right hand side in <= form, "
                                            "which the standard method cannot start from; "
                                            "use big_m or two_phase");
            }
        }
        l.rel[i] = r;
    }

    // Slack / surplus columns follow the decision variables in row order.
    int s = 0;
    for (int i = 0; i < m; i++) {
        if (l.rel[i] == relation::equal)
            continue;
        l.slack_col[i] = n + s++;
        l.slack_coeff[i] = (l.rel[i] == relation::less_equal) ? 1.0 : -1.0;
    }

    int a = 0;
    if (use_artificials) {
        for (int i = 0; i < m; i++) {
            if (l.rel[i] == relation::less_equal)
                continue;
            l.artificial_col[i] = n + s + a++;
        }
    }
    l.s = s;
    l.a = a;

    l.cost = p.c;
    if (p.sense == objective_sense::minimize) {
        for (int j = 0; j < n; j++) {
            l.cost[j] = -l.cost[j];
        }
    }

    for (int j = 0; j < n; j++)
        l.variable_names.push_back("x" + std::to_string(j + 1));
    for (int j = 0; j < s; j++)
        l.variable_names.push_back("s" + std::to_string(j + 1));
    for (int j = 0; j < a; j++)
        l.variable_names.push_back("a" + std::to_string(j + 1));

    return l;
}
