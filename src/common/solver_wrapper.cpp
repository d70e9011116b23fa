#include "solver_wrapper.hpp"

#include <stdexcept>
#include <string>

#include "logging.hpp"

struct result solver_wrapper(objective_sense sense, int n, int m, const vec& c, const mat& rows) {
    vector<relation> relations(m, relation::less_equal);
    return solver_wrapper(sense, n, m, c, rows, relations, init_method::standard);
}

struct result solver_wrapper(objective_sense sense,
                             int n,
                             int m,
                             const vec& c,
                             const mat& rows,
                             const vector<relation>& relations,
                             init_method method,
                             const solver_settings& settings) {
    if (n < 1 || m < 1) {
        throw std::invalid_argument("Problem needs n >= 1 and m >= 1, got n=" +
                                    std::to_string(n) + ", m=" + std::to_string(m));
    }
    if (rows.size() != m) {
        throw std::invalid_argument("Expected " + std::to_string(m) + " constraint rows, got " +
                                    std::to_string(rows.size()));
    }
    if (relations.size() != m) {
        throw std::invalid_argument("Expected " + std::to_string(m) + " relations, got " +
                                    std::to_string(relations.size()));
    }

    Problem p;
    p.sense = sense;
    p.n = n;
    p.m = m;
    p.c = c;
    p.constraints.resize(m);
    for (int i = 0; i < m; i++) {
        if (rows[i].size() != n + 1) {
            throw std::invalid_argument("Constraint " + std::to_string(i + 1) + " has " +
                                        std::to_string(rows[i].size()) + " entries, expected " +
                                        std::to_string(n + 1) + " (coefficients and rhs)");
        }
        p.constraints[i].coefficients.assign(rows[i].begin(), rows[i].begin() + n);
        p.constraints[i].rel = relations[i];
        p.constraints[i].rhs = rows[i][n];
    }

    logging::info("Solving with " + to_string(method) + " method (n=" + std::to_string(n) +
                  ", m=" + std::to_string(m) + ")");
    return solver(p, method, settings);
}
