#include "problem.hpp"

#include <cmath>
#include <stdexcept>

void validate_problem(const Problem& p) {
    if (p.n < 1)
        throw std::invalid_argument("Problem needs at least one variable, got n=" +
                                    std::to_string(p.n));
    if (p.m < 1)
        throw std::invalid_argument("Problem needs at least one constraint, got m=" +
                                    std::to_string(p.m));
    if (p.c.size() != p.n)
        throw std::invalid_argument("Expected " + std::to_string(p.n) +
                                    " objective coefficients, got " +
                                    std::to_string(p.c.size()));
    if (p.constraints.size() != p.m)
        throw std::invalid_argument("Expected " + std::to_string(p.m) + " constraints, got " +
                                    std::to_string(p.constraints.size()));

    for (int j = 0; j < p.n; j++) {
        if (!std::isfinite(p.c[j]))
            throw std::invalid_argument("Objective coefficient " + std::to_string(j + 1) +
                                        " is not finite");
    }
    for (int i = 0; i < p.m; i++) {
        const constraint& row = p.constraints[i];
        if (row.coefficients.size() != p.n)
            throw std::invalid_argument("Constraint " + std::to_string(i + 1) + " has " +
                                        std::to_string(row.coefficients.size()) +
                                        " coefficients, expected " + std::to_string(p.n));
        for (int j = 0; j < p.n; j++) {
            if (!std::isfinite(row.coefficients[j]))
                throw std::invalid_argument("Constraint " + std::to_string(i + 1) +
                                            " has a non-finite coefficient");
        }
        if (!std::isfinite(row.rhs))
            throw std::invalid_argument("Constraint " + std::to_string(i + 1) +
                                        " has a non-finite right hand side");
    }
}

relation parse_relation(const std::string& s) {
    if (s == "<=")
        return relation::less_equal;
    if (s == ">=")
        return relation::greater_equal;
    if (s == "=" || s == "==")
        return relation::equal;
    throw std::invalid_argument("Unknown relation: " + s);
}

init_method parse_method(const std::string& s) {
    if (s == "standard")
        return init_method::standard;
    if (s == "big_m" || s == "bigM")
        return init_method::big_m;
    if (s == "two_phase" || s == "twoPhase")
        return init_method::two_phase;
    throw std::invalid_argument("Unknown method: " + s);
}

objective_sense parse_sense(const std::string& s) {
    if (s == "max" || s == "maximize")
        return objective_sense::maximize;
    if (s == "min" || s == "minimize")
        return objective_sense::minimize;
    throw std::invalid_argument("Unknown objective sense: " + s);
}

std::string to_string(relation r) {
    switch (r) {
        case relation::less_equal: return "<=";
        case relation::greater_equal: return ">=";
        case relation::equal: return "=";
    }
    return "?";
}

std::string to_string(init_method method) {
    switch (method) {
        case init_method::standard: return "standard";
        case init_method::big_m: return "big_m";
        case init_method::two_phase: return "two_phase";
    }
    return "?";
}

std::string to_string(solve_status status) {
    switch (status) {
        case solve_status::optimal: return "Optimal";
        case solve_status::unbounded: return "Unbounded";
        case solve_status::infeasible: return "Infeasible";
    }
    return "?";
}
