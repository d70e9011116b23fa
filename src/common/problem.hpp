#pragma once

#include <string>
#include <vector>

#include "types.hpp"

struct constraint {
    vec coefficients; // n entries
    relation rel;
    double rhs;
};

struct Problem {
    objective_sense sense;
    int n; // decision variables
    int m; // constraints
    vec c; // size n
    std::vector<constraint> constraints; // size m
};

/**
 * Checks the caller contract of the solver: n >= 1, m >= 1, sizes consistent,
 * every number finite.
 *
 * Throws std::invalid_argument naming the first violation.
 */
void validate_problem(const Problem& p);

/**
 * Text to enum conversions used by the tools and the problem reader.
 * All throw std::invalid_argument on unknown input.
 *
 * relation: "<=", ">=", "=" (also "==")
 * method:   "standard", "big_m" / "bigM", "two_phase" / "twoPhase"
 * sense:    "max" / "maximize", "min" / "minimize"
 */
relation parse_relation(const std::string& s);
init_method parse_method(const std::string& s);
objective_sense parse_sense(const std::string& s);

std::string to_string(relation r);
std::string to_string(init_method method);
std::string to_string(solve_status status);
