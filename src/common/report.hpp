#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "solver.hpp"
#include "types.hpp"

/**
 * Integral values print as integers, everything else with `precision` decimals.
 */
std::string format_value(double v, int precision);

// Header row with the variable names and "RHS", then one line per tableau row
// labelled with its basic variable ("z" for row 0).
void print_tableau(std::ostream& out,
                   const mat& T,
                   const idx& basis,
                   const std::vector<std::string>& names);

// Every step of the trace, then status, solution and objective value.
void print_result(std::ostream& out, const result& r);
