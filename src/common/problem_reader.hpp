#pragma once

#include <istream>
#include <string>

#include "problem.hpp"

/**
 * Reads a problem file in the format:
 * sense n m                      -- "max" or "min", variables, constraints
 * (one line with n numbers)      -- c
 * (m lines: n numbers, relation, rhs) -- relation is one of <=, >=, =
 *
 * '#' starts a comment that runs to the end of the line.
 *
 * Throws std::runtime_error if the file cannot be opened or is malformed.
 */
Problem read_problem(const std::string& path);

// Same format, from an already open stream. name is used in error messages.
Problem read_problem(std::istream& in, const std::string& name);
