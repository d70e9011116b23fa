/**
 * Utility for simple Linear Programming questions.
 */
#pragma once
#include "problem.hpp"
#include "types.hpp"

/**
 * Given an x, does it satisfy x >= 0 and every constraint of p, within eps?
 */
bool feasible(const Problem& p, const vec& x, double eps = 1e-6);

/**
 * Given an x, evaluate its score c^T x (in the problem's own sense).
 */
double score(int n, const vec& x, const vec& c);
