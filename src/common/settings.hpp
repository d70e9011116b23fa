#pragma once

/**
 * Numerical parameters of the tableau solver.
 */
struct solver_settings {
    double zero_tol = 1e-9;        // |v| <= zero_tol is treated as zero in pricing and ratio test
    double feasibility_tol = 1e-5; // largest phase 1 objective / artificial value still feasible
    double big_m = 1e5;            // penalty on artificial variables for the Big-M method
    int iteration_limit = 100;     // pivots per phase
    bool check_artificial_basis = true; // Big-M: report infeasible if an artificial stays positive
};
