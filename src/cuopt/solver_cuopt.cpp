#include <stdexcept>
#include <string>
#include <cuopt/linear_programming/cuopt_c.h>

#include "base_solver.hpp"
#include "logging.hpp"

typedef vector<cuopt_int_t> cu_idx;
typedef vector<cuopt_float_t> cu_vec;

// Owns the cuOpt handles of one solve.
struct cuopt_handles {
    cuOptOptimizationProblem problem = NULL;
    cuOptSolverSettings settings = NULL;
    cuOptSolution solution = NULL;

    ~cuopt_handles() {
        cuOptDestroyProblem(&problem);
        cuOptDestroySolverSettings(&settings);
        cuOptDestroySolution(&solution);
    }
};

static void check(cuopt_int_t status, const char* what) {
    if (status != CUOPT_SUCCESS) {
        throw std::runtime_error(std::string("cuOpt: error ") + what + ": " +
                                 std::to_string(status));
    }
}

static char constraint_type(relation r) {
    switch (r) {
        case relation::less_equal: return CUOPT_LESS_THAN;
        case relation::greater_equal: return CUOPT_GREATER_THAN;
        case relation::equal: return CUOPT_EQUAL;
    }
    return CUOPT_LESS_THAN;
}

struct result base_solver(const Problem& p) {
    validate_problem(p);
    int m = p.m;
    int n = p.n;

    // Dense rows handed over as CSR.
    cu_idx row_offsets(m + 1);
    cu_idx column_indices(m * n);
    cu_vec values(m * n);
    for (int i = 0; i < m + 1; i++) {
        row_offsets[i] = i * n;
    }
    for (int i = 0; i < m; i++) {
        for (int j = 0; j < n; j++) {
            column_indices[i * n + j] = j;
            values[i * n + j] = p.constraints[i].coefficients[j];
        }
    }

    cu_vec c(p.c.begin(), p.c.end());
    cu_vec b(m);
    vector<char> constraint_types(m);
    for (int i = 0; i < m; i++) {
        b[i] = p.constraints[i].rhs;
        constraint_types[i] = constraint_type(p.constraints[i].rel);
    }

    cu_vec var_lower_bounds(n, 0);
    cu_vec var_upper_bounds(n, CUOPT_INFINITY);
    vector<char> var_types(n, CUOPT_CONTINUOUS);
    cuopt_int_t sense =
        (p.sense == objective_sense::maximize) ? CUOPT_MAXIMIZE : CUOPT_MINIMIZE;

    cuopt_handles h;
    check(cuOptCreateProblem(m,
                             n,
                             sense,
                             0.0, // objective offset
                             c.data(),
                             row_offsets.data(),
                             column_indices.data(),
                             values.data(),
                             constraint_types.data(),
                             b.data(),
                             var_lower_bounds.data(),
                             var_upper_bounds.data(),
                             var_types.data(),
                             &h.problem),
          "creating problem");

    check(cuOptCreateSolverSettings(&h.settings), "creating solver settings");
    check(cuOptSetIntegerParameter(h.settings, CUOPT_LOG_TO_CONSOLE, logging::active),
          "setting log state");
    check(cuOptSetFloatParameter(h.settings, CUOPT_ABSOLUTE_PRIMAL_TOLERANCE, 0.0001),
          "setting primal tolerance");
    check(cuOptSetIntegerParameter(h.settings, CUOPT_METHOD, CUOPT_METHOD_DUAL_SIMPLEX),
          "setting method");

    check(cuOptSolve(h.problem, h.settings, &h.solution), "solving problem");

    cuopt_int_t termination_status;
    check(cuOptGetTerminationStatus(h.solution, &termination_status),
          "getting termination status");

    result res;
    res.optimal_value = 0.0;
    res.iteration_limit_reached = false;
    switch (termination_status) {
        case CUOPT_TERIMINATION_STATUS_OPTIMAL: res.status = solve_status::optimal; break;
        case CUOPT_TERIMINATION_STATUS_UNBOUNDED: res.status = solve_status::unbounded; break;
        case CUOPT_TERIMINATION_STATUS_INFEASIBLE: res.status = solve_status::infeasible; break;
        default:
            throw std::runtime_error("cuOpt: unexpected termination status " +
                                     std::to_string(termination_status));
    }
    if (res.status != solve_status::optimal)
        return res;

    cu_vec solution_values(n);
    check(cuOptGetPrimalSolution(h.solution, solution_values.data()), "getting solution values");
    cuopt_float_t objective_value;
    check(cuOptGetObjectiveValue(h.solution, &objective_value), "getting objective value");

    res.solution.assign(solution_values.begin(), solution_values.end());
    res.optimal_value = objective_value;
    return res;
}
