#include <cmath>
#include <utility>

#include "logging.hpp"
#include "normalizer.hpp"
#include "pivot.hpp"
#include "solver.hpp"
#include "tableau.hpp"

static void extract_solution(result& res, const tableau_layout& l, objective_sense sense) {
    int rhs = l.rhs_col();
    res.solution.assign(l.n, 0.0);
    for (int i = 0; i < l.m; i++) {
        int var = res.final_basis[i];
        if (var < l.n) {
            res.solution[var] = res.final_tableau[i + 1][rhs];
        }
    }
    res.optimal_value = res.final_tableau[0][rhs];
    if (sense == objective_sense::minimize) {
        res.optimal_value = -res.optimal_value;
    }
}

static void finish(result& res, phase_result&& ph) {
    res.status = ph.status;
    res.iteration_limit_reached = res.iteration_limit_reached || ph.iteration_limit_reached;
    res.final_tableau = std::move(ph.tableau);
    res.final_basis = std::move(ph.basis);
}

/**
 * An artificial variable basic at a positive value means the penalized
 * problem could not reach the original feasible region.
 */
static bool artificial_in_basis(const mat& T,
                                const idx& basis,
                                const tableau_layout& l,
                                double tol) {
    int rhs = l.rhs_col();
    for (int i = 0; i < l.m; i++) {
        if (l.is_artificial(basis[i]) && T[i + 1][rhs] > tol) {
            logging::info("Artificial " + l.variable_names[basis[i]] + " basic at " +
                          std::to_string(T[i + 1][rhs]));
            return true;
        }
    }
    return false;
}

struct result solver(const Problem& p, init_method method, const solver_settings& settings) {
    validate_problem(p);
    tableau_layout l = normalize(p, method);

    result res;
    res.status = solve_status::optimal;
    res.optimal_value = 0.0;
    res.iteration_limit_reached = false;
    res.variable_names = l.variable_names;

    idx basis;
    mat T = build_tableau(p, l, basis);
    int all_cols = l.n + l.s + l.a;

    if (method == init_method::standard || method == init_method::big_m) {
        if (method == init_method::standard) {
            set_objective_row(T, l, objective_kind::real, 0.0);
        } else {
            set_objective_row(T, l, objective_kind::penalized, settings.big_m);
        }
        canonicalize_objective(T, basis);
        logging::log("T", T);

        phase_result ph = run_phase(std::move(T), std::move(basis), all_cols, 1,
                                    l.variable_names, settings, res.steps);
        finish(res, std::move(ph));

        // An improving ray found while an artificial is still positive does not
        // make the original problem unbounded.
        if (method == init_method::big_m && settings.check_artificial_basis &&
            artificial_in_basis(res.final_tableau, res.final_basis, l, settings.feasibility_tol)) {
            res.status = solve_status::infeasible;
            return res;
        }
        if (res.status != solve_status::optimal)
            return res;

        extract_solution(res, l, p.sense);
        return res;
    }

    // Two-Phase. Phase 1: minimize the sum of artificials.
    set_objective_row(T, l, objective_kind::artificial, 0.0);
    canonicalize_objective(T, basis);
    logging::info("Phase 1: driving " + std::to_string(l.a) + " artificial(s) to zero");
    logging::log("T", T);

    phase_result ph1 = run_phase(std::move(T), std::move(basis), all_cols, 1, l.variable_names,
                                 settings, res.steps);
    if (ph1.status != solve_status::optimal) {
        finish(res, std::move(ph1));
        return res;
    }

    double phase1_obj = ph1.tableau[0][l.rhs_col()];
    if (std::abs(phase1_obj) > settings.feasibility_tol) {
        logging::info("Infeasible: phase 1 objective " + std::to_string(phase1_obj));
        finish(res, std::move(ph1));
        res.status = solve_status::infeasible;
        return res;
    }
    logging::info("Phase 1 objective " + std::to_string(phase1_obj) + ", starting phase 2");

    // Phase 2 takes over the phase 1 tableau.
    res.iteration_limit_reached = ph1.iteration_limit_reached;
    mat T2 = std::move(ph1.tableau);
    idx basis2 = std::move(ph1.basis);

    drive_out_artificials(T2, basis2, l, settings, res.steps);
    set_objective_row(T2, l, objective_kind::real, 0.0);
    canonicalize_objective(T2, basis2);
    logging::log("T", T2);

    // Artificials are out of the problem from here on.
    phase_result ph2 = run_phase(std::move(T2), std::move(basis2), l.n + l.s, 2,
                                 l.variable_names, settings, res.steps);
    finish(res, std::move(ph2));
    if (res.status != solve_status::optimal)
        return res;

    extract_solution(res, l, p.sense);
    return res;
}
