#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include "linprog.hpp"
#include "solver.hpp"
#include "solver_wrapper.hpp"
#include "tableau.hpp"
#include "test_problems.hpp"

using namespace test_problems;

static const init_method all_methods[] = {
    init_method::standard, init_method::big_m, init_method::two_phase};
static const init_method artificial_methods[] = {init_method::big_m, init_method::two_phase};

// The solution satisfies the original rows and reproduces the reported value.
static void expect_consistent(const Problem& p, const result& r) {
    ASSERT_EQ(r.status, solve_status::optimal);
    ASSERT_EQ(r.solution.size(), p.n);
    EXPECT_TRUE(feasible(p, r.solution, 1e-6));
    EXPECT_NEAR(score(p.n, r.solution, p.c), r.optimal_value, 1e-6);
}

TEST(solver, production_problem_all_methods) {
    Problem p = production();
    for (init_method method : all_methods) {
        SCOPED_TRACE(to_string(method));
        result r = solver(p, method, solver_settings());

        expect_consistent(p, r);
        EXPECT_FALSE(r.iteration_limit_reached);
        EXPECT_NEAR(r.optimal_value, 36, 1e-9);
        EXPECT_NEAR(r.solution[0], 2, 1e-9);
        EXPECT_NEAR(r.solution[1], 6, 1e-9);
        EXPECT_LE(r.steps.size(), solver_settings().iteration_limit);
    }
}

TEST(solver, production_trace) {
    result r = solver(production(), init_method::standard, solver_settings());

    ASSERT_EQ(r.steps.size(), 2);
    EXPECT_EQ(r.steps[0].description, "Pivot on row 2, col 1 (Enter x2, Leave s2)");
    EXPECT_EQ(r.steps[1].description, "Pivot on row 3, col 0 (Enter x1, Leave s3)");
    EXPECT_EQ(r.final_basis, (idx{2, 1, 0}));
    EXPECT_EQ(r.variable_names, (std::vector<std::string>{"x1", "x2", "s1", "s2", "s3"}));
    ASSERT_EQ(r.final_tableau.size(), 4);
    EXPECT_NEAR(r.final_tableau[0][3], 1.5, 1e-9);
    EXPECT_NEAR(r.final_tableau[0][4], 1, 1e-9);
}

TEST(solver, simple_wrapper_assumes_less_equal) {
    mat rows = {{1, 0, 4}, {0, 2, 12}, {3, 2, 18}};
    result r = solver_wrapper(objective_sense::maximize, 2, 3, {3, 5}, rows);

    EXPECT_EQ(r.status, solve_status::optimal);
    EXPECT_NEAR(r.optimal_value, 36, 1e-9);
    EXPECT_EQ(r.steps.size(), 2);
}

TEST(solver, extended_wrapper_with_relations) {
    mat rows = {{1, 1, 4}, {1, 3, 6}};
    std::vector<relation> rel = {relation::greater_equal, relation::greater_equal};
    result r =
        solver_wrapper(objective_sense::minimize, 2, 2, {2, 3}, rows, rel, init_method::big_m);

    EXPECT_EQ(r.status, solve_status::optimal);
    EXPECT_NEAR(r.optimal_value, 9, 1e-6);
    EXPECT_NEAR(r.solution[0], 3, 1e-6);
    EXPECT_NEAR(r.solution[1], 1, 1e-6);
}

TEST(solver, wrapper_rejects_malformed_input) {
    mat rows = {{1, 0, 4}, {0, 2}};
    EXPECT_THROW(solver_wrapper(objective_sense::maximize, 2, 2, {3, 5}, rows),
                 std::invalid_argument);
    EXPECT_THROW(solver_wrapper(objective_sense::maximize, 0, 1, {}, mat{{4}}),
                 std::invalid_argument);
    EXPECT_THROW(solver_wrapper(objective_sense::maximize, 2, 1, {3}, mat{{1, 1, 4}}),
                 std::invalid_argument);
    EXPECT_THROW(solver_wrapper(objective_sense::maximize, 2, 1, {3, NAN}, mat{{1, 1, 4}}),
                 std::invalid_argument);
    EXPECT_THROW(solver_wrapper(objective_sense::maximize,
                                2,
                                1,
                                {3, 5},
                                mat{{1, 1, 4}},
                                {relation::less_equal, relation::less_equal},
                                init_method::two_phase),
                 std::invalid_argument);
}

TEST(solver, standard_rejects_problems_without_slack_basis) {
    EXPECT_THROW(solver(diet(), init_method::standard, solver_settings()),
                 std::invalid_argument);
    EXPECT_THROW(solver(equality(), init_method::standard, solver_settings()),
                 std::invalid_argument);
}

TEST(solver, greater_equal_problem) {
    Problem p = diet();
    for (init_method method : artificial_methods) {
        SCOPED_TRACE(to_string(method));
        result r = solver(p, method, solver_settings());

        expect_consistent(p, r);
        EXPECT_NEAR(r.optimal_value, 9, 1e-6);
        EXPECT_NEAR(r.solution[0], 3, 1e-6);
        EXPECT_NEAR(r.solution[1], 1, 1e-6);
    }
}

TEST(solver, equality_problem) {
    Problem p = equality();
    for (init_method method : artificial_methods) {
        SCOPED_TRACE(to_string(method));
        result r = solver(p, method, solver_settings());

        expect_consistent(p, r);
        EXPECT_NEAR(r.optimal_value, 9, 1e-6);
        EXPECT_NEAR(r.solution[0], 1, 1e-6);
        EXPECT_NEAR(r.solution[1], 4, 1e-6);
    }
}

TEST(solver, negative_rhs_problem) {
    Problem p = negative_rhs();
    for (init_method method : artificial_methods) {
        SCOPED_TRACE(to_string(method));
        result r = solver(p, method, solver_settings());

        expect_consistent(p, r);
        EXPECT_NEAR(r.optimal_value, 6, 1e-6);
    }
}

TEST(solver, redundant_equality_keeps_artificial_at_zero) {
    Problem p = redundant_equalities();
    for (init_method method : artificial_methods) {
        SCOPED_TRACE(to_string(method));
        result r = solver(p, method, solver_settings());

        expect_consistent(p, r);
        EXPECT_NEAR(r.optimal_value, 2, 1e-6);
    }
}

TEST(solver, two_phase_trace_is_tagged_by_phase) {
    result r = solver(diet(), init_method::two_phase, solver_settings());

    ASSERT_EQ(r.status, solve_status::optimal);
    ASSERT_FALSE(r.steps.empty());
    EXPECT_EQ(r.steps.front().phase, 1);
    for (int k = 1; k < r.steps.size(); k++) {
        EXPECT_GE(r.steps[k].phase, r.steps[k - 1].phase);
    }
    EXPECT_EQ(r.variable_names, (std::vector<std::string>{"x1", "x2", "s1", "s2", "a1", "a2"}));

    // No artificial is left in the final basis at a non zero level.
    int rhs = r.final_tableau[0].size() - 1;
    for (int i = 0; i < r.final_basis.size(); i++) {
        if (r.final_basis[i] >= 4) {
            EXPECT_NEAR(r.final_tableau[i + 1][rhs], 0, 1e-9);
        }
    }
}

TEST(solver, unbounded_problem) {
    Problem p = unbounded();
    for (init_method method : all_methods) {
        SCOPED_TRACE(to_string(method));
        result r = solver(p, method, solver_settings());

        EXPECT_EQ(r.status, solve_status::unbounded);
        EXPECT_TRUE(r.solution.empty());
        EXPECT_EQ(r.optimal_value, 0);
        EXPECT_EQ(r.steps.size(), 1);
    }
}

TEST(solver, two_phase_detects_infeasible) {
    result r = solver(disjoint(), init_method::two_phase, solver_settings());

    EXPECT_EQ(r.status, solve_status::infeasible);
    EXPECT_TRUE(r.solution.empty());
    ASSERT_EQ(r.steps.size(), 1);
    EXPECT_EQ(r.steps[0].phase, 1);
    EXPECT_NEAR(r.final_tableau[0][5], -2, 1e-9);
}

TEST(solver, big_m_detects_infeasible_artificial) {
    result r = solver(disjoint(), init_method::big_m, solver_settings());
    EXPECT_EQ(r.status, solve_status::infeasible);
    EXPECT_TRUE(r.solution.empty());
}

TEST(solver, infeasible_problem_with_improving_ray) {
    Problem p = infeasible_with_ray();
    for (init_method method : artificial_methods) {
        SCOPED_TRACE(to_string(method));
        result r = solver(p, method, solver_settings());

        EXPECT_EQ(r.status, solve_status::infeasible);
        EXPECT_TRUE(r.solution.empty());
        EXPECT_EQ(r.optimal_value, 0);
    }
}

TEST(solver, big_m_without_artificial_check_reports_optimal) {
    solver_settings settings;
    settings.check_artificial_basis = false;
    result r = solver(disjoint(), init_method::big_m, settings);

    EXPECT_EQ(r.status, solve_status::optimal);
    EXPECT_FALSE(feasible(disjoint(), r.solution, 1e-6));
}

TEST(solver, minimization_is_negated_maximization) {
    Problem max_p = production();
    Problem min_p = production();
    min_p.sense = objective_sense::minimize;
    for (double& c : min_p.c)
        c = -c;

    for (init_method method : all_methods) {
        SCOPED_TRACE(to_string(method));
        result r_max = solver(max_p, method, solver_settings());
        result r_min = solver(min_p, method, solver_settings());

        ASSERT_EQ(r_max.status, solve_status::optimal);
        ASSERT_EQ(r_min.status, solve_status::optimal);
        EXPECT_EQ(r_min.solution, r_max.solution);
        EXPECT_EQ(r_min.optimal_value, -r_max.optimal_value);
    }
}

TEST(solver, solving_twice_gives_identical_results) {
    for (init_method method : artificial_methods) {
        SCOPED_TRACE(to_string(method));
        result a = solver(diet(), method, solver_settings());
        result b = solver(diet(), method, solver_settings());

        ASSERT_EQ(a.steps.size(), b.steps.size());
        for (int k = 0; k < a.steps.size(); k++) {
            EXPECT_EQ(a.steps[k].tableau, b.steps[k].tableau);
            EXPECT_EQ(a.steps[k].basis, b.steps[k].basis);
            EXPECT_EQ(a.steps[k].description, b.steps[k].description);
        }
        EXPECT_EQ(a.final_basis, b.final_basis);
        EXPECT_EQ(a.optimal_value, b.optimal_value);
    }
}

TEST(solver, every_recorded_tableau_is_canonical) {
    const Problem problems[] = {production(), diet(), equality(), negative_rhs(),
                                redundant_equalities()};
    for (const Problem& p : problems) {
        for (init_method method : artificial_methods) {
            result r = solver(p, method, solver_settings());
            for (const step& s : r.steps) {
                EXPECT_TRUE(is_canonical(s.tableau, s.basis, 1e-9)) << s.description;
            }
            EXPECT_TRUE(is_canonical(r.final_tableau, r.final_basis, 1e-9));
        }
    }
}

TEST(solver, iteration_limit_is_flagged) {
    solver_settings settings;
    settings.iteration_limit = 1;
    result r = solver(production(), init_method::standard, settings);

    EXPECT_EQ(r.status, solve_status::optimal);
    EXPECT_TRUE(r.iteration_limit_reached);
    EXPECT_EQ(r.steps.size(), 1);
    // x2 = 6 is reached after the first pivot, x1 has not entered yet.
    EXPECT_NEAR(r.optimal_value, 30, 1e-9);
}
