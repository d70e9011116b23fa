#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>

#include "../cuopt/base_solver.hpp"
#include "linprog.hpp"
#include "logging.hpp"
#include "solver.hpp"

double fRand(double min, double max) { return (((double)rand()) / RAND_MAX) * (max - min) + min; }

struct Timer {
    std::chrono::high_resolution_clock::time_point time_point;

    // Returns duration in milliseconds
    double stop() {
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> ms = end - time_point;
        return ms.count();
    }
    void start() {
        auto t = std::chrono::high_resolution_clock::now();
        time_point = t;
    }
};

/**
 * Random problem with mixed relations that is feasible by construction:
 * every row is evaluated at a random non negative point x0 and its rhs is
 * placed on the correct side of a_i^T x0.
 */
Problem random_problem(int seed) {
    srand(seed);
    Problem p;
    p.n = 2 + (rand() % 8);
    p.m = 2 + (rand() % 8);
    p.sense = (rand() % 2) ? objective_sense::maximize : objective_sense::minimize;

    vec x0(p.n);
    for (int j = 0; j < p.n; j++)
        x0[j] = fRand(0, 5);

    p.c.resize(p.n);
    for (int j = 0; j < p.n; j++)
        p.c[j] = fRand(1, 10);

    p.constraints.resize(p.m);
    for (int i = 0; i < p.m; i++) {
        constraint& row = p.constraints[i];
        row.coefficients.resize(p.n);
        double lhs = 0;
        for (int j = 0; j < p.n; j++) {
            row.coefficients[j] = fRand(0, 10);
            lhs += row.coefficients[j] * x0[j];
        }
        int kind = rand() % 5;
        if (kind == 0) {
            row.rel = relation::greater_equal;
            row.rhs = lhs - fRand(0, 1);
        } else if (kind == 1) {
            row.rel = relation::equal;
            row.rhs = lhs;
        } else {
            row.rel = relation::less_equal;
            row.rhs = lhs + fRand(0, 1);
        }
    }

    // Maximizing needs a bounded region: cap the sum of the variables.
    if (p.sense == objective_sense::maximize) {
        double sum = 0;
        for (int j = 0; j < p.n; j++)
            sum += x0[j];
        p.constraints.push_back({vec(p.n, 1.0), relation::less_equal, sum + 10});
        p.m++;
    }
    return p;
}

bool test(int seed, init_method method) {
    Problem p = random_problem(seed);
    std::cout << "Test(seed: " << seed << ", n: " << p.n << ", m: " << p.m << ")" << std::endl;

    Timer timer_backend;
    Timer timer_base;
    timer_backend.start();
    struct result r = solver(p, method, solver_settings());
    double time_backend = timer_backend.stop();
    timer_base.start();
    struct result base_r = base_solver(p);
    double time_base = timer_base.stop();

    std::cout << "Backend: " << to_string(r.status) << " (" << r.steps.size()
              << " pivots), Base: " << to_string(base_r.status) << std::endl;
    std::cout << "Backend time (ms): " << time_backend << std::endl;
    std::cout << "Base time (ms): " << time_base << std::endl;

    if (r.status != base_r.status) {
        std::cout << "failure: solvers disagree on status" << std::endl;
        return false;
    }
    if (r.status != solve_status::optimal)
        return true;

    double delta = std::fabs(r.optimal_value - base_r.optimal_value);
    std::cout << "score backend: " << r.optimal_value << " score base: " << base_r.optimal_value
              << " delta: " << delta << std::endl;
    std::cout << "Feasible: " << (feasible(p, r.solution, 1e-5) ? "Yes" : "No") << std::endl;

    // cuOpt works to an absolute primal tolerance of 1e-4.
    if (delta > 1e-3 * (1 + std::fabs(base_r.optimal_value)) || !feasible(p, r.solution, 1e-5)) {
        std::cout << "failure" << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    logging::active = false;
    init_method method = init_method::two_phase;
    int count = 100;

    try {
        if (argc > 1)
            method = parse_method(argv[1]);
        if (argc > 2)
            count = std::stoi(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "Usage: " << argv[0] << " [big_m|two_phase] [count]" << std::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    int failed = 0;
    for (int i = 0; i < count; i++) {
        try {
            if (!test(i, method))
                failed++;
        } catch (const std::exception& e) {
            std::cerr << "Test " << i << " threw: " << e.what() << std::endl;
            failed++;
        }
        std::cout << std::endl;
    }

    std::cout << "Failed: " << failed << " of " << count << std::endl;
    return failed > 0 ? 1 : 0;
}
