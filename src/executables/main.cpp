#include <iostream>
#include <stdexcept>
#include <string>

#include "linprog.hpp"
#include "logging.hpp"
#include "problem_reader.hpp"
#include "report.hpp"
#include "solver.hpp"

// max 3 x1 + 5 x2, x1 <= 4, 2 x2 <= 12, 3 x1 + 2 x2 <= 18
static Problem example_problem() {
    Problem p;
    p.sense = objective_sense::maximize;
    p.n = 2;
    p.m = 3;
    p.c = {3, 5};
    p.constraints = {
        {{1, 0}, relation::less_equal, 4},
        {{0, 2}, relation::less_equal, 12},
        {{3, 2}, relation::less_equal, 18},
    };
    return p;
}

static bool is_method(const std::string& arg) {
    try {
        parse_method(arg);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [problem_file] [standard|big_m|two_phase] [-v]"
              << std::endl;
}

int main(int argc, char** argv) {
    std::string path;
    init_method method = init_method::two_phase;
    bool method_given = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "-v") {
                logging::active = true;
            } else if (arg == "-h" || arg == "--help") {
                usage(argv[0]);
                return 0;
            } else if (!method_given && is_method(arg)) {
                method = parse_method(arg);
                method_given = true;
            } else if (path.empty()) {
                path = arg;
            } else {
                usage(argv[0]);
                return 1;
            }
        }

        Problem p = path.empty() ? example_problem() : read_problem(path);
        std::cout << "Solving " << (path.empty() ? "built-in example" : path) << " (n=" << p.n
                  << ", m=" << p.m << ") with " << to_string(method) << " method" << std::endl
                  << std::endl;

        struct result r = solver(p, method, solver_settings());
        print_result(std::cout, r);

        if (r.status == solve_status::optimal) {
            std::cout << "Feasible: " << (feasible(p, r.solution) ? "Yes" : "No") << std::endl;
            std::cout << "Score: " << score(p.n, r.solution, p.c) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
