#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "linprog.hpp"
#include "logging.hpp"
#include "problem_reader.hpp"
#include "report.hpp"
#include "solver.hpp"

namespace fs = std::filesystem;

/**
 * Solves p with one method and prints a one line summary.
 * Returns FALSE if the method claims optimality for an infeasible point or
 * an objective that does not match its solution.
 */
bool run_method(const Problem& p, init_method method, result& r, bool& ran) {
    ran = false;
    try {
        r = solver(p, method, solver_settings());
        ran = true;
    } catch (const std::invalid_argument& e) {
        // The standard method refuses problems without a slack basis.
        std::cout << "  " << std::setw(10) << to_string(method) << ": skipped (" << e.what()
                  << ")" << std::endl;
        return method == init_method::standard;
    }

    std::cout << "  " << std::setw(10) << to_string(method) << ": " << to_string(r.status)
              << " after " << r.steps.size() << " pivots";
    if (r.status == solve_status::optimal)
        std::cout << ", value " << format_value(r.optimal_value, 6);
    if (r.iteration_limit_reached)
        std::cout << " (iteration limit)";
    std::cout << std::endl;

    if (r.status != solve_status::optimal)
        return true;

    if (!feasible(p, r.solution)) {
        std::cout << "  !! WARNING: " << to_string(method) << " solution is not feasible!"
                  << std::endl;
        return false;
    }
    double delta = std::fabs(score(p.n, r.solution, p.c) - r.optimal_value);
    if (delta > 1e-6 * (1 + std::fabs(r.optimal_value))) {
        std::cout << "  !! WARNING: " << to_string(method)
                  << " objective does not match its solution (delta " << delta << ")"
                  << std::endl;
        return false;
    }
    return true;
}

bool agree(const result& a, const result& b) {
    if (a.status != b.status)
        return false;
    if (a.status != solve_status::optimal)
        return true;
    return std::fabs(a.optimal_value - b.optimal_value) <= 1e-6 * (1 + std::fabs(a.optimal_value));
}

/**
 * Runs all methods on a single problem.
 * Returns TRUE if the test passed (methods are consistent and agree),
 * Returns FALSE if the test failed.
 */
bool run_solver_test(const Problem& p, const std::string& problem_name) {
    std::cout << "Testing: " << problem_name << " (n=" << p.n << ", m=" << p.m << ")"
              << std::endl;

    bool passed = true;
    result r_standard, r_big_m, r_two_phase;
    bool ran_standard, ran_big_m, ran_two_phase;

    passed &= run_method(p, init_method::standard, r_standard, ran_standard);
    passed &= run_method(p, init_method::big_m, r_big_m, ran_big_m);
    passed &= run_method(p, init_method::two_phase, r_two_phase, ran_two_phase);

    if (ran_big_m && ran_two_phase && !agree(r_big_m, r_two_phase)) {
        std::cout << "  !! WARNING: big_m and two_phase disagree!" << std::endl;
        passed = false;
    }
    if (ran_standard && ran_two_phase && !agree(r_standard, r_two_phase)) {
        std::cout << "  !! WARNING: standard and two_phase disagree!" << std::endl;
        passed = false;
    }

    std::cout << std::endl;
    return passed;
}

/**
 * Helper function to read and test a single problem file.
 * Updates counters for processed and failed files.
 */
void process_problem_file(const fs::path& path, int& files_processed, int& files_failed) {
    if (path.extension().string() != ".txt") {
        std::cout << "Skipping non-problem file: " << path.string() << std::endl;
        return;
    }

    files_processed++;

    try {
        Problem p = read_problem(path.string());
        if (!run_solver_test(p, path.string())) {
            files_failed++;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to read or test file: " << path.string() << std::endl;
        std::cerr << "  Error: " << e.what() << std::endl << std::endl;
        files_failed++;
    }
}

int main(int argc, char** argv) {
    logging::active = false;

    // Path to test (can be a file or directory)
    fs::path input_path = "problems";
    if (argc > 1) {
        input_path = argv[1];
    }

    std::cout << "Processing path: " << input_path << std::endl;
    std::cout << "---------------------------------" << std::endl;

    int files_processed = 0;
    int files_failed = 0;

    try {
        if (fs::is_directory(input_path)) {
            for (const auto& entry : fs::directory_iterator(input_path)) {
                if (entry.is_regular_file()) {
                    process_problem_file(entry.path(), files_processed, files_failed);
                }
            }
        } else if (fs::is_regular_file(input_path)) {
            process_problem_file(input_path, files_processed, files_failed);
        } else {
            std::cerr << "Fatal Error: Path is not a valid file or directory: " << input_path
                      << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: Error while processing path: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "---------------------------------" << std::endl;
    std::cout << "Test run complete." << std::endl;
    std::cout << "Processed: " << files_processed << " files" << std::endl;
    std::cout << "Failed:    " << files_failed << " files" << std::endl;

    return (files_failed > 0 || files_processed == 0) ? 1 : 0;
}
