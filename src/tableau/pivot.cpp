#include "pivot.hpp"

#include <cmath>
#include <limits>
#include <utility>

#include "logging.hpp"

int select_entering(const mat& T, int eligible_cols, double tol) {
    const vec& z = T[0];
    int col = -1;
    double min_value = -tol;
    for (int j = 0; j < eligible_cols; j++) {
        if (z[j] < min_value) {
            min_value = z[j];
            col = j;
        }
    }
    return col;
}

int ratio_test(const mat& T, int col, double tol) {
    int rhs = T[0].size() - 1;
    int row = -1;
    double min_ratio = std::numeric_limits<double>::infinity();
    for (int i = 1; i < T.size(); i++) {
        double coeff = T[i][col];
        if (coeff <= tol)
            continue;
        double ratio = T[i][rhs] / coeff;
        // Rounding noise must not beat an earlier row with the same ratio.
        if (row == -1 || ratio < min_ratio - tol) {
            min_ratio = ratio;
            row = i;
        }
    }
    return row;
}

void pivot(mat& T, idx& basis, int row, int col) {
    int cols = T[0].size();
    vec& p = T[row];
    double pivot_element = p[col];

    for (int j = 0; j < cols; j++) {
        p[j] /= pivot_element;
    }
    p[col] = 1.0;

    for (int i = 0; i < T.size(); i++) {
        if (i == row)
            continue;
        double factor = T[i][col];
        if (factor == 0.0)
            continue;
        for (int j = 0; j < cols; j++) {
            T[i][j] -= factor * p[j];
        }
        T[i][col] = 0.0;
    }

    basis[row - 1] = col;
}

void record_step(vector<step>& steps,
                 const mat& T,
                 const idx& basis,
                 int row,
                 int col,
                 int phase,
                 const vector<std::string>& names) {
    step s;
    s.tableau = T;
    s.pivot_row = row;
    s.pivot_col = col;
    s.entering = col;
    s.leaving = basis[row - 1];
    s.basis = basis;
    s.phase = phase;
    s.description = "Pivot on row " + std::to_string(row) + ", col " + std::to_string(col) +
                    " (Enter " + names[col] + ", Leave " + names[s.leaving] + ")";
    steps.push_back(std::move(s));
}

phase_result run_phase(mat T,
                       idx basis,
                       int eligible_cols,
                       int phase,
                       const vector<std::string>& names,
                       const solver_settings& settings,
                       vector<step>& steps) {
    phase_result res;
    res.status = solve_status::optimal;
    res.iteration_limit_reached = true;

    for (int it = 0; it < settings.iteration_limit; it++) {
        logging::log("B", basis);
        logging::log("z", T[0]);

        // 1. Check optimality / select entering variable.
        int col = select_entering(T, eligible_cols, settings.zero_tol);
        if (col == -1) {
            res.iteration_limit_reached = false;
            break;
        }

        // 2. Ratio test for the leaving variable.
        int row = ratio_test(T, col, settings.zero_tol);
        if (row == -1) {
            logging::info("Phase " + std::to_string(phase) + ": unbounded in direction of " +
                          names[col]);
            res.status = solve_status::unbounded;
            res.iteration_limit_reached = false;
            break;
        }

        // 3. Record and pivot.
        record_step(steps, T, basis, row, col, phase, names);
        logging::info(steps.back().description);
        pivot(T, basis, row, col);
    }

    // The loop may also run out exactly when the last pivot reached optimality.
    if (res.iteration_limit_reached && select_entering(T, eligible_cols, settings.zero_tol) == -1) {
        res.iteration_limit_reached = false;
    }
    if (res.iteration_limit_reached) {
        logging::info("Phase " + std::to_string(phase) + ": iteration limit of " +
                      std::to_string(settings.iteration_limit) + " reached");
    }

    res.tableau = std::move(T);
    res.basis = std::move(basis);
    return res;
}

void drive_out_artificials(mat& T,
                           idx& basis,
                           const tableau_layout& l,
                           const solver_settings& settings,
                           vector<step>& steps) {
    int rhs = l.rhs_col();
    for (int i = 0; i < l.m; i++) {
        if (!l.is_artificial(basis[i]))
            continue;
        int row = i + 1;
        bool positive_only = T[row][rhs] > settings.zero_tol;
        int col = -1;
        double max_abs = settings.zero_tol;
        for (int j = 0; j < l.n + l.s; j++) {
            double coeff = T[row][j];
            if (positive_only && coeff <= 0)
                continue;
            if (std::abs(coeff) > max_abs) {
                max_abs = std::abs(coeff);
                col = j;
            }
        }
        if (col == -1) {
            logging::info("Row " + std::to_string(row) + " has no pivot column, " +
                          l.variable_names[basis[i]] + " stays basic at " +
                          std::to_string(T[row][rhs]));
            continue;
        }
        record_step(steps, T, basis, row, col, 1, l.variable_names);
        logging::info(steps.back().description);
        pivot(T, basis, row, col);
    }
}
