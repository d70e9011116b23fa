#include "report.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

std::string format_value(double v, int precision) {
    if (v == std::floor(v) && std::abs(v) < 1e15) {
        std::ostringstream s;
        s << static_cast<long long>(v);
        return s.str();
    }
    std::ostringstream s;
    s << std::fixed << std::setprecision(precision) << v;
    return s.str();
}

void print_tableau(std::ostream& out,
                   const mat& T,
                   const idx& basis,
                   const std::vector<std::string>& names) {
    const int w = 10;
    out << std::setw(6) << "Basis";
    for (const auto& name : names)
        out << std::setw(w) << name;
    out << std::setw(w) << "RHS" << std::endl;

    for (int i = 0; i < T.size(); i++) {
        std::string label = (i == 0) ? "z" : names[basis[i - 1]];
        out << std::setw(6) << label;
        for (int j = 0; j < T[i].size(); j++) {
            out << std::setw(w) << format_value(T[i][j], 3);
        }
        out << std::endl;
    }
}

void print_result(std::ostream& out, const result& r) {
    for (int k = 0; k < r.steps.size(); k++) {
        const step& s = r.steps[k];
        out << "Step " << (k + 1) << " (phase " << s.phase << "): " << s.description << std::endl;
        print_tableau(out, s.tableau, s.basis, r.variable_names);
        out << std::endl;
    }

    out << "Final tableau:" << std::endl;
    print_tableau(out, r.final_tableau, r.final_basis, r.variable_names);
    out << std::endl;

    out << "Status: " << to_string(r.status) << std::endl;
    if (r.iteration_limit_reached)
        out << "Warning: iteration limit reached" << std::endl;
    if (r.status != solve_status::optimal)
        return;

    out << "Optimal value: " << format_value(r.optimal_value, 4) << std::endl;
    for (int j = 0; j < r.solution.size(); j++) {
        out << r.variable_names[j] << " = " << format_value(r.solution[j], 4) << std::endl;
    }
}
