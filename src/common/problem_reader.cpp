#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
using std::string;

#include "problem_reader.hpp"

// Splits the stream into whitespace separated tokens, dropping '#' comments.
static std::vector<string> tokenize(std::istream& in) {
    std::vector<string> tokens;
    string line;
    while (std::getline(in, line)) {
        size_t hash = line.find('#');
        if (hash != string::npos)
            line.erase(hash);
        std::istringstream ls(line);
        string tok;
        while (ls >> tok)
            tokens.push_back(tok);
    }
    return tokens;
}

static double to_number(const string& tok, const string& name, const string& what) {
    size_t used = 0;
    double v;
    try {
        v = std::stod(tok, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(name + ": expected a number for " + what + ", got '" + tok + "'");
    }
    if (used != tok.size())
        throw std::runtime_error(name + ": expected a number for " + what + ", got '" + tok + "'");
    return v;
}

static int to_count(const string& tok, const string& name, const string& what) {
    double v = to_number(tok, name, what);
    if (!(v >= 1 && v <= 1e6) || v != static_cast<int>(v))
        throw std::runtime_error(name + ": " + what + " must be a positive integer, got '" + tok +
                                 "'");
    return static_cast<int>(v);
}

Problem read_problem(std::istream& in, const string& name) {
    std::vector<string> tokens = tokenize(in);
    size_t pos = 0;
    auto next = [&](const string& what) -> const string& {
        if (pos >= tokens.size())
            throw std::runtime_error(name + ": unexpected end of input, expected " + what);
        return tokens[pos++];
    };

    Problem p;
    try {
        p.sense = parse_sense(next("objective sense"));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(name + ": " + e.what());
    }
    p.n = to_count(next("n"), name, "n");
    p.m = to_count(next("m"), name, "m");

    p.c.assign(p.n, 0.0);
    for (int j = 0; j < p.n; ++j) {
        p.c[j] = to_number(next("objective coefficient"), name, "objective coefficient");
    }

    p.constraints.resize(p.m);
    for (int i = 0; i < p.m; ++i) {
        constraint& row = p.constraints[i];
        string what = "constraint " + std::to_string(i + 1);
        row.coefficients.assign(p.n, 0.0);
        for (int j = 0; j < p.n; ++j) {
            row.coefficients[j] = to_number(next(what), name, what);
        }
        const string& rel = next(what + " relation");
        try {
            row.rel = parse_relation(rel);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(name + ": " + e.what() + " in " + what);
        }
        row.rhs = to_number(next(what + " rhs"), name, what + " rhs");
    }

    if (pos != tokens.size())
        throw std::runtime_error(name + ": trailing input after " + std::to_string(p.m) +
                                 " constraints");

    return p;
}

Problem read_problem(const string& path) {
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Could not open file: " + path);
    return read_problem(in, path);
}
