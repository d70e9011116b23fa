#pragma once
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
using std::string;
using std::vector;

namespace logging {
extern bool active;

template<typename T>
void log(string name, const vector<T>& v) {
    if(!active) return;
    std::cout << name << "(" << v.size() << "): ";
    for(int i = 0; i < v.size(); i++) {
        std::cout << v[i] << ", ";
    }
    std::cout << std::endl;
}

// Prints a row major matrix, one row per line.
template<typename T>
void log(string name, const vector<vector<T>>& A) {
    if(!active) return;
    std::cout << name << "(" << A.size() << "x" << (A.empty() ? 0 : A[0].size()) << "):"
              << std::endl;
    for(int i = 0; i < A.size(); i++) {
        std::cout << "  ";
        for(int j = 0; j < A[i].size(); j++) {
            std::cout << std::setw(10) << A[i][j] << " ";
        }
        std::cout << std::endl;
    }
}

inline void info(const string& message) {
    if(!active) return;
    std::cout << message << std::endl;
}
}
