#pragma once
#include <stdexcept>
#include <string>
#include "frame_types.h"

// Physically impossible spans; aborts plan generation for the current input.
struct ConstructionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Dimension search ran out of iterations without every check passing.
struct OptimizationExhausted : std::runtime_error {
    OptimizationExhausted(const std::string& msg, const CrossSections& last, int iterations)
        : std::runtime_error(msg), lastSections(last), iterations(iterations) {}
    CrossSections lastSections;
    int iterations;
};
