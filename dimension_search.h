#pragma once
#include <functional>
#include <string>
#include <vector>
#include "frame_types.h"
#include "part_registry.h"

constexpr int MAX_ITERATIONS = 30;

extern const std::vector<double> STANDARD_HEIGHTS;
extern const std::vector<double> STANDARD_WIDTHS;

// First standard above current + 1mm, else current + 0.02.
double nextStandard(const std::vector<double>& standards, double current);

enum class FailureCategory { None, Rafter, Beam, TieBeam, MiddlePurlin };
FailureCategory failureCategory(const std::string& key);

// Bumps the height of every failed category once, then widens the beam
// when it became too slender. A failing middle purlin also raises the beam.
CrossSections enlargeSections(const CrossSections& cs, const std::vector<std::string>& failedKeys);

// Keys of the parts failing their structural check for the given parameters.
using PlanEvaluator = std::function<std::vector<std::string>(const FrameParameters&)>;
std::vector<std::string> evaluatePlan(const FrameParameters& p);

enum class SearchState { Iterating, Converged, Exhausted };

class DimensionSearch {
public:
    explicit DimensionSearch(FrameParameters start, int maxIterations = MAX_ITERATIONS,
                             PlanEvaluator evaluator = evaluatePlan);

    SearchState step();
    // Steps until done; throws OptimizationExhausted.
    FrameParameters run();

    SearchState state() const { return state_; }
    int iterations() const { return iterations_; }
    const FrameParameters& params() const { return params_; }
    const std::vector<std::string>& lastFailures() const { return failures_; }

private:
    FrameParameters params_;
    int maxIterations_;
    PlanEvaluator evaluator_;
    SearchState state_ = SearchState::Iterating;
    int iterations_ = 0;
    std::vector<std::string> failures_;
};

struct ConstructionPlan {
    FrameParameters params;
    PartRegistry parts;
    SummaryInfo summary;
    int iterations = 0;
};

// Post = beam width, regenerate, statics and cutting plans.
ConstructionPlan finalizePlan(const FrameParameters& converged, int iterations);

ConstructionPlan buildConstructionPlan(const FrameParameters& p, int maxIterations = MAX_ITERATIONS,
                                       bool search = true);
