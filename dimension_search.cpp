#include "dimension_search.h"
#include "frame_errors.h"
#include "frame_plan.h"
#include "statics.h"
#include "summary.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

const std::vector<double> STANDARD_HEIGHTS = {
    0.10, 0.12, 0.14, 0.16, 0.18, 0.20, 0.22, 0.24, 0.26, 0.28,
    0.30, 0.32, 0.34, 0.36, 0.38, 0.40, 0.44, 0.48, 0.50};
const std::vector<double> STANDARD_WIDTHS = {
    0.06, 0.08, 0.10, 0.12, 0.14, 0.16, 0.18, 0.20, 0.22, 0.24};

double nextStandard(const std::vector<double>& standards, double current){
    for(double s : standards)
        if(s > current + 0.001) return s;
    return current + 0.02;
}

static bool has(const std::string& key, const char* part){
    return key.find(part) != std::string::npos;
}

FailureCategory failureCategory(const std::string& key){
    if(has(key, "rafter")) return FailureCategory::Rafter;
    if(has(key, "cross_member")) return FailureCategory::TieBeam;
    if(has(key, "middle_purlin")) return FailureCategory::MiddlePurlin;
    if(has(key, "plate") || has(key, "purlin") || has(key, "beam") || has(key, "ceiling_joist"))
        return FailureCategory::Beam;
    return FailureCategory::None;
}

CrossSections enlargeSections(const CrossSections& cs, const std::vector<std::string>& failedKeys){
    bool rafter = false, beam = false, tie = false, middle = false;
    for(const auto& k : failedKeys){
        switch(failureCategory(k)){
        case FailureCategory::Rafter: rafter = true; break;
        case FailureCategory::Beam: beam = true; break;
        case FailureCategory::TieBeam: tie = true; break;
        case FailureCategory::MiddlePurlin: middle = true; beam = true; break;
        case FailureCategory::None:
            spdlog::warn("[SEARCH] no resize rule for {}", k);
            break;
        }
    }
    CrossSections next = cs;
    if(rafter) next.rafterH = nextStandard(STANDARD_HEIGHTS, cs.rafterH);
    if(beam) next.beamH = nextStandard(STANDARD_HEIGHTS, cs.beamH);
    if(tie) next.tieBeamH = nextStandard(STANDARD_HEIGHTS, cs.tieBeamH);
    if(middle) next.middlePurlinH = nextStandard(STANDARD_HEIGHTS, cs.middlePurlinH);
    if(next.beamH > next.beamW * 2.5 && next.beamW < 0.24)
        next.beamW = nextStandard(STANDARD_WIDTHS, next.beamW);
    return next;
}

std::vector<std::string> evaluatePlan(const FrameParameters& p){
    PartRegistry parts = generatePlan(p);
    StaticsEngine(p).apply(parts);
    std::vector<std::string> failed;
    for(const auto& part : parts)
        if(part.statics && !part.statics->passed) failed.push_back(part.key);
    return failed;
}

// ───────── search ─────────
DimensionSearch::DimensionSearch(FrameParameters start, int maxIterations, PlanEvaluator evaluator)
    : params_(std::move(start)), maxIterations_(maxIterations), evaluator_(std::move(evaluator))
{
    if(maxIterations_ < 1) throw std::runtime_error("iteration budget must be positive");
}

SearchState DimensionSearch::step(){
    if(state_ != SearchState::Iterating) return state_;
    ++iterations_;
    failures_ = evaluator_(params_);
    if(failures_.empty()){
        state_ = SearchState::Converged;
        spdlog::info("[SEARCH] converged after {} iteration(s)", iterations_);
        return state_;
    }
    spdlog::info("[SEARCH] iteration {}: {} failing part(s)", iterations_, failures_.size());
    if(iterations_ >= maxIterations_){
        state_ = SearchState::Exhausted;
        return state_;
    }
    params_ = params_.withSections(enlargeSections(params_.cs, failures_));
    const CrossSections& cs = params_.cs;
    spdlog::info("[SEARCH] -> rafter {}x{} beam {}x{} tie {} middle {}", cs.rafterW, cs.rafterH,
                 cs.beamW, cs.beamH, cs.tieBeamH, cs.middlePurlinH);
    return state_;
}

FrameParameters DimensionSearch::run(){
    while(step() == SearchState::Iterating) {}
    if(state_ == SearchState::Exhausted){
        std::string keys;
        for(const auto& k : failures_) keys += (keys.empty() ? "" : ", ") + k;
        throw OptimizationExhausted(
            fmt::format("no passing cross-sections after {} iterations (failing: {})", iterations_, keys),
            params_.cs, iterations_);
    }
    return params_;
}

// ───────── assembly ─────────
ConstructionPlan finalizePlan(const FrameParameters& converged, int iterations){
    CrossSections cs = converged.cs;
    cs.postDim = cs.beamW;
    ConstructionPlan plan;
    plan.params = converged.withSections(cs);
    plan.iterations = iterations;
    plan.parts = generatePlan(plan.params);
    const int failed = StaticsEngine(plan.params).apply(plan.parts);
    if(failed > 0)
        spdlog::warn("[SEARCH] {} part(s) fail after post resize", failed);
    attachCuttingPlans(plan.parts);
    plan.summary = computeSummary(plan.parts, plan.params);
    return plan;
}

ConstructionPlan buildConstructionPlan(const FrameParameters& p, int maxIterations, bool search){
    if(!search) return finalizePlan(p, 0);
    DimensionSearch s(p, maxIterations);
    FrameParameters converged = s.run();
    return finalizePlan(converged, s.iterations());
}
