#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "dimension_search.h"
#include "frame_errors.h"

TEST_CASE("next standard") {
    REQUIRE(nextStandard(STANDARD_HEIGHTS, 0.16) == Approx(0.18));
    REQUIRE(nextStandard(STANDARD_HEIGHTS, 0.165) == Approx(0.18));
    REQUIRE(nextStandard(STANDARD_HEIGHTS, 0.40) == Approx(0.44));
    REQUIRE(nextStandard(STANDARD_HEIGHTS, 0.50) == Approx(0.52));
    REQUIRE(nextStandard(STANDARD_WIDTHS, 0.12) == Approx(0.14));
    REQUIRE(nextStandard(STANDARD_WIDTHS, 0.24) == Approx(0.26));
}

TEST_CASE("failure categories are disjoint") {
    REQUIRE(failureCategory("rafter") == FailureCategory::Rafter);
    REQUIRE(failureCategory("rafter_sloped") == FailureCategory::Rafter);
    REQUIRE(failureCategory("side_plate") == FailureCategory::Beam);
    REQUIRE(failureCategory("top_plate_d") == FailureCategory::Beam);
    REQUIRE(failureCategory("tie_beam") == FailureCategory::Beam);
    REQUIRE(failureCategory("ridge_beam") == FailureCategory::Beam);
    REQUIRE(failureCategory("ceiling_joist") == FailureCategory::Beam);
    REQUIRE(failureCategory("purlin_low") == FailureCategory::Beam);
    REQUIRE(failureCategory("cross_member") == FailureCategory::TieBeam);
    REQUIRE(failureCategory("middle_purlin") == FailureCategory::MiddlePurlin);
    REQUIRE(failureCategory("middle_purlin_pult") == FailureCategory::MiddlePurlin);
    REQUIRE(failureCategory("post") == FailureCategory::None);
}

TEST_CASE("enlarge only the failed rafter") {
    CrossSections cs;
    CrossSections next = enlargeSections(cs, {"rafter"});
    REQUIRE(next.rafterH == Approx(0.18));
    REQUIRE(next.rafterW == cs.rafterW);
    REQUIRE(next.beamH == cs.beamH);
    REQUIRE(next.beamW == cs.beamW);
    REQUIRE(next.tieBeamH == cs.tieBeamH);
    REQUIRE(next.middlePurlinH == cs.middlePurlinH);
    REQUIRE(next.postDim == cs.postDim);
}

TEST_CASE("enlarge bumps each category once") {
    CrossSections cs;
    CrossSections next = enlargeSections(cs, {"side_plate", "ridge_beam", "middle_purlin", "cross_member"});
    REQUIRE(next.beamH == Approx(0.14));
    REQUIRE(next.middlePurlinH == Approx(0.18));
    REQUIRE(next.tieBeamH == Approx(0.16));
    REQUIRE(next.rafterH == cs.rafterH);
}

TEST_CASE("middle purlin failure raises the beam as well") {
    CrossSections cs;
    CrossSections next = enlargeSections(cs, {"middle_purlin"});
    REQUIRE(next.beamH == Approx(0.14));
    REQUIRE(next.middlePurlinH == Approx(0.18));
    REQUIRE(next.rafterH == cs.rafterH);
    REQUIRE(next.tieBeamH == cs.tieBeamH);

    CrossSections pult = enlargeSections(cs, {"middle_purlin_pult", "purlin_high"});
    REQUIRE(pult.beamH == Approx(0.14));
    REQUIRE(pult.middlePurlinH == Approx(0.18));
}

TEST_CASE("slender beam gets wider") {
    CrossSections cs;
    cs.beamH = 0.30;
    CrossSections next = enlargeSections(cs, {"ridge_beam"});
    REQUIRE(next.beamH == Approx(0.32));
    REQUIRE(next.beamW == Approx(0.14));
}

TEST_CASE("search converges after a rafter bump") {
    int calls = 0;
    PlanEvaluator eval = [&](const FrameParameters& p){
        ++calls;
        if(p.cs.rafterH < 0.17) return std::vector<std::string>{"rafter"};
        return std::vector<std::string>{};
    };
    FrameParameters start;
    DimensionSearch s(start, MAX_ITERATIONS, eval);
    REQUIRE(s.step() == SearchState::Iterating);
    REQUIRE(s.params().cs.rafterH == Approx(0.18));
    REQUIRE(s.params().cs.beamH == start.cs.beamH);
    REQUIRE(s.params().cs.beamW == start.cs.beamW);
    REQUIRE(s.params().cs.tieBeamH == start.cs.tieBeamH);
    REQUIRE(s.lastFailures() == std::vector<std::string>{"rafter"});
    REQUIRE(s.step() == SearchState::Converged);
    REQUIRE(s.iterations() == 2);
    REQUIRE(s.step() == SearchState::Converged);
    REQUIRE(calls == 2);
    // input copy untouched
    REQUIRE(start.cs.rafterH == Approx(0.16));
}

TEST_CASE("search stops at the iteration cap") {
    int calls = 0;
    PlanEvaluator never = [&](const FrameParameters&){
        ++calls;
        return std::vector<std::string>{"rafter"};
    };
    DimensionSearch s(FrameParameters(), MAX_ITERATIONS, never);
    REQUIRE_THROWS_AS(s.run(), OptimizationExhausted);
    REQUIRE(s.state() == SearchState::Exhausted);
    REQUIRE(s.iterations() == MAX_ITERATIONS);
    REQUIRE(calls == MAX_ITERATIONS);

    DimensionSearch small(FrameParameters(), 5, never);
    try {
        small.run();
        FAIL("expected OptimizationExhausted");
    } catch (const OptimizationExhausted& e) {
        REQUIRE(e.iterations == 5);
        REQUIRE(e.lastSections.rafterH > 0.16);
    }
}

TEST_CASE("carport plan converges") {
    FrameParameters p;
    ConstructionPlan plan = buildConstructionPlan(p);
    REQUIRE(plan.iterations > 1);
    REQUIRE(plan.iterations <= MAX_ITERATIONS);
    REQUIRE(plan.params.cs.postDim == plan.params.cs.beamW);
    REQUIRE(plan.params.cs.beamH > p.cs.beamH);
    for(const auto& part : plan.parts)
        if(part.statics) REQUIRE(part.statics->passed);
    REQUIRE(plan.parts.find("counter_batten")->cutting);
    REQUIRE(plan.summary.timberVolume > 0);
}

TEST_CASE("garden house plan converges") {
    FrameParameters p;
    p.building = BuildingType::GardenHouse;
    p.W = 3.0; p.D = 4.0; p.H = 2.4;
    ConstructionPlan plan = buildConstructionPlan(p);
    for(const auto& part : plan.parts)
        if(part.statics) REQUIRE(part.statics->passed);
    REQUIRE(plan.summary.totalLoad > plan.summary.snowLoad);
}

TEST_CASE("plan without search keeps the sections") {
    FrameParameters p;
    ConstructionPlan plan = buildConstructionPlan(p, MAX_ITERATIONS, false);
    REQUIRE(plan.iterations == 0);
    REQUIRE(plan.params.cs.beamH == p.cs.beamH);
    REQUIRE(plan.parts.find("counter_batten")->cutting);
}
