#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "frame_errors.h"
#include "frame_plan.h"

static int quantityWithPrefix(const PartRegistry& parts, const std::string& prefix){
    int n = 0;
    for(const auto& p : parts)
        if(p.key.rfind(prefix, 0) == 0) n += p.quantity;
    return n;
}

TEST_CASE("registry merges quantities") {
    PartRegistry r;
    Part a; a.quantity = 2; a.description = "first";
    Part b; b.quantity = 3; b.description = "second";
    Part z; z.quantity = 0;
    r.insert("x", a);
    r.insert("y", b);
    r.insert("x", b);
    r.insert("zero", z);
    REQUIRE(r.size() == 2);
    REQUIRE(r.find("x")->quantity == 5);
    REQUIRE(r.find("x")->description == "first");
    REQUIRE(r.find("x")->key == "x");
    REQUIRE(r.parts()[0].key == "x");
    REQUIRE(r.parts()[1].key == "y");
    REQUIRE_FALSE(r.contains("zero"));
    REQUIRE(r.find("zero") == nullptr);
}

TEST_CASE("section description") {
    REQUIRE(sectionDescription("Sparren", 0.08, 0.16, 3.1234) == "Sparren 8.0x16.0cm, Länge: 312.3cm");
    Part p = makePart("Pfosten", 0.12, 0.12, 2.88, 4);
    REQUIRE(p.quantity == 4);
    REQUIRE(p.nominal->length == Approx(2.88));
    REQUIRE(makeBattenPart(0.06, 0.08, {1.0}).description == "Traglatten 60x80mm");
}

TEST_CASE("top plate fallbacks") {
    CrossSections cs;
    cs.beamW = 0.06; cs.beamH = 0.08;
    REQUIRE(topPlateWidth(cs) == Approx(0.10));
    REQUIRE(topPlateHeight(cs) == Approx(0.12));
    cs.beamW = 0.14; cs.beamH = 0.20;
    REQUIRE(topPlateWidth(cs) == Approx(0.14));
    REQUIRE(topPlateHeight(cs) == Approx(0.20));
}

TEST_CASE("gable carport") {
    FrameParameters p;
    PartRegistry parts = generateCarportPlan(p);
    REQUIRE(parts.find("post")->quantity == 4);
    REQUIRE(parts.find("side_plate")->quantity == 2);
    REQUIRE(parts.find("side_plate")->nominal->length == Approx(6.0));
    REQUIRE(parts.find("tie_beam")->quantity == 2);
    REQUIRE(parts.find("tie_beam")->nominal->length == Approx(4.88));
    REQUIRE(parts.find("ridge_beam")->quantity == 1);
    REQUIRE(parts.find("king_post")->quantity == 2);
    REQUIRE(parts.find("rafter")->quantity == 16);
    REQUIRE(parts.find("rafter")->drawing);
    REQUIRE(parts.find("brace_main_trans_99")->quantity == 4);
    REQUIRE(parts.find("brace_main_long_99")->quantity == 4);
    REQUIRE(quantityWithPrefix(parts, "brace_king_") == 2);
    REQUIRE_FALSE(parts.contains("middle_purlin"));
    REQUIRE_FALSE(parts.find("counter_batten")->requiredCuts.empty());

    const Part* post = parts.find("post");
    REQUIRE(post->drawing->markers.size() == 1);
    REQUIRE(post->drawing->markers[0].text == "Anriss Kopfb.");
    REQUIRE(parts.find("side_plate")->drawing->markers.size() == 8);
}

TEST_CASE("gable carport with middle purlin") {
    FrameParameters p;
    p.cs.useMiddlePurlin = true;
    p.cs.postsPerSide = 3;
    PartRegistry parts = generateCarportPlan(p);
    REQUIRE(parts.find("post")->quantity == 6);
    REQUIRE(parts.find("middle_purlin")->quantity == 2);
    REQUIRE(parts.find("support_post")->quantity == 6);
    REQUIRE(parts.find("rafter")->drawing);
}

TEST_CASE("shed carport") {
    FrameParameters p;
    p.roof = RoofType::Shed;
    PartRegistry parts = generateCarportPlan(p);
    REQUIRE(parts.find("post_high")->quantity == 2);
    REQUIRE(parts.find("post_low")->quantity == 2);
    REQUIRE(parts.find("post_low")->nominal->length < parts.find("post_high")->nominal->length);
    REQUIRE(parts.find("purlin_high")->quantity == 1);
    REQUIRE(parts.find("purlin_low")->quantity == 1);
    REQUIRE(parts.find("cross_member")->nominal->height == Approx(p.cs.tieBeamH));
    REQUIRE(parts.find("rafter_sloped")->quantity == 8);
    REQUIRE(quantityWithPrefix(parts, "brace_high_long_") == 2);
    REQUIRE(quantityWithPrefix(parts, "brace_low_long_") == 2);
    REQUIRE(quantityWithPrefix(parts, "brace_low_trans_") == 2);
    REQUIRE_FALSE(parts.contains("rafter"));
    REQUIRE_FALSE(parts.contains("king_post"));

    p.cs.useMiddlePurlin = true;
    PartRegistry mid = generateCarportPlan(p);
    REQUIRE(mid.find("middle_purlin_pult")->quantity == 1);
}

TEST_CASE("flat carport uses the shed frame") {
    FrameParameters p;
    p.roof = RoofType::Flat;
    p.pitchDeg = 3;
    PartRegistry parts = generatePlan(p);
    REQUIRE(parts.contains("post_high"));
    REQUIRE(parts.contains("rafter_sloped"));
}

TEST_CASE("carport construction errors") {
    FrameParameters p;
    p.W = 0;
    REQUIRE_THROWS_AS(generateCarportPlan(p), ConstructionError);
    p = FrameParameters();
    p.W = 0.1;
    REQUIRE_THROWS_AS(generateCarportPlan(p), ConstructionError);
    p = FrameParameters();
    p.D = 1.0;
    REQUIRE_THROWS_AS(generateCarportPlan(p), ConstructionError);
    p = FrameParameters();
    p.H = 0.1;
    REQUIRE_THROWS_AS(generateCarportPlan(p), ConstructionError);
}

TEST_CASE("garden house") {
    FrameParameters p;
    p.building = BuildingType::GardenHouse;
    PartRegistry parts = generatePlan(p);

    StudLayout gable = calculateStudLayout(4.76, STUD_THICKNESS, DEFAULT_STUD_SPACING);
    StudLayout side = calculateStudLayout(6.0, STUD_THICKNESS, DEFAULT_STUD_SPACING);
    REQUIRE(parts.find("stud_gable")->quantity == int(gable.positions.size()) * 2);
    REQUIRE(parts.find("stud_side")->quantity == int(side.positions.size()) * 2);
    REQUIRE(parts.find("stud_side")->nominal->length == Approx(3.0 - SILL_H - 0.12));
    REQUIRE(parts.find("sill_d")->drawing->markers.size() == side.positions.size());
    REQUIRE(parts.find("top_plate_d")->nominal->length == Approx(7.0));
    REQUIRE(parts.find("top_plate_w")->nominal->length == Approx(4.76));
    REQUIRE(parts.find("ceiling_joist")->quantity == 8);
    REQUIRE(parts.find("ridge_beam")->nominal->length == Approx(7.0));
    REQUIRE(parts.find("king_post")->quantity == 8);
    REQUIRE(parts.find("gable_post")->quantity == 2);
    REQUIRE(parts.find("rafter")->quantity == 16);
    REQUIRE(quantityWithPrefix(parts, "brace_gable_") >= 2);
    REQUIRE(quantityWithPrefix(parts, "brace_side_") >= 2);
    REQUIRE(parts.contains("counter_batten"));
    REQUIRE_FALSE(parts.contains("post"));
}

TEST_CASE("shallow depth is rejected") {
    FrameParameters p;
    p.building = BuildingType::GardenHouse;
    p.W = 3.0; p.D = 0.08; p.H = 2.4;
    REQUIRE_THROWS_AS(generatePlan(p), ConstructionError);
    p.D = 2 * STUD_THICKNESS;
    REQUIRE_THROWS_AS(generatePlan(p), ConstructionError);
    p.building = BuildingType::Carport;
    p.overhang = 0.0;
    p.D = 0.08;
    REQUIRE_THROWS_AS(generatePlan(p), ConstructionError);
}

TEST_CASE("gable needs a rafter run between plate and ridge") {
    FrameParameters p;
    p.W = 0.2;
    REQUIRE_THROWS_AS(generateCarportPlan(p), ConstructionError);

    FrameParameters house;
    house.building = BuildingType::GardenHouse;
    house.W = 0.35;
    REQUIRE_THROWS_AS(generatePlan(house), ConstructionError);
}

TEST_CASE("garden house top plates carry stud marks") {
    FrameParameters p;
    p.building = BuildingType::GardenHouse;
    PartRegistry parts = generatePlan(p);
    StudLayout gable = calculateStudLayout(4.76, STUD_THICKNESS, DEFAULT_STUD_SPACING);
    const Part* plate = parts.find("top_plate_w");
    REQUIRE(plate->drawing->markers.size() == gable.positions.size());
    REQUIRE(plate->drawing->markers[0].text == "Ständer");
    REQUIRE(plate->drawing->dimensions.size() == 2 + gable.spacings.size());
}

TEST_CASE("garden house without king posts") {
    FrameParameters p;
    p.building = BuildingType::GardenHouse;
    p.cs.useKingPosts = false;
    PartRegistry parts = generatePlan(p);
    REQUIRE_FALSE(parts.contains("ceiling_joist"));
    REQUIRE_FALSE(parts.contains("king_post"));
    REQUIRE(parts.contains("gable_post"));
}

TEST_CASE("garden house construction errors") {
    FrameParameters p;
    p.building = BuildingType::GardenHouse;
    p.H = 0.2;
    REQUIRE_THROWS_AS(generatePlan(p), ConstructionError);
    p.H = 2.5;
    p.W = 0.3;
    REQUIRE_THROWS_AS(generatePlan(p), ConstructionError);
    p.W = 3.0;
    p.roof = RoofType::Shed;
    REQUIRE_THROWS_AS(generatePlan(p), ConstructionError);
}

TEST_CASE("batten cutting plan attached") {
    FrameParameters p;
    PartRegistry parts = generatePlan(p);
    const size_t cuts = parts.find("counter_batten")->requiredCuts.size();
    attachCuttingPlans(parts);
    const Part* b = parts.find("counter_batten");
    REQUIRE(b->cutting);
    REQUIRE(b->requiredCuts.empty());
    REQUIRE(b->quantity == b->cutting->stockCount());
    REQUIRE(b->description.rfind("Traglatten 60x80mm (", 0) == 0);
    REQUIRE(b->description.find("Zuschnittplan") != std::string::npos);
    size_t placed = b->cutting->rejected.size();
    for(const auto& bin : b->cutting->bins) placed += bin.cuts.size() * bin.count;
    REQUIRE(placed == cuts);
    REQUIRE(b->cutting->rejected.empty());
}
