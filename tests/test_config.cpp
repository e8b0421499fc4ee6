#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include "config.h"

using json = nlohmann::json;

static std::string writeTemp(const std::string& name, const std::string& text){
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << text;
    return path.string();
}

TEST_CASE("numbers and numeric strings") {
    json j = {{"a", 2.5}, {"b", "3.75m"}, {"c", "abc"}, {"d", nullptr}, {"e", "0"}};
    REQUIRE(parseNumber(j, "a", 1) == Approx(2.5));
    REQUIRE(parseNumber(j, "b", 1) == Approx(3.75));
    REQUIRE(parseNumber(j, "c", 1) == Approx(1));
    REQUIRE(parseNumber(j, "d", 1) == Approx(1));
    REQUIRE(parseNumber(j, "e", 1) == Approx(0));
    REQUIRE(parseNumber(j, "missing", 7) == Approx(7));
}

TEST_CASE("roof and building names") {
    REQUIRE(parseRoofType("gable") == RoofType::Gable);
    REQUIRE(parseRoofType("Satteldach") == RoofType::Gable);
    REQUIRE(parseRoofType("PULTDACH") == RoofType::Shed);
    REQUIRE(parseRoofType("Flachdach") == RoofType::Flat);
    REQUIRE_THROWS_AS(parseRoofType("Walmdach"), std::runtime_error);
    REQUIRE(parseBuildingType("Carport") == BuildingType::Carport);
    REQUIRE(parseBuildingType("Gartenhaus") == BuildingType::GardenHouse);
    REQUIRE(parseBuildingType("Sauna") == BuildingType::GardenHouse);
    REQUIRE(parseBuildingType("schopf") == BuildingType::GardenHouse);
    REQUIRE_THROWS_AS(parseBuildingType("Hochhaus"), std::runtime_error);
    REQUIRE(std::string(roofTypeName(RoofType::Shed)) == "shed");
    REQUIRE(std::string(buildingTypeName(BuildingType::GardenHouse)) == "garden_house");
}

TEST_CASE("input fallbacks") {
    FrameParameters p = parseFrameInput(json::object());
    REQUIRE(p.building == BuildingType::Carport);
    REQUIRE(p.roof == RoofType::Gable);
    REQUIRE(p.W == Approx(5));
    REQUIRE(p.D == Approx(6));
    REQUIRE(p.H == Approx(3));
    REQUIRE(p.overhang == Approx(0.5));
    REQUIRE(p.pitchDeg == Approx(15));
    REQUIRE(p.altitude == Approx(600));

    FrameParameters q = parseFrameInput(json{{"dimensions", {{"width", "breit"}, {"depth", "7.2"}}}});
    REQUIRE(q.W == Approx(5));
    REQUIRE(q.D == Approx(7.2));
}

TEST_CASE("full input document") {
    json j = json::parse(R"({
        "buildingType": "Gartenhaus", "roofType": "Satteldach",
        "dimensions": { "width": 3, "depth": "4", "height": 2.4, "altitude": 900 },
        "roofOverhang": 0.3, "roofPitch": "25",
        "structuralConfig": { "numberOfPostsPerSide": 3, "useMiddlePurlin": true,
                              "useKingPosts": false, "studDepth": 0.1,
                              "counterBattenW": 0.05, "counterBattenH": 0.03 } })");
    FrameParameters p = parseFrameInput(j);
    REQUIRE(p.building == BuildingType::GardenHouse);
    REQUIRE(p.D == Approx(4));
    REQUIRE(p.pitchDeg == Approx(25));
    REQUIRE(p.altitude == Approx(900));
    REQUIRE(p.overhang == Approx(0.3));
    REQUIRE(p.cs.postsPerSide == 3);
    REQUIRE(p.cs.useMiddlePurlin);
    REQUIRE_FALSE(p.cs.useKingPosts);
    REQUIRE(p.cs.studD == Approx(0.1));
    REQUIRE(p.cs.battenW == Approx(0.05));
    REQUIRE(p.cs.battenH == Approx(0.03));
}

TEST_CASE("advisory overrides") {
    CrossSections cs;
    applyAdvice(cs, json{{"postsPerSide", 1}, {"useMiddlePurlin", "true"},
                         {"battenWidth", 0.04}, {"battenHeight", "0.06"}});
    REQUIRE(cs.postsPerSide == 2);
    REQUIRE(cs.useMiddlePurlin);
    REQUIRE(cs.useKingPosts);
    REQUIRE(cs.battenW == Approx(0.04));
    REQUIRE(cs.battenH == Approx(0.06));
    REQUIRE(cs.beamH == Approx(0.12));
    REQUIRE_THROWS_AS(applyAdvice(cs, json::array()), std::runtime_error);
}

TEST_CASE("post count stays in range") {
    CrossSections cs;
    applyAdvice(cs, json{{"numberOfPostsPerSide", "1e400"}});
    REQUIRE(cs.postsPerSide == 2);
    applyAdvice(cs, json{{"numberOfPostsPerSide", "nan"}});
    REQUIRE(cs.postsPerSide == 2);
    applyAdvice(cs, json{{"numberOfPostsPerSide", 1e12}});
    REQUIRE(cs.postsPerSide == 50);
    applyAdvice(cs, json{{"numberOfPostsPerSide", 4}});
    REQUIRE(cs.postsPerSide == 4);
}

TEST_CASE("input and advice files") {
    std::string input = writeTemp("frameplan_input.json",
        R"({"roofType": "shed", "dimensions": {"width": 4}})");
    std::string advice = writeTemp("frameplan_advice.json",
        R"({"structuralConfig": {"numberOfPostsPerSide": 4, "useKingPosts": false}})");
    FrameParameters p = loadFrameInput(input, advice);
    REQUIRE(p.roof == RoofType::Shed);
    REQUIRE(p.W == Approx(4));
    REQUIRE(p.cs.postsPerSide == 4);
    REQUIRE_FALSE(p.cs.useKingPosts);
}

TEST_CASE("bad files") {
    REQUIRE_THROWS_AS(loadJsonFile("/nonexistent/frameplan.json"), std::runtime_error);
    std::string broken = writeTemp("frameplan_broken.json", "{ \"width\": ");
    REQUIRE_THROWS_AS(loadJsonFile(broken), std::runtime_error);
    std::string bad = writeTemp("frameplan_badroof.json", R"({"roofType": "Walmdach"})");
    REQUIRE_THROWS_AS(loadFrameInput(bad), std::runtime_error);
}
