#include "config.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

const char* roofTypeName(RoofType r){
    switch(r){
    case RoofType::Gable: return "gable";
    case RoofType::Shed: return "shed";
    case RoofType::Flat: return "flat";
    }
    return "?";
}

const char* buildingTypeName(BuildingType b){
    switch(b){
    case BuildingType::Carport: return "carport";
    case BuildingType::GardenHouse: return "garden_house";
    }
    return "?";
}

static constexpr double MAX_POSTS_PER_SIDE = 50;

static std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return char(std::tolower(c)); });
    return s;
}

double parseNumber(const nlohmann::json& obj, const char* key, double fallback){
    if(!obj.is_object() || !obj.contains(key)) return fallback;
    const auto& v = obj.at(key);
    if(v.is_number()) return v.get<double>();
    if(v.is_string()){
        const std::string s = v.get<std::string>();
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if(end != s.c_str()) return d;
    }
    spdlog::warn("[JSON] {} is not numeric, using {}", key, fallback);
    return fallback;
}

RoofType parseRoofType(const std::string& name){
    const std::string n = lower(name);
    if(n == "gable" || n == "satteldach") return RoofType::Gable;
    if(n == "shed" || n == "pultdach") return RoofType::Shed;
    if(n == "flat" || n == "flachdach") return RoofType::Flat;
    throw std::runtime_error("unknown roof type '" + name + "'");
}

BuildingType parseBuildingType(const std::string& name){
    const std::string n = lower(name);
    if(n == "carport") return BuildingType::Carport;
    if(n == "garden_house" || n == "gartenhaus" || n == "sauna" || n == "schopf")
        return BuildingType::GardenHouse;
    throw std::runtime_error("unknown building type '" + name + "'");
}

static bool parseFlag(const nlohmann::json& obj, const char* key, bool fallback){
    if(!obj.contains(key)) return fallback;
    const auto& v = obj.at(key);
    if(v.is_boolean()) return v.get<bool>();
    if(v.is_string()){
        const std::string s = lower(v.get<std::string>());
        if(s == "true" || s == "ja" || s == "1") return true;
        if(s == "false" || s == "nein" || s == "0") return false;
    }
    if(v.is_number()) return v.get<double>() != 0.0;
    spdlog::warn("[JSON] {} is not a flag, using {}", key, fallback);
    return fallback;
}

void applyAdvice(CrossSections& cs, const nlohmann::json& advice){
    if(!advice.is_object()) throw std::runtime_error("advisory config must be an object");
    const nlohmann::json& a = advice.contains("structuralConfig") ? advice.at("structuralConfig") : advice;
    if(!a.is_object()) throw std::runtime_error("structuralConfig must be an object");

    double posts = parseNumber(a, "numberOfPostsPerSide", parseNumber(a, "postsPerSide", cs.postsPerSide));
    if(!std::isfinite(posts)){
        spdlog::warn("[JSON] posts per side not finite, using {}", cs.postsPerSide);
        posts = cs.postsPerSide;
    }
    cs.postsPerSide = int(std::min(MAX_POSTS_PER_SIDE, std::max(2.0, posts)));
    cs.useMiddlePurlin = parseFlag(a, "useMiddlePurlin", cs.useMiddlePurlin);
    cs.useKingPosts = parseFlag(a, "useKingPosts", cs.useKingPosts);
    cs.studD = parseNumber(a, "studDepth", cs.studD);
    cs.battenW = parseNumber(a, "counterBattenW", parseNumber(a, "battenWidth", cs.battenW));
    cs.battenH = parseNumber(a, "counterBattenH", parseNumber(a, "battenHeight", cs.battenH));
    spdlog::info("[JSON] advice: {} posts/side, middle purlin {}, king posts {}, batten {}x{}",
                 cs.postsPerSide, cs.useMiddlePurlin, cs.useKingPosts, cs.battenW, cs.battenH);
}

FrameParameters parseFrameInput(const nlohmann::json& j){
    if(!j.is_object()) throw std::runtime_error("input must be a JSON object");
    FrameParameters p;
    if(j.contains("buildingType")) p.building = parseBuildingType(j.at("buildingType").get<std::string>());
    if(j.contains("roofType")) p.roof = parseRoofType(j.at("roofType").get<std::string>());

    static const nlohmann::json EMPTY = nlohmann::json::object();
    const nlohmann::json& d = j.contains("dimensions") ? j.at("dimensions") : EMPTY;
    p.W = parseNumber(d, "width", 5.0);
    p.D = parseNumber(d, "depth", 6.0);
    p.H = parseNumber(d, "height", 3.0);
    p.altitude = parseNumber(d, "altitude", 600.0);
    p.overhang = parseNumber(j, "roofOverhang", 0.5);
    p.pitchDeg = parseNumber(j, "roofPitch", 15.0);

    if(j.contains("structuralConfig")) applyAdvice(p.cs, j.at("structuralConfig"));
    spdlog::info("[JSON] {} {} {}x{}x{} pitch {} overhang {} altitude {}", buildingTypeName(p.building),
                 roofTypeName(p.roof), p.W, p.D, p.H, p.pitchDeg, p.overhang, p.altitude);
    return p;
}

nlohmann::json loadJsonFile(const std::string& filename){
    spdlog::info("[JSON] parsing {}", filename);
    std::ifstream fin(filename);
    if(!fin) throw std::runtime_error("cannot open " + filename);
    std::stringstream buf; buf << fin.rdbuf();
    try{
        return nlohmann::json::parse(buf.str());
    }catch(const nlohmann::json::parse_error& e){
        spdlog::error("[JSON] parse {}: {}", filename, e.what());
        throw std::runtime_error("malformed JSON in " + filename);
    }
}

FrameParameters loadFrameInput(const std::string& inputFile, const std::string& adviceFile){
    FrameParameters p = parseFrameInput(loadJsonFile(inputFile));
    if(!adviceFile.empty()) applyAdvice(p.cs, loadJsonFile(adviceFile));
    return p;
}
