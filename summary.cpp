#include "summary.h"
#include "statics.h"
#include <regex>
#include <spdlog/spdlog.h>

static const std::regex SECTION_RE(R"((\d+\.\d+)x(\d+\.\d+)cm, Länge: (\d+\.\d+)cm)");
static const std::regex STOCK_RE(R"((\d+)x(\d+)mm)");
static const std::regex SPACES_RE(R"(\s+)");

std::optional<double> volumeFromDescription(const Part& part){
    const std::string text = std::regex_replace(part.description, SPACES_RE, " ");
    std::smatch m;
    if(part.cutting){
        if(!std::regex_search(text, m, STOCK_RE)) return std::nullopt;
        const double w = std::stod(m[1]) / 1000, h = std::stod(m[2]) / 1000;
        return w * h * part.cutting->stockLength * part.cutting->stockCount();
    }
    if(!std::regex_search(text, m, SECTION_RE)) return std::nullopt;
    return std::stod(m[1]) / 100 * std::stod(m[2]) / 100 * std::stod(m[3]) / 100;
}

SummaryInfo computeSummary(const PartRegistry& parts, const FrameParameters& p){
    SummaryInfo s;
    for(const auto& part : parts){
        auto v = volumeFromDescription(part);
        if(!v){
            spdlog::info("[PLAN] no volume for {}", part.key);
            continue;
        }
        // cutting-plan volume already covers every stock bar
        s.timberVolume += part.cutting ? *v : *v * part.quantity;
    }
    s.timberWeight = s.timberVolume * TIMBER_MASS_DENSITY * GRAVITY;
    s.snowLoad = snowLoadGround(p.altitude) * p.W * p.D;
    s.totalLoad = s.timberWeight + s.snowLoad;
    return s;
}
