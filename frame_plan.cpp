#include "frame_plan.h"
#include "cutting.h"
#include "frame_errors.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

double topPlateHeight(const CrossSections& cs){
    return cs.beamH > 0.1 ? cs.beamH : 0.12;
}

double topPlateWidth(const CrossSections& cs){
    return cs.beamW > 0.08 ? cs.beamW : 0.10;
}

std::string sectionDescription(const std::string& name, double w, double h, double length){
    return fmt::format("{} {:.1f}x{:.1f}cm, Länge: {:.1f}cm", name, w * 100, h * 100, length * 100);
}

Part makePart(const std::string& name, double w, double h, double length, int quantity,
              std::optional<DrawingInfo> drawing)
{
    Part p;
    p.quantity = quantity;
    p.description = sectionDescription(name, w, h, length);
    p.nominal = NominalSection{w, h, length};
    p.drawing = std::move(drawing);
    return p;
}

Part makeBattenPart(double w, double h, std::vector<double> cuts){
    Part p;
    p.quantity = 1;
    p.description = fmt::format("Traglatten {}x{}mm", std::lround(w * 1000), std::lround(h * 1000));
    p.nominal = NominalSection{w, h, 0.0};
    p.requiredCuts = std::move(cuts);
    return p;
}

void validateFrame(const FrameParameters& p){
    if(!(p.W > 0) || !(p.D > 0) || !(p.H > 0))
        throw ConstructionError(fmt::format("non-positive building size {}x{}x{}", p.W, p.D, p.H));
    if(!(p.pitchDeg >= 0) || p.pitchDeg >= 90)
        throw ConstructionError(fmt::format("roof pitch {}° out of range", p.pitchDeg));
    const double minDepth = std::max(p.cs.rafterW, 2 * STUD_THICKNESS);
    if(p.D <= minDepth)
        throw ConstructionError(fmt::format("depth {} leaves no rafter spacing (min {})", p.D, minDepth));
    if(p.overhang < 0)
        throw ConstructionError(fmt::format("negative roof overhang {}", p.overhang));
}

PartRegistry generatePlan(const FrameParameters& p){
    spdlog::info("[PLAN] {} {} W={} D={} H={} pitch={}°", buildingTypeName(p.building),
                 roofTypeName(p.roof), p.W, p.D, p.H, p.pitchDeg);
    if(p.building == BuildingType::GardenHouse)
        return generateGardenHousePlan(p);
    return generateCarportPlan(p);
}

void attachCuttingPlans(PartRegistry& parts, double stockLength, double kerf){
    for(auto& part : parts){
        if(part.requiredCuts.empty()) continue;
        CuttingPlan plan = optimizeCuttingList(part.requiredCuts, stockLength, kerf);
        const int stock = plan.stockCount();
        std::string desc = fmt::format("{} ({} x {:g}m Stangen)", part.description, stock, stockLength);
        std::string summary = cuttingSummary(plan);
        if(!summary.empty()) desc += "\n\n" + summary;
        part.description = std::move(desc);
        part.quantity = std::max(1, stock);
        if(part.nominal) part.nominal->length = stockLength;
        part.cutting = std::move(plan);
        part.requiredCuts.clear();
    }
}
