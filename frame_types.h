#pragma once
#include <clipper2/clipper.h>
#include <optional>
#include <string>
#include <vector>
using namespace Clipper2Lib;

// ───────── input ─────────
enum class RoofType { Gable, Shed, Flat };
enum class BuildingType { Carport, GardenHouse };

struct MiddlePurlin { double w = 0.0, h = 0.0; };

struct CrossSections {
    double postDim = 0.12;
    double beamW = 0.12;
    double beamH = 0.12;
    double tieBeamH = 0.14;      // shed cross member
    double rafterW = 0.08;
    double rafterH = 0.16;
    double braceDim = 0.10;
    double battenW = 0.06;
    double battenH = 0.08;
    double studD = 0.12;
    double middlePurlinW = 0.12;
    double middlePurlinH = 0.16;
    bool useMiddlePurlin = false;
    bool useKingPosts = true;
    int postsPerSide = 2;

    // empty unless the flag is set and the section is usable
    std::optional<MiddlePurlin> middlePurlin() const {
        if(!useMiddlePurlin || middlePurlinW <= 0 || middlePurlinH <= 0)
            return std::nullopt;
        return MiddlePurlin{middlePurlinW, middlePurlinH};
    }
};

struct FrameParameters {
    BuildingType building = BuildingType::Carport;
    double W = 5.0, D = 6.0, H = 3.0;
    RoofType roof = RoofType::Gable;
    double pitchDeg = 15.0;
    double overhang = 0.5;
    double altitude = 600.0;
    CrossSections cs;

    FrameParameters withSections(const CrossSections& next) const {
        FrameParameters p = *this;
        p.cs = next;
        return p;
    }
};

// ───────── drawing ─────────
enum class DimensionType { LinearHorizontal, LinearVertical, LinearAligned, Angular };

// Linear kinds use p1/p2/offset; angular uses center/p1/p2/radius.
struct Dimension {
    DimensionType type = DimensionType::LinearHorizontal;
    PointD p1, p2;
    PointD center;
    double offset = 0.0;
    double radius = 0.0;
    std::string label;
};

enum class MarkerOrientation { Vertical, Horizontal };

struct Marker {
    double position = 0.0;
    MarkerOrientation orientation = MarkerOrientation::Vertical;
    std::string text;
};

struct ReferenceLine {
    PointD p1, p2;
    bool dashed = true;
};

struct BBox { double minX = 0, maxX = 0, minY = 0, maxY = 0; };

struct DrawingInfo {
    PathD points;
    BBox bbox;
    double depth = 0.0;
    std::vector<Dimension> dimensions;
    std::vector<Marker> markers;
    std::vector<ReferenceLine> referenceLines;
};

// ───────── results ─────────
struct StaticsResult {
    double span = 0.0;
    double load = 0.0;                 // N/m
    std::optional<double> pointLoad;   // N
    double maxDeflection = 0.0;
    double allowedDeflection = 0.0;
    bool passed = false;
    double inertia = 0.0;
    double eModulus = 0.0;
    std::string formula;
    std::string formulaDescription;
};

struct CuttingBin {
    std::vector<double> cuts;   // sorted descending
    int count = 0;
};

struct CuttingPlan {
    double stockLength = 0.0;
    double kerf = 0.0;
    std::vector<CuttingBin> bins;
    std::vector<double> rejected;

    int stockCount() const {
        int n = 0;
        for(const auto& b : bins) n += b.count;
        return n;
    }
};

struct NominalSection { double width = 0, height = 0, length = 0; };

struct Part {
    std::string key;
    int quantity = 0;
    std::string description;
    std::optional<NominalSection> nominal;
    std::optional<DrawingInfo> drawing;
    std::optional<StaticsResult> statics;
    std::optional<CuttingPlan> cutting;
    std::vector<double> requiredCuts;   // battens, before optimisation
};

struct SummaryInfo {
    double timberVolume = 0.0;   // m³
    double timberWeight = 0.0;   // N
    double snowLoad = 0.0;       // N
    double totalLoad = 0.0;      // N
};

const char* roofTypeName(RoofType r);
const char* buildingTypeName(BuildingType b);
