#pragma once
#include <optional>
#include <string>
#include "frame_types.h"
#include "part_registry.h"

constexpr double E_MODULUS = 11e9;              // N/m², C24 timber
constexpr double WOOD_WEIGHT_DENSITY = 4900.0;  // N/m³
constexpr double MIN_STATIC_SPAN = 0.1;
constexpr double SPAN_LIMIT = 300.0;
constexpr double CANTILEVER_LIMIT = 150.0;

double snowLoadGround(double altitude);   // N/m²
double rectInertia(double w, double h);

double deflectionUniform(double q, double L, double E, double I);     // 5qL⁴/384EI
double deflectionPointMid(double P, double L, double E, double I);    // PL³/48EI
double deflectionCantilever(double q, double L, double E, double I);  // qL⁴/8EI

// Simply supported member under UDL, allowed L/300.
StaticsResult simplySupportedCheck(double span, double q, double I, double E = E_MODULUS);

// Inner span (L/300) and cantilever tip (L/150) under the same UDL; the
// case with the higher utilisation is reported, passed requires both.
StaticsResult spanWithCantileverCheck(double innerSpan, double cantilever, double q,
                                      double I, double E = E_MODULUS);

enum class MemberClass { None, Rafter, CeilingJoist, TieBeam, Purlin, CantileverBeam };

MemberClass classifyMember(const std::string& key, BuildingType building);

class StaticsEngine {
public:
    explicit StaticsEngine(const FrameParameters& p);

    // Empty for parts that carry no structural check.
    std::optional<StaticsResult> evaluate(const Part& part) const;
    // Attaches results in place; returns the number of failing parts.
    int apply(PartRegistry& parts) const;

    double roofLoad() const { return roofLoad_; }
    double rafterSpacing() const { return rafterSpacing_; }

private:
    StaticsResult rafter() const;
    std::optional<StaticsResult> ceilingJoist() const;
    std::optional<StaticsResult> tieBeam(const std::string& key) const;
    std::optional<StaticsResult> purlin(const std::string& key) const;
    StaticsResult cantileverBeam(const std::string& key) const;

    FrameParameters p_;
    std::optional<MiddlePurlin> middle_;
    double cosA_;
    double rafterSpacing_;
    double roofLoad_;
    double topPlateW_, topPlateH_;
};
