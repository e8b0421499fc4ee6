#include "statics.h"
#include "frame_plan.h"
#include "layout.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#ifdef _OPENMP
#include <omp.h>
#endif

static const char* F_UDL = "w = (5 · q · L⁴) / (384 · E · I)";
static const char* F_UDL_PERP = "w = (5 · q⟂ · L⁴) / (384 · E · I)";
static const char* F_CANTILEVER = "w = (q · L⁴) / (8 · E · I)";

double snowLoadGround(double altitude){
    return (altitude / 500.0 + 0.4) * 0.8 * 1000.0;
}

double rectInertia(double w, double h){
    return w * h * h * h / 12.0;
}

double deflectionUniform(double q, double L, double E, double I){
    return 5.0 * q * std::pow(L, 4) / (384.0 * E * I);
}

double deflectionPointMid(double P, double L, double E, double I){
    return P * std::pow(L, 3) / (48.0 * E * I);
}

double deflectionCantilever(double q, double L, double E, double I){
    return q * std::pow(L, 4) / (8.0 * E * I);
}

StaticsResult simplySupportedCheck(double span, double q, double I, double E){
    StaticsResult r;
    r.span = span;
    r.load = q;
    r.inertia = I;
    r.eModulus = E;
    r.maxDeflection = deflectionUniform(q, span, E, I);
    r.allowedDeflection = span / SPAN_LIMIT;
    r.passed = r.maxDeflection <= r.allowedDeflection;
    r.formula = F_UDL;
    r.formulaDescription = "Berechnung der Durchbiegung (w) eines Balkens unter Gleichlast (q).";
    return r;
}

StaticsResult spanWithCantileverCheck(double innerSpan, double cantilever, double q,
                                      double I, double E)
{
    const double allowedInner = innerSpan / SPAN_LIMIT;
    const double wInner = deflectionUniform(q, innerSpan, E, I);
    const bool innerOk = wInner <= allowedInner;

    double wCant = 0.0, allowedCant = std::numeric_limits<double>::infinity();
    bool cantOk = true;
    if(cantilever > 0){
        allowedCant = cantilever / CANTILEVER_LIMIT;
        wCant = deflectionCantilever(q, cantilever, E, I);
        cantOk = wCant <= allowedCant;
    }
    const bool cantileverGoverns = cantilever > 0 && wCant / allowedCant > wInner / allowedInner;

    StaticsResult r;
    r.load = q;
    r.inertia = I;
    r.eModulus = E;
    r.passed = innerOk && cantOk;
    if(cantileverGoverns){
        r.span = cantilever;
        r.maxDeflection = wCant;
        r.allowedDeflection = allowedCant;
        r.formula = F_CANTILEVER;
        r.formulaDescription = fmt::format(
            "Kritischer Punkt: Auskragung ({:.0f}cm).\nDurchbiegung (w) für Kragarm unter Gleichlast (q).",
            cantilever * 100);
    }else{
        r.span = innerSpan;
        r.maxDeflection = wInner;
        r.allowedDeflection = allowedInner;
        r.formula = F_UDL;
        r.formulaDescription = fmt::format(
            "Kritischer Punkt: Innenfeld ({:.0f}cm).\nDurchbiegung (w) eines Balkens unter Gleichlast (q).",
            innerSpan * 100);
    }
    return r;
}

static bool has(const std::string& key, const char* s){
    return key.find(s) != std::string::npos;
}

MemberClass classifyMember(const std::string& key, BuildingType building){
    if(building == BuildingType::GardenHouse && (key == "top_plate_d" || key == "ridge_beam"))
        return MemberClass::CantileverBeam;
    if(has(key, "rafter")) return MemberClass::Rafter;
    if(key == "ceiling_joist") return MemberClass::CeilingJoist;
    if(has(key, "tie_beam") || has(key, "cross_member")) return MemberClass::TieBeam;
    if(has(key, "plate") || has(key, "purlin") || has(key, "beam")) return MemberClass::Purlin;
    return MemberClass::None;
}

// ───────── engine ─────────
StaticsEngine::StaticsEngine(const FrameParameters& p)
    : p_(p)
{
    const CrossSections& cs = p_.cs;
    // middle purlins exist on carports only
    if(p_.building == BuildingType::Carport) middle_ = cs.middlePurlin();
    cosA_ = std::cos(p_.pitchDeg * M_PI / 180.0);
    RafterLayout rl = rafterLayout(p_.D, cs.rafterW);
    rafterSpacing_ = rl.spacing;
    roofLoad_ = snowLoadGround(p_.altitude);
    if(rafterSpacing_ > 0)
        roofLoad_ += cs.rafterW * cs.rafterH * WOOD_WEIGHT_DENSITY / rafterSpacing_;
    topPlateW_ = topPlateWidth(cs);
    topPlateH_ = topPlateHeight(cs);
}

std::optional<StaticsResult> StaticsEngine::evaluate(const Part& part) const {
    switch(classifyMember(part.key, p_.building)){
    case MemberClass::CantileverBeam: return cantileverBeam(part.key);
    case MemberClass::Rafter: {
        StaticsResult r = rafter();
        if(r.span <= MIN_STATIC_SPAN) return std::nullopt;
        return r;
    }
    case MemberClass::CeilingJoist: return ceilingJoist();
    case MemberClass::TieBeam: return tieBeam(part.key);
    case MemberClass::Purlin: return purlin(part.key);
    case MemberClass::None: break;
    }
    return std::nullopt;
}

StaticsResult StaticsEngine::rafter() const {
    const CrossSections& cs = p_.cs;
    double span;
    if(p_.roof == RoofType::Gable){
        double horizontal = p_.W / 2 - cs.beamW / 2;
        span = (middle_ ? horizontal / 2 : horizontal) / cosA_;
    }else{
        span = (middle_ ? p_.W / 2 : p_.W) / cosA_;
    }
    const double self = cs.rafterW * cs.rafterH * WOOD_WEIGHT_DENSITY;
    const double total = self + roofLoad_ * rafterSpacing_ * cosA_;
    const double perp = total * cosA_;
    StaticsResult r = simplySupportedCheck(span, perp, rectInertia(cs.rafterW, cs.rafterH));
    r.formula = F_UDL_PERP;
    r.formulaDescription = "Berechnung der Durchbiegung (w) für Gleichlast (q) senkrecht zum Bauteil.";
    return r;
}

// UDL from self-weight plus an optional midspan reaction from a post.
static StaticsResult selfWeightWithPointLoad(double span, double w, double h, double P, const char* source){
    const double I = rectInertia(w, h);
    const double q = w * h * WOOD_WEIGHT_DENSITY;
    StaticsResult r;
    r.span = span;
    r.load = q;
    r.inertia = I;
    r.eModulus = E_MODULUS;
    r.maxDeflection = deflectionUniform(q, span, E_MODULUS, I);
    if(P > 0){
        r.pointLoad = P;
        r.maxDeflection += deflectionPointMid(P, span, E_MODULUS, I);
    }
    r.allowedDeflection = span / SPAN_LIMIT;
    r.passed = r.maxDeflection <= r.allowedDeflection;
    if(P > 0){
        r.formula = "w_ges = w(q) + w(P)";
        r.formulaDescription = fmt::format(
            "Gesamtdurchbiegung aus Eigengewicht (q) und Punktlast (P) von {}.\n"
            "w(q) = (5·q·L⁴)/(384·E·I)\nw(P) = (P·L³)/(48·E·I)", source);
    }else{
        r.formula = "w_ges = w(q)";
        r.formulaDescription = "Gesamtdurchbiegung aus Eigengewicht (q).\nw(q) = (5·q·L⁴)/(384·E·I)";
    }
    return r;
}

std::optional<StaticsResult> StaticsEngine::ceilingJoist() const {
    const CrossSections& cs = p_.cs;
    const double span = p_.W - 2 * topPlateW_;
    if(span <= MIN_STATIC_SPAN) return std::nullopt;
    double P = 0.0;
    if(p_.roof == RoofType::Gable){
        double ridgeSpan = p_.W / 2 - topPlateW_;
        double area = (middle_ ? ridgeSpan / 2 : ridgeSpan) * rafterSpacing_;
        P = roofLoad_ * area + cs.beamW * cs.beamH * WOOD_WEIGHT_DENSITY * rafterSpacing_;
    }
    return selfWeightWithPointLoad(span, cs.rafterW, topPlateH_, P, "First-Stütze");
}

std::optional<StaticsResult> StaticsEngine::tieBeam(const std::string& key) const {
    const CrossSections& cs = p_.cs;
    const double span = p_.W - cs.postDim;
    if(span <= MIN_STATIC_SPAN) return std::nullopt;
    const double h = has(key, "cross_member") ? cs.tieBeamH : cs.beamH;

    const int n = std::max(2, cs.postsPerSide);
    const double postSpacing = (p_.D - 2 * p_.overhang) / (n - 1);
    double P = 0.0;
    if(p_.roof == RoofType::Gable){
        double ridgeSpan = p_.W / 2 - cs.beamW / 2;
        double area = (middle_ ? ridgeSpan / 2 : ridgeSpan) * postSpacing;
        P = roofLoad_ * area + cs.beamW * cs.beamH * WOOD_WEIGHT_DENSITY * postSpacing;
    }else if(middle_){
        double area = p_.W / 2 * postSpacing;
        P = roofLoad_ * area + middle_->w * middle_->h * WOOD_WEIGHT_DENSITY * postSpacing;
    }
    return selfWeightWithPointLoad(span, cs.beamW, h, P, "Stütze");
}

std::optional<StaticsResult> StaticsEngine::purlin(const std::string& key) const {
    if(p_.building != BuildingType::Carport) return std::nullopt;   // no post grid
    const CrossSections& cs = p_.cs;
    double w = cs.beamW, h = cs.beamH;
    if(has(key, "middle") && middle_){
        w = middle_->w;
        h = middle_->h;
    }
    const int n = std::max(2, cs.postsPerSide);
    const double span = (p_.D - 2 * p_.overhang) / (n - 1);
    if(span <= MIN_STATIC_SPAN) return std::nullopt;

    double tributary = 0.0;
    if(p_.roof == RoofType::Gable){
        double rs = p_.W / 2 - cs.beamW / 2;
        if(has(key, "side_plate"))
            tributary = (middle_ ? rs / 4 : rs / 2) + p_.overhang;
        else if(has(key, "middle_purlin"))
            tributary = rs / 2;
        else if(has(key, "ridge_beam"))
            tributary = middle_ ? rs / 4 : rs / 2;
    }else{
        double rs = p_.W - cs.beamW;
        if(has(key, "purlin_high") || has(key, "purlin_low"))
            tributary = (middle_ ? rs / 4 : rs / 2) + p_.overhang;
        else if(has(key, "middle_purlin_pult"))
            tributary = rs / 2;
    }
    double q = w * h * WOOD_WEIGHT_DENSITY;
    if(tributary > 0) q += roofLoad_ * tributary;
    return simplySupportedCheck(span, q, rectInertia(w, h));
}

StaticsResult StaticsEngine::cantileverBeam(const std::string& key) const {
    const CrossSections& cs = p_.cs;
    double w, h, inner, tributary;
    const double rafterHorizontal = p_.W / 2;
    if(key == "top_plate_d"){
        w = topPlateW_;
        h = topPlateH_;
        StudLayout side = calculateStudLayout(p_.D, STUD_THICKNESS, DEFAULT_STUD_SPACING);
        inner = *std::max_element(side.spacings.begin(), side.spacings.end());
        tributary = middle_ ? rafterHorizontal / 4 : rafterHorizontal / 2;
    }else{
        // ridge beam carried by the gable walls
        w = cs.beamW;
        h = cs.beamH;
        inner = p_.D;
        tributary = middle_ ? rafterHorizontal / 2 : rafterHorizontal;
    }
    double cantilever = p_.overhang < 0.1 ? 0.0 : p_.overhang;
    double q = roofLoad_ * tributary + w * h * WOOD_WEIGHT_DENSITY;
    return spanWithCantileverCheck(inner, cantilever, q, rectInertia(w, h));
}

int StaticsEngine::apply(PartRegistry& registry) const {
    std::vector<Part>& parts = registry.parts();
    const int n = int(parts.size());
    int failed = 0;
#ifdef _OPENMP
#pragma omp parallel for reduction(+:failed) schedule(static)
#endif
    for(int i = 0; i < n; ++i){
        auto r = evaluate(parts[i]);
        if(!r) continue;
        if(!r->passed) ++failed;
        parts[i].statics = std::move(*r);
    }
    for(const auto& part : parts){
        if(part.statics && !part.statics->passed)
            spdlog::info("[STATICS] {} fails: w={:.2f}mm > {:.2f}mm (L={:.2f}m)", part.key,
                         part.statics->maxDeflection * 1000, part.statics->allowedDeflection * 1000,
                         part.statics->span);
    }
    return failed;
}
