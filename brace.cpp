#include "brace.h"
#include "annotation.h"
#include "drawing.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

static BraceSolution degenerateBrace(double depth, const char* why){
    BraceSolution s;
    s.drawing = getDrawingInfo({}, depth);
    s.note = why;
    spdlog::info("[BRACE] degenerate: {}", why);
    return s;
}

BraceSolution solveBayBrace(double bayHeight, double bayWidth, double thickness,
                            double drawWidth, double depth)
{
    const double H = bayHeight, B = bayWidth, D = thickness;
    if(H < 0.01 || B < 0.01)
        return degenerateBrace(depth, "bay too small");
    if(D >= H)
        return degenerateBrace(depth, "brace thicker than bay height");

    const double C = H * H + B * B;
    const double E = H * H - D * D;
    const double radicand = B * B * D * D + C * E;
    if(radicand < 0 || C < 1e-9)
        return degenerateBrace(depth, "no real fitting angle");

    double arg = (B * D + std::sqrt(radicand)) / C;
    arg = std::max(-1.0, std::min(1.0, arg));
    const double alpha = std::asin(arg);
    const double cut = M_PI / 2.0 - alpha;
    const double cosv = std::cos(cut);
    if(std::abs(cosv) < 1e-9 || !std::isfinite(alpha))
        return degenerateBrace(depth, "cut angle undefined");
    const double tanv = std::tan(cut);

    BraceSolution s;
    s.degenerate = false;
    s.angleRad = alpha;
    s.cutAngleRad = cut;
    s.outerLength = H / cosv;

    const double w = drawWidth;
    PointD p1(0, 0);
    PointD p2(s.outerLength, 0);
    PointD p3(s.outerLength + w * tanv, w);
    PointD p4(w * tanv, w);
    s.tipLength = std::hypot(p3.x, p3.y);

    std::vector<Dimension> dims;
    std::vector<ReferenceLine> refs;
    dims.push_back(linearDim(DimensionType::LinearHorizontal, PointD(0, w), p3, 45,
                             "Länge: " + cmLabel(s.tipLength)));
    dims.push_back(linearDim(DimensionType::LinearVertical, p1, p4, -40, cmLabel(w)));

    const double sawDeg = 90.0 - alpha * 180.0 / M_PI;
    const std::string label = degLabel(sawDeg);
    constexpr double lineLen = 0.35, radius = 40;
    auto along = [&](const PointD& o, const PointD& to){
        double vx = to.x - o.x, vy = to.y - o.y;
        double mag = std::hypot(vx, vy);
        if(mag < 1e-6) return o;
        return PointD(o.x + vx / mag * lineLen, o.y + vy / mag * lineLen);
    };
    for(const auto& corner : {std::make_pair(p4, p1), std::make_pair(p3, p2)}){
        PointD c = corner.first;
        PointD perp(c.x, c.y - lineLen);
        PointD cutEnd = along(c, corner.second);
        refs.push_back({c, perp, true});
        refs.push_back({c, cutEnd, true});
        dims.push_back(angularDim(c, perp, cutEnd, radius, label));
    }

    s.drawing = getDrawingInfo({p1, p2, p3, p4}, depth, std::move(dims), {}, std::move(refs));
    s.note = fmt::format("H={:.1f}mm B={:.1f}mm D={:.1f}mm α={:.2f}° Schnitt={:.2f}°",
                         H * 1000, B * 1000, D * 1000, alpha * 180 / M_PI, cut * 180 / M_PI);
    return s;
}

MiteredBrace miteredBrace(double leg, double size){
    if(leg <= 0.01) leg = 0.1;
    MiteredBrace b;
    b.leg = leg;
    b.outerLength = std::sqrt(2.0) * leg;
    const double L = b.outerLength;

    PathD pts = { PointD(size, 0), PointD(L - size, 0), PointD(L, size), PointD(0, size) };
    PointD topLeft(0, size), topRight(L, size);
    std::vector<Dimension> dims = {
        linearDim(DimensionType::LinearHorizontal, topLeft, topRight, 45, "L: " + cmLabel(L)),
        linearDim(DimensionType::LinearVertical, topRight, PointD(L, 0), 45, cmLabel(size)),
    };
    std::vector<ReferenceLine> refs = {
        {topLeft, PointD(0, 0), true},
        {topLeft, PointD(size, 0), true},
        {topRight, PointD(L, 0), true},
        {topRight, PointD(L - size, 0), true},
    };
    dims.push_back(angularDim(topLeft, PointD(0, size - 1), PointD(1, size - 1), 25, "45°"));
    dims.push_back(angularDim(topRight, PointD(L, size - 1), PointD(L - 1, size - 1), 25, "45°"));
    b.drawing = getDrawingInfo(std::move(pts), size, std::move(dims), {}, std::move(refs));
    return b;
}

double mainBraceLeg(double postHeight, double beamH, double tieBeamLength, double postDim){
    return std::min({0.7,
                     std::max(0.1, postHeight - beamH - 0.1),
                     std::max(0.1, tieBeamLength / 2 - postDim / 2 - 0.1)});
}

double kingBraceLeg(double kingPostHeight){
    return std::min(0.7, std::max(0.1, kingPostHeight - 0.05));
}

double postBraceLeg(double postHeight){
    return std::min(0.7, std::max(0.1, postHeight - 0.1));
}

double shedBraceLeg(double postHeight, double beamH){
    return std::min(0.7, std::max(0.1, postHeight - beamH - 0.1));
}
