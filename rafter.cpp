#include "rafter.h"
#include "annotation.h"
#include "drawing.h"
#include <cmath>
#include <spdlog/spdlog.h>

static constexpr double DEDUP_EPS = 1e-6;

static double rad(double deg){ return deg * M_PI / 180.0; }

GableRoofLine::GableRoofLine(double pitchDeg, double inner, double top)
    : tanA(std::tan(rad(pitchDeg))), plateInnerX(inner), plateTopY(top) {}

double GableRoofLine::bottom(double x) const {
    return -tanA * (std::abs(x) - plateInnerX) + plateTopY;
}

double GableRoofLine::ridgeSeatY(double ridgeHalfWidth, double rafterH) const {
    return bottom(ridgeHalfWidth) + rafterH / 3.0;
}

ShedRoofLine::ShedRoofLine(double W, double beamW, double H, double pitchDeg){
    slope = -std::tan(rad(pitchDeg));
    double highRefX = -W / 2 - beamW / 2;
    C = H - slope * highRefX;
}

static PathD dedup(const PathD& raw){
    return StripNearEqual(raw, DEDUP_EPS * DEDUP_EPS, false);
}

RafterProfile gableRafterProfile(const GableRafterGeometry& g,
                                 const std::optional<PurlinSeat>& purlin)
{
    GableRoofLine line(g.pitchDeg, g.plateInnerX, g.plateTopY);
    const double slopeHeight = g.rafterH / std::cos(rad(g.pitchDeg));
    auto top = [&](double x){ return line.bottom(x) + slopeHeight; };
    const double xTail = g.plateOuterX + g.overhang;
    const double ridgeSeat = line.ridgeSeatY(g.ridgeHalfWidth, g.rafterH);

    RafterProfile r;
    RafterKeyPoints& k = r.keys;
    k.ridgeTop   = PointD(0, top(g.ridgeHalfWidth));
    k.tailTop    = PointD(xTail, top(xTail));
    k.tailBottom = PointD(xTail, line.bottom(xTail));
    k.heelBottom = PointD(g.plateOuterX, line.bottom(g.plateOuterX));
    k.heelTop    = PointD(g.plateOuterX, g.plateTopY);
    k.seatInner  = PointD(g.plateInnerX, g.plateTopY);
    k.ridgeNotchOuterBottom = PointD(g.ridgeHalfWidth, line.bottom(g.ridgeHalfWidth));
    k.ridgeNotchOuterTop    = PointD(g.ridgeHalfWidth, ridgeSeat);
    k.ridgeNotchInner       = PointD(0, ridgeSeat);

    PathD raw = { k.ridgeTop, k.tailTop, k.tailBottom, k.heelBottom, k.heelTop, k.seatInner };
    if(purlin){
        double xIn = purlin->centerX - purlin->width / 2;
        double xOut = purlin->centerX + purlin->width / 2;
        k.purlinPlumbStartBottom = PointD(xIn, line.bottom(xIn));
        k.purlinSeatStart = PointD(xIn, purlin->seatY);
        k.purlinSeatEnd = PointD(xOut, purlin->seatY);
        k.purlinPlumbEndBottom = PointD(xOut, line.bottom(xOut));
        raw.push_back(*k.purlinPlumbEndBottom);
        raw.push_back(*k.purlinSeatEnd);
        raw.push_back(*k.purlinSeatStart);
        raw.push_back(*k.purlinPlumbStartBottom);
    }
    raw.push_back(k.ridgeNotchOuterBottom);
    raw.push_back(k.ridgeNotchOuterTop);
    raw.push_back(k.ridgeNotchInner);

    r.points = dedup(raw);
    r.totalLength = std::hypot(k.tailBottom.x - k.ridgeTop.x, k.tailBottom.y - k.ridgeTop.y);
    return r;
}

RafterProfile shedRafterProfile(double W, double beamW, double rafterH, double H,
                                double overhang, double pitchDeg,
                                const std::optional<PurlinSeat>& purlin)
{
    ShedRoofLine line(W, beamW, H, pitchDeg);
    const double slopeHeight = rafterH / std::cos(rad(pitchDeg));
    auto top = [&](double x){ return line.underside(x) + slopeHeight; };

    const double highX = -W / 2, lowX = W / 2;
    const double highSeat = H;
    const double lowSeat = line.underside(lowX - beamW / 2);
    const double highInner = highX + beamW / 2, highOuter = highX - beamW / 2;
    const double lowInner = lowX - beamW / 2, lowOuter = lowX + beamW / 2;
    const double endHigh = highOuter - overhang, endLow = lowOuter + overhang;

    // high end plays the ridge role, low end the tail role
    RafterProfile r;
    RafterKeyPoints& k = r.keys;
    k.ridgeTop   = PointD(endHigh, top(endHigh));
    k.tailTop    = PointD(endLow, top(endLow));
    k.tailBottom = PointD(endLow, line.underside(endLow));
    k.heelBottom = PointD(lowOuter, line.underside(lowOuter));
    k.heelTop    = PointD(lowOuter, lowSeat);
    k.seatInner  = PointD(lowInner, lowSeat);
    k.ridgeNotchOuterBottom = PointD(highOuter, line.underside(highOuter));
    k.ridgeNotchOuterTop    = PointD(highOuter, highSeat);
    k.ridgeNotchInner       = PointD(highInner, highSeat);

    // underside walked from the high end to the low end
    PathD bottom = { k.ridgeNotchInner, k.ridgeNotchOuterTop, k.ridgeNotchOuterBottom };
    if(purlin){
        double xIn = purlin->centerX - purlin->width / 2;
        double xOut = purlin->centerX + purlin->width / 2;
        k.purlinSeatStart = PointD(xIn, purlin->seatY);
        k.purlinSeatEnd = PointD(xOut, purlin->seatY);
        k.purlinPlumbStartBottom = PointD(xIn, line.underside(xIn));
        k.purlinPlumbEndBottom = PointD(xOut, line.underside(xOut));
        bottom.push_back(*k.purlinPlumbStartBottom);
        bottom.push_back(*k.purlinSeatStart);
        bottom.push_back(*k.purlinSeatEnd);
        bottom.push_back(*k.purlinPlumbEndBottom);
    }
    bottom.push_back(k.seatInner);
    bottom.push_back(k.heelTop);
    bottom.push_back(k.heelBottom);

    PathD raw = { k.ridgeTop, k.tailTop, k.tailBottom };
    raw.insert(raw.end(), bottom.rbegin(), bottom.rend());

    r.points = dedup(raw);
    r.totalLength = std::hypot(k.tailBottom.x - k.ridgeTop.x, k.tailBottom.y - k.ridgeTop.y);
    return r;
}

static double dist(const PointD& a, const PointD& b){
    return std::hypot(b.x - a.x, b.y - a.y);
}

DrawingInfo annotateRafter(const RafterProfile& rafter, double rafterW,
                           double rafterH, double pitchDeg)
{
    const RafterKeyPoints& k = rafter.keys;
    LocalFrame frame(k.ridgeTop, k.tailTop);
    Annotator a(frame);
    const double rot = frame.rotation();
    const std::string plumb = degLabel(90.0 - pitchDeg);

    a.cutAngle(k.ridgeNotchOuterTop, plumb, PointD(0, -1), PointD(std::sin(rot), -std::cos(rot)), 70);
    a.cutAngle(k.tailTop, plumb, PointD(0, 1), PointD(-std::sin(rot), std::cos(rot)), 70);

    // birdsmouth: heel (plumb) and seat (level) cuts
    const PointD plumbUpLeft(std::sin(rot), -std::cos(rot));
    const PointD seatUpRight(std::cos(rot), std::sin(rot));
    a.cutAngle(k.heelTop, plumb, PointD(0, -1), plumbUpLeft);
    a.cutAngle(k.seatInner, degLabel(pitchDeg), PointD(1, 0), seatUpRight);
    a.cutAngle(k.heelTop, degLabel(90.0), plumbUpLeft, seatUpRight);

    a.aligned(k.ridgeNotchInner, k.ridgeNotchOuterTop, 40,
              cmLabel(std::abs(k.ridgeNotchOuterTop.x - k.ridgeNotchInner.x)));
    a.aligned(k.ridgeNotchOuterTop, k.ridgeNotchOuterBottom, 40,
              cmLabel(std::abs(k.ridgeNotchOuterTop.y - k.ridgeNotchOuterBottom.y)));
    a.aligned(k.seatInner, k.heelTop, 40, cmLabel(dist(k.seatInner, k.heelTop)));
    a.aligned(k.heelTop, k.heelBottom, -40, cmLabel(dist(k.heelTop, k.heelBottom)));
    if(k.purlinSeatStart && k.purlinSeatEnd && k.purlinPlumbStartBottom){
        a.aligned(*k.purlinSeatStart, *k.purlinSeatEnd, 40, cmLabel(dist(*k.purlinSeatStart, *k.purlinSeatEnd)));
        a.aligned(*k.purlinSeatStart, *k.purlinPlumbStartBottom, -40,
                  cmLabel(dist(*k.purlinSeatStart, *k.purlinPlumbStartBottom)));
    }
    a.horizontal(k.ridgeTop, k.tailBottom, -110, "Länge: " + cmLabel(rafter.totalLength));

    PathD local;
    local.reserve(rafter.points.size());
    for(const auto& p : rafter.points) local.push_back(frame.toLocal(p));
    if(!isSimplePolygon(local))
        spdlog::warn("[PLAN] rafter profile self-intersects (pitch {}°)", pitchDeg);

    DrawingInfo d = getDrawingInfo(std::move(local), rafterW, std::move(a.dimensions()),
                                   {}, std::move(a.referenceLines()));
    d.dimensions.push_back(linearDim(DimensionType::LinearVertical,
                                     PointD(d.bbox.minX, d.bbox.minY), PointD(d.bbox.minX, d.bbox.maxY),
                                     -55, cmLabel(rafterH)));
    return d;
}
