#pragma once
#include <optional>
#include "frame_types.h"

// Rafter underside for a gable roof: y = −tan·(|x| − plateInnerX) + plateTopY.
struct GableRoofLine {
    double tanA = 0.0;
    double plateInnerX = 0.0;
    double plateTopY = 0.0;

    GableRoofLine(double pitchDeg, double plateInnerX, double plateTopY);
    double bottom(double x) const;
    // Ridge seat height after cutting a notch of rafterH/3 into the underside.
    double ridgeSeatY(double ridgeHalfWidth, double rafterH) const;
};

// Rafter underside for a shed roof: high purlin at x = −W/2, seat at wall height.
struct ShedRoofLine {
    double slope = 0.0;
    double C = 0.0;

    ShedRoofLine(double W, double beamW, double H, double pitchDeg);
    double underside(double x) const { return slope * x + C; }
};

struct PurlinSeat {
    double centerX = 0.0;
    double width = 0.0;
    double height = 0.0;
    double seatY = 0.0;
};

struct RafterKeyPoints {
    PointD ridgeTop, tailTop, tailBottom;
    PointD heelBottom, heelTop, seatInner;
    PointD ridgeNotchOuterBottom, ridgeNotchOuterTop, ridgeNotchInner;
    std::optional<PointD> purlinSeatStart, purlinSeatEnd;
    std::optional<PointD> purlinPlumbStartBottom, purlinPlumbEndBottom;
};

struct RafterProfile {
    PathD points;
    RafterKeyPoints keys;
    double totalLength = 0.0;
};

// Right-hand gable rafter; x is measured from the ridge axis.
struct GableRafterGeometry {
    double plateOuterX = 0.0;
    double plateInnerX = 0.0;
    double plateTopY = 0.0;
    double ridgeHalfWidth = 0.0;
    double rafterH = 0.0;
    double pitchDeg = 0.0;
    double overhang = 0.0;
};

RafterProfile gableRafterProfile(const GableRafterGeometry& g,
                                 const std::optional<PurlinSeat>& purlin);

RafterProfile shedRafterProfile(double W, double beamW, double rafterH, double H,
                                double overhang, double pitchDeg,
                                const std::optional<PurlinSeat>& purlin);

// Cut drawing in the rafter's own frame with all joinery call-outs.
DrawingInfo annotateRafter(const RafterProfile& rafter, double rafterW,
                           double rafterH, double pitchDeg);
