#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <cmath>
#include "annotation.h"
#include "drawing.h"
#include "rafter.h"

static GableRafterGeometry carportGeometry(){
    // W=5, beam 0.12, H=3
    return {2.56, 2.44, 3.0, 0.06, 0.16, 15.0, 0.5};
}

TEST_CASE("gable roof line") {
    GableRoofLine line(15.0, 2.44, 3.0);
    REQUIRE(line.bottom(2.44) == Approx(3.0));
    REQUIRE(line.bottom(-1.0) == Approx(line.bottom(1.0)));
    REQUIRE(line.bottom(0.0) > line.bottom(1.0));
    REQUIRE(line.ridgeSeatY(0.06, 0.15) == Approx(line.bottom(0.06) + 0.05));
}

TEST_CASE("shed roof line") {
    ShedRoofLine line(5.0, 0.12, 3.0, 15.0);
    REQUIRE(line.underside(-2.56) == Approx(3.0));
    REQUIRE(line.underside(2.44) < 3.0);
}

TEST_CASE("gable rafter profile is simple") {
    RafterProfile r = gableRafterProfile(carportGeometry(), std::nullopt);
    REQUIRE(r.points.size() >= 8);
    REQUIRE(isSimplePolygon(r.points));
    REQUIRE(r.totalLength > 3.06);
    REQUIRE(r.keys.seatInner.y == Approx(3.0));
    REQUIRE_FALSE(r.keys.purlinSeatStart);
}

TEST_CASE("gable rafter with purlin seat") {
    GableRoofLine line(15.0, 2.44, 3.0);
    PurlinSeat seat{1.25, 0.12, 0.16, line.bottom(1.19)};
    RafterProfile r = gableRafterProfile(carportGeometry(), seat);
    REQUIRE(r.keys.purlinSeatStart);
    REQUIRE(r.keys.purlinSeatStart->x == Approx(1.19));
    REQUIRE(r.keys.purlinSeatEnd->x == Approx(1.31));
    REQUIRE(isSimplePolygon(r.points));
}

TEST_CASE("shed rafter profile is simple") {
    RafterProfile r = shedRafterProfile(5.0, 0.12, 0.16, 3.0, 0.5, 15.0, std::nullopt);
    REQUIRE(isSimplePolygon(r.points));
    REQUIRE(r.keys.ridgeTop.x < r.keys.tailTop.x);
    REQUIRE(r.totalLength > 6.0);

    ShedRoofLine line(5.0, 0.12, 3.0, 15.0);
    PurlinSeat seat{0.0, 0.12, 0.16, line.underside(-0.06)};
    RafterProfile p = shedRafterProfile(5.0, 0.12, 0.16, 3.0, 0.5, 15.0, seat);
    REQUIRE(isSimplePolygon(p.points));
}

TEST_CASE("rafter annotation") {
    RafterProfile r = gableRafterProfile(carportGeometry(), std::nullopt);
    DrawingInfo d = annotateRafter(r, 0.08, 0.16, 15.0);
    REQUIRE(d.depth == Approx(0.08));
    REQUIRE(d.points.size() == r.points.size());
    bool length = false;
    int angular = 0;
    for(const auto& dim : d.dimensions){
        if(dim.label.rfind("Länge:", 0) == 0) length = true;
        if(dim.type == DimensionType::Angular){
            ++angular;
            REQUIRE(std::abs(angularSweep(dim)) <= M_PI);
        }
    }
    REQUIRE(length);
    REQUIRE(angular > 0);
    REQUIRE_FALSE(d.referenceLines.empty());

    double minX = 1e9, maxX = -1e9;
    for(const auto& p : d.points){ minX = std::min(minX, p.x); maxX = std::max(maxX, p.x); }
    REQUIRE(d.bbox.minX == Approx(minX));
    REQUIRE(d.bbox.maxX == Approx(maxX));
}

TEST_CASE("rafter cut angle labels") {
    RafterProfile r = gableRafterProfile(carportGeometry(), std::nullopt);
    DrawingInfo d = annotateRafter(r, 0.08, 0.16, 15.0);
    int plumb = 0, seat = 0, square = 0, other = 0;
    for(const auto& dim : d.dimensions){
        if(dim.type != DimensionType::Angular) continue;
        if(dim.label == "75.0°") ++plumb;
        else if(dim.label == "15.0°") ++seat;
        else if(dim.label == "90.0°") ++square;
        else ++other;
    }
    // ridge notch, tail and heel are plumb cuts
    REQUIRE(plumb == 3);
    REQUIRE(seat == 1);
    REQUIRE(square == 1);
    REQUIRE(other == 0);

    DrawingInfo steep = annotateRafter(gableRafterProfile({2.56, 2.44, 3.0, 0.06, 0.16, 35.0, 0.5}, std::nullopt),
                                       0.08, 0.16, 35.0);
    int steepPlumb = 0;
    for(const auto& dim : steep.dimensions)
        if(dim.type == DimensionType::Angular && dim.label == "55.0°") ++steepPlumb;
    REQUIRE(steepPlumb == 3);
}

TEST_CASE("angular sweep takes the smaller arc") {
    Dimension a = angularDim(PointD(0, 0), PointD(1, 0), PointD(0, 1), 40, "90°");
    REQUIRE(angularSweep(a) == Approx(M_PI / 2));
    Dimension b = angularDim(PointD(0, 0), PointD(1, 0), PointD(0, -1), 40, "90°");
    REQUIRE(angularSweep(b) == Approx(-M_PI / 2));
    Dimension c = angularDim(PointD(1, 1), PointD(2, 1), PointD(0, 1.1), 40, "");
    REQUIRE(std::abs(angularSweep(c)) <= M_PI);
}

TEST_CASE("local frame") {
    LocalFrame f(PointD(1, 2), PointD(3, 2));
    PointD o = f.toLocal(PointD(1, 2));
    REQUIRE(o.x == Approx(0).margin(1e-12));
    REQUIRE(o.y == Approx(0).margin(1e-12));
    PointD a = f.toLocal(PointD(2, 2));
    REQUIRE(a.x == Approx(1));
    REQUIRE(a.y == Approx(0).margin(1e-12));
    REQUIRE(f.toLocal(PointD(1, 3)).y == Approx(-1));
}

TEST_CASE("labels") {
    REQUIRE(cmLabel(0.123) == "12.3cm");
    REQUIRE(degLabel(75) == "75.0°");
}

TEST_CASE("simple polygon check") {
    PathD square = { PointD(0, 0), PointD(1, 0), PointD(1, 1), PointD(0, 1) };
    REQUIRE(isSimplePolygon(square));
    PathD bow = { PointD(0, 0), PointD(1, 1), PointD(1, 0), PointD(0, 1) };
    REQUIRE_FALSE(isSimplePolygon(bow));
    REQUIRE_FALSE(isSimplePolygon(PathD{ PointD(0, 0), PointD(1, 1) }));
}
