#pragma once
#include <string>
#include <vector>
#include "frame_types.h"

std::string cmLabel(double meters);     // 0.123 -> "12.3cm"
std::string degLabel(double degrees);   // 75 -> "75.0°"

Dimension linearDim(DimensionType type, PointD p1, PointD p2, double offset, std::string label);
Dimension angularDim(PointD center, PointD p1, PointD p2, double radius, std::string label);

// Signed arc sweep in radians from p1 to p2 around center (the smaller arc).
double angularSweep(const Dimension& d);

// Drawing-local frame: origin at the pivot, x along the part's top edge,
// y flipped so that +y points down into the part.
class LocalFrame {
public:
    LocalFrame(const PointD& pivot, const PointD& along);
    PointD toLocal(const PointD& world) const;
    double rotation() const { return rot_; }
private:
    PointD pivot_;
    double rot_, sin_, cos_;
};

class Annotator {
public:
    explicit Annotator(const LocalFrame& frame) : frame_(frame) {}

    // v1/v2 are unit directions in drawing coordinates (+y down).
    void cutAngle(const PointD& cornerWorld, const std::string& label,
                  const PointD& v1, const PointD& v2, double radius = 45);
    void aligned(const PointD& a, const PointD& b, double offset, const std::string& label);
    void horizontal(const PointD& a, const PointD& b, double offset, const std::string& label);

    const LocalFrame& frame() const { return frame_; }
    std::vector<Dimension>& dimensions() { return dims_; }
    std::vector<ReferenceLine>& referenceLines() { return refs_; }

private:
    LocalFrame frame_;
    std::vector<Dimension> dims_;
    std::vector<ReferenceLine> refs_;
};
