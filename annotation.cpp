#include "annotation.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

static constexpr double REF_LINE_LEN = 0.6;

std::string cmLabel(double meters){
    return fmt::format("{:.1f}cm", meters * 100.0);
}

std::string degLabel(double degrees){
    return fmt::format("{:.1f}°", degrees);
}

Dimension linearDim(DimensionType type, PointD p1, PointD p2, double offset, std::string label){
    Dimension d;
    d.type = type;
    d.p1 = p1; d.p2 = p2;
    d.offset = offset;
    d.label = std::move(label);
    return d;
}

Dimension angularDim(PointD center, PointD p1, PointD p2, double radius, std::string label){
    Dimension d;
    d.type = DimensionType::Angular;
    d.center = center;
    d.p1 = p1; d.p2 = p2;
    d.radius = radius;
    d.label = std::move(label);
    return d;
}

double angularSweep(const Dimension& d){
    double ax = d.p1.x - d.center.x, ay = d.p1.y - d.center.y;
    double bx = d.p2.x - d.center.x, by = d.p2.y - d.center.y;
    return std::atan2(ax * by - ay * bx, ax * bx + ay * by);
}

// --- local frame ---
LocalFrame::LocalFrame(const PointD& pivot, const PointD& along)
    : pivot_(pivot)
{
    double topEdge = std::atan2(along.y - pivot.y, along.x - pivot.x);
    rot_ = -topEdge;
    sin_ = std::sin(rot_);
    cos_ = std::cos(rot_);
}

PointD LocalFrame::toLocal(const PointD& world) const {
    double dx = world.x - pivot_.x;
    double dy = world.y - pivot_.y;
    double rx = dx * cos_ - dy * sin_;
    double ry = dx * sin_ + dy * cos_;
    return PointD(rx, -ry);
}

// --- annotator ---
void Annotator::cutAngle(const PointD& cornerWorld, const std::string& label,
                         const PointD& v1, const PointD& v2, double radius)
{
    PointD c = frame_.toLocal(cornerWorld);
    PointD e1(c.x + v1.x * REF_LINE_LEN, c.y + v1.y * REF_LINE_LEN);
    PointD e2(c.x + v2.x * REF_LINE_LEN, c.y + v2.y * REF_LINE_LEN);
    refs_.push_back({c, e1, true});
    refs_.push_back({c, e2, true});
    dims_.push_back(angularDim(c, e1, e2, radius, label));
}

void Annotator::aligned(const PointD& a, const PointD& b, double offset, const std::string& label){
    dims_.push_back(linearDim(DimensionType::LinearAligned,
                              frame_.toLocal(a), frame_.toLocal(b), offset, label));
}

void Annotator::horizontal(const PointD& a, const PointD& b, double offset, const std::string& label){
    dims_.push_back(linearDim(DimensionType::LinearHorizontal,
                              frame_.toLocal(a), frame_.toLocal(b), offset, label));
}
