#include "drawing.h"
#include "annotation.h"
#include "layout.h"
#include <cmath>

DrawingInfo getDrawingInfo(PathD points, double depth,
                           std::vector<Dimension> dimensions,
                           std::vector<Marker> markers,
                           std::vector<ReferenceLine> referenceLines)
{
    DrawingInfo d;
    if(!points.empty()){
        RectD r = GetBounds(points);
        d.bbox = {r.left, r.right, r.top, r.bottom};
    }
    d.points = std::move(points);
    d.depth = depth;
    d.dimensions = std::move(dimensions);
    d.markers = std::move(markers);
    d.referenceLines = std::move(referenceLines);
    return d;
}

DrawingInfo createBoxDrawing(double length, double height, double depth,
                             const std::vector<Dimension>& custom,
                             const std::vector<Marker>& markers)
{
    PathD pts = { PointD(0, 0), PointD(length, 0), PointD(length, height), PointD(0, height) };
    std::vector<Dimension> dims = {
        linearDim(DimensionType::LinearHorizontal, PointD(0, height), PointD(length, height), 40, cmLabel(length)),
        linearDim(DimensionType::LinearVertical, PointD(0, 0), PointD(0, height), -40, cmLabel(height)),
    };
    dims.insert(dims.end(), custom.begin(), custom.end());
    return getDrawingInfo(std::move(pts), depth, std::move(dims), markers);
}

DrawingInfo createPostDrawing(double height, double postDim, double braceLeg){
    PathD pts = { PointD(0, 0), PointD(height, 0), PointD(height, postDim), PointD(0, postDim) };
    std::vector<Marker> markers = { {height - braceLeg, MarkerOrientation::Vertical, "Anriss Kopfb."} };
    std::vector<Dimension> dims = {
        linearDim(DimensionType::LinearHorizontal, PointD(0, postDim), PointD(height, postDim), 80, cmLabel(height)),
        linearDim(DimensionType::LinearHorizontal, PointD(height - braceLeg, postDim), PointD(height, postDim), 50, cmLabel(braceLeg)),
        linearDim(DimensionType::LinearVertical, PointD(0, 0), PointD(0, postDim), -40, cmLabel(postDim)),
    };
    return getDrawingInfo(std::move(pts), postDim, std::move(dims), std::move(markers));
}

Markings generateStudMarkings(const StudLayout& layout, double beamHeight, double xOffset){
    Markings m;
    for(double pos : layout.positions)
        m.markers.push_back({xOffset + pos, MarkerOrientation::Vertical, "Ständer"});
    for(size_t i = 0; i + 1 < layout.positions.size(); ++i){
        double x1 = xOffset + layout.positions[i];
        double x2 = xOffset + layout.positions[i+1];
        m.dimensions.push_back(linearDim(DimensionType::LinearHorizontal,
                                         PointD(x1, beamHeight), PointD(x2, beamHeight),
                                         70, cmLabel(layout.spacings[i])));
    }
    return m;
}

Markings rafterMarkings(double depth, double rafterW){
    Markings m;
    RafterLayout r = rafterLayout(depth, rafterW);
    const double first = rafterW / 2;
    for(int i = 0; i < r.count; ++i)
        m.markers.push_back({first + i * r.spacing, MarkerOrientation::Vertical, "Mitte Sparren"});
    m.dimensions.push_back(linearDim(DimensionType::LinearHorizontal,
                                     PointD(0, 0), PointD(first, 0), 50, cmLabel(first)));
    m.dimensions.push_back(linearDim(DimensionType::LinearHorizontal,
                                     PointD(first, 0), PointD(first + r.spacing, 0), 70,
                                     "Abstand: " + cmLabel(r.spacing)));
    return m;
}

bool isSimplePolygon(const PathD& path){
    if(path.size() < 3) return false;
    double a = std::abs(Area(path));
    if(a <= 0) return false;
    PathsD u = Union(PathsD{path}, FillRule::NonZero, 8);
    if(u.size() != 1) return false;
    return std::abs(std::abs(Area(u[0])) - a) <= a * 1e-4;
}
