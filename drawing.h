#pragma once
#include <vector>
#include "frame_types.h"
#include "layout.h"

DrawingInfo getDrawingInfo(PathD points, double depth,
                           std::vector<Dimension> dimensions = {},
                           std::vector<Marker> markers = {},
                           std::vector<ReferenceLine> referenceLines = {});

// Rectangle (0,0)-(length,height) with length and height dimensions.
DrawingInfo createBoxDrawing(double length, double height, double depth,
                             const std::vector<Dimension>& custom = {},
                             const std::vector<Marker>& markers = {});

// Post laid horizontally, with the knee-brace scribe mark.
DrawingInfo createPostDrawing(double height, double postDim, double braceLeg);

struct Markings {
    std::vector<Marker> markers;
    std::vector<Dimension> dimensions;
};

Markings generateStudMarkings(const StudLayout& layout, double beamHeight, double xOffset = 0.0);
Markings rafterMarkings(double depth, double rafterW);

// True for a closed polygon without self-intersections (checked with Clipper2).
bool isSimplePolygon(const PathD& path);
