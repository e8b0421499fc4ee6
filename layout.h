#pragma once
#include <vector>

constexpr double STUD_THICKNESS = 0.055;
constexpr double DEFAULT_STUD_SPACING = 0.625;
constexpr double RAFTER_TARGET_SPACING = 0.8;
constexpr double BATTEN_SPACING = 0.35;
constexpr double STOCK_LENGTH = 5.0;
constexpr double SAW_KERF = 0.005;

struct StudLayout {
    std::vector<double> positions;   // stud centerlines from the run start
    std::vector<double> spacings;
};

// Greedy-then-snap: last bay absorbs the remainder.
StudLayout calculateStudLayout(double totalLength, double studThickness, double spacing);

struct RafterLayout {
    int count = 2;
    double spacing = 0.0;
};

RafterLayout rafterLayout(double depth, double rafterW);
// Centerlines along the depth axis, centred on 0.
std::vector<double> rafterCenters(double depth, double rafterW);
std::vector<double> postPositions(double depth, double overhang, int postsPerSide);

// Cuts for one batten row; joints fall on the given positions (row centred on 0).
std::vector<double> battenRowCuts(double rowLength, double stockLength,
                                  const std::vector<double>& jointPositions);
int battenRows(double rafterLength);
