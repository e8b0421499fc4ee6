#include "layout.h"
#include <algorithm>
#include <cmath>

StudLayout calculateStudLayout(double totalLength, double studThickness, double spacing){
    StudLayout out;
    if(totalLength < studThickness * 2){
        out.positions = {studThickness / 2, totalLength - studThickness / 2};
        out.spacings = {totalLength - studThickness};
        return out;
    }
    double cur = studThickness / 2;
    const double endPos = totalLength - studThickness / 2;
    out.positions.push_back(cur);
    while(cur + spacing < endPos - spacing / 2){
        cur += spacing;
        out.positions.push_back(cur);
    }
    out.positions.push_back(endPos);
    for(size_t i = 0; i + 1 < out.positions.size(); ++i)
        out.spacings.push_back(out.positions[i+1] - out.positions[i]);
    return out;
}

RafterLayout rafterLayout(double depth, double rafterW){
    RafterLayout r;
    r.count = std::max(2, int(std::floor(depth / RAFTER_TARGET_SPACING)) + 1);
    r.spacing = (depth - rafterW) / (r.count - 1);
    return r;
}

std::vector<double> rafterCenters(double depth, double rafterW){
    RafterLayout r = rafterLayout(depth, rafterW);
    std::vector<double> z(r.count);
    for(int i = 0; i < r.count; ++i)
        z[i] = -depth / 2 + rafterW / 2 + i * r.spacing;
    return z;
}

std::vector<double> postPositions(double depth, double overhang, int postsPerSide){
    int n = std::max(2, postsPerSide);
    double run = depth - 2 * overhang;
    std::vector<double> z(n);
    for(int i = 0; i < n; ++i)
        z[i] = -run / 2 + i * (run / (n - 1));
    return z;
}

std::vector<double> battenRowCuts(double rowLength, double stockLength,
                                  const std::vector<double>& jointPositions){
    constexpr double eps = 1e-6;
    std::vector<double> cuts;
    double covered = 0.0;
    while(covered < rowLength - eps){
        double remaining = rowLength - covered;
        double startZ = -rowLength / 2 + covered;
        double idealEnd = startZ + std::min(remaining, stockLength);

        double jointZ = -1e100;
        for(double z : jointPositions)
            if(z > startZ + eps && z < idealEnd + eps) jointZ = std::max(jointZ, z);

        double cut = remaining;
        if(remaining > stockLength + eps && jointZ > -1e99)
            cut = jointZ - startZ;
        if(cut <= eps) break;   // no joint inside reach
        cuts.push_back(cut);
        covered += cut;
    }
    return cuts;
}

int battenRows(double rafterLength){
    return int(std::ceil(rafterLength / BATTEN_SPACING));
}
