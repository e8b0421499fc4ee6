#pragma once
#include <string>
#include "frame_types.h"

// Diagonal wall brace fitted into a rectangular stud bay.
struct BraceSolution {
    bool degenerate = true;
    double angleRad = 0.0;       // brace axis from horizontal (α)
    double cutAngleRad = 0.0;    // saw cut from vertical (90° − α)
    double outerLength = 0.0;    // H / cos(cut)
    double tipLength = 0.0;      // tip-to-tip stock length
    DrawingInfo drawing;
    std::string note;
};

// bayHeight H, bayWidth B, thickness D enter the fit; drawWidth is the
// profile width in the drawing and depth its extrusion.
BraceSolution solveBayBrace(double bayHeight, double bayWidth, double thickness,
                            double drawWidth, double depth);

// 45° knee brace (Kopfband) between post and beam.
struct MiteredBrace {
    double leg = 0.0;
    double outerLength = 0.0;
    DrawingInfo drawing;
};

MiteredBrace miteredBrace(double leg, double size);

double mainBraceLeg(double postHeight, double beamH, double tieBeamLength, double postDim);
double kingBraceLeg(double kingPostHeight);
double postBraceLeg(double postHeight);
// Knee brace under a purlin sitting directly on the post head.
double shedBraceLeg(double postHeight, double beamH);
