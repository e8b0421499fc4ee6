#include "frame_plan.h"
#include "brace.h"
#include "drawing.h"
#include "frame_errors.h"
#include "rafter.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {

// Diagonal braces in the first and last bay of a wall, both walls of a kind.
void addWallBraces(PartRegistry& parts, const char* prefix, const char* name,
                   const StudLayout& layout, double wallHeight, double studD)
{
    const size_t bays = layout.spacings.size();
    for(size_t i = 0; i < bays; ++i){
        if(i != 0 && i != bays - 1) continue;
        const double bay = layout.spacings[i] - STUD_THICKNESS;
        if(bay <= STUD_THICKNESS * 0.5) continue;
        BraceSolution b = solveBayBrace(wallHeight, bay, STUD_THICKNESS, STUD_THICKNESS, studD);
        if(b.degenerate){
            spdlog::warn("[PLAN] {} bay {}: {}", prefix, i, b.note);
            continue;
        }
        parts.insert(fmt::format("{}_{}", prefix, std::lround(bay * 1000)),
                     makePart(name, studD, STUD_THICKNESS, b.tipLength, 2, std::move(b.drawing)));
    }
}

} // namespace

PartRegistry generateGardenHousePlan(const FrameParameters& p){
    validateFrame(p);
    const CrossSections& cs = p.cs;
    if(p.roof != RoofType::Gable)
        throw ConstructionError(fmt::format("garden house needs a gable roof, got {}", roofTypeName(p.roof)));
    if(cs.middlePurlin())
        spdlog::info("[PLAN] middle purlin ignored for garden house");

    const double tpH = topPlateHeight(cs);
    const double tpW = topPlateWidth(cs);
    const double wallHeight = p.H - SILL_H - tpH;
    if(wallHeight <= 0)
        throw ConstructionError(fmt::format("wall height {:.3f}m not positive", wallHeight));
    const double gableLen = p.W - 2 * cs.studD;
    if(gableLen < 2 * STUD_THICKNESS)
        throw ConstructionError(fmt::format("gable wall {:.3f}m too short for two studs", gableLen));

    PartRegistry parts;
    const StudLayout gable = calculateStudLayout(gableLen, STUD_THICKNESS, DEFAULT_STUD_SPACING);
    const StudLayout side = calculateStudLayout(p.D, STUD_THICKNESS, DEFAULT_STUD_SPACING);

    // --- walls ---
    const DrawingInfo stud = createBoxDrawing(wallHeight, cs.studD, STUD_THICKNESS);
    parts.insert("stud_gable", makePart("Ständer", cs.studD, STUD_THICKNESS, wallHeight,
                                        int(gable.positions.size()) * 2, stud));
    parts.insert("stud_side", makePart("Ständer", cs.studD, STUD_THICKNESS, wallHeight,
                                       int(side.positions.size()) * 2, stud));

    const Markings sillMarks = generateStudMarkings(side, SILL_H);
    parts.insert("sill_d", makePart("Schwelle Längsseite", cs.studD, SILL_H, p.D, 2,
                                    createBoxDrawing(p.D, SILL_H, cs.studD,
                                                     sillMarks.dimensions, sillMarks.markers)));
    const Markings gableMarks = generateStudMarkings(gable, SILL_H);
    parts.insert("sill_w", makePart("Schwelle Stirnseite", cs.studD, SILL_H, gableLen, 2,
                                    createBoxDrawing(gableLen, SILL_H, cs.studD,
                                                     gableMarks.dimensions, gableMarks.markers)));

    addWallBraces(parts, "brace_gable", "Strebe Giebelwand", gable, wallHeight, cs.studD);
    addWallBraces(parts, "brace_side", "Strebe Längswand", side, wallHeight, cs.studD);

    // --- plates ---
    const double plateLen = p.D + 2 * p.overhang;
    const Markings plateMarks = generateStudMarkings(side, tpH, p.overhang);
    parts.insert("top_plate_d", makePart("Rähm Längsseite", tpW, tpH, plateLen, 2,
                                         createBoxDrawing(plateLen, tpH, tpW,
                                                          plateMarks.dimensions, plateMarks.markers)));
    const Markings gablePlateMarks = generateStudMarkings(gable, tpH);
    parts.insert("top_plate_w", makePart("Rähm Stirnseite", tpW, tpH, gableLen, 2,
                                         createBoxDrawing(gableLen, tpH, tpW,
                                                          gablePlateMarks.dimensions, gablePlateMarks.markers)));

    const RafterLayout rl = rafterLayout(p.D, cs.rafterW);
    if(cs.useKingPosts){
        const double joistLen = p.W - 2 * tpW;
        parts.insert("ceiling_joist", makePart("Deckenbalken", cs.rafterW, tpH, joistLen, rl.count,
                                               createBoxDrawing(joistLen, tpH, cs.rafterW)));
    }
    parts.insert("ridge_beam", makePart("Firstpfette", cs.beamW, cs.beamH, plateLen, 1,
                                        createBoxDrawing(plateLen, cs.beamH, cs.beamW)));

    // --- roof ---
    if(p.W / 2 - tpW <= cs.beamW / 2)
        throw ConstructionError(fmt::format("width {} leaves no rafter run between plate and ridge", p.W));
    const GableRoofLine line(p.pitchDeg, p.W / 2 - tpW, p.H);
    const double ridgeBottom = line.ridgeSeatY(cs.beamW / 2, cs.rafterH) - cs.beamH;
    const double postH = ridgeBottom - p.H;
    if(postH > 0.1){
        if(cs.useKingPosts)
            parts.insert("king_post", makePart("Firststütze", cs.rafterW, cs.beamW, postH, rl.count,
                                               createBoxDrawing(postH, cs.beamW, cs.rafterW)));
        parts.insert("gable_post", makePart("Giebelstütze", cs.studD, STUD_THICKNESS, postH, 2,
                                            createBoxDrawing(postH, cs.studD, STUD_THICKNESS)));
    }

    const RafterProfile rafter = gableRafterProfile(
        GableRafterGeometry{p.W / 2, p.W / 2 - tpW, p.H, cs.beamW / 2,
                            cs.rafterH, p.pitchDeg, p.overhang},
        std::nullopt);
    const int extra = std::max(0, int(std::ceil(2 * p.overhang / rl.spacing)) - 2);
    parts.insert("rafter", makePart("Sparren", cs.rafterW, cs.rafterH, rafter.totalLength,
                                    (rl.count + extra) * 2,
                                    annotateRafter(rafter, cs.rafterW, cs.rafterH, p.pitchDeg)));

    if(cs.battenW > 0 && cs.battenH > 0 && rafter.totalLength > 0.1){
        const int rows = battenRows(rafter.totalLength) * 2;
        const std::vector<double> row = battenRowCuts(plateLen, STOCK_LENGTH,
                                                      rafterCenters(p.D, cs.rafterW));
        std::vector<double> cuts;
        for(int i = 0; i < rows; ++i) cuts.insert(cuts.end(), row.begin(), row.end());
        parts.insert("counter_batten", makeBattenPart(cs.battenW, cs.battenH, std::move(cuts)));
    }
    spdlog::info("[PLAN] garden house: {} part kinds", parts.size());
    return parts;
}
