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

std::string braceKey(const char* prefix, double outerLength){
    return fmt::format("{}_{}", prefix, std::lround(outerLength * 100));
}

DrawingInfo beamDrawing(double length, double w, double h, const Markings& m = {}){
    return createBoxDrawing(length, std::max(w, h), std::min(w, h), m.dimensions, m.markers);
}

void addBrace(PartRegistry& parts, const char* prefix, const char* name,
              const MiteredBrace& b, double dim, int quantity)
{
    parts.insert(braceKey(prefix, b.outerLength),
                 makePart(name, dim, dim, b.outerLength, quantity, b.drawing));
}

void addBattens(PartRegistry& parts, const CrossSections& cs, double rafterLength,
                double rowLength, int sides, const std::vector<double>& joints)
{
    if(cs.battenW <= 0 || cs.battenH <= 0 || rafterLength <= 0.1) return;
    const int rows = battenRows(rafterLength) * sides;
    std::vector<double> cuts;
    const std::vector<double> row = battenRowCuts(rowLength, STOCK_LENGTH, joints);
    for(int i = 0; i < rows; ++i) cuts.insert(cuts.end(), row.begin(), row.end());
    spdlog::info("[PLAN] battens: {} rows, {} cuts", rows, cuts.size());
    parts.insert("counter_batten", makeBattenPart(cs.battenW, cs.battenH, std::move(cuts)));
}

// --- gable ---
void gableCarport(const FrameParameters& p, PartRegistry& parts, int n){
    const CrossSections& cs = p.cs;
    const RafterLayout rl = rafterLayout(p.D, cs.rafterW);
    const Markings marks = rafterMarkings(p.D, cs.rafterW);
    const auto mp = cs.middlePurlin();

    const double postH = p.H - cs.beamH;
    if(postH <= 0)
        throw ConstructionError(fmt::format("beam height {} exceeds wall height {}", cs.beamH, p.H));
    const double tieLen = p.W - cs.postDim;

    parts.insert("post", makePart("Pfosten", cs.postDim, cs.postDim, postH, n * 2,
                                  createPostDrawing(postH, cs.postDim, postBraceLeg(postH))));
    parts.insert("side_plate", makePart("Fusspfette", cs.beamW, cs.beamH, p.D, 2,
                                        beamDrawing(p.D, cs.beamW, cs.beamH, marks)));
    parts.insert("tie_beam", makePart("Zange", cs.beamW, cs.beamH, tieLen, n,
                                      beamDrawing(tieLen, cs.beamW, cs.beamH)));

    if(p.W / 2 - cs.beamW <= 0)
        throw ConstructionError(fmt::format("width {} leaves no rafter run between plate and ridge", p.W));
    const GableRoofLine line(p.pitchDeg, p.W / 2 - cs.beamW / 2, p.H);
    const double ridgeSeat = line.ridgeSeatY(cs.beamW / 2, cs.rafterH);
    const double kingH = ridgeSeat - cs.beamH - p.H;
    if(kingH > 0.1){
        parts.insert("king_post", makePart("Firststütze", cs.postDim, cs.postDim, kingH, n,
                                           createPostDrawing(kingH, cs.postDim, kingBraceLeg(kingH))));
        addBrace(parts, "brace_king", "Kopfband Firststütze",
                 miteredBrace(kingBraceLeg(kingH), cs.braceDim), cs.braceDim, 2);
    }else{
        spdlog::info("[PLAN] king post {:.3f}m too short, omitted", kingH);
    }
    parts.insert("ridge_beam", makePart("Firstpfette", cs.beamW, cs.beamH, p.D, 1,
                                        beamDrawing(p.D, cs.beamW, cs.beamH, marks)));

    std::optional<PurlinSeat> seat;
    if(mp){
        const double span = (p.W / 2 - cs.beamW / 2) - cs.beamW / 2;
        const double centerX = cs.beamW / 2 + span / 2;
        const double seatY = line.bottom(centerX - mp->w / 2);
        seat = PurlinSeat{centerX, mp->w, mp->h, seatY};
        parts.insert("middle_purlin", makePart("Mittelpfette", mp->w, mp->h, p.D, 2,
                                               beamDrawing(p.D, mp->w, mp->h, marks)));
        const double supportH = seatY - mp->h - p.H;
        if(supportH > 0.01)
            parts.insert("support_post", makePart("Mittelpfettenstütze", cs.postDim, cs.postDim,
                                                  supportH, n * 2,
                                                  createBoxDrawing(supportH, cs.postDim, cs.postDim)));
    }

    const MiteredBrace mainBrace = miteredBrace(mainBraceLeg(postH, cs.beamH, tieLen, cs.postDim), cs.braceDim);
    // two end posts, one brace each way into the tie beam
    for(int end = 0; end < 2; ++end)
        addBrace(parts, "brace_main_trans", "Kopfband Pfosten quer", mainBrace, cs.braceDim, 2);
    addBrace(parts, "brace_main_long", "Kopfband Pfosten längs", mainBrace, cs.braceDim, 4);

    const RafterProfile rafter = gableRafterProfile(
        GableRafterGeometry{p.W / 2 + cs.beamW / 2, p.W / 2 - cs.beamW / 2, p.H,
                            cs.beamW / 2, cs.rafterH, p.pitchDeg, p.overhang},
        seat);
    parts.insert("rafter", makePart("Sparren", cs.rafterW, cs.rafterH, rafter.totalLength,
                                    rl.count * 2,
                                    annotateRafter(rafter, cs.rafterW, cs.rafterH, p.pitchDeg)));

    addBattens(parts, cs, rafter.totalLength, p.D, 2, rafterCenters(p.D, cs.rafterW));
}

// --- shed / flat ---
void shedCarport(const FrameParameters& p, PartRegistry& parts, int n){
    const CrossSections& cs = p.cs;
    const RafterLayout rl = rafterLayout(p.D, cs.rafterW);
    const Markings marks = rafterMarkings(p.D, cs.rafterW);
    const auto mp = cs.middlePurlin();

    const ShedRoofLine line(p.W, cs.beamW, p.H, p.pitchDeg);
    const double lowSeat = line.underside(p.W / 2 - cs.beamW / 2);
    const double highPostH = p.H - cs.beamH;
    const double lowPostH = lowSeat - cs.beamH;
    if(highPostH <= 0 || lowPostH <= 0)
        throw ConstructionError(fmt::format("low post height {:.3f}m not positive", lowPostH));
    const double crossLen = p.W - cs.postDim;
    const double zangeTop = lowSeat;

    const double highLeg = shedBraceLeg(highPostH, cs.beamH);
    const double lowLeg = shedBraceLeg(lowPostH, cs.beamH);

    parts.insert("post_high", makePart("Pfosten hoch", cs.postDim, cs.postDim, highPostH, n,
                                       createPostDrawing(highPostH, cs.postDim, highLeg)));
    parts.insert("post_low", makePart("Pfosten tief", cs.postDim, cs.postDim, lowPostH, n,
                                      createPostDrawing(lowPostH, cs.postDim, lowLeg)));
    parts.insert("purlin_high", makePart("Pfette hoch", cs.beamW, cs.beamH, p.D, 1,
                                         beamDrawing(p.D, cs.beamW, cs.beamH, marks)));
    parts.insert("purlin_low", makePart("Pfette tief", cs.beamW, cs.beamH, p.D, 1,
                                        beamDrawing(p.D, cs.beamW, cs.beamH, marks)));
    parts.insert("cross_member", makePart("Zange", cs.beamW, cs.tieBeamH, crossLen, n,
                                          beamDrawing(crossLen, cs.beamW, cs.tieBeamH)));

    std::optional<PurlinSeat> seat;
    if(mp){
        const double seatY = line.underside(-mp->w / 2);
        seat = PurlinSeat{0.0, mp->w, mp->h, seatY};
        parts.insert("middle_purlin_pult", makePart("Mittelpfette", mp->w, mp->h, p.D, 1,
                                                    beamDrawing(p.D, mp->w, mp->h, marks)));
        const double supportH = seatY - mp->h - zangeTop;
        if(supportH > 0.01)
            parts.insert("support_post_pult", makePart("Mittelpfettenstütze", cs.postDim, cs.postDim,
                                                       supportH, n,
                                                       createBoxDrawing(supportH, cs.postDim, cs.postDim)));
    }

    addBrace(parts, "brace_high_long", "Kopfband hoch längs",
             miteredBrace(highLeg, cs.braceDim), cs.braceDim, 2);
    const MiteredBrace low = miteredBrace(lowLeg, cs.braceDim);
    addBrace(parts, "brace_low_long", "Kopfband tief längs", low, cs.braceDim, 2);
    addBrace(parts, "brace_low_trans", "Kopfband tief quer", low, cs.braceDim, n);

    const RafterProfile rafter = shedRafterProfile(p.W, cs.beamW, cs.rafterH, p.H,
                                                   p.overhang, p.pitchDeg, seat);
    parts.insert("rafter_sloped", makePart("Sparren", cs.rafterW, cs.rafterH, rafter.totalLength,
                                           rl.count,
                                           annotateRafter(rafter, cs.rafterW, cs.rafterH, p.pitchDeg)));

    addBattens(parts, cs, rafter.totalLength, p.D, 1, rafterCenters(p.D, cs.rafterW));
}

} // namespace

PartRegistry generateCarportPlan(const FrameParameters& p){
    validateFrame(p);
    const CrossSections& cs = p.cs;
    if(p.W - cs.postDim <= 0)
        throw ConstructionError(fmt::format("width {} does not clear post size {}", p.W, cs.postDim));
    if(p.D - 2 * p.overhang <= 0.1)
        throw ConstructionError(fmt::format("depth {} leaves no post spacing after overhang {}", p.D, p.overhang));

    const int n = std::max(2, cs.postsPerSide);
    PartRegistry parts;
    if(p.roof == RoofType::Gable) gableCarport(p, parts, n);
    else shedCarport(p, parts, n);
    spdlog::info("[PLAN] carport: {} part kinds", parts.size());
    return parts;
}
