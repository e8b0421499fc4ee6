#include "plan_export.h"
#include "annotation.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

static const char* dimensionTypeName(DimensionType t){
    switch(t){
    case DimensionType::LinearHorizontal: return "linear_horizontal";
    case DimensionType::LinearVertical: return "linear_vertical";
    case DimensionType::LinearAligned: return "linear_aligned";
    case DimensionType::Angular: return "angular";
    }
    return "?";
}

static json pt(const PointD& p){ return json::array({p.x, p.y}); }

// --- JSON ---
json drawingToJson(const DrawingInfo& d){
    json j;
    j["points"] = json::array();
    for(const auto& p : d.points) j["points"].push_back(pt(p));
    j["bbox"] = {{"minX", d.bbox.minX}, {"maxX", d.bbox.maxX}, {"minY", d.bbox.minY}, {"maxY", d.bbox.maxY}};
    j["depth"] = d.depth;
    j["dimensions"] = json::array();
    for(const auto& dim : d.dimensions){
        json jd = {{"type", dimensionTypeName(dim.type)}, {"p1", pt(dim.p1)}, {"p2", pt(dim.p2)},
                   {"label", dim.label}};
        if(dim.type == DimensionType::Angular){
            jd["center"] = pt(dim.center);
            jd["radius"] = dim.radius;
        }else{
            jd["offset"] = dim.offset;
        }
        j["dimensions"].push_back(std::move(jd));
    }
    j["markers"] = json::array();
    for(const auto& m : d.markers)
        j["markers"].push_back({{"position", m.position},
                                {"orientation", m.orientation == MarkerOrientation::Vertical ? "vertical" : "horizontal"},
                                {"text", m.text}});
    j["referenceLines"] = json::array();
    for(const auto& r : d.referenceLines)
        j["referenceLines"].push_back({{"p1", pt(r.p1)}, {"p2", pt(r.p2)}, {"dashed", r.dashed}});
    return j;
}

json partToJson(const Part& p){
    json j = {{"key", p.key}, {"quantity", p.quantity}, {"description", p.description}};
    if(p.nominal)
        j["nominal"] = {{"width", p.nominal->width}, {"height", p.nominal->height}, {"length", p.nominal->length}};
    if(p.statics){
        const StaticsResult& s = *p.statics;
        j["statics"] = {{"span", s.span}, {"load", s.load}, {"maxDeflection", s.maxDeflection},
                        {"allowedDeflection", s.allowedDeflection}, {"passed", s.passed},
                        {"inertia", s.inertia}, {"eModulus", s.eModulus},
                        {"formula", s.formula}, {"formulaDescription", s.formulaDescription}};
        if(s.pointLoad) j["statics"]["pointLoad"] = *s.pointLoad;
    }
    if(p.cutting){
        json bins = json::array();
        for(const auto& b : p.cutting->bins) bins.push_back({{"cuts", b.cuts}, {"count", b.count}});
        j["cuttingPlan"] = {{"stockLength", p.cutting->stockLength}, {"kerf", p.cutting->kerf},
                            {"stockCount", p.cutting->stockCount()}, {"bins", bins},
                            {"rejected", p.cutting->rejected}};
    }
    if(p.drawing) j["drawing"] = drawingToJson(*p.drawing);
    return j;
}

json planToJson(const ConstructionPlan& plan){
    const FrameParameters& p = plan.params;
    const CrossSections& cs = p.cs;
    json j;
    j["parameters"] = {{"buildingType", buildingTypeName(p.building)}, {"roofType", roofTypeName(p.roof)},
                       {"width", p.W}, {"depth", p.D}, {"height", p.H}, {"roofPitch", p.pitchDeg},
                       {"roofOverhang", p.overhang}, {"altitude", p.altitude}};
    j["crossSections"] = {{"postDim", cs.postDim}, {"beamW", cs.beamW}, {"beamH", cs.beamH},
                          {"tieBeamH", cs.tieBeamH}, {"rafterW", cs.rafterW}, {"rafterH", cs.rafterH},
                          {"braceDim", cs.braceDim}, {"battenW", cs.battenW}, {"battenH", cs.battenH},
                          {"studD", cs.studD}, {"postsPerSide", cs.postsPerSide},
                          {"useKingPosts", cs.useKingPosts}, {"useMiddlePurlin", cs.useMiddlePurlin}};
    if(auto mp = cs.middlePurlin())
        j["crossSections"]["middlePurlin"] = {{"w", mp->w}, {"h", mp->h}};
    j["iterations"] = plan.iterations;
    j["summary"] = {{"timberVolume", plan.summary.timberVolume}, {"timberWeight", plan.summary.timberWeight},
                    {"snowLoad", plan.summary.snowLoad}, {"totalLoad", plan.summary.totalLoad}};
    j["parts"] = json::array();
    for(const auto& part : plan.parts) j["parts"].push_back(partToJson(part));
    return j;
}

void ExportPlanToJson(const std::string& filename, const ConstructionPlan& plan){
    std::ofstream f(filename);
    if(!f) throw std::runtime_error("cannot write " + filename);
    f << planToJson(plan).dump(2) << "\n";
    spdlog::info("[EXPORT] plan -> {}", filename);
}

// --- CSV ---
static std::string csvField(const std::string& s){
    if(s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for(char c : s){
        if(c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

void ExportPartsToCSV(const std::string& filename, const PartRegistry& parts){
    std::ofstream f(filename);
    if(!f) throw std::runtime_error("cannot write " + filename);
    f << "key,quantity,width,height,length,statics,description\n";
    for(const auto& p : parts){
        f << csvField(p.key) << ',' << p.quantity << ',';
        if(p.nominal) f << p.nominal->width << ',' << p.nominal->height << ',' << p.nominal->length << ',';
        else f << ",,,";
        if(p.statics) f << (p.statics->passed ? "ok" : "fail");
        f << ',' << csvField(p.description) << "\n";
    }
    spdlog::info("[EXPORT] {} part(s) -> {}", parts.size(), filename);
}

// --- SVG ---
namespace {

constexpr double SVG_SIZE = 1000.0;   // longest bbox side in user units
constexpr double SVG_MARGIN = 150.0;

struct View {
    double minX, minY, s;
    double x(double v) const { return (v - minX) * s + SVG_MARGIN; }
    double y(double v) const { return (v - minY) * s + SVG_MARGIN; }
};

std::string escape(const std::string& s){
    std::string out;
    for(char c : s){
        switch(c){
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '&': out += "&amp;"; break;
        case '\'': out += "&apos;"; break;
        case '\n': out += ' '; break;
        default: out += c;
        }
    }
    return out;
}

void line(std::ostream& f, double x1, double y1, double x2, double y2, const char* style){
    f << "<line x1='" << x1 << "' y1='" << y1 << "' x2='" << x2 << "' y2='" << y2 << "' " << style << "/>\n";
}

void text(std::ostream& f, double x, double y, const std::string& s){
    f << "<text x='" << x << "' y='" << y << "' font-size='18' text-anchor='middle'>" << escape(s) << "</text>\n";
}

void emitDimension(std::ostream& f, const View& v, const Dimension& d){
    const char* style = "stroke='blue' stroke-width='1'";
    if(d.type == DimensionType::Angular){
        const double cx = v.x(d.center.x), cy = v.y(d.center.y);
        const double a1 = std::atan2(d.p1.y - d.center.y, d.p1.x - d.center.x);
        const double sweep = angularSweep(d);
        const double a2 = a1 + sweep;
        const double r = d.radius;
        f << "<path fill='none' " << style << " d='M " << cx + r * std::cos(a1) << ' ' << cy + r * std::sin(a1)
          << " A " << r << ' ' << r << " 0 0 " << (sweep > 0 ? 1 : 0) << ' '
          << cx + r * std::cos(a2) << ' ' << cy + r * std::sin(a2) << "'/>\n";
        const double am = a1 + sweep / 2;
        text(f, cx + (r + 20) * std::cos(am), cy + (r + 20) * std::sin(am), d.label);
        return;
    }
    double x1 = v.x(d.p1.x), y1 = v.y(d.p1.y), x2 = v.x(d.p2.x), y2 = v.y(d.p2.y);
    double nx = 0, ny = 0;
    if(d.type == DimensionType::LinearHorizontal){
        ny = 1;
        y2 = y1;
    }else if(d.type == DimensionType::LinearVertical){
        nx = 1;
        x2 = x1;
    }else{
        const double len = std::hypot(x2 - x1, y2 - y1);
        if(len < 1e-9) return;
        nx = -(y2 - y1) / len;
        ny = (x2 - x1) / len;
    }
    const double ox = nx * d.offset, oy = ny * d.offset;
    line(f, x1, y1, x1 + ox, y1 + oy, "stroke='gray' stroke-width='0.5'");
    line(f, x2, y2, x2 + ox, y2 + oy, "stroke='gray' stroke-width='0.5'");
    line(f, x1 + ox, y1 + oy, x2 + ox, y2 + oy, style);
    text(f, (x1 + x2) / 2 + ox, (y1 + y2) / 2 + oy - 4, d.label);
}

} // namespace

std::string DrawingToSVG(const DrawingInfo& d, const std::string& title){
    const double w = d.bbox.maxX - d.bbox.minX, h = d.bbox.maxY - d.bbox.minY;
    const double longest = std::max(w, h);
    const View v{d.bbox.minX, d.bbox.minY, longest > 0 ? SVG_SIZE / longest : 1.0};
    const double vw = w * v.s + 2 * SVG_MARGIN, vh = h * v.s + 2 * SVG_MARGIN;

    std::ostringstream f;
    f << "<svg xmlns='http://www.w3.org/2000/svg' viewBox='0 0 " << vw << ' ' << vh << "'>\n";
    f << "<title>" << escape(title) << "</title>\n";
    f << "<polyline fill='none' stroke='black' stroke-width='2' points='";
    for(const auto& p : d.points) f << v.x(p.x) << ',' << v.y(p.y) << ' ';
    if(!d.points.empty()) f << v.x(d.points.front().x) << ',' << v.y(d.points.front().y);
    f << "'/>\n";
    for(const auto& r : d.referenceLines)
        line(f, v.x(r.p1.x), v.y(r.p1.y), v.x(r.p2.x), v.y(r.p2.y),
             r.dashed ? "stroke='gray' stroke-dasharray='6,4'" : "stroke='gray'");
    for(const auto& m : d.markers){
        if(m.orientation == MarkerOrientation::Vertical){
            const double x = v.x(d.bbox.minX + m.position);
            line(f, x, v.y(d.bbox.minY), x, v.y(d.bbox.maxY), "stroke='red'");
            text(f, x, v.y(d.bbox.minY) - 8, m.text);
        }else{
            const double y = v.y(d.bbox.minY + m.position);
            line(f, v.x(d.bbox.minX), y, v.x(d.bbox.maxX), y, "stroke='red'");
            text(f, v.x(d.bbox.maxX) + 40, y, m.text);
        }
    }
    for(const auto& dim : d.dimensions) emitDimension(f, v, dim);
    f << "</svg>\n";
    return f.str();
}

int ExportDrawingsToSVG(const std::string& dir, const PartRegistry& parts){
    std::filesystem::create_directories(dir);
    int n = 0;
    for(const auto& p : parts){
        if(!p.drawing) continue;
        const std::string file = (std::filesystem::path(dir) / (p.key + ".svg")).string();
        std::ofstream f(file);
        if(!f) throw std::runtime_error("cannot write " + file);
        f << DrawingToSVG(*p.drawing, p.description);
        ++n;
    }
    spdlog::info("[EXPORT] {} drawing(s) -> {}", n, dir);
    return n;
}
