#pragma once
#include <optional>
#include <string>
#include <vector>
#include "frame_types.h"
#include "layout.h"
#include "part_registry.h"

constexpr double SILL_H = 0.08;

// Garden-house wall top plate, never slimmer than 0.10 x 0.12.
double topPlateHeight(const CrossSections& cs);
double topPlateWidth(const CrossSections& cs);

// "<name> WxHcm, Länge: Lcm"
std::string sectionDescription(const std::string& name, double w, double h, double length);

Part makePart(const std::string& name, double w, double h, double length, int quantity,
              std::optional<DrawingInfo> drawing = std::nullopt);
Part makeBattenPart(double w, double h, std::vector<double> cuts);

// Rejects non-positive fundamental spans with ConstructionError.
void validateFrame(const FrameParameters& p);

PartRegistry generateCarportPlan(const FrameParameters& p);
PartRegistry generateGardenHousePlan(const FrameParameters& p);
PartRegistry generatePlan(const FrameParameters& p);

// Runs the batten cuts through the cutting optimizer and rewrites the
// batten description and quantity from the resulting plan.
void attachCuttingPlans(PartRegistry& parts, double stockLength = STOCK_LENGTH,
                        double kerf = SAW_KERF);
