#pragma once
#include <optional>
#include "frame_types.h"
#include "part_registry.h"

constexpr double TIMBER_MASS_DENSITY = 500.0;   // kg/m³
constexpr double GRAVITY = 9.81;

// Single-piece volume read back from a "WxHcm, Länge: Lcm" description, or
// section × stock length × stock count for parts with a cutting plan.
std::optional<double> volumeFromDescription(const Part& part);

SummaryInfo computeSummary(const PartRegistry& parts, const FrameParameters& p);
