#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "dimension_search.h"

nlohmann::json drawingToJson(const DrawingInfo& d);
nlohmann::json partToJson(const Part& p);
nlohmann::json planToJson(const ConstructionPlan& plan);

void ExportPlanToJson(const std::string& filename, const ConstructionPlan& plan);
void ExportPartsToCSV(const std::string& filename, const PartRegistry& parts);

// One SVG file per part drawing, named <key>.svg; returns the count written.
int ExportDrawingsToSVG(const std::string& dir, const PartRegistry& parts);
std::string DrawingToSVG(const DrawingInfo& d, const std::string& title);
