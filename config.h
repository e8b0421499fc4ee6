#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "frame_types.h"

// Leading-number parse of a JSON number or numeric string ("2.5m" -> 2.5).
// Returns fallback when the key is absent or carries no number.
double parseNumber(const nlohmann::json& obj, const char* key, double fallback);

// English and German names, case-insensitive; throws std::runtime_error.
RoofType parseRoofType(const std::string& name);
BuildingType parseBuildingType(const std::string& name);

// Overrides the start cross-sections from an advisory structuralConfig object.
void applyAdvice(CrossSections& cs, const nlohmann::json& advice);

FrameParameters parseFrameInput(const nlohmann::json& j);

// Throws std::runtime_error on unreadable or malformed files.
nlohmann::json loadJsonFile(const std::string& filename);

FrameParameters loadFrameInput(const std::string& inputFile, const std::string& adviceFile = "");
