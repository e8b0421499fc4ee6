#pragma once
#include <string>
#include <vector>
#include "frame_types.h"

// Best-fit-decreasing packing of linear cuts onto stock lengths.
// Cuts longer than the stock are collected in CuttingPlan::rejected.
CuttingPlan optimizeCuttingList(const std::vector<double>& cuts, double stockLength, double kerf);

// "Zuschnittplan (...):\n<n>x 5m Stange: schneiden zu a + b" or empty.
std::string cuttingSummary(const CuttingPlan& plan);
