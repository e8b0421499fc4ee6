#include "cutting.h"
#include "annotation.h"
#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

CuttingPlan optimizeCuttingList(const std::vector<double>& cuts, double stockLength, double kerf){
    CuttingPlan plan;
    plan.stockLength = stockLength;
    plan.kerf = kerf;

    std::vector<double> sorted(cuts);
    std::sort(sorted.begin(), sorted.end(), std::greater<double>());

    std::vector<std::vector<double>> bins;
    std::vector<double> remaining;
    for(double cut : sorted){
        if(cut > stockLength){
            spdlog::warn("[CUT] cut {:.3f}m longer than stock {:.3f}m, skipped", cut, stockLength);
            plan.rejected.push_back(cut);
            continue;
        }
        int best = -1;
        double minRemaining = std::numeric_limits<double>::infinity();
        for(size_t i = 0; i < bins.size(); ++i){
            if(remaining[i] >= cut + kerf && remaining[i] < minRemaining){
                minRemaining = remaining[i];
                best = int(i);
            }
        }
        if(best >= 0){
            bins[best].push_back(cut);
            remaining[best] -= cut + kerf;
        }else{
            bins.push_back({cut});
            remaining.push_back(stockLength - cut - kerf);
        }
    }

    // group identical patterns, first occurrence keeps its position
    std::map<std::string, size_t> groupOf;
    for(auto& bin : bins){
        std::sort(bin.begin(), bin.end(), std::greater<double>());
        std::string key;
        for(double c : bin) key += fmt::format("{:.1f},", c * 100.0);
        auto it = groupOf.find(key);
        if(it == groupOf.end()){
            groupOf.emplace(key, plan.bins.size());
            plan.bins.push_back({bin, 1});
        }else{
            plan.bins[it->second].count++;
        }
    }
    spdlog::info("[CUT] {} cuts -> {} stock pieces in {} patterns",
                 cuts.size() - plan.rejected.size(), plan.stockCount(), plan.bins.size());
    return plan;
}

std::string cuttingSummary(const CuttingPlan& plan){
    if(plan.bins.empty()) return "";
    std::string out = fmt::format("Zuschnittplan (optimiert für {:g}m Stangen, inkl. {:g}mm Sägeschnitt):",
                                  plan.stockLength, plan.kerf * 1000.0);
    for(const auto& bin : plan.bins){
        std::string cuts;
        for(size_t i = 0; i < bin.cuts.size(); ++i){
            if(i) cuts += " + ";
            cuts += cmLabel(bin.cuts[i]);
        }
        out += fmt::format("\n{}x {:g}m Stange: schneiden zu {}", bin.count, plan.stockLength, cuts);
    }
    return out;
}
