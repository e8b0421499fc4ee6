// frameplan: timber-frame construction planner
//   frameplan -i carport.json -o plan.json --csv parts.csv --svg drawings
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#ifdef _OPENMP
#include <omp.h>
#endif
#include "config.h"
#include "dimension_search.h"
#include "frame_errors.h"
#include "plan_export.h"

// ───────── CLI ─────────
struct CLI{
    std::string input;
    std::string advice;
    std::string out;
    std::string csv;
    std::string svgDir;
    int maxIter = MAX_ITERATIONS;
    bool search = true;
    bool verbose = false;
};

static CLI parse(int ac, char** av){
    CLI c;
    cxxopts::Options options(av[0], "Timber-frame construction planner");
    options.add_options()
        ("i,input", "building input json", cxxopts::value<std::string>())
        ("advice", "advisory structural config json", cxxopts::value<std::string>())
        ("o,out", "output plan json", cxxopts::value<std::string>())
        ("csv", "output bill of materials csv", cxxopts::value<std::string>())
        ("svg", "directory for part drawings", cxxopts::value<std::string>())
        ("max-iter", "dimension search budget", cxxopts::value<int>())
        ("no-search", "skip dimension search, use given sections")
        ("v,verbose", "verbose", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "print help");

    auto result = options.parse(ac, av);
    if(result.count("help") || ac==1){
        std::cout << options.help() << "\n";
        std::exit(0);
    }

    c.input   = result.count("input")    ? result["input"].as<std::string>()  : "";
    c.advice  = result.count("advice")   ? result["advice"].as<std::string>() : "";
    c.out     = result.count("out")      ? result["out"].as<std::string>()    : "plan.json";
    c.csv     = result.count("csv")      ? result["csv"].as<std::string>()    : "";
    c.svgDir  = result.count("svg")      ? result["svg"].as<std::string>()    : "";
    c.maxIter = result.count("max-iter") ? result["max-iter"].as<int>()       : MAX_ITERATIONS;
    c.search  = !result.count("no-search");
    c.verbose = result["verbose"].as<bool>();

    if(c.input.empty() || c.maxIter < 1)
        throw std::runtime_error("use --help for usage");
    return c;
}

static void printPlan(const ConstructionPlan& plan){
    for(const auto& p : plan.parts){
        std::string first = p.description.substr(0, p.description.find('\n'));
        std::cout << std::setw(4) << p.quantity << "x  " << std::left << std::setw(28) << p.key
                  << std::right << first;
        if(p.statics) std::cout << (p.statics->passed ? "  [ok]" : "  [FAIL]");
        std::cout << "\n";
    }
    const SummaryInfo& s = plan.summary;
    std::cout << std::fixed << std::setprecision(3)
              << "timber " << s.timberVolume << " m3, weight " << s.timberWeight / 1000 << " kN"
              << ", snow " << s.snowLoad / 1000 << " kN, total " << s.totalLoad / 1000 << " kN"
              << "  (" << plan.iterations << " iteration(s))\n";
}

int main(int argc, char* argv[])
{
    try {
        CLI cli = parse(argc, argv);
        spdlog::set_pattern("[%H:%M:%S] %^%l%$ %v");
        spdlog::set_level(cli.verbose ? spdlog::level::info : spdlog::level::warn);
#ifdef _OPENMP
        spdlog::info("OpenMP threads: {}", omp_get_max_threads());
#else
        spdlog::info("OpenMP DISABLED");
#endif

        FrameParameters params = loadFrameInput(cli.input, cli.advice);
        ConstructionPlan plan;
        try {
            plan = buildConstructionPlan(params, cli.maxIter, cli.search);
        } catch (const OptimizationExhausted& e) {
            const CrossSections& cs = e.lastSections;
            std::cerr << "last sections after " << e.iterations << " iteration(s): rafter "
                      << cs.rafterW << 'x' << cs.rafterH << ", beam " << cs.beamW << 'x' << cs.beamH
                      << ", tie beam h " << cs.tieBeamH << ", middle purlin h " << cs.middlePurlinH << "\n";
            throw;
        }

        printPlan(plan);
        ExportPlanToJson(cli.out, plan);
        if(!cli.csv.empty()) ExportPartsToCSV(cli.csv, plan.parts);
        if(!cli.svgDir.empty()) ExportDrawingsToSVG(cli.svgDir, plan.parts);
        std::cout << plan.parts.size() << " part kinds  ->  " << cli.out << "\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "ERR: " << e.what() << "\n";
        return 1;
    }
}
