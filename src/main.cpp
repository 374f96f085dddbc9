#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "surface_properties.h"
#include "geometry_loader.h"
#include "classifier.h"
#include "report_formatter.h"

namespace po = boost::program_options;

static void printLines(const std::vector<std::string> &lines) {
    for (const auto &line : lines)
        std::cout << line << "\n";
}

int main(int argc, char** argv) {
    ClassifierSettings settings;
    std::vector<std::string> windowFiles, shadingFiles, contextFiles;
    std::string modeText, configFile;
    int month = 1;
    int threads = 0;

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("window,w", po::value<std::vector<std::string>>(&windowFiles)->composing(), "window STL file (repeatable)")
        ("shading,s", po::value<std::vector<std::string>>(&shadingFiles)->composing(),
            "shading device STL paired with the window at the same position, '-' for none")
        ("context,c", po::value<std::vector<std::string>>(&contextFiles)->composing(), "context building STL file (repeatable)")
        ("month,m", po::value<int>(&month)->default_value(1), "analysis month, 1..12")
        ("mode", po::value<std::string>(&modeText)->default_value("heating"), "calculation mode: heating, cooling or solar")
        ("threads,t", po::value<int>(&threads)->default_value(0), "worker threads (0: OpenMP default)")
        ("log-file", po::value<std::string>(&settings.logFile), "append per-window results to this CSV file")
        ("debug,d", po::bool_switch(&settings.debugTrace), "print the per-window analysis trace")
        ("verbose,v", po::bool_switch(&settings.verbose), "progress messages")
        ("config", po::value<std::string>(&configFile), "key=value configuration file")
    ;

    po::options_description tuning("Tuning (also accepted in the configuration file)");
    tuning.add_options()
        ("significance-threshold", po::value<double>(&settings.significanceThreshold)->default_value(settings.significanceThreshold),
            "degrees of blocked sky above which an obstruction counts")
        ("azimuth-spread", po::value<double>(&settings.azimuthSpread)->default_value(settings.azimuthSpread),
            "half-width of the azimuth fan in degrees")
        ("azimuth-steps", po::value<int>(&settings.azimuthSteps)->default_value(settings.azimuthSteps),
            "azimuth samples across the fan")
        ("sample-inset", po::value<double>(&settings.sampleInset)->default_value(settings.sampleInset),
            "height of the bottom sample points above the window sill")
        ("lateral-offset", po::value<double>(&settings.lateralOffsetFraction)->default_value(settings.lateralOffsetFraction),
            "sideways offset of the corner samples as a fraction of the window width")
        ("max-context-distance", po::value<double>(&settings.maxContextDistance)->default_value(settings.maxContextDistance),
            "context hits at or beyond this distance are ignored")
        ("max-shading-distance", po::value<double>(&settings.maxShadingDistance)->default_value(settings.maxShadingDistance),
            "shading hits at or beyond this distance are ignored")
    ;
    desc.add(tuning);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("config")) {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream cfg(path);
            if (!cfg) {
                std::cerr << "Cannot open configuration file: " << path << "\n";
                return 1;
            }
            po::store(po::parse_config_file(cfg, desc), vm);
        }
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }
    if (windowFiles.empty()) {
        std::cerr << "Error: at least one --window is required.\n" << desc << "\n";
        return 1;
    }
    if (month < 1 || month > 12) {
        std::cerr << "Error: --month must be in 1..12, got " << month << "\n";
        return 1;
    }
    if (settings.azimuthSteps < 1) {
        std::cerr << "Error: --azimuth-steps must be at least 1\n";
        return 1;
    }
    const CalculationMode mode = parseCalculationMode(modeText);

#ifdef _OPENMP
    if (threads > 0)
        omp_set_num_threads(threads);
#else
    if (threads > 1)
        std::cerr << "Warning: built without OpenMP, --threads ignored.\n";
#endif

    std::vector<Mesh> windows(windowFiles.size());
    for (size_t i = 0; i < windowFiles.size(); i++) {
        if (!loadSTL(windowFiles[i], windows[i])) {
            std::cerr << "Failed to load window STL file: " << windowFiles[i] << "\n";
            return 1;
        }
    }

    std::vector<std::unique_ptr<Mesh>> shadingMeshes;
    std::vector<const Mesh*> shadings;
    for (const auto &file : shadingFiles) {
        if (file == "-") {
            shadings.push_back(nullptr);
            continue;
        }
        auto mesh = std::make_unique<Mesh>();
        if (!loadSTL(file, *mesh)) {
            std::cerr << "Failed to load shading STL file: " << file << "\n";
            return 1;
        }
        shadings.push_back(mesh.get());
        shadingMeshes.push_back(std::move(mesh));
    }

    std::vector<Mesh> contextMeshes;
    for (const auto &file : contextFiles) {
        Mesh mesh;
        if (!loadSTL(file, mesh)) {
            std::cerr << "[Context] Warning: skipping unreadable context file " << file << "\n";
            continue;
        }
        contextMeshes.push_back(std::move(mesh));
    }

    ReportInputSummary input;
    input.numWindows = static_cast<int>(windows.size());
    input.numShading = static_cast<int>(shadingMeshes.size());
    input.numContext = static_cast<int>(contextMeshes.size());
    input.month      = month;
    input.mode       = mode;
    input.significanceThreshold = settings.significanceThreshold;

    BatchResult batch = classifyBatch(windows, shadings, contextMeshes, month, mode, settings);

    printLines(formatReportHeader(input));
    for (size_t i = 0; i < batch.results.size(); i++)
        std::cout << formatReportRow(static_cast<int>(i), batch.results[i]) << "\n";
    printLines(formatReportSummary(batch.results));

    if (batch.contextItemsSkipped > 0) {
        std::cout << "\n" << batch.contextItemsSkipped << " context item(s) skipped, "
                  << batch.contextItemsUsed << " used.\n";
    }

    if (settings.debugTrace) {
        for (const auto &r : batch.results) {
            if (!r.debugTrace.empty())
                std::cout << "\n" << r.debugTrace << "\n";
        }
    }
    return 0;
}
