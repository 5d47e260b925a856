#include "trackcover/trackcover.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>

int main(int argc, char *argv[]) {
    tc::CommandLine cl;
    try {
        cl = tc::parseCommandLine(argc, argv);
    } catch (const tc::ConfigError &e) {
        std::cerr << "ERROR: " << e.what() << "\n\n" << tc::usage(argv[0]);
        return 2;
    }
    if (cl.help) {
        std::cout << tc::usage(argv[0]);
        return 0;
    }
    try {
        tc::validate(cl.config);
    } catch (const tc::ConfigError &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    const auto &config = cl.config;
    spdlog::set_level(spdlog::level::from_str(config.logLevel));

    try {
        // 1) Reference boundaries and region catalogue, built once
        auto dataset = tc::BoundaryDataset::load(config.boundaries, config.nameAttribute);
        tc::CoordinateProjector projector;
        const tc::RegionRegistry registry(dataset, config.catalogue, projector);

        // 2) Tracks in, one coverage result per region out
        auto report = tc::run(config, registry);

        // 3) Summary
        std::cout << "\nFiles: " << report.ingest.files.size() << " parsed, " << report.ingest.validFiles
                  << " valid, " << report.ingest.failedFiles << " failed, " << report.ingest.skippedFiles
                  << " skipped\n";
        std::cout << "Points: " << report.ingest.points.size() << "\n";
        for (const auto &outcome : report.regions) {
            std::cout << "  " << std::left << std::setw(18) << outcome.region;
            if (outcome.ok()) {
                const auto &r = *outcome.result;
                std::cout << r.pointsInRegion << " points (" << tc::toString(r.predicate) << ")";
                if (r.percentage)
                    std::cout << ", coverage " << std::fixed << std::setprecision(4) << *r.percentage << "%";
                std::cout << "\n";
            } else {
                std::cout << tc::toString(outcome.failure->kind) << ": " << outcome.failure->message << "\n";
            }
        }
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
