#pragma once

#include "trackcover/region.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace trackcover {

    struct RunConfig {
        std::filesystem::path activities = "data/activities";
        std::filesystem::path boundaries = "data/ne_10m_admin_0_countries.geojson";
        std::string nameAttribute = "ADMIN";

        std::vector<std::string> regions{"World", "UK", "Sheffield", "Buckinghamshire"};
        std::vector<RegionSpec> catalogue = defaultRegionSpecs();

        std::size_t sampleStride = 1;
        std::size_t jobs = 1;
        std::size_t circleSegments = 64;
        bool diagnostics = false; // log how many disks touch each region boundary

        std::optional<std::filesystem::path> outputDir; // GeoJSON exports, when set
        std::string logLevel = "info";
    };

    // Applies a JSON configuration document on top of `base`. Throws ConfigError.
    RunConfig parseConfig(const std::string &jsonText, RunConfig base = {});

    RunConfig loadConfig(const std::filesystem::path &file, RunConfig base = {});

    struct CommandLine {
        RunConfig config;
        bool help = false;
    };

    // "--config FILE" is applied first, then the remaining flags override it. Throws ConfigError.
    CommandLine parseCommandLine(int argc, const char *const argv[]);

    // Throws ConfigError for values no run can use.
    void validate(const RunConfig &config);

    std::string usage(const std::string &program);

} // namespace trackcover
