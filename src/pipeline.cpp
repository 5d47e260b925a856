#include "trackcover/pipeline.hpp"
#include "trackcover/coverage.hpp"
#include "trackcover/errors.hpp"
#include "trackcover/projection.hpp"
#include "trackcover/spatial_filter.hpp"
#include "trackcover/writer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <future>

namespace trackcover {

    CoverageResult processRegion(const PointSet &points, const RegionDefinition &region,
                                 const CoordinateProjector &projector, const ProcessOptions &options) {
        spdlog::info("Processing {} view...", region.name);

        PointSet candidates;
        candidates.crs = points.crs;
        if (region.extent && points.crs.kind == CrsKind::Geographic) {
            for (const auto &tp : points.points) {
                if (bg::covered_by(tp.position, *region.extent))
                    candidates.points.push_back(tp);
            }
        } else {
            candidates.points = points.points;
        }

        std::size_t dropped = 0;
        auto projected = projector.project(candidates, region.crs, dropped);
        if (dropped > 0)
            spdlog::warn("{}: {} point(s) could not be projected to {} and were dropped", region.name, dropped,
                         region.crs.name());
        auto filtered = filterPoints(projected, region);
        spdlog::info("Points in {}: {}", region.name, filtered.points.size());

        if (filtered.points.empty())
            throw EmptyCoverage("No points found in " + region.name + ". Skipping.");

        if (options.diagnostics && region.filtersPoints) {
            auto touching = countIntersectingBuffers(filtered.points, region.boundary, region.bufferRadius,
                                                     options.circleSegments);
            spdlog::info("Buffers that intersect {}: {} / {}", region.name, touching, filtered.points.size());
        }

        BufferOptions buffer;
        buffer.radius = region.bufferRadius;
        buffer.tolerance = region.simplifyTolerance;
        buffer.segments = options.circleSegments;

        CoverageResult result;
        result.region = region.name;
        result.crs = region.crs;
        result.coverage = buildCoverage(filtered.points, buffer);
        result.coveredArea = bg::area(result.coverage);
        result.regionArea = region.area;
        result.pointsInRegion = filtered.points.size();
        result.pointsConsidered = points.size();
        result.predicate = filtered.predicate;

        if (region.hasArea) {
            result.percentage = coveragePercentage(result.coverage, region);
            spdlog::info("Coverage Percentage: {:.4f}%", *result.percentage);
        }
        return result;
    }

    const char *toString(RegionFailure::Kind kind) {
        switch (kind) {
        case RegionFailure::Kind::UnknownRegion:
            return "unknown region";
        case RegionFailure::Kind::EmptyCoverage:
            return "empty coverage";
        case RegionFailure::Kind::ProjectionFailure:
            return "projection failure";
        case RegionFailure::Kind::ZeroArea:
            return "zero area";
        case RegionFailure::Kind::Geometry:
            return "geometry failure";
        }
        return "unknown";
    }

    RegionOutcome captureOutcome(const std::string &name, const std::function<CoverageResult()> &work) {
        RegionOutcome outcome;
        outcome.region = name;

        auto fail = [&](RegionFailure::Kind kind, const char *what) {
            outcome.failure = RegionFailure{kind, what};
            if (kind == RegionFailure::Kind::EmptyCoverage)
                spdlog::info("{}", what);
            else
                spdlog::error("Region {} failed ({}): {}", name, toString(kind), what);
        };

        try {
            outcome.result = work();
        } catch (const UnknownRegion &e) {
            fail(RegionFailure::Kind::UnknownRegion, e.what());
        } catch (const EmptyCoverage &e) {
            fail(RegionFailure::Kind::EmptyCoverage, e.what());
        } catch (const ProjectionFailure &e) {
            fail(RegionFailure::Kind::ProjectionFailure, e.what());
        } catch (const ZeroAreaError &e) {
            fail(RegionFailure::Kind::ZeroArea, e.what());
        } catch (const bg::exception &e) {
            fail(RegionFailure::Kind::Geometry, e.what());
        } catch (const std::invalid_argument &e) {
            fail(RegionFailure::Kind::Geometry, e.what());
        } catch (const std::runtime_error &e) {
            fail(RegionFailure::Kind::Geometry, e.what());
        }
        return outcome;
    }

    RegionOutcome processOutcome(const std::string &name, const PointSet &points, const RegionRegistry &registry,
                                 const ProcessOptions &options) {
        return captureOutcome(name, [&] {
            const auto &region = registry.get(name);
            CoordinateProjector projector;
            return processRegion(points, region, projector, options);
        });
    }

    RunReport run(const RunConfig &config, const RegionRegistry &registry) {
        RunReport report;

        IngestOptions ingest;
        ingest.sampleStride = config.sampleStride;
        ingest.jobs = config.jobs;
        report.ingest = ingestDirectory(config.activities, ingest);
        if (report.ingest.points.empty())
            spdlog::warn("No GPS points were extracted. Check your activity files.");

        ProcessOptions options;
        options.circleSegments = config.circleSegments;
        options.diagnostics = config.diagnostics;

        const auto &points = report.ingest.points;
        std::size_t jobs = std::max<std::size_t>(1, config.jobs);
        if (jobs == 1) {
            for (const auto &name : config.regions)
                report.regions.push_back(processOutcome(name, points, registry, options));
        } else {
            std::vector<std::future<RegionOutcome>> pending;
            for (const auto &name : config.regions) {
                pending.push_back(std::async(std::launch::async, [&, name] {
                    return processOutcome(name, points, registry, options);
                }));
            }
            for (auto &f : pending)
                report.regions.push_back(f.get());
        }

        if (config.outputDir) {
            std::filesystem::create_directories(*config.outputDir);
            CoordinateProjector projector;
            for (const auto &outcome : report.regions) {
                if (!outcome.ok())
                    continue;
                std::string stem = outcome.region;
                std::transform(stem.begin(), stem.end(), stem.begin(), [](unsigned char c) {
                    return std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_';
                });
                auto path = *config.outputDir / (stem + "_coverage.geojson");
                try {
                    writeCoverage(*outcome.result, path, projector);
                    spdlog::info("Coverage saved as '{}'", path.string());
                } catch (const std::runtime_error &e) {
                    spdlog::error("Cannot export {}: {}", outcome.region, e.what());
                }
            }
        }

        std::size_t succeeded = static_cast<std::size_t>(
            std::count_if(report.regions.begin(), report.regions.end(), [](const RegionOutcome &o) { return o.ok(); }));
        spdlog::info("{} of {} region(s) processed successfully", succeeded, report.regions.size());
        return report;
    }

} // namespace trackcover
