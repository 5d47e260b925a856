#pragma once

#include "trackcover/config.hpp"
#include "trackcover/region.hpp"
#include "trackcover/track_reader.hpp"
#include "trackcover/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace trackcover {

    class CoordinateProjector;

    struct ProcessOptions {
        std::size_t circleSegments = 64;
        bool diagnostics = false; // count disks touching the boundary (costly)
    };

    // Project, filter, buffer, union, simplify and measure one region. `points` are WGS84.
    // Points outside the region extent are skipped and points that fail to project are dropped.
    // Throws EmptyCoverage, ProjectionFailure or ZeroAreaError.
    CoverageResult processRegion(const PointSet &points, const RegionDefinition &region,
                                 const CoordinateProjector &projector, const ProcessOptions &options = {});

    struct RegionFailure {
        enum class Kind { UnknownRegion, EmptyCoverage, ProjectionFailure, ZeroArea, Geometry };
        Kind kind;
        std::string message;
    };

    const char *toString(RegionFailure::Kind kind);

    struct RegionOutcome {
        std::string region;
        std::optional<CoverageResult> result;
        std::optional<RegionFailure> failure;

        bool ok() const { return result.has_value(); }
    };

    // Runs `work` and maps the per-region exceptions to a failure entry: the typed ones to their kind,
    // any other geometry or runtime error to Kind::Geometry.
    RegionOutcome captureOutcome(const std::string &name, const std::function<CoverageResult()> &work);

    // Looks the region up and processes it, turning every per-region error into a failure entry.
    RegionOutcome processOutcome(const std::string &name, const PointSet &points, const RegionRegistry &registry,
                                 const ProcessOptions &options = {});

    struct RunReport {
        IngestReport ingest;
        std::vector<RegionOutcome> regions; // in request order
    };

    // Ingests the activity directory and processes every requested region. Only a missing
    // activity directory aborts; everything else is reported per file or per region.
    RunReport run(const RunConfig &config, const RegionRegistry &registry);

} // namespace trackcover
