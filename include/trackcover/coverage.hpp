#pragma once

#include "trackcover/region.hpp"
#include "trackcover/types.hpp"

#include <cstddef>
#include <vector>

namespace trackcover {

    struct BufferOptions {
        double radius = 100.0;       // CRS linear unit
        double tolerance = 0.0;      // simplification; 0 keeps the union as is
        std::size_t segments = 64;   // polygon vertices per disk
    };

    // Polygonal approximation of a disk around `center`.
    Polygon bufferPoint(const Point &center, double radius, std::size_t segments = 64);

    // Union of all inputs, reduced pairwise so each step merges geometries of similar size.
    MultiPolygon unionAll(std::vector<MultiPolygon> parts);

    // Buffers every point, unions the disks and simplifies the result. An empty point set gives
    // an empty geometry. Throws ProjectionFailure for geographic input and std::invalid_argument
    // for a non-positive radius.
    MultiPolygon buildCoverage(const PointSet &points, const BufferOptions &options);

    // Number of disks around `points` that cross or lie inside the boundary.
    std::size_t countIntersectingBuffers(const PointSet &points, const MultiPolygon &boundary, double radius,
                                         std::size_t segments = 64);

    // 100 * area(coverage) / area(region), both in the region CRS. Not clamped.
    // Throws ZeroAreaError when the region has no area semantics or a zero area.
    double coveragePercentage(const MultiPolygon &coverage, const RegionDefinition &region);

} // namespace trackcover
