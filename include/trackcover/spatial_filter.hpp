#pragma once

#include "trackcover/region.hpp"
#include "trackcover/types.hpp"

#include <cstddef>

namespace trackcover {

    struct FilterResult {
        PointSet points;            // attributable to the region, input order kept
        std::size_t considered = 0; // size of the input set
        Predicate predicate = Predicate::Within;
    };

    bool strictlyInside(const Point &p, const MultiPolygon &boundary);
    bool touchesOrInside(const Point &p, const MultiPolygon &boundary);

    // Keeps the points lying within the region boundary. When none do, falls back to points
    // that intersect it (boundary points included). For a valid boundary the fallback only
    // adds points on the boundary itself. The world pseudo-region keeps everything.
    // Throws ProjectionFailure when the point set is not in the region CRS.
    FilterResult filterPoints(const PointSet &points, const RegionDefinition &region);

} // namespace trackcover
