#pragma once

#include "trackcover/types.hpp"

#include <boost/json/value.hpp>

#include <filesystem>

namespace trackcover {

    class CoordinateProjector;

    // GeoJSON FeatureCollection with the coverage reprojected to WGS84 and the figures as properties.
    boost::json::value toJson(const CoverageResult &result, const CoordinateProjector &projector);

    void writeCoverage(const CoverageResult &result, const std::filesystem::path &outPath,
                       const CoordinateProjector &projector);

} // namespace trackcover
