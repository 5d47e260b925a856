#pragma once

#include "trackcover/types.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace trackcover {

    // Reprojects points and polygons between CRSs. EPSG codes go through PROJ, ENU frames
    // through concord (chained via WGS84). Transformations are cached per instance, so an
    // instance must not be shared between threads.
    class CoordinateProjector {
      public:
        CoordinateProjector();
        ~CoordinateProjector();

        CoordinateProjector(const CoordinateProjector &) = delete;
        CoordinateProjector &operator=(const CoordinateProjector &) = delete;
        CoordinateProjector(CoordinateProjector &&) noexcept;
        CoordinateProjector &operator=(CoordinateProjector &&) noexcept;

        // Throws ProjectionFailure if PROJ does not recognise the CRS or its kind is not the declared one.
        void validate(const Crs &crs) const;

        Point transform(const Point &p, const Crs &from, const Crs &to) const;

        // Same count and order as the input.
        PointSet project(const PointSet &points, const Crs &to) const;

        // Drops the points that do not transform to finite coordinates and counts them in `dropped`.
        PointSet project(const PointSet &points, const Crs &to, std::size_t &dropped) const;

        Polygon project(const Polygon &polygon, const Crs &from, const Crs &to) const;
        MultiPolygon project(const MultiPolygon &geometry, const Crs &from, const Crs &to) const;

      private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

    // Area and buffer math are only meaningful in linear units.
    void requireLinear(const Crs &crs, const std::string &context);

} // namespace trackcover
