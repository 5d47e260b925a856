#pragma once

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <datapod/datapod.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dp = ::datapod;

namespace trackcover {

    namespace bg = boost::geometry;

    // Planar geometry models. x is longitude/easting, y is latitude/northing.
    using Point = bg::model::d2::point_xy<double>;
    using Polygon = bg::model::polygon<Point>;
    using MultiPolygon = bg::model::multi_polygon<Polygon>;
    using MultiPoint = bg::model::multi_point<Point>;
    using Box = bg::model::box<Point>;

    enum class CrsKind { Geographic, Projected, LocalEnu };

    struct Crs {
        CrsKind kind = CrsKind::Geographic;
        std::string code = "EPSG:4326";
        dp::Geo origin{0.0, 0.0, 0.0}; // only meaningful for LocalEnu

        static Crs wgs84();
        static Crs epsg(int code);
        static Crs enu(const dp::Geo &origin);

        bool isGeographic() const { return kind == CrsKind::Geographic; }
        bool isLinear() const { return kind != CrsKind::Geographic; }

        std::string name() const;
    };

    bool operator==(const Crs &a, const Crs &b);
    bool operator!=(const Crs &a, const Crs &b);

    // Accepts "EPSG:<n>", "WGS84"/"WGS" and "ENU". ENU origins are filled in later.
    Crs parseCRS(const std::string &s);

    using Timestamp = std::chrono::system_clock::time_point;

    struct TrackPoint {
        Point position;
        std::optional<double> elevation;
        std::optional<Timestamp> time;

        double longitude() const { return position.x(); }
        double latitude() const { return position.y(); }
    };

    struct PointSet {
        Crs crs;
        std::vector<TrackPoint> points;

        std::size_t size() const { return points.size(); }
        bool empty() const { return points.empty(); }
        void append(const PointSet &other);
    };

    enum class Predicate { Within, Intersects, All };

    const char *toString(Predicate p);

    struct CoverageResult {
        std::string region;
        MultiPolygon coverage;
        Crs crs;
        double regionArea = 0.0;
        double coveredArea = 0.0;
        std::optional<double> percentage; // absent for regions without area semantics
        std::size_t pointsInRegion = 0;
        std::size_t pointsConsidered = 0;
        Predicate predicate = Predicate::Within;
    };

} // namespace trackcover
