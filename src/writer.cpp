#include "trackcover/writer.hpp"
#include "trackcover/projection.hpp"

#include <boost/json.hpp>

#include <fstream>
#include <stdexcept>

namespace trackcover {

    namespace {

        boost::json::array ringToJson(const Polygon::ring_type &ring) {
            boost::json::array arr;
            for (auto const &p : ring) {
                boost::json::array c;
                c.push_back(p.x());
                c.push_back(p.y());
                arr.push_back(std::move(c));
            }
            return arr;
        }

        // RFC 7946 wants counter-clockwise exterior rings; the planar model is clockwise.
        boost::json::array polygonToJson(const Polygon &poly) {
            boost::json::array rings;
            auto outer = poly.outer();
            bg::reverse(outer);
            rings.push_back(ringToJson(outer));
            for (auto inner : poly.inners()) {
                bg::reverse(inner);
                rings.push_back(ringToJson(inner));
            }
            return rings;
        }

        boost::json::value geometryToJson(const MultiPolygon &geom) {
            boost::json::object j;
            j["type"] = "MultiPolygon";
            boost::json::array polys;
            for (auto const &poly : geom)
                polys.push_back(polygonToJson(poly));
            j["coordinates"] = std::move(polys);
            return j;
        }

    } // namespace

    boost::json::value toJson(const CoverageResult &result, const CoordinateProjector &projector) {
        auto wgs = projector.project(result.coverage, result.crs, Crs::wgs84());

        boost::json::object props;
        props["region"] = result.region;
        props["crs"] = result.crs.name();
        if (result.percentage)
            props["coverage_percent"] = *result.percentage;
        else
            props["coverage_percent"] = nullptr;
        props["covered_area"] = result.coveredArea;
        props["region_area"] = result.regionArea;
        props["points_in_region"] = result.pointsInRegion;
        props["points_considered"] = result.pointsConsidered;
        props["predicate"] = toString(result.predicate);

        boost::json::object feature;
        feature["type"] = "Feature";
        feature["properties"] = std::move(props);
        feature["geometry"] = geometryToJson(wgs);

        boost::json::object j;
        j["type"] = "FeatureCollection";
        boost::json::array features;
        features.push_back(std::move(feature));
        j["features"] = std::move(features);
        return j;
    }

    void writeCoverage(const CoverageResult &result, const std::filesystem::path &outPath,
                       const CoordinateProjector &projector) {
        auto j = toJson(result, projector);
        std::ofstream ofs(outPath);
        if (!ofs)
            throw std::runtime_error("Cannot open for write: " + outPath.string());
        ofs << boost::json::serialize(j) << "\n";
    }

} // namespace trackcover
