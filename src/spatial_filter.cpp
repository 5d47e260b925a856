#include "trackcover/spatial_filter.hpp"
#include "trackcover/errors.hpp"

#include <spdlog/spdlog.h>

namespace trackcover {

    namespace {

        template <typename Pred> PointSet select(const PointSet &points, const Box &envelope, Pred pred) {
            PointSet out;
            out.crs = points.crs;
            for (const auto &tp : points.points) {
                if (!bg::covered_by(tp.position, envelope))
                    continue;
                if (pred(tp.position))
                    out.points.push_back(tp);
            }
            return out;
        }

    } // namespace

    bool strictlyInside(const Point &p, const MultiPolygon &boundary) { return bg::within(p, boundary); }

    bool touchesOrInside(const Point &p, const MultiPolygon &boundary) { return bg::intersects(p, boundary); }

    FilterResult filterPoints(const PointSet &points, const RegionDefinition &region) {
        if (!points.empty() && points.crs != region.crs)
            throw ProjectionFailure("filterPoints: points are in " + points.crs.name() + " but region \"" +
                                    region.name + "\" is in " + region.crs.name());

        FilterResult result;
        result.considered = points.size();

        if (!region.filtersPoints) {
            result.points = points;
            result.points.crs = region.crs;
            result.predicate = Predicate::All;
            return result;
        }

        result.points.crs = region.crs;
        if (points.empty() || region.boundary.empty())
            return result;

        Box envelope;
        bg::envelope(region.boundary, envelope);

        result.points = select(points, envelope, [&](const Point &p) { return strictlyInside(p, region.boundary); });
        result.predicate = Predicate::Within;
        if (!result.points.empty()) {
            spdlog::debug("Region {}: {} of {} point(s) within", region.name, result.points.size(), points.size());
            return result;
        }

        spdlog::info("No points found within {}. Trying with intersects instead...", region.name);
        result.points =
            select(points, envelope, [&](const Point &p) { return touchesOrInside(p, region.boundary); });
        result.predicate = Predicate::Intersects;
        return result;
    }

} // namespace trackcover
