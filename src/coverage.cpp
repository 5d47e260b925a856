#include "trackcover/coverage.hpp"
#include "trackcover/errors.hpp"
#include "trackcover/projection.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace trackcover {

    Polygon bufferPoint(const Point &center, double radius, std::size_t segments) {
        if (!(radius > 0.0))
            throw std::invalid_argument("buffer radius must be positive");
        if (segments < 3)
            segments = 3;

        bg::strategy::buffer::distance_symmetric<double> distance(radius);
        bg::strategy::buffer::side_straight side;
        bg::strategy::buffer::join_round join(segments);
        bg::strategy::buffer::end_round end(segments);
        bg::strategy::buffer::point_circle circle(segments);

        MultiPolygon out;
        bg::buffer(center, out, distance, side, join, end, circle);
        if (out.empty())
            throw std::runtime_error("buffer of a point produced no polygon");
        return out.front();
    }

    MultiPolygon unionAll(std::vector<MultiPolygon> parts) {
        if (parts.empty())
            return {};
        while (parts.size() > 1) {
            std::vector<MultiPolygon> next;
            next.reserve((parts.size() + 1) / 2);
            for (std::size_t i = 0; i + 1 < parts.size(); i += 2) {
                MultiPolygon merged;
                bg::union_(parts[i], parts[i + 1], merged);
                next.push_back(std::move(merged));
            }
            if (parts.size() % 2 == 1)
                next.push_back(std::move(parts.back()));
            parts.swap(next);
        }
        return std::move(parts.front());
    }

    MultiPolygon buildCoverage(const PointSet &points, const BufferOptions &options) {
        requireLinear(points.crs, "buildCoverage");
        if (!(options.radius > 0.0))
            throw std::invalid_argument("buildCoverage: buffer radius must be positive");
        if (points.empty())
            return {};

        std::vector<MultiPolygon> disks;
        disks.reserve(points.size());
        for (const auto &tp : points.points) {
            MultiPolygon disk;
            disk.push_back(bufferPoint(tp.position, options.radius, options.segments));
            disks.push_back(std::move(disk));
        }

        MultiPolygon covered = unionAll(std::move(disks));

        if (options.tolerance > 0.0) {
            MultiPolygon simplified;
            bg::simplify(covered, simplified, options.tolerance);
            covered = std::move(simplified);
        }

        std::string reason;
        if (!bg::is_valid(covered, reason))
            spdlog::warn("Coverage geometry is not valid after simplification: {}", reason);
        return covered;
    }

    std::size_t countIntersectingBuffers(const PointSet &points, const MultiPolygon &boundary, double radius,
                                         std::size_t segments) {
        std::size_t n = 0;
        for (const auto &tp : points.points) {
            if (bg::intersects(bufferPoint(tp.position, radius, segments), boundary))
                ++n;
        }
        return n;
    }

    double coveragePercentage(const MultiPolygon &coverage, const RegionDefinition &region) {
        if (!region.hasArea)
            throw ZeroAreaError("region \"" + region.name + "\" has no area semantics");
        requireLinear(region.crs, "coveragePercentage");
        if (!(region.area > 0.0))
            throw ZeroAreaError("region \"" + region.name + "\" has zero area");
        return bg::area(coverage) / region.area * 100.0;
    }

} // namespace trackcover
