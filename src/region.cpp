#include "trackcover/region.hpp"
#include "trackcover/errors.hpp"
#include "trackcover/projection.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace trackcover {

    namespace {

        constexpr int kBoxEdgeSteps = 32;
        constexpr double kExtentMargin = 0.05; // degrees

        // Projected edges bow away from their geographic counterparts, hence the margin.
        Box paddedExtent(const MultiPolygon &geographic) {
            Box env;
            bg::envelope(geographic, env);
            return Box(Point(std::max(-180.0, env.min_corner().x() - kExtentMargin),
                             std::max(-90.0, env.min_corner().y() - kExtentMargin)),
                       Point(std::min(180.0, env.max_corner().x() + kExtentMargin),
                             std::min(90.0, env.max_corner().y() + kExtentMargin)));
        }

        // Edges are densified so they follow the projection instead of cutting corners.
        Polygon densifiedBox(const BoundingBox &b) {
            Polygon poly;
            auto &ring = poly.outer();
            auto edge = [&](double x0, double y0, double x1, double y1) {
                for (int i = 0; i < kBoxEdgeSteps; ++i) {
                    double t = static_cast<double>(i) / kBoxEdgeSteps;
                    ring.push_back(Point(x0 + (x1 - x0) * t, y0 + (y1 - y0) * t));
                }
            };
            edge(b.minLon, b.minLat, b.minLon, b.maxLat);
            edge(b.minLon, b.maxLat, b.maxLon, b.maxLat);
            edge(b.maxLon, b.maxLat, b.maxLon, b.minLat);
            edge(b.maxLon, b.minLat, b.minLon, b.minLat);
            ring.push_back(ring.front());
            bg::correct(poly);
            return poly;
        }

        void checkBox(const std::string &name, const BoundingBox &b) {
            if (!(b.minLon < b.maxLon) || !(b.minLat < b.maxLat) || b.minLon < -180.0 || b.maxLon > 180.0 ||
                b.minLat < -90.0 || b.maxLat > 90.0)
                throw std::invalid_argument("region \"" + name + "\": invalid bounding box");
        }

        // ENU frames are anchored at the centre of the region's geographic extent.
        Crs anchor(const Crs &crs, const MultiPolygon &geographic) {
            if (crs.kind != CrsKind::LocalEnu || geographic.empty())
                return crs;
            Box env;
            bg::envelope(geographic, env);
            double lon = (env.min_corner().x() + env.max_corner().x()) / 2.0;
            double lat = (env.min_corner().y() + env.max_corner().y()) / 2.0;
            return Crs::enu(dp::Geo{lat, lon, 0.0});
        }

        MultiPolygon simplifyEach(const MultiPolygon &in, double tolerance) {
            if (tolerance <= 0.0)
                return in;
            MultiPolygon out;
            out.reserve(in.size());
            for (const auto &poly : in) {
                Polygon simplified;
                bg::simplify(poly, simplified, tolerance);
                if (simplified.outer().size() >= 4)
                    out.push_back(std::move(simplified));
            }
            return out;
        }

    } // namespace

    RegionDefinition makeRegion(std::string name, RegionKind kind, const Crs &crs, MultiPolygon boundary,
                                double bufferRadius, double simplifyTolerance) {
        requireLinear(crs, "region \"" + name + "\"");
        if (!(bufferRadius > 0.0))
            throw std::invalid_argument("region \"" + name + "\": buffer radius must be positive");
        if (simplifyTolerance < 0.0)
            throw std::invalid_argument("region \"" + name + "\": simplification tolerance must not be negative");

        RegionDefinition def;
        def.name = std::move(name);
        def.kind = std::move(kind);
        def.crs = crs;
        def.boundary = std::move(boundary);
        def.bufferRadius = bufferRadius;
        def.simplifyTolerance = simplifyTolerance;
        def.area = bg::area(def.boundary);
        bool world = std::holds_alternative<WorldSimplified>(def.kind);
        def.hasArea = !world;
        def.filtersPoints = !world;

        std::string reason;
        if (!world && !bg::is_valid(def.boundary, reason))
            spdlog::warn("Region {}: boundary is not a valid polygon ({})", def.name, reason);
        return def;
    }

    RegionDefinition buildRegion(const RegionSpec &spec, const BoundaryDataset &dataset,
                                 const CoordinateProjector &projector) {
        MultiPolygon geographic = std::visit(
            [&](auto const &kind) -> MultiPolygon {
                using T = std::decay_t<decltype(kind)>;
                if constexpr (std::is_same_v<T, AdministrativeBoundary>) {
                    auto geom = dataset.geometryOf(kind.boundaryName);
                    if (!geom)
                        throw UnknownRegion(spec.name, "region \"" + spec.name + "\": \"" + kind.boundaryName +
                                                           "\" is not in the boundary dataset");
                    return *geom;
                } else if constexpr (std::is_same_v<T, BoundingBox>) {
                    checkBox(spec.name, kind);
                    MultiPolygon box;
                    box.push_back(densifiedBox(kind));
                    return box;
                } else {
                    return simplifyEach(dataset.all(), kind.tolerance);
                }
            },
            spec.kind);

        Crs crs = anchor(spec.crs, geographic);
        requireLinear(crs, "region \"" + spec.name + "\"");
        projector.validate(crs);

        auto boundary = projector.project(geographic, Crs::wgs84(), crs);
        auto def = makeRegion(spec.name, spec.kind, crs, std::move(boundary), spec.bufferRadius,
                              spec.simplifyTolerance);
        if (def.filtersPoints && !geographic.empty())
            def.extent = paddedExtent(geographic);
        spdlog::info("Region {}: {} polygon(s) in {}, area {:.1f}", def.name, def.boundary.size(), crs.name(),
                     def.area);
        return def;
    }

    std::vector<RegionSpec> defaultRegionSpecs() {
        return {
            {"UK", AdministrativeBoundary{"United Kingdom"}, Crs::epsg(27700), 100.0, 10.0},
            {"Sheffield", BoundingBox{-1.55, 53.32, -1.35, 53.48}, Crs::epsg(3857), 200.0, 30.0},
            {"Buckinghamshire", BoundingBox{-1.02, 51.48, -0.47, 52.08}, Crs::epsg(3857), 200.0, 30.0},
            {"World", WorldSimplified{0.1}, Crs::epsg(8857), 2000.0, 100.0},
        };
    }

    RegionRegistry::RegionRegistry(std::shared_ptr<const BoundaryDataset> dataset,
                                   const std::vector<RegionSpec> &specs, const CoordinateProjector &projector)
        : dataset_(std::move(dataset)) {
        if (!dataset_)
            throw std::invalid_argument("RegionRegistry: no boundary dataset");

        for (const auto &spec : specs) {
            if (regions_.count(spec.name) || failures_.count(spec.name))
                throw std::invalid_argument("RegionRegistry: duplicate region \"" + spec.name + "\"");
            try {
                regions_.emplace(spec.name, buildRegion(spec, *dataset_, projector));
            } catch (const UnknownRegion &e) {
                spdlog::warn("{}", e.what());
                failures_.emplace(spec.name, std::current_exception());
            } catch (const ProjectionFailure &e) {
                spdlog::error("Region {}: {}", spec.name, e.what());
                failures_.emplace(spec.name, std::current_exception());
            } catch (const std::invalid_argument &e) {
                spdlog::error("{}", e.what());
                failures_.emplace(spec.name, std::current_exception());
            } catch (const bg::exception &e) {
                spdlog::error("Region {}: {}", spec.name, e.what());
                failures_.emplace(spec.name, std::current_exception());
            } catch (const std::runtime_error &e) {
                spdlog::error("Region {}: {}", spec.name, e.what());
                failures_.emplace(spec.name, std::current_exception());
            }
        }
    }

    RegionRegistry::RegionRegistry(std::vector<RegionDefinition> definitions) {
        for (auto &def : definitions) {
            std::string name = def.name;
            if (!regions_.emplace(name, std::move(def)).second)
                throw std::invalid_argument("RegionRegistry: duplicate region \"" + name + "\"");
        }
    }

    const RegionDefinition &RegionRegistry::get(const std::string &name) const {
        auto it = regions_.find(name);
        if (it != regions_.end())
            return it->second;
        auto failed = failures_.find(name);
        if (failed != failures_.end())
            std::rethrow_exception(failed->second);
        throw UnknownRegion(name);
    }

    bool RegionRegistry::contains(const std::string &name) const {
        return regions_.count(name) > 0 || failures_.count(name) > 0;
    }

    std::vector<std::string> RegionRegistry::names() const {
        std::vector<std::string> out;
        for (const auto &kv : regions_)
            out.push_back(kv.first);
        for (const auto &kv : failures_)
            out.push_back(kv.first);
        return out;
    }

} // namespace trackcover
