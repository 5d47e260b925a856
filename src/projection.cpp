#include "trackcover/projection.hpp"
#include "trackcover/errors.hpp"

#include <concord/concord.hpp>
#include <proj.h>

#include <cmath>
#include <unordered_map>

namespace trackcover {

    struct CoordinateProjector::Impl {
        PJ_CONTEXT *ctx = nullptr;
        std::unordered_map<std::string, PJ *> operations;

        Impl() : ctx(proj_context_create()) {
            if (!ctx)
                throw ProjectionFailure("proj_context_create() failed");
        }

        ~Impl() {
            for (auto &kv : operations)
                proj_destroy(kv.second);
            proj_context_destroy(ctx);
        }

        std::string lastError() const {
            int err = proj_context_errno(ctx);
            const char *msg = err ? proj_context_errno_string(ctx, err) : nullptr;
            return msg ? msg : "unknown PROJ error";
        }

        PJ *operation(const Crs &from, const Crs &to) {
            std::string key = from.code + "->" + to.code;
            auto it = operations.find(key);
            if (it != operations.end())
                return it->second;

            PJ *raw = proj_create_crs_to_crs(ctx, from.code.c_str(), to.code.c_str(), nullptr);
            if (!raw)
                throw ProjectionFailure("cannot transform " + from.code + " to " + to.code + ": " + lastError());
            // Keep x = longitude/easting regardless of the authority's axis order.
            PJ *norm = proj_normalize_for_visualization(ctx, raw);
            proj_destroy(raw);
            if (!norm)
                throw ProjectionFailure("cannot normalise " + from.code + " to " + to.code + ": " + lastError());

            operations.emplace(key, norm);
            return norm;
        }

        Point apply(PJ *op, const Point &p, const Crs &from, const Crs &to) {
            PJ_COORD in = proj_coord(p.x(), p.y(), 0.0, 0.0);
            PJ_COORD out = proj_trans(op, PJ_FWD, in);
            if (std::isinf(out.xy.x) || std::isinf(out.xy.y) || std::isnan(out.xy.x) || std::isnan(out.xy.y)) {
                int err = proj_errno(op);
                proj_errno_reset(op);
                std::string msg = err ? proj_context_errno_string(ctx, err) : "non-finite result";
                throw ProjectionFailure("cannot transform (" + std::to_string(p.x()) + ", " + std::to_string(p.y()) +
                                        ") from " + from.code + " to " + to.code + ": " + msg);
            }
            return Point(out.xy.x, out.xy.y);
        }

        // Any CRS to WGS84 longitude/latitude.
        Point toGeographic(const Point &p, const Crs &from) {
            switch (from.kind) {
            case CrsKind::Geographic:
                return p;
            case CrsKind::LocalEnu: {
                concord::frame::ENU enu{dp::Point{p.x(), p.y(), 0.0}, from.origin};
                auto wgs = concord::frame::to_wgs(enu);
                return Point(wgs.longitude, wgs.latitude);
            }
            case CrsKind::Projected:
                break;
            }
            return apply(operation(from, Crs::wgs84()), p, from, Crs::wgs84());
        }

        Point fromGeographic(const Point &p, const Crs &to) {
            switch (to.kind) {
            case CrsKind::Geographic:
                return p;
            case CrsKind::LocalEnu: {
                concord::earth::WGS wgs{p.y(), p.x(), to.origin.altitude};
                auto enu = concord::frame::to_enu(to.origin, wgs);
                return Point(enu.east(), enu.north());
            }
            case CrsKind::Projected:
                break;
            }
            return apply(operation(Crs::wgs84(), to), p, Crs::wgs84(), to);
        }

        Point transform(const Point &p, const Crs &from, const Crs &to) {
            if (from == to)
                return p;
            if (from.kind == CrsKind::Projected && to.kind == CrsKind::Projected)
                return apply(operation(from, to), p, from, to);
            return fromGeographic(toGeographic(p, from), to);
        }
    };

    CoordinateProjector::CoordinateProjector() : impl_(std::make_unique<Impl>()) {}

    CoordinateProjector::~CoordinateProjector() = default;

    CoordinateProjector::CoordinateProjector(CoordinateProjector &&) noexcept = default;

    CoordinateProjector &CoordinateProjector::operator=(CoordinateProjector &&) noexcept = default;

    void CoordinateProjector::validate(const Crs &crs) const {
        if (crs.kind == CrsKind::LocalEnu) {
            if (std::abs(crs.origin.latitude) > 90.0 || std::abs(crs.origin.longitude) > 180.0)
                throw ProjectionFailure("ENU origin out of range: " + crs.name());
            return;
        }

        PJ *obj = proj_create(impl_->ctx, crs.code.c_str());
        if (!obj)
            throw ProjectionFailure("unrecognised CRS " + crs.code + ": " + impl_->lastError());
        PJ_TYPE type = proj_get_type(obj);
        proj_destroy(obj);

        bool geographic = type == PJ_TYPE_GEOGRAPHIC_2D_CRS || type == PJ_TYPE_GEOGRAPHIC_3D_CRS;
        if (crs.kind == CrsKind::Projected && type != PJ_TYPE_PROJECTED_CRS)
            throw ProjectionFailure(crs.code + " is not a projected CRS");
        if (crs.kind == CrsKind::Geographic && !geographic)
            throw ProjectionFailure(crs.code + " is not a geographic CRS");
    }

    Point CoordinateProjector::transform(const Point &p, const Crs &from, const Crs &to) const {
        return impl_->transform(p, from, to);
    }

    PointSet CoordinateProjector::project(const PointSet &points, const Crs &to) const {
        PointSet out;
        out.crs = to;
        out.points.reserve(points.size());
        for (const auto &tp : points.points) {
            TrackPoint moved = tp;
            moved.position = impl_->transform(tp.position, points.crs, to);
            out.points.push_back(moved);
        }
        return out;
    }

    PointSet CoordinateProjector::project(const PointSet &points, const Crs &to, std::size_t &dropped) const {
        PointSet out;
        out.crs = to;
        out.points.reserve(points.size());
        dropped = 0;
        for (const auto &tp : points.points) {
            TrackPoint moved = tp;
            try {
                moved.position = impl_->transform(tp.position, points.crs, to);
            } catch (const ProjectionFailure &) {
                ++dropped;
                continue;
            }
            out.points.push_back(moved);
        }
        return out;
    }

    Polygon CoordinateProjector::project(const Polygon &polygon, const Crs &from, const Crs &to) const {
        Polygon out;
        for (const auto &p : polygon.outer())
            out.outer().push_back(impl_->transform(p, from, to));
        for (const auto &ring : polygon.inners()) {
            Polygon::ring_type projected;
            for (const auto &p : ring)
                projected.push_back(impl_->transform(p, from, to));
            out.inners().push_back(std::move(projected));
        }
        bg::correct(out);
        return out;
    }

    MultiPolygon CoordinateProjector::project(const MultiPolygon &geometry, const Crs &from, const Crs &to) const {
        MultiPolygon out;
        out.reserve(geometry.size());
        for (const auto &poly : geometry)
            out.push_back(project(poly, from, to));
        return out;
    }

    void requireLinear(const Crs &crs, const std::string &context) {
        if (!crs.isLinear())
            throw ProjectionFailure(context + ": " + crs.name() + " is in degrees; project to a linear CRS first");
    }

} // namespace trackcover
