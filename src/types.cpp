#include "trackcover/types.hpp"
#include "trackcover/errors.hpp"

#include <algorithm>
#include <cctype>

namespace trackcover {

    Crs Crs::wgs84() { return Crs{}; }

    Crs Crs::epsg(int code) {
        if (code == 4326)
            return wgs84();
        Crs crs;
        crs.kind = CrsKind::Projected;
        crs.code = "EPSG:" + std::to_string(code);
        return crs;
    }

    Crs Crs::enu(const dp::Geo &origin) {
        Crs crs;
        crs.kind = CrsKind::LocalEnu;
        crs.code = "ENU";
        crs.origin = origin;
        return crs;
    }

    std::string Crs::name() const {
        if (kind != CrsKind::LocalEnu)
            return code;
        return "ENU(" + std::to_string(origin.latitude) + "," + std::to_string(origin.longitude) + ")";
    }

    bool operator==(const Crs &a, const Crs &b) {
        if (a.kind != b.kind || a.code != b.code)
            return false;
        if (a.kind != CrsKind::LocalEnu)
            return true;
        return a.origin.latitude == b.origin.latitude && a.origin.longitude == b.origin.longitude &&
               a.origin.altitude == b.origin.altitude;
    }

    bool operator!=(const Crs &a, const Crs &b) { return !(a == b); }

    Crs parseCRS(const std::string &s) {
        std::string upper = s;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (upper == "EPSG:4326" || upper == "WGS84" || upper == "WGS")
            return Crs::wgs84();
        if (upper == "ENU")
            return Crs::enu(dp::Geo{0.0, 0.0, 0.0});

        const std::string prefix = "EPSG:";
        if (upper.compare(0, prefix.size(), prefix) == 0 && upper.size() > prefix.size()) {
            auto digits = upper.substr(prefix.size());
            if (std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); }) &&
                digits.size() <= 6) {
                return Crs::epsg(std::stoi(digits));
            }
        }
        throw ProjectionFailure("Unknown CRS string: " + s);
    }

    void PointSet::append(const PointSet &other) {
        if (!other.empty() && !empty() && other.crs != crs)
            throw ProjectionFailure("PointSet::append: mixing " + crs.name() + " and " + other.crs.name());
        if (empty())
            crs = other.crs;
        points.insert(points.end(), other.points.begin(), other.points.end());
    }

    const char *toString(Predicate p) {
        switch (p) {
        case Predicate::Within:
            return "within";
        case Predicate::Intersects:
            return "intersects";
        case Predicate::All:
            return "all";
        }
        return "unknown";
    }

} // namespace trackcover
