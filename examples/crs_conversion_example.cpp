#include "trackcover/trackcover.hpp"

#include <iomanip>
#include <iostream>

int main() {
    try {
        tc::CoordinateProjector projector;

        // 1) A point in Sheffield, longitude/latitude
        tc::Point sheffield(-1.4701, 53.3811);

        // 2) The same point in every working CRS the default regions use
        const tc::Crs targets[] = {tc::Crs::epsg(27700), tc::Crs::epsg(3857), tc::Crs::epsg(8857),
                                   tc::Crs::enu(dp::Geo{53.40, -1.45, 0.0})};

        std::cout << std::fixed << std::setprecision(3);
        for (const auto &crs : targets) {
            projector.validate(crs);
            auto p = projector.transform(sheffield, tc::Crs::wgs84(), crs);
            auto back = projector.transform(p, crs, tc::Crs::wgs84());
            std::cout << std::setw(28) << std::left << crs.name() << p.x() << ", " << p.y() << "  (back: "
                      << std::setprecision(7) << back.x() << ", " << back.y() << ")\n"
                      << std::setprecision(3);
        }

        // 3) Unknown codes fail loudly
        try {
            projector.validate(tc::parseCRS("EPSG:999999"));
        } catch (const tc::ProjectionFailure &e) {
            std::cout << "\nRejected: " << e.what() << "\n";
        }
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
