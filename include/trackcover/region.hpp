#pragma once

#include "trackcover/boundary.hpp"
#include "trackcover/types.hpp"

#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trackcover {

    class CoordinateProjector;

    // A named feature of the boundary dataset, e.g. "United Kingdom".
    struct AdministrativeBoundary {
        std::string boundaryName;
    };

    // For places the boundary dataset does not carry. Geographic degrees.
    struct BoundingBox {
        double minLon;
        double minLat;
        double maxLon;
        double maxLat;
    };

    // Every country in the dataset, simplified by `tolerance` degrees. No area semantics.
    struct WorldSimplified {
        double tolerance = 0.1;
    };

    using RegionKind = std::variant<AdministrativeBoundary, BoundingBox, WorldSimplified>;

    struct RegionSpec {
        std::string name;
        RegionKind kind;
        Crs crs;                       // working CRS; ENU origins are placed at the region centre
        double bufferRadius = 100.0;   // in the CRS linear unit
        double simplifyTolerance = 10.0;
    };

    struct RegionDefinition {
        std::string name;
        RegionKind kind;
        Crs crs;
        MultiPolygon boundary; // in `crs`
        double bufferRadius = 0.0;
        double simplifyTolerance = 0.0;
        double area = 0.0;      // of `boundary`, in squared CRS units
        bool hasArea = true;    // false for the world pseudo-region
        bool filtersPoints = true;
        std::optional<Box> extent; // WGS84 envelope, padded; points outside it are never projected
    };

    // Builds a definition from an already projected boundary, computing its area.
    RegionDefinition makeRegion(std::string name, RegionKind kind, const Crs &crs, MultiPolygon boundary,
                                double bufferRadius, double simplifyTolerance);

    // Dispatches on the region kind. Throws UnknownRegion when an administrative boundary is
    // missing from the dataset and ProjectionFailure for an unusable CRS.
    RegionDefinition buildRegion(const RegionSpec &spec, const BoundaryDataset &dataset,
                                 const CoordinateProjector &projector);

    // UK, Sheffield, Buckinghamshire and World.
    std::vector<RegionSpec> defaultRegionSpecs();

    class RegionRegistry {
      public:
        // Builds every region up front. A region that fails to build is remembered and its
        // error is rethrown by get(); the others stay usable.
        RegionRegistry(std::shared_ptr<const BoundaryDataset> dataset, const std::vector<RegionSpec> &specs,
                       const CoordinateProjector &projector);

        explicit RegionRegistry(std::vector<RegionDefinition> definitions);

        const RegionDefinition &get(const std::string &name) const;

        bool contains(const std::string &name) const;
        std::vector<std::string> names() const;

        const BoundaryDataset *dataset() const { return dataset_.get(); }

      private:
        std::shared_ptr<const BoundaryDataset> dataset_;
        std::map<std::string, RegionDefinition> regions_;
        std::map<std::string, std::exception_ptr> failures_;
    };

} // namespace trackcover
