#pragma once

#include "trackcover/types.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trackcover {

    struct BoundaryFeature {
        std::string name;
        MultiPolygon geometry; // WGS84 longitude/latitude
        std::unordered_map<std::string, std::string> properties;
    };

    // Reference administrative boundaries, loaded once at startup and never mutated.
    class BoundaryDataset {
      public:
        explicit BoundaryDataset(std::vector<BoundaryFeature> features);

        // Reads a GeoJSON FeatureCollection (a bare Feature or geometry is wrapped). The name
        // comes from `nameAttribute`, falling back to "NAME" and "name".
        static std::shared_ptr<const BoundaryDataset> load(const std::filesystem::path &file,
                                                           const std::string &nameAttribute = "ADMIN");

        const std::vector<BoundaryFeature> &features() const { return features_; }
        std::size_t size() const { return features_.size(); }

        bool contains(const std::string &name) const;

        // All polygons of every feature carrying `name`, or nothing if there is none.
        std::optional<MultiPolygon> geometryOf(const std::string &name) const;

        // Every polygon in the dataset.
        MultiPolygon all() const;

      private:
        std::vector<BoundaryFeature> features_;
        std::unordered_map<std::string, std::vector<std::size_t>> byName_;
    };

    std::ostream &operator<<(std::ostream &os, const BoundaryDataset &dataset);

} // namespace trackcover
